#include "delivery/cancellation.hpp"

#include <algorithm>

namespace egress {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!is_cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kPollSlice);
        cv_.wait_for(lock, slice, [this] { return is_cancelled(); });
    }
    return true;
}

} // namespace egress
