#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace egress {

/**
 * @brief Caller-level cancellation for delivery retry loops
 *
 * Backoff sleeps are the only suspension points of a delivery and all of
 * them go through wait_for(), which returns early once cancel() is called.
 * cancel() is safe from any thread; the CLI calls request_cancel() from a
 * signal handler, which only stores the flag.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Set the flag and wake every waiter
    void cancel();

    /// Async-signal-safe: set the flag only. Waiters notice within one poll slice.
    void request_cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for `duration` unless cancelled first
     * @return true if cancelled (before or during the wait)
     */
    [[nodiscard]] bool wait_for(std::chrono::milliseconds duration);

private:
    // Upper bound on one condition-variable wait, so request_cancel() is
    // observed without a notify.
    static constexpr std::chrono::milliseconds kPollSlice{100};

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace egress
