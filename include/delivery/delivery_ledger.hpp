#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace egress {

/**
 * @brief Set of artifact fingerprints already delivered
 *
 * The delivery client consults it before sending a follow-up artifact (the
 * CDN manifest), so a retried or repeated call does not post it twice.
 * Callers that deliver the same batch in several calls share one ledger.
 */
class DeliveryLedger {
public:
    [[nodiscard]] bool contains(const std::string& fingerprint) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_.contains(fingerprint);
    }

    /// Returns false if the fingerprint was already recorded
    bool record(const std::string& fingerprint) {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_.insert(fingerprint).second;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> delivered_;
};

} // namespace egress
