#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace egress {

/**
 * @brief Immutable retry parameters for one delivery call
 *
 * Retry n (n >= 1) waits min(base_delay * 2^(n-1), max_delay). A 429 with a
 * server hint waits min(hint, max_retry_after) instead. The first attempt
 * never waits.
 */
struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds max_retry_after{60000};
    std::function<bool(int)> retryable_status = &RetryPolicy::default_retryable_status;

    /// 429 and every 5xx
    [[nodiscard]] static bool default_retryable_status(int status) {
        return status == 429 || (status >= 500 && status <= 599);
    }

    [[nodiscard]] bool is_retryable(int status) const {
        return retryable_status ? retryable_status(status) : default_retryable_status(status);
    }

    [[nodiscard]] std::chrono::milliseconds backoff_for(uint32_t retry_number) const;

    [[nodiscard]] std::chrono::milliseconds delay_for(
        uint32_t retry_number,
        std::optional<std::chrono::milliseconds> server_hint) const;

    /// Empty string on success, otherwise the first constraint violated
    [[nodiscard]] std::string validate() const;

    /**
     * @brief Server-provided delay from a 429 response
     *
     * JSON body `retry_after` (seconds, fractional allowed) wins over the
     * `Retry-After` header (delta-seconds). HTTP-date headers and negative
     * values are ignored.
     */
    [[nodiscard]] static std::optional<std::chrono::milliseconds> parse_retry_after(
        std::string_view header_value,
        std::string_view body);

    /// Error kind for a non-2xx status
    [[nodiscard]] static ErrorKind classify_status(int status);
};

} // namespace egress
