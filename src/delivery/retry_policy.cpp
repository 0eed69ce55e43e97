#include "delivery/retry_policy.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <string>

namespace egress {

namespace {

std::optional<std::chrono::milliseconds> seconds_to_ms(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) return std::nullopt;
    // Anything beyond a day is clamped later anyway
    const double ms = std::min(seconds, 86400.0) * 1000.0;
    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(ms)));
}

} // anonymous namespace

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t retry_number) const {
    if (retry_number == 0) return std::chrono::milliseconds{0};

    const int64_t base = base_delay.count();
    const int64_t cap = max_delay.count();
    int64_t delay = base;
    for (uint32_t i = 1; i < retry_number; ++i) {
        if (delay >= cap) break;
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

std::chrono::milliseconds RetryPolicy::delay_for(
    uint32_t retry_number,
    std::optional<std::chrono::milliseconds> server_hint) const {
    if (server_hint) {
        return std::min(*server_hint, max_retry_after);
    }
    return backoff_for(retry_number);
}

std::string RetryPolicy::validate() const {
    if (max_attempts < 1) return "max_attempts must be >= 1";
    if (base_delay.count() < 0) return "base_delay must be >= 0";
    if (max_delay < base_delay) return "max_delay must be >= base_delay";
    if (max_retry_after.count() < 0) return "max_retry_after must be >= 0";
    return {};
}

std::optional<std::chrono::milliseconds> RetryPolicy::parse_retry_after(
    std::string_view header_value,
    std::string_view body) {

    if (!body.empty()) {
        try {
            const auto doc = JsonValue::parse(std::string(body));
            if (const auto secs = doc.number("retry_after")) {
                if (auto ms = seconds_to_ms(*secs)) return ms;
            }
        } catch (const JsonValue::parse_error&) {
            // Non-JSON body: fall through to the header
        }
    }

    const std::string header = utils::trim(std::string(header_value));
    if (header.empty()) return std::nullopt;

    double secs = 0.0;
    const auto [ptr, ec] = std::from_chars(header.data(), header.data() + header.size(), secs);
    if (ec != std::errc{} || ptr != header.data() + header.size()) {
        return std::nullopt;
    }
    return seconds_to_ms(secs);
}

ErrorKind RetryPolicy::classify_status(int status) {
    if (status >= 200 && status <= 299) return ErrorKind::NONE;
    if (status == 401 || status == 403) return ErrorKind::AUTH_ERROR;
    if (status == 429) return ErrorKind::RATE_LIMIT_ERROR;
    if (status >= 500 && status <= 599) return ErrorKind::TRANSIENT_NETWORK_ERROR;
    // 3xx (redirects are never followed) and remaining 4xx
    if (status >= 300 && status <= 499) return ErrorKind::VALIDATION_ERROR;
    return ErrorKind::TRANSIENT_NETWORK_ERROR;
}

} // namespace egress
