#pragma once

#include <optional>
#include <string>
#include <utility>

namespace egress {

/**
 * @brief Error taxonomy for everything that leaves the egress core
 *
 * Retry classification lives in the delivery layer; this enum only names
 * what went wrong.
 */
enum class ErrorKind {
    NONE,
    VALIDATION_ERROR,         // Malformed or disallowed endpoint/path, not retried
    AUTH_ERROR,               // Rejected credential, not retried
    RATE_LIMIT_ERROR,         // Retried with server-provided delay
    TRANSIENT_NETWORK_ERROR,  // Connection failure or 5xx, retried with backoff
    SYMLINK_ERROR,            // Symlink at a write target
    PATH_TRAVERSAL_ERROR,     // Write target escapes its parent directory
    FILESYSTEM_ERROR,         // Any other I/O failure
    EXHAUSTED_RETRIES_ERROR,  // Terminal after max_attempts
    CANCELLED,                // Caller-level cancellation during a retry loop
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                    return "none";
        case ErrorKind::VALIDATION_ERROR:        return "validation_error";
        case ErrorKind::AUTH_ERROR:              return "auth_error";
        case ErrorKind::RATE_LIMIT_ERROR:        return "rate_limit_error";
        case ErrorKind::TRANSIENT_NETWORK_ERROR: return "transient_network_error";
        case ErrorKind::SYMLINK_ERROR:           return "symlink_error";
        case ErrorKind::PATH_TRAVERSAL_ERROR:    return "path_traversal_error";
        case ErrorKind::FILESYSTEM_ERROR:        return "filesystem_error";
        case ErrorKind::EXHAUSTED_RETRIES_ERROR: return "exhausted_retries_error";
        case ErrorKind::CANCELLED:               return "cancelled";
        case ErrorKind::INTERNAL_ERROR:          return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Structured error handed back to callers
 *
 * `message` is always scrubbed before an EgressError is constructed by
 * the delivery client; never build one from raw upstream text.
 */
struct EgressError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorKind kind, std::string message) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }

    EgressError error() const { return {error_kind_, error_message_}; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
};

} // namespace egress
