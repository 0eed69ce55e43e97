#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <string>
#include <utility>
#include <vector>

namespace egress {

struct MultipartPart {
    std::string name;           // form field, e.g. "payload_json" or "files[0]"
    std::string content;
    std::string filename;       // empty for plain fields
    std::string content_type;
};

struct HttpRequest {
    std::string method;         // GET, POST, PUT
    std::string url;            // absolute https URL
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string content_type;
    std::vector<MultipartPart> multipart;   // non-empty = multipart/form-data POST
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    /// Case-insensitive header lookup; empty if absent
    [[nodiscard]] std::string header(std::string_view name) const {
        const std::string wanted = utils::to_lower(name);
        for (const auto& [k, v] : headers) {
            if (utils::to_lower(k) == wanted) return v;
        }
        return {};
    }
};

/**
 * @brief Abstract HTTP transport (one request, no retries, no redirects)
 *
 * Connection-level failures come back as TRANSIENT_NETWORK_ERROR; any
 * received response, whatever its status, is a success at this layer.
 * Implementations must not throw.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace egress
