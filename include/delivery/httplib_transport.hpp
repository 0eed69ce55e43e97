#pragma once

#include "delivery/http_transport.hpp"

#include <chrono>
#include <string>

namespace egress {

/**
 * @brief IHttpTransport over cpp-httplib with OpenSSL
 *
 * One httplib::Client per request (no connection reuse across calls, so no
 * credential-bearing state outlives the request). Redirects are never
 * followed; a 3xx is returned to the caller as-is.
 */
class HttplibTransport : public IHttpTransport {
public:
    struct Config {
        std::chrono::seconds connection_timeout{10};
        std::chrono::seconds read_timeout{60};
        std::chrono::seconds write_timeout{60};
        std::string ca_cert_path;   // empty = system trust store
    };

    HttplibTransport() = default;
    explicit HttplibTransport(Config config) : config_(std::move(config)) {}

    [[nodiscard]] Result<HttpResponse> send(const HttpRequest& request) override;

    /// Split "https://host[:port]/path" into ("https://host[:port]", "/path")
    [[nodiscard]] static Result<std::pair<std::string, std::string>> split_url(const std::string& url);

private:
    Config config_;
};

} // namespace egress
