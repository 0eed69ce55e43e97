#include "delivery/httplib_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace egress {

Result<std::pair<std::string, std::string>> HttplibTransport::split_url(const std::string& url) {
    using R = Result<std::pair<std::string, std::string>>;
    constexpr std::string_view kHttps = "https://";

    if (!url.starts_with(kHttps)) {
        return R::error(ErrorKind::VALIDATION_ERROR, "Only https URLs are sent");
    }
    const auto path_pos = url.find('/', kHttps.size());
    if (path_pos == std::string::npos) {
        return R::ok({url, "/"});
    }
    if (path_pos == kHttps.size()) {
        return R::error(ErrorKind::VALIDATION_ERROR, "URL has no host");
    }
    return R::ok({url.substr(0, path_pos), url.substr(path_pos)});
}

Result<HttpResponse> HttplibTransport::send(const HttpRequest& request) {
    using R = Result<HttpResponse>;

    auto parts = split_url(request.url);
    if (parts.is_error()) {
        return R::error(parts.error_kind(), parts.error_message());
    }
    const auto& [scheme_host, path] = parts.value();

    try {
        httplib::Client client(scheme_host);
        client.set_follow_location(false);
        client.set_connection_timeout(config_.connection_timeout);
        client.set_read_timeout(config_.read_timeout);
        client.set_write_timeout(config_.write_timeout);
        client.enable_server_certificate_verification(true);
        if (!config_.ca_cert_path.empty()) {
            client.set_ca_cert_path(config_.ca_cert_path);
        }

        httplib::Headers headers;
        for (const auto& [k, v] : request.headers) {
            headers.emplace(k, v);
        }

        if (request.method != "GET" && request.method != "PUT" && request.method != "POST") {
            return R::error(ErrorKind::INTERNAL_ERROR,
                std::format("Unsupported HTTP method: {}", request.method));
        }

        auto perform = [&]() -> httplib::Result {
            if (request.method == "GET") {
                return client.Get(path, headers);
            }
            if (request.method == "PUT") {
                return client.Put(path, headers, request.body, request.content_type);
            }
            if (!request.multipart.empty()) {
                httplib::MultipartFormDataItems items;
                items.reserve(request.multipart.size());
                for (const auto& part : request.multipart) {
                    items.push_back({part.name, part.content, part.filename, part.content_type});
                }
                return client.Post(path, headers, items);
            }
            return client.Post(path, headers, request.body, request.content_type);
        };

        auto res = perform();
        if (!res) {
            return R::error(ErrorKind::TRANSIENT_NETWORK_ERROR,
                std::format("HTTP request failed: {}", httplib::to_string(res.error())));
        }

        HttpResponse out;
        out.status = res->status;
        out.body = res->body;
        out.headers.reserve(res->headers.size());
        for (const auto& [k, v] : res->headers) {
            out.headers.emplace_back(k, v);
        }
        return R::ok(std::move(out));
    } catch (const std::exception& e) {
        return R::error(ErrorKind::TRANSIENT_NETWORK_ERROR,
            std::format("HTTP transport error: {}", e.what()));
    }
}

} // namespace egress
