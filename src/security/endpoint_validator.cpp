#include "security/endpoint_validator.hpp"

#include <format>

namespace egress {

namespace {

constexpr std::string_view kScheme = "https://";
constexpr std::string_view kWebhookPrefix = "/api/webhooks/";

Result<EndpointDescriptor> reject(std::string_view reason) {
    return Result<EndpointDescriptor>::error(
        ErrorKind::VALIDATION_ERROR,
        std::format("Invalid webhook URL: {}", reason));
}

} // anonymous namespace

std::optional<WebhookHost> EndpointValidator::match_host(std::string_view host) {
    if (host == "discord.com") return WebhookHost::PRIMARY_DOMAIN;
    if (host == "discordapp.com") return WebhookHost::ALTERNATE_DOMAIN;
    return std::nullopt;
}

bool EndpointValidator::is_id_segment(std::string_view seg) {
    if (seg.empty() || seg.size() > kMaxIdLength) return false;
    for (const char c : seg) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool EndpointValidator::is_token_segment(std::string_view seg) {
    if (seg.empty() || seg.size() > kMaxTokenLength) return false;
    for (const char c : seg) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

Result<EndpointDescriptor> EndpointValidator::validate(std::string_view raw_url) {
    if (raw_url.empty()) {
        return reject("empty");
    }
    if (raw_url.size() > kMaxUrlLength) {
        return reject("too long");
    }

    // Byte-level screen before any structural parsing. Every character
    // legitimately present in the grammar is in [A-Za-z0-9_./:-].
    for (const char c : raw_url) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u >= 0x7F) return reject("whitespace, control or non-ASCII character");
        if (c == '%') return reject("percent-encoding is not accepted");
        if (c == '@') return reject("userinfo is not accepted");
        if (c == '?') return reject("query string is not accepted");
        if (c == '#') return reject("fragment is not accepted");
        if (c == '\\') return reject("backslash is not accepted");
    }

    if (!raw_url.starts_with(kScheme)) {
        return reject("scheme must be https");
    }

    const std::string_view rest = raw_url.substr(kScheme.size());
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return reject("missing path");
    }

    // Authority must be the bare host: no port, no trailing dot, exact case
    const std::string_view host = rest.substr(0, slash);
    if (host.find(':') != std::string_view::npos) {
        return reject("explicit port is not accepted");
    }
    const auto host_kind = match_host(host);
    if (!host_kind) {
        return reject("host is not an allow-listed webhook domain");
    }

    const std::string_view path = rest.substr(slash);
    if (!path.starts_with(kWebhookPrefix)) {
        return reject("path is not a webhook resource");
    }

    const std::string_view tail = path.substr(kWebhookPrefix.size());
    const auto sep = tail.find('/');
    if (sep == std::string_view::npos) {
        return reject("missing webhook token segment");
    }
    const std::string_view id = tail.substr(0, sep);
    const std::string_view token = tail.substr(sep + 1);

    if (!is_id_segment(id)) {
        return reject("webhook id segment is malformed");
    }
    // A further '/' would be an extra segment or a trailing slash
    if (token.find('/') != std::string_view::npos) {
        return reject("unexpected extra path segment");
    }
    if (!is_token_segment(token)) {
        return reject("webhook token segment is malformed");
    }

    EndpointDescriptor desc;
    desc.raw_url = std::string(raw_url);
    desc.host = *host_kind;
    desc.resource_id = std::string(id);
    desc.token = std::string(token);
    desc.canonical_url = std::format("https://{}/api/webhooks/{}/{}",
                                     webhook_host_to_string(*host_kind), id, token);
    return Result<EndpointDescriptor>::ok(std::move(desc));
}

} // namespace egress
