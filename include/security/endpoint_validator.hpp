#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string_view>

namespace egress {

/**
 * @brief Strict validator for chat webhook destination URLs
 *
 * Accepts exactly
 *   https://{discord.com|discordapp.com}/api/webhooks/{id}/{token}
 * with a 1-25 digit id and a 1-128 char [A-Za-z0-9_-] token.
 *
 * There is one code path and no lenient fallback. Case variants, trailing
 * dots, userinfo, ports, IP literals, percent-encoding, query strings,
 * fragments and extra segments are all rejected with VALIDATION_ERROR.
 */
class EndpointValidator {
public:
    static constexpr size_t kMaxUrlLength = 256;
    static constexpr size_t kMaxIdLength = 25;
    static constexpr size_t kMaxTokenLength = 128;

    [[nodiscard]] static Result<EndpointDescriptor> validate(std::string_view raw_url);

    /// Allow-listed host lookup (exact, case-sensitive)
    [[nodiscard]] static std::optional<WebhookHost> match_host(std::string_view host);

private:
    [[nodiscard]] static bool is_id_segment(std::string_view seg);
    [[nodiscard]] static bool is_token_segment(std::string_view seg);
};

} // namespace egress
