#pragma once

#include "core/json.hpp"
#include "security/secret_scrubber.hpp"

#include <string>
#include <string_view>

namespace egress {

/**
 * @brief Strips credentials out of workflow JSON before it is exported
 *
 * Rules, applied recursively to objects and arrays:
 * - values under the keys `webhook_url` and `github_token` become ""
 * - strings that look like a webhook URL or start with a GitHub token
 *   prefix become ""
 * - strings of 40+ chars inside a node whose "type" mentions github
 *   become ""
 * - every remaining string goes through SecretScrubber::scrub()
 *
 * Object keys and non-string scalars pass through unchanged.
 */
class WorkflowSanitizer {
public:
    static constexpr size_t kContextTokenMinLength = 40;

    /// `scrubber` must outlive the sanitizer
    explicit WorkflowSanitizer(const SecretScrubber& scrubber = SecretScrubber::default_instance())
        : scrubber_(scrubber) {}

    /// Sanitize in place
    void sanitize(JsonValue& doc) const;

    /**
     * @brief Sanitize serialized JSON
     *
     * Input that does not parse as JSON is handled as one plain string, so
     * the result is always safe to export.
     */
    [[nodiscard]] std::string sanitize_text(std::string_view text) const;

    [[nodiscard]] static bool is_webhook_url(std::string_view value);
    [[nodiscard]] static bool is_github_token(std::string_view value);
    [[nodiscard]] static bool is_sensitive_key(std::string_view key);

private:
    void sanitize_node(glz::json_t& node, const std::string& context_type) const;
    [[nodiscard]] std::string sanitize_string(const std::string& value,
                                              const std::string& context_type) const;

    const SecretScrubber& scrubber_;
};

} // namespace egress
