#pragma once

#include <memory>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace egress {

/**
 * @brief Pattern-driven credential redaction for any outbound text
 *
 * Every string that reaches a log line, an error message or a remote
 * payload passes through scrub(). Input is percent-decoded to a fixed point
 * first so encoded credentials (%2F, %252F, ...) cannot slip past the
 * patterns, then each pattern replaces its match with kRedacted.
 *
 * Output never contains a pattern match, so scrub(scrub(x)) == scrub(x).
 * Instances are immutable after construction and safe to share between
 * threads.
 */
class SecretScrubber {
public:
    static constexpr std::string_view kRedacted = "[REDACTED]";

    /// Known per-call secrets shorter than this are not substituted
    static constexpr size_t kMinKnownSecretLength = 8;

    struct SecretPattern {
        std::string name;
        std::regex pattern;
        std::string replacement;   // std::regex_replace format string
    };

    /// Built-in patterns only
    SecretScrubber();

    /// Built-in patterns followed by `extra`
    explicit SecretScrubber(std::vector<SecretPattern> extra);

    /// Process-wide instance with the built-in patterns
    [[nodiscard]] static const SecretScrubber& default_instance();
    [[nodiscard]] static const std::shared_ptr<const SecretScrubber>& shared_default();

    [[nodiscard]] std::string scrub(std::string_view text) const;

    /**
     * @brief Scrub, additionally redacting literal occurrences of `known_secrets`
     *
     * Used with the exact webhook token / API token of the current call so a
     * credential is removed even when it does not look like one.
     */
    [[nodiscard]] std::string scrub(std::string_view text,
                                    std::span<const std::string> known_secrets) const;

    /// Build a case-insensitive pattern; throws std::regex_error on bad syntax
    [[nodiscard]] static SecretPattern make_pattern(std::string name,
                                                    const std::string& regex,
                                                    std::string replacement);

    [[nodiscard]] size_t pattern_count() const { return patterns_.size(); }

private:
    [[nodiscard]] std::string scrub_once(std::string_view text,
                                         std::span<const std::string> known_secrets) const;

    std::vector<SecretPattern> patterns_;
};

} // namespace egress
