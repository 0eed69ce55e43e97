#include "security/secret_scrubber.hpp"
#include "core/utils.hpp"

namespace egress {

namespace {

// Bounded re-application. One pass is a fixed point for the built-in
// patterns; extra patterns and known secrets adjacent to a marker can need
// a second.
constexpr int kMaxPasses = 4;

std::vector<SecretScrubber::SecretPattern> builtin_patterns() {
    std::vector<SecretScrubber::SecretPattern> p;
    p.reserve(8);

    // Every repetition is bounded; std::regex recurses once per matched character

    // Webhook URL: keep the path up to the id, drop the token
    p.push_back(SecretScrubber::make_pattern(
        "webhook_url",
        R"re((discord(?:app)?\.com/api/(?:v\d{1,3}/)?webhooks/\d{1,25}/)[A-Za-z0-9_-]{1,128})re",
        "$1[REDACTED]"));

    // Authorization header values (Bearer / token schemes)
    p.push_back(SecretScrubber::make_pattern(
        "authorization_header",
        R"re((authorization[ \t]{0,8}[:=][ \t]{0,8}"?(?:bearer|token|bot)[ \t]{1,8})[A-Za-z0-9._~+/=-]{8,512})re",
        "$1[REDACTED]"));

    // Repository-host tokens
    p.push_back(SecretScrubber::make_pattern(
        "github_token", R"re(gh[pousr]_[A-Za-z0-9]{20,255})re", "[REDACTED]"));
    p.push_back(SecretScrubber::make_pattern(
        "github_pat", R"re(github_pat_[A-Za-z0-9_]{20,255})re", "[REDACTED]"));

    p.push_back(SecretScrubber::make_pattern(
        "slack_token", R"re(xox[baprs]-[A-Za-z0-9-]{10,255})re", "[REDACTED]"));
    p.push_back(SecretScrubber::make_pattern(
        "api_secret_key", R"re(sk-[A-Za-z0-9_-]{20,255})re", "[REDACTED]"));
    p.push_back(SecretScrubber::make_pattern(
        "aws_access_key", R"re(AKIA[0-9A-Z]{16})re", "[REDACTED]"));

    // "token": "..." / token=... style key-value pairs
    p.push_back(SecretScrubber::make_pattern(
        "token_assignment",
        R"re(((?:webhook_token|github_token|api_key|access_token)"?[ \t]{0,8}[:=][ \t]{0,8}"?)[A-Za-z0-9._~+/=-]{8,512})re",
        "$1[REDACTED]"));

    return p;
}

} // anonymous namespace

SecretScrubber::SecretScrubber() : patterns_(builtin_patterns()) {}

SecretScrubber::SecretScrubber(std::vector<SecretPattern> extra)
    : patterns_(builtin_patterns()) {
    for (auto& pattern : extra) {
        patterns_.push_back(std::move(pattern));
    }
}

const std::shared_ptr<const SecretScrubber>& SecretScrubber::shared_default() {
    static const auto instance = std::make_shared<const SecretScrubber>();
    return instance;
}

const SecretScrubber& SecretScrubber::default_instance() {
    return *shared_default();
}

SecretScrubber::SecretPattern SecretScrubber::make_pattern(std::string name,
                                                           const std::string& regex,
                                                           std::string replacement) {
    return SecretPattern{
        std::move(name),
        std::regex(regex, std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
        std::move(replacement)};
}

std::string SecretScrubber::scrub(std::string_view text) const {
    return scrub(text, {});
}

std::string SecretScrubber::scrub(std::string_view text,
                                  std::span<const std::string> known_secrets) const {
    std::string current = scrub_once(text, known_secrets);
    for (int pass = 1; pass < kMaxPasses; ++pass) {
        std::string next = scrub_once(current, known_secrets);
        if (next == current) break;
        current = std::move(next);
    }
    return current;
}

std::string SecretScrubber::scrub_once(std::string_view text,
                                       std::span<const std::string> known_secrets) const {
    std::string out = utils::percent_decode_fully(text);

    for (const auto& secret : known_secrets) {
        if (secret.size() < kMinKnownSecretLength) continue;
        if (kRedacted.find(secret) != std::string_view::npos) continue;
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), kRedacted);
            pos += kRedacted.size();
        }
    }

    for (const auto& p : patterns_) {
        out = std::regex_replace(out, p.pattern, p.replacement);
    }
    return out;
}

} // namespace egress
