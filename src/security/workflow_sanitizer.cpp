#include "security/workflow_sanitizer.hpp"
#include "core/utils.hpp"

#include <array>

namespace egress {

namespace {

constexpr std::array<std::string_view, 5> kGithubTokenPrefixes = {
    "ghp_", "github_pat_", "gho_", "ghs_", "ghu_"
};

} // anonymous namespace

bool WorkflowSanitizer::is_webhook_url(std::string_view value) {
    if (utils::contains_ci(value, "discord.com/api/webhooks") ||
        utils::contains_ci(value, "discordapp.com/api/webhooks")) {
        return true;
    }
    // Generic webhook-looking URLs
    if (value.starts_with("http") &&
        (utils::contains_ci(value, "webhook") || utils::contains_ci(value, "discord"))) {
        return true;
    }
    return false;
}

bool WorkflowSanitizer::is_github_token(std::string_view value) {
    for (const auto prefix : kGithubTokenPrefixes) {
        if (value.starts_with(prefix)) return true;
    }
    return false;
}

bool WorkflowSanitizer::is_sensitive_key(std::string_view key) {
    return key == "webhook_url" || key == "github_token";
}

std::string WorkflowSanitizer::sanitize_string(const std::string& value,
                                               const std::string& context_type) const {
    if (is_webhook_url(value) || is_github_token(value)) {
        return {};
    }
    if (value.size() >= kContextTokenMinLength && utils::contains_ci(context_type, "github")) {
        return {};
    }
    return scrubber_.scrub(value);
}

void WorkflowSanitizer::sanitize_node(glz::json_t& node, const std::string& context_type) const {
    if (node.is_string()) {
        node = sanitize_string(node.get<std::string>(), context_type);
        return;
    }

    if (node.is_array()) {
        for (auto& item : node.get_array()) {
            sanitize_node(item, context_type);
        }
        return;
    }

    if (!node.is_object()) return;

    auto& obj = node.get_object();

    // A workflow node's "type" scopes the heuristics for everything below it
    std::string scope = context_type;
    if (auto it = obj.find("type"); it != obj.end() && it->second.is_string()) {
        scope = it->second.get<std::string>();
    }

    for (auto& [key, value] : obj) {
        if (is_sensitive_key(key)) {
            value = std::string{};
            continue;
        }
        sanitize_node(value, scope);
    }
}

void WorkflowSanitizer::sanitize(JsonValue& doc) const {
    sanitize_node(doc.raw(), std::string{});
}

std::string WorkflowSanitizer::sanitize_text(std::string_view text) const {
    JsonValue doc;
    try {
        doc = JsonValue::parse(std::string(text));
    } catch (const JsonValue::parse_error&) {
        return sanitize_string(std::string(text), std::string{});
    }
    sanitize(doc);
    return doc.dump(2);
}

} // namespace egress
