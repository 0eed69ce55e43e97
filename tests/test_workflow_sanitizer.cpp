#include <catch2/catch_test_macros.hpp>
#include "security/workflow_sanitizer.hpp"

#include <string>

using namespace egress;

namespace {

const std::string kWebhook = "https://discord.com/api/webhooks/123/WorkflowSecretToken";
const std::string kGhp = "ghp_" + std::string(36, 'k');

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("WorkflowSanitizer: sensitive keys are blanked", "[sanitizer]") {
    WorkflowSanitizer sanitizer;
    auto doc = JsonValue::parse(R"({"webhook_url": ")" + kWebhook + R"(", "github_token": 12345, "seed": 7})");
    sanitizer.sanitize(doc);

    CHECK(doc.string_or("webhook_url", "x").empty());
    CHECK(doc["github_token"].is_string());
    CHECK(doc.string_or("github_token", "x").empty());
    CHECK(doc["seed"].get<int>() == 7);
}

TEST_CASE("WorkflowSanitizer: workflow nodes are cleaned recursively", "[sanitizer]") {
    WorkflowSanitizer sanitizer;
    const std::string workflow = R"({
        "nodes": [
            {"id": 1, "type": "DiscordSendSaveImage",
             "widgets_values": ["prefix", ")" + kWebhook + R"(", true, 3]},
            {"id": 2, "type": "GithubUploader",
             "inputs": {"repo": "alice/repo", "secret": ")" + std::string(45, 'Z') + R"("}},
            {"id": 3, "type": "KSampler", "inputs": {"prompt": ")" + std::string(45, 'p') + R"("}}
        ],
        "extra": {"nested": [[")" + kGhp + R"("]]}
    })";

    const auto out = sanitizer.sanitize_text(workflow);
    CHECK_FALSE(contains(out, "WorkflowSecretToken"));
    CHECK_FALSE(contains(out, kGhp));
    CHECK_FALSE(contains(out, std::string(45, 'Z')));
    // Long strings outside a github-typed node survive
    CHECK(contains(out, std::string(45, 'p')));
    CHECK(contains(out, "prefix"));
    CHECK(contains(out, "alice/repo"));

    const auto doc = JsonValue::parse(out);
    const auto widgets = doc["nodes"][0]["widgets_values"];
    CHECK(widgets.size() == 4);
    CHECK(widgets[1].get<std::string>().empty());
}

TEST_CASE("WorkflowSanitizer: embedded secrets inside text are scrubbed", "[sanitizer]") {
    WorkflowSanitizer sanitizer;
    auto doc = JsonValue::parse(R"({"notes": "pushed with )" + kGhp + R"( yesterday"})");
    sanitizer.sanitize(doc);
    // Only the token is redacted, the surrounding text stays
    CHECK(doc.string_or("notes", "") == "pushed with [REDACTED] yesterday");
}

TEST_CASE("WorkflowSanitizer: non-JSON input is sanitized as a string", "[sanitizer]") {
    WorkflowSanitizer sanitizer;
    CHECK(sanitizer.sanitize_text(kWebhook).empty());
    CHECK(sanitizer.sanitize_text("just some text") == "just some text");
}

TEST_CASE("WorkflowSanitizer: classification helpers", "[sanitizer]") {
    CHECK(WorkflowSanitizer::is_webhook_url(kWebhook));
    CHECK(WorkflowSanitizer::is_webhook_url("https://DISCORDAPP.com/api/webhooks/1/x"));
    CHECK(WorkflowSanitizer::is_webhook_url("https://hooks.example.com/webhook/abc"));
    CHECK_FALSE(WorkflowSanitizer::is_webhook_url("a webhook mentioned in passing"));

    CHECK(WorkflowSanitizer::is_github_token(kGhp));
    CHECK(WorkflowSanitizer::is_github_token("github_pat_abc"));
    CHECK_FALSE(WorkflowSanitizer::is_github_token("xghp_abc"));

    CHECK(WorkflowSanitizer::is_sensitive_key("webhook_url"));
    CHECK(WorkflowSanitizer::is_sensitive_key("github_token"));
    CHECK_FALSE(WorkflowSanitizer::is_sensitive_key("url"));
}
