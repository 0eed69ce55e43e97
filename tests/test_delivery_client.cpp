#include <catch2/catch_test_macros.hpp>
#include "delivery/delivery_client.hpp"
#include "core/json.hpp"
#include "security/endpoint_validator.hpp"
#include "mocks/mock_http_transport.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace egress;
using egress::testing::MockHttpTransport;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

const std::string kToken = "SECRETTOKENabc123";
const std::string kUrl = "https://discord.com/api/webhooks/123456789/" + kToken;
const std::string kCdnBody =
    R"({"id":"111","attachments":[{"filename":"a.png","url":"https://cdn.discordapp.com/attachments/1/2/a.png"}]})";

RetryPolicy fast_policy(uint32_t attempts = 3) {
    RetryPolicy p;
    p.max_attempts = attempts;
    p.base_delay = 0ms;
    p.max_delay = 0ms;
    return p;
}

EndpointDescriptor endpoint() {
    auto r = EndpointValidator::validate(kUrl);
    REQUIRE(r.is_ok());
    return r.value();
}

WebhookPayload text(const std::string& message) {
    WebhookPayload p;
    p.message = message;
    return p;
}

WebhookPayload with_files(size_t n) {
    WebhookPayload p;
    p.message = "batch";
    for (size_t i = 0; i < n; ++i) {
        p.attachments.push_back({"img_" + std::to_string(i) + ".png", "", "bytes", std::nullopt});
    }
    return p;
}

// RAII temporary directory
struct TmpDir {
    fs::path path;
    explicit TmpDir(const std::string& name)
        : path(fs::temp_directory_path() / ("egress_test_" + name)) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

struct Fixture {
    std::shared_ptr<MockHttpTransport> transport = std::make_shared<MockHttpTransport>();
    DeliveryClient::Config config;

    DeliveryClient client() const { return DeliveryClient(transport, config); }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Retry behavior
// ============================================================================

TEST_CASE("DeliveryClient: transient failures are retried until success", "[delivery][retry]") {
    Fixture f;
    f.transport->push(MockHttpTransport::status(500));
    f.transport->push(MockHttpTransport::status(500));
    f.transport->push(MockHttpTransport::status(200, R"({"id":"42"})"));

    auto result = f.client().deliver(endpoint(), text("hello"), fast_policy());
    CHECK(result.status == DeliveryStatus::DELIVERED);
    CHECK(result.attempts == 3);
    CHECK(result.requests_delivered == 1);
    CHECK_FALSE(result.error.has_value());
    REQUIRE(result.remote_ids.size() == 1);
    CHECK(result.remote_ids[0] == "42");
}

TEST_CASE("DeliveryClient: connection errors are retried", "[delivery][retry]") {
    Fixture f;
    f.transport->push(MockHttpTransport::connection_error());
    f.transport->push(MockHttpTransport::status(204));

    auto result = f.client().deliver(endpoint(), text("hello"), fast_policy());
    CHECK(result.delivered());
    CHECK(result.attempts == 2);
}

TEST_CASE("DeliveryClient: auth failure is terminal", "[delivery][retry]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(401, R"({"message":"Invalid Webhook Token"})"));

    auto result = f.client().deliver(endpoint(), text("hello"), fast_policy(5));
    CHECK(result.status == DeliveryStatus::FAILED);
    CHECK(result.attempts == 1);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::AUTH_ERROR);
    CHECK(f.transport->send_count() == 1);
}

TEST_CASE("DeliveryClient: other 4xx are terminal validation errors", "[delivery][retry]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(400));

    auto result = f.client().deliver(endpoint(), text("hello"), fast_policy());
    CHECK(result.attempts == 1);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::VALIDATION_ERROR);
}

TEST_CASE("DeliveryClient: exhausted retries", "[delivery][retry]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(503, "upstream down"));

    auto result = f.client().deliver(endpoint(), text("hello"), fast_policy(4));
    CHECK(result.status == DeliveryStatus::FAILED);
    CHECK(result.attempts == 4);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::EXHAUSTED_RETRIES_ERROR);
    CHECK(contains(result.error->message, "after 4 attempts"));
}

TEST_CASE("DeliveryClient: 429 honors the server hint", "[delivery][retry]") {
    Fixture f;
    f.transport->push(MockHttpTransport::status(429, R"({"retry_after": 0.25})"));
    f.transport->push(MockHttpTransport::status(429, "", {{"Retry-After", "120"}}));
    f.transport->push(MockHttpTransport::status(204));

    auto client = f.client();
    std::vector<std::chrono::milliseconds> sleeps;
    client.set_sleeper([&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    RetryPolicy policy = fast_policy(3);
    policy.max_retry_after = 5000ms;

    auto result = client.deliver(endpoint(), text("hello"), policy);
    CHECK(result.delivered());
    CHECK(result.attempts == 3);
    REQUIRE(sleeps.size() == 2);
    CHECK(sleeps[0] == 250ms);
    CHECK(sleeps[1] == 5000ms);
}

TEST_CASE("DeliveryClient: exponential backoff between attempts", "[delivery][retry]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(500));

    auto client = f.client();
    std::vector<std::chrono::milliseconds> sleeps;
    client.set_sleeper([&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.base_delay = 100ms;
    policy.max_delay = 250ms;

    auto result = client.deliver(endpoint(), text("hello"), policy);
    CHECK(result.attempts == 4);
    REQUIRE(sleeps.size() == 3);
    CHECK(sleeps[0] == 100ms);
    CHECK(sleeps[1] == 200ms);
    CHECK(sleeps[2] == 250ms);
}

TEST_CASE("DeliveryClient: invalid retry policy fails before sending", "[delivery][retry]") {
    Fixture f;
    RetryPolicy policy = fast_policy();
    policy.max_attempts = 0;

    auto result = f.client().deliver(endpoint(), text("hello"), policy);
    CHECK(result.status == DeliveryStatus::FAILED);
    CHECK(result.attempts == 0);
    CHECK(f.transport->send_count() == 0);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("DeliveryClient: cancelled before start sends nothing", "[delivery][cancel]") {
    Fixture f;
    CancellationToken token;
    token.cancel();

    auto result = f.client().deliver(endpoint(), text("hello"), fast_policy(), &token);
    CHECK(result.status == DeliveryStatus::FAILED);
    CHECK(result.attempts == 0);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::CANCELLED);
    CHECK(f.transport->send_count() == 0);
}

TEST_CASE("DeliveryClient: cancellation during backoff stops the loop", "[delivery][cancel]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(500));
    CancellationToken token;
    f.transport->on_send([&](const HttpRequest&) { token.cancel(); });

    RetryPolicy policy = fast_policy(10);
    policy.base_delay = 60000ms;
    policy.max_delay = 60000ms;

    auto result = f.client().deliver(endpoint(), text("hello"), policy, &token);
    CHECK(result.attempts == 1);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::CANCELLED);
}

TEST_CASE("DeliveryClient: snapshots removed after cancellation", "[delivery][cancel]") {
    TmpDir staging("delivery_cancel_staging");
    TmpDir src("delivery_cancel_src");
    {
        std::ofstream(src.path / "frame.png") << "pixels";
    }

    Fixture f;
    f.config.staging_dir = staging.path.string();
    f.transport->set_fallback(MockHttpTransport::status(500));
    CancellationToken token;
    f.transport->on_send([&](const HttpRequest&) { token.cancel(); });

    WebhookPayload payload;
    payload.attachments.push_back({"frame.png", "", "", (src.path / "frame.png").string()});

    auto result = f.client().deliver(endpoint(), payload, fast_policy(), &token);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::CANCELLED);
    CHECK(fs::is_empty(staging.path));
}

// ============================================================================
// Batching and payload shape
// ============================================================================

TEST_CASE("DeliveryClient: attachments are batched", "[delivery][batch]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(204));

    auto result = f.client().deliver(endpoint(), with_files(11), fast_policy());
    CHECK(result.delivered());
    CHECK(result.requests_total == 2);
    CHECK(result.requests_delivered == 2);
    CHECK(result.attempts == 2);

    const auto reqs = f.transport->requests();
    REQUIRE(reqs.size() == 2);
    REQUIRE(reqs[0].multipart.size() == 11);
    REQUIRE(reqs[1].multipart.size() == 2);

    CHECK(reqs[0].multipart[0].name == "payload_json");
    CHECK(contains(reqs[0].multipart[0].content, "\"content\""));
    CHECK_FALSE(contains(reqs[1].multipart[0].content, "\"content\""));

    CHECK(reqs[0].multipart[1].name == "files[0]");
    CHECK(reqs[0].multipart[10].name == "files[9]");
    CHECK(reqs[1].multipart[1].name == "files[0]");
    CHECK(reqs[1].multipart[1].filename == "img_10.png");
    CHECK(reqs[1].multipart[1].content_type == "image/png");

    for (const auto& r : reqs) {
        CHECK(r.method == "POST");
        CHECK(r.url == kUrl + "?wait=true");
        for (const auto& [name, value] : r.headers) {
            CHECK(name != "Authorization");
        }
    }
}

TEST_CASE("DeliveryClient: failed second batch is partial delivery", "[delivery][batch]") {
    Fixture f;
    f.transport->push(MockHttpTransport::status(204));
    f.transport->push(MockHttpTransport::status(403));

    auto result = f.client().deliver(endpoint(), with_files(12), fast_policy());
    CHECK(result.status == DeliveryStatus::PARTIALLY_DELIVERED);
    CHECK(result.requests_delivered == 1);
    CHECK(result.requests_total == 2);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::AUTH_ERROR);
}

TEST_CASE("DeliveryClient: long messages are truncated", "[delivery][payload]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(204));

    auto result = f.client().deliver(endpoint(), text(std::string(2500, 'a')), fast_policy());
    REQUIRE(result.delivered());

    const auto reqs = f.transport->requests();
    REQUIRE(reqs.size() == 1);
    const auto doc = JsonValue::parse(reqs[0].multipart[0].content);
    const auto content = doc.string_or("content", "");
    CHECK(content.size() <= 2000);
    CHECK(content.ends_with("...[Message truncated]"));
}

TEST_CASE("DeliveryClient: very long message is bounded before scrubbing", "[delivery][payload]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(204));

    auto result = f.client().deliver(endpoint(), text(kUrl + " " + std::string(200000, 'a')),
                                     fast_policy());
    REQUIRE(result.delivered());

    const auto doc = JsonValue::parse(f.transport->requests()[0].multipart[0].content);
    const auto content = doc.string_or("content", "");
    CHECK(content.size() <= 2000);
    CHECK(content.ends_with("...[Message truncated]"));
    CHECK_FALSE(contains(content, kToken));
}

TEST_CASE("DeliveryClient: oversize attachments are skipped", "[delivery][payload]") {
    Fixture f;
    f.config.max_attachment_bytes = 4;
    f.transport->set_fallback(MockHttpTransport::status(204));

    WebhookPayload payload = text("hi");
    payload.attachments.push_back({"big.png", "", "123456", std::nullopt});
    payload.attachments.push_back({"ok.png", "", "1234", std::nullopt});

    auto result = f.client().deliver(endpoint(), payload, fast_policy());
    CHECK(result.delivered());
    const auto reqs = f.transport->requests();
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].multipart.size() == 2);
    CHECK(reqs[0].multipart[1].filename == "ok.png");
}

TEST_CASE("DeliveryClient: oversize source files are skipped", "[delivery][payload]") {
    TmpDir staging("delivery_oversize_staging");
    TmpDir src("delivery_oversize_src");
    {
        std::ofstream(src.path / "big.png") << "0123456789";
        std::ofstream(src.path / "ok.png") << "1234";
    }

    Fixture f;
    f.config.staging_dir = staging.path.string();
    f.config.max_attachment_bytes = 4;
    f.transport->set_fallback(MockHttpTransport::status(204));

    WebhookPayload payload = text("hi");
    payload.attachments.push_back({"big.png", "", "", (src.path / "big.png").string()});
    payload.attachments.push_back({"ok.png", "", "", (src.path / "ok.png").string()});

    auto result = f.client().deliver(endpoint(), payload, fast_policy());
    CHECK(result.delivered());
    const auto reqs = f.transport->requests();
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].multipart.size() == 2);
    CHECK(reqs[0].multipart[1].filename == "ok.png");
    CHECK(reqs[0].multipart[1].content == "1234");
    CHECK(fs::is_empty(staging.path));
}

TEST_CASE("DeliveryClient: username and filenames are scrubbed", "[delivery][scrub]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(204));

    WebhookPayload payload = text("hi");
    payload.username = "bot " + kToken;
    payload.attachments.push_back({"frame_" + kToken + ".png", "", "data", std::nullopt});

    auto result = f.client().deliver(endpoint(), payload, fast_policy());
    REQUIRE(result.delivered());
    const auto reqs = f.transport->requests();
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].multipart.size() == 2);
    CHECK_FALSE(contains(reqs[0].multipart[0].content, kToken));
    CHECK(contains(reqs[0].multipart[0].content, "bot [REDACTED]"));
    CHECK(reqs[0].multipart[1].filename == "frame_[REDACTED].png");
}

TEST_CASE("DeliveryClient: empty payload is rejected", "[delivery][payload]") {
    Fixture f;
    auto result = f.client().deliver(endpoint(), WebhookPayload{}, fast_policy());
    CHECK(result.status == DeliveryStatus::FAILED);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::VALIDATION_ERROR);
    CHECK(f.transport->send_count() == 0);
}

TEST_CASE("DeliveryClient: embeds are validated and capped", "[delivery][payload]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(204));

    SECTION("not an array") {
        WebhookPayload p;
        p.embeds_json = R"({"title":"x"})";
        auto result = f.client().deliver(endpoint(), p, fast_policy());
        REQUIRE(result.error.has_value());
        CHECK(result.error->kind == ErrorKind::VALIDATION_ERROR);
    }
    SECTION("capped at ten") {
        std::string arr = "[";
        for (int i = 0; i < 12; ++i) {
            if (i) arr += ",";
            arr += R"({"title":"t"})";
        }
        arr += "]";
        WebhookPayload p;
        p.embeds_json = arr;
        auto result = f.client().deliver(endpoint(), p, fast_policy());
        REQUIRE(result.delivered());
        const auto doc = JsonValue::parse(f.transport->requests()[0].multipart[0].content);
        CHECK(doc["embeds"].size() == 10);
    }
}

TEST_CASE("DeliveryClient: source files are snapshotted and cleaned up", "[delivery][payload]") {
    TmpDir staging("delivery_staging");
    TmpDir src("delivery_src");
    {
        std::ofstream(src.path / "frame.png") << "pixels";
    }

    Fixture f;
    f.config.staging_dir = staging.path.string();
    f.transport->set_fallback(MockHttpTransport::status(204));

    WebhookPayload payload;
    payload.attachments.push_back({"frame.png", "", "", (src.path / "frame.png").string()});

    auto result = f.client().deliver(endpoint(), payload, fast_policy());
    CHECK(result.delivered());
    const auto reqs = f.transport->requests();
    REQUIRE(reqs.size() == 1);
    CHECK(reqs[0].multipart[1].content == "pixels");
    CHECK(fs::is_empty(staging.path));
}

TEST_CASE("DeliveryClient: symlinked source file is refused", "[delivery][payload]") {
    TmpDir staging("delivery_link_staging");
    TmpDir src("delivery_link_src");
    {
        std::ofstream(src.path / "real.png") << "pixels";
    }
    fs::create_symlink(src.path / "real.png", src.path / "alias.png");

    Fixture f;
    f.config.staging_dir = staging.path.string();

    WebhookPayload payload;
    payload.attachments.push_back({"alias.png", "", "", (src.path / "alias.png").string()});

    auto result = f.client().deliver(endpoint(), payload, fast_policy());
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::SYMLINK_ERROR);
    CHECK(f.transport->send_count() == 0);
}

TEST_CASE("DeliveryClient: workflow attachment is sanitized", "[delivery][payload]") {
    Fixture f;
    f.transport->set_fallback(MockHttpTransport::status(204));

    WebhookPayload payload = text("with workflow");
    payload.workflow_json =
        R"({"nodes":[{"type":"DiscordSendSaveImage","inputs":{"webhook_url":")" + kUrl + R"("}}]})";

    auto result = f.client().deliver(endpoint(), payload, fast_policy());
    REQUIRE(result.delivered());
    const auto reqs = f.transport->requests();
    REQUIRE(reqs[0].multipart.size() == 2);
    CHECK(reqs[0].multipart[1].filename == "workflow.json");
    CHECK_FALSE(contains(reqs[0].multipart[1].content, kToken));
    CHECK_FALSE(contains(reqs[0].multipart[1].content, "api/webhooks"));
}

// ============================================================================
// CDN manifest
// ============================================================================

TEST_CASE("DeliveryClient: 204 yields no CDN data and no manifest", "[delivery][manifest]") {
    Fixture f;
    f.config.send_cdn_manifest = true;
    f.transport->set_fallback(MockHttpTransport::status(204));

    auto result = f.client().deliver(endpoint(), with_files(1), fast_policy());
    CHECK(result.delivered());
    CHECK(result.cdn_attachments.empty());
    CHECK_FALSE(result.manifest_delivered);
    CHECK(f.transport->send_count() == 1);
}

TEST_CASE("DeliveryClient: manifest sent once after all batches", "[delivery][manifest]") {
    Fixture f;
    f.config.send_cdn_manifest = true;
    f.transport->set_fallback(MockHttpTransport::status(200, kCdnBody));

    DeliveryLedger ledger;
    auto result = f.client().deliver(endpoint(), with_files(11), fast_policy(), nullptr, &ledger);
    CHECK(result.delivered());
    CHECK(result.manifest_delivered);
    CHECK(result.cdn_attachments.size() == 2);
    CHECK(f.transport->send_count() == 3);
    CHECK(ledger.size() == 1);

    const auto reqs = f.transport->requests();
    const auto& manifest = reqs.back();
    CHECK(manifest.url == kUrl);
    REQUIRE(manifest.multipart.size() == 2);
    CHECK(manifest.multipart[1].filename.starts_with("cdn_urls-"));
    CHECK(manifest.multipart[1].filename.ends_with(".txt"));
    CHECK(contains(manifest.multipart[1].content,
                   "1. a.png: https://cdn.discordapp.com/attachments/1/2/a.png"));

    SECTION("repeated call with the same ledger skips the manifest") {
        auto again = f.client().deliver(endpoint(), with_files(11), fast_policy(), nullptr, &ledger);
        CHECK(again.delivered());
        CHECK_FALSE(again.manifest_delivered);
        CHECK(f.transport->send_count() == 5);
        CHECK(ledger.size() == 1);
    }
}

TEST_CASE("DeliveryClient: untrusted CDN entries never reach a manifest", "[delivery][manifest]") {
    Fixture f;
    f.config.send_cdn_manifest = true;
    f.transport->set_fallback(MockHttpTransport::status(200,
        R"({"id":"1","attachments":[{"filename":"a.png","url":"https://evil.example/a.png"}]})"));

    auto result = f.client().deliver(endpoint(), with_files(1), fast_policy());
    CHECK(result.delivered());
    CHECK_FALSE(result.manifest_delivered);
    CHECK(f.transport->send_count() == 1);
}

// ============================================================================
// Validation and scrubbing
// ============================================================================

TEST_CASE("DeliveryClient: invalid URL fails closed", "[delivery][validation]") {
    Fixture f;
    auto result = f.client().deliver_to_url("https://evil.com/api/webhooks/1/" + kToken,
                                            text("hello"), fast_policy());
    CHECK(result.status == DeliveryStatus::FAILED);
    CHECK(result.attempts == 0);
    REQUIRE(result.error.has_value());
    CHECK(result.error->kind == ErrorKind::VALIDATION_ERROR);
    CHECK(f.transport->send_count() == 0);
}

TEST_CASE("DeliveryClient: hand-built descriptor is re-validated", "[delivery][validation]") {
    Fixture f;
    EndpointDescriptor forged = endpoint();
    forged.canonical_url = "https://evil.com/api/webhooks/1/token";

    auto result = f.client().deliver(forged, text("hello"), fast_policy());
    CHECK(result.attempts == 0);
    CHECK(f.transport->send_count() == 0);
}

TEST_CASE("DeliveryClient: errors and logs never carry the token", "[delivery][scrub]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->set_fallback(MockHttpTransport::status(400,
        "bad request for " + kUrl + " token=" + kToken));

    std::vector<std::string> lines;
    Logger logger(SecretScrubber::shared_default(), Logger::Level::DEBUG,
                  [&](Logger::Level, const std::string& line) { lines.push_back(line); });
    DeliveryClient client(transport, DeliveryClient::Config{}, logger);

    auto result = client.deliver(endpoint(), text("see " + kUrl), fast_policy());
    REQUIRE(result.error.has_value());
    CHECK_FALSE(contains(result.error->message, kToken));
    CHECK_FALSE(lines.empty());
    for (const auto& line : lines) {
        CHECK_FALSE(contains(line, kToken));
    }

    // Message text is scrubbed before it leaves the process
    const auto reqs = transport->requests();
    REQUIRE_FALSE(reqs.empty());
    CHECK_FALSE(contains(reqs[0].multipart[0].content, kToken));
}

TEST_CASE("DeliveryClient: logger passed as a temporary stays usable", "[delivery][scrub]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->set_fallback(MockHttpTransport::status(400, "rejected " + kUrl));

    std::vector<std::string> lines;
    DeliveryClient client(transport, DeliveryClient::Config{},
                          Logger(std::make_shared<const SecretScrubber>(), Logger::Level::DEBUG,
                                 [&](Logger::Level, const std::string& line) { lines.push_back(line); }));

    auto result = client.deliver(endpoint(), text("hello"), fast_policy());
    CHECK(result.status == DeliveryStatus::FAILED);
    REQUIRE_FALSE(lines.empty());
    for (const auto& line : lines) {
        CHECK_FALSE(contains(line, kToken));
    }
}
