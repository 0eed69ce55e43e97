#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "delivery/cancellation.hpp"
#include "delivery/delivery_ledger.hpp"
#include "delivery/http_transport.hpp"
#include "delivery/retry_policy.hpp"
#include "security/secret_scrubber.hpp"
#include "storage/secure_file_writer.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace egress {

/**
 * @brief Retrying HTTP delivery to the chat webhook and the repository content API
 *
 * Per request: Pending -> Attempting -> {Delivered | Retrying | Failed}.
 * Connection failures, 5xx and 429 are retried; 401/403 and other 4xx are
 * terminal. Every error placed in a DeliveryResult and every log line is
 * scrubbed with the call's credentials as known secrets.
 *
 * Attachment snapshots live in ScopedTempFiles owned by the call and are
 * removed on success, exhaustion and cancellation alike.
 *
 * One DeliveryClient may serve concurrent calls as long as the transport
 * does; there is no per-call state in the object.
 */
class DeliveryClient {
public:
    struct Config {
        std::string staging_dir = "/tmp";
        std::string archive_api_base = "https://api.github.com";
        size_t max_attachments_per_request = 10;
        size_t max_attachment_bytes = 25ULL * 1024 * 1024;
        size_t max_message_length = 2000;
        size_t max_embeds = 10;
        size_t max_error_body = 512;           // bytes of upstream body kept in errors
        bool collect_cdn_urls = true;          // POST with ?wait=true
        bool send_cdn_manifest = false;        // follow-up cdn_urls-<uuid>.txt
        std::string workflow_filename = "workflow.json";
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// `logger` is copied; the copy shares its scrubber
    DeliveryClient(std::shared_ptr<IHttpTransport> transport,
                   Config config,
                   const Logger& logger = Logger::null_logger());

    /**
     * @brief Send a payload to a validated webhook endpoint
     *
     * The descriptor is re-validated from its canonical URL before any
     * request. Attachments beyond max_attachments_per_request are batched
     * into further requests; the message text rides on the first one.
     *
     * @param ledger Shared duplicate-avoidance ledger; a call-local one is
     *        used when null
     */
    [[nodiscard]] DeliveryResult deliver(const EndpointDescriptor& endpoint,
                                         const WebhookPayload& payload,
                                         const RetryPolicy& policy,
                                         CancellationToken* cancel = nullptr,
                                         DeliveryLedger* ledger = nullptr) const;

    /**
     * @brief Merge CDN entries into an archive file in a repository
     *
     * GET contents (404 = new file), merge, then PUT with the previous sha.
     * Only entries that pass CdnManifest::filter_trusted() are written.
     * `credential` is sent as a Bearer token to the content API and never to
     * the webhook.
     */
    [[nodiscard]] DeliveryResult deliver(const ArchiveTarget& target,
                                         const ArchiveUpdate& update,
                                         const std::string& credential,
                                         const RetryPolicy& policy,
                                         CancellationToken* cancel = nullptr) const;

    /// Validate `raw_url` first; an invalid URL fails closed with zero attempts
    [[nodiscard]] DeliveryResult deliver_to_url(std::string_view raw_url,
                                                const WebhookPayload& payload,
                                                const RetryPolicy& policy,
                                                CancellationToken* cancel = nullptr,
                                                DeliveryLedger* ledger = nullptr) const;

    /// Replace the backoff sleep used when no CancellationToken is supplied (tests)
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    /// Accepted statuses end the retry loop successfully
    using StatusFilter = std::function<bool(int)>;

    [[nodiscard]] Result<HttpResponse> execute(const HttpRequest& request,
                                               const RetryPolicy& policy,
                                               CancellationToken* cancel,
                                               std::span<const std::string> secrets,
                                               std::string_view label,
                                               const StatusFilter& accept,
                                               uint32_t& attempts) const;

    /// Backoff wait; returns true if cancelled
    [[nodiscard]] bool pause(std::chrono::milliseconds delay, CancellationToken* cancel) const;

    [[nodiscard]] bool send_manifest(const EndpointDescriptor& endpoint,
                                     const std::vector<CdnAttachment>& entries,
                                     const RetryPolicy& policy,
                                     CancellationToken* cancel,
                                     DeliveryLedger& ledger,
                                     std::span<const std::string> secrets,
                                     uint32_t& attempts) const;

    void fail(DeliveryResult& result, ErrorKind kind, std::string_view message,
              std::span<const std::string> secrets) const;

    std::shared_ptr<IHttpTransport> transport_;
    Config config_;
    Logger logger_;
    SecureFileWriter writer_;
    Sleeper sleeper_;
};

} // namespace egress
