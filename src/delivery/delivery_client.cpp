#include "delivery/delivery_client.hpp"
#include "core/base64.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "delivery/cdn_manifest.hpp"
#include "delivery/content_type.hpp"
#include "delivery/http_constants.hpp"
#include "delivery/message_builder.hpp"
#include "security/archive_validator.hpp"
#include "security/endpoint_validator.hpp"
#include "security/workflow_sanitizer.hpp"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <format>
#include <thread>

namespace egress {

namespace fs = std::filesystem;

namespace {

/// One file part ready for the wire
struct PreparedAttachment {
    std::string filename;
    std::string content_type;
    const std::string* bytes = nullptr;
};

bool is_success(int status) {
    return status >= 200 && status <= 299;
}

std::string clip(std::string_view s, size_t max_len) {
    if (s.size() <= max_len) return std::string(s);
    return std::string(s.substr(0, max_len)) + "...";
}

/// Scrub every string value (keys untouched) so the JSON stays well-formed
void scrub_strings(glz::json_t& node, const SecretScrubber& scrubber,
                   std::span<const std::string> secrets) {
    if (node.is_string()) {
        node = scrubber.scrub(node.get<std::string>(), secrets);
    } else if (node.is_array()) {
        for (auto& item : node.get_array()) scrub_strings(item, scrubber, secrets);
    } else if (node.is_object()) {
        for (auto& [key, value] : node.get_object()) scrub_strings(value, scrubber, secrets);
    }
}

std::string build_payload_json(const std::string* content,
                               const glz::json_t* embeds,
                               const std::optional<std::string>& username) {
    JsonValue doc;
    doc.raw() = glz::json_t::object_t{};
    auto& obj = doc.raw().get_object();
    if (content) obj["content"] = *content;
    if (embeds) obj["embeds"] = *embeds;
    if (username) obj["username"] = *username;
    return doc.dump();
}

} // anonymous namespace

DeliveryClient::DeliveryClient(std::shared_ptr<IHttpTransport> transport,
                               Config config,
                               const Logger& logger)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      logger_(logger),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

// ============================================================================
// Retry loop
// ============================================================================

bool DeliveryClient::pause(std::chrono::milliseconds delay, CancellationToken* cancel) const {
    if (cancel) {
        return cancel->wait_for(delay);
    }
    if (delay.count() > 0) sleeper_(delay);
    return false;
}

Result<HttpResponse> DeliveryClient::execute(const HttpRequest& request,
                                             const RetryPolicy& policy,
                                             CancellationToken* cancel,
                                             std::span<const std::string> secrets,
                                             std::string_view label,
                                             const StatusFilter& accept,
                                             uint32_t& attempts) const {
    using R = Result<HttpResponse>;
    const auto& scrubber = logger_.scrubber();

    std::string last_error;
    for (uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        if (cancel && cancel->is_cancelled()) {
            return R::error(ErrorKind::CANCELLED, std::format("{} cancelled", label));
        }

        ++attempts;
        auto res = transport_->send(request);
        std::optional<std::chrono::milliseconds> hint;

        if (res.is_error()) {
            const std::string detail = scrubber.scrub(res.error_message(), secrets);
            if (res.error_kind() != ErrorKind::TRANSIENT_NETWORK_ERROR) {
                return R::error(res.error_kind(), std::format("{} failed: {}", label, detail));
            }
            last_error = detail;
        } else {
            const HttpResponse& response = res.value();
            if (is_success(response.status) || (accept && accept(response.status))) {
                logger_.log(Logger::Level::DEBUG,
                    std::format("{} -> HTTP {} (attempt {})", label, response.status, attempt),
                    secrets);
                return res;
            }

            const std::string detail = std::format("HTTP {}: {}", response.status,
                scrubber.scrub(clip(response.body, config_.max_error_body), secrets));
            if (!policy.is_retryable(response.status)) {
                return R::error(RetryPolicy::classify_status(response.status),
                                std::format("{} rejected: {}", label, detail));
            }
            if (response.status == http::kStatusTooManyRequests) {
                hint = RetryPolicy::parse_retry_after(
                    response.header(http::kRetryAfterHeader), response.body);
            }
            last_error = detail;
        }

        if (attempt == policy.max_attempts) break;

        const auto delay = policy.delay_for(attempt, hint);
        logger_.log(Logger::Level::WARN,
            std::format("{} attempt {}/{} failed ({}), retrying in {}ms",
                        label, attempt, policy.max_attempts, last_error, delay.count()),
            secrets);
        if (pause(delay, cancel)) {
            return R::error(ErrorKind::CANCELLED, std::format("{} cancelled", label));
        }
    }

    return R::error(ErrorKind::EXHAUSTED_RETRIES_ERROR,
        std::format("{} failed after {} attempts: {}", label, policy.max_attempts, last_error));
}

void DeliveryClient::fail(DeliveryResult& result, ErrorKind kind, std::string_view message,
                          std::span<const std::string> secrets) const {
    EgressError err{kind, logger_.scrubber().scrub(message, secrets)};
    logger_.error(std::format("Delivery failed [{}]: {}", error_kind_to_string(kind), err.message));
    result.error = std::move(err);
}

// ============================================================================
// Destination A: chat webhook
// ============================================================================

DeliveryResult DeliveryClient::deliver_to_url(std::string_view raw_url,
                                              const WebhookPayload& payload,
                                              const RetryPolicy& policy,
                                              CancellationToken* cancel,
                                              DeliveryLedger* ledger) const {
    auto endpoint = EndpointValidator::validate(raw_url);
    if (endpoint.is_error()) {
        DeliveryResult result;
        fail(result, endpoint.error_kind(), endpoint.error_message(), {});
        return result;
    }
    return deliver(endpoint.value(), payload, policy, cancel, ledger);
}

DeliveryResult DeliveryClient::deliver(const EndpointDescriptor& endpoint,
                                       const WebhookPayload& payload,
                                       const RetryPolicy& policy,
                                       CancellationToken* cancel,
                                       DeliveryLedger* ledger) const {
    DeliveryResult result;
    const auto& scrubber = logger_.scrubber();

    // The descriptor may have been assembled by hand: trust only a re-parse
    auto checked = EndpointValidator::validate(endpoint.canonical_url);
    if (checked.is_error()) {
        fail(result, checked.error_kind(), checked.error_message(), {});
        return result;
    }
    const EndpointDescriptor& ep = checked.value();
    const std::vector<std::string> secrets{ep.token};

    if (const auto problem = policy.validate(); !problem.empty()) {
        fail(result, ErrorKind::VALIDATION_ERROR, std::format("Invalid retry policy: {}", problem), secrets);
        return result;
    }

    // ===== Attachments =====

    std::vector<ScopedTempFile> snapshots;   // removed on every return path
    std::deque<std::string> owned_bytes;
    std::vector<PreparedAttachment> files;
    files.reserve(payload.attachments.size() + 1);

    for (size_t i = 0; i < payload.attachments.size(); ++i) {
        const Attachment& a = payload.attachments[i];
        const std::string filename = a.filename.empty()
            ? std::format("attachment_{}", i)
            : scrubber.scrub(a.filename, secrets);

        const auto skip_oversize = [&](size_t size) {
            logger_.warn(std::format("Skipping attachment '{}': {} exceeds the {} limit",
                filename, MessageBuilder::format_file_size(size),
                MessageBuilder::format_file_size(config_.max_attachment_bytes)));
        };

        const std::string* bytes = &a.bytes;
        if (a.source_path) {
            // Size gate before copying; symlinks are left to stage_snapshot
            std::error_code ec;
            if (fs::is_regular_file(fs::symlink_status(*a.source_path, ec))) {
                const auto size = fs::file_size(*a.source_path, ec);
                if (!ec && size > config_.max_attachment_bytes) {
                    skip_oversize(static_cast<size_t>(size));
                    continue;
                }
            }

            auto snap = writer_.stage_snapshot(config_.staging_dir, *a.source_path);
            if (snap.is_error()) {
                fail(result, snap.error_kind(),
                     std::format("Cannot stage attachment '{}': {}", filename, snap.error_message()),
                     secrets);
                return result;
            }
            snapshots.push_back(std::move(snap.value()));

            // The source may have grown between the size gate and the copy
            const auto staged = fs::file_size(snapshots.back().path(), ec);
            if (!ec && staged > config_.max_attachment_bytes) {
                skip_oversize(static_cast<size_t>(staged));
                continue;
            }

            auto data = SecureFileWriter::read_file(snapshots.back().path(), config_.max_attachment_bytes);
            if (data.is_error()) {
                fail(result, data.error_kind(),
                     std::format("Cannot read attachment '{}': {}", filename, data.error_message()),
                     secrets);
                return result;
            }
            owned_bytes.push_back(std::move(data.value()));
            bytes = &owned_bytes.back();
        }

        if (bytes->size() > config_.max_attachment_bytes) {
            skip_oversize(bytes->size());
            continue;
        }

        files.push_back({filename,
                         a.content_type.empty() ? content_type_for(filename) : a.content_type,
                         bytes});
    }

    if (payload.workflow_json) {
        const WorkflowSanitizer sanitizer(scrubber);
        owned_bytes.push_back(sanitizer.sanitize_text(*payload.workflow_json));
        files.push_back({config_.workflow_filename, "application/json", &owned_bytes.back()});
    }

    // ===== Message text and embeds =====

    // Bound the scrub input to a window that still covers max_message_length
    // after percent-decoding (3 bytes per escape); the cut tail is marked
    const size_t scrub_window = config_.max_message_length * 4;
    std::string content;
    if (payload.message.size() > scrub_window) {
        content = scrubber.scrub(std::string_view(payload.message).substr(0, scrub_window), secrets);
        content += MessageBuilder::kTruncationNotice;
    } else {
        content = scrubber.scrub(payload.message, secrets);
    }
    content = MessageBuilder::truncate(std::move(content), config_.max_message_length);

    std::optional<glz::json_t> embeds;
    if (payload.embeds_json) {
        JsonValue parsed;
        try {
            parsed = JsonValue::parse(*payload.embeds_json);
        } catch (const JsonValue::parse_error&) {
            fail(result, ErrorKind::VALIDATION_ERROR, "embeds_json is not valid JSON", secrets);
            return result;
        }
        if (!parsed.is_array()) {
            fail(result, ErrorKind::VALIDATION_ERROR, "embeds_json must be a JSON array", secrets);
            return result;
        }
        auto& arr = parsed.raw().get_array();
        if (arr.size() > config_.max_embeds) {
            logger_.warn(std::format("Dropping {} embeds beyond the limit of {}",
                                     arr.size() - config_.max_embeds, config_.max_embeds));
            arr.resize(config_.max_embeds);
        }
        scrub_strings(parsed.raw(), scrubber, secrets);
        if (!arr.empty()) embeds = parsed.raw();
    }

    if (content.empty() && !embeds && files.empty()) {
        fail(result, ErrorKind::VALIDATION_ERROR, "Nothing to deliver", secrets);
        return result;
    }

    std::optional<std::string> username;
    if (payload.username) username = scrubber.scrub(*payload.username, secrets);

    // ===== Batched requests =====

    const size_t per_request = std::max<size_t>(1, config_.max_attachments_per_request);
    const size_t batches = files.empty() ? 1 : (files.size() + per_request - 1) / per_request;
    result.requests_total = static_cast<uint32_t>(batches);

    const std::string url = config_.collect_cdn_urls ? ep.canonical_url + "?wait=true"
                                                     : ep.canonical_url;
    logger_.info(std::format("Delivering {} file(s) in {} request(s) to {}",
                             files.size(), batches, ep.redacted()));

    for (size_t b = 0; b < batches; ++b) {
        HttpRequest request;
        request.method = "POST";
        request.url = url;
        request.headers.emplace_back(http::kUserAgentHeader, http::kUserAgent);

        const bool first = (b == 0);
        request.multipart.push_back({"payload_json",
            build_payload_json(first && !content.empty() ? &content : nullptr,
                               first && embeds ? &*embeds : nullptr,
                               username),
            "", http::kJsonContentType});

        const size_t begin = b * per_request;
        const size_t end = std::min(files.size(), begin + per_request);
        for (size_t i = begin; i < end; ++i) {
            request.multipart.push_back({std::format("files[{}]", i - begin),
                                         *files[i].bytes, files[i].filename, files[i].content_type});
        }

        const std::string label = std::format("Webhook request {}/{}", b + 1, batches);
        auto res = execute(request, policy, cancel, secrets, label, {}, result.attempts);
        if (res.is_error()) {
            fail(result, res.error_kind(), res.error_message(), secrets);
            break;
        }

        ++result.requests_delivered;
        const HttpResponse& response = res.value();
        if (response.status == http::kStatusOk && !response.body.empty()) {
            try {
                const auto doc = JsonValue::parse(response.body);
                const auto id = doc.string_or("id", "");
                if (!id.empty()) result.remote_ids.push_back(id);
            } catch (const JsonValue::parse_error&) {
                logger_.debug("Webhook response body is not JSON");
            }
            for (auto& entry : CdnManifest::extract(response.body)) {
                result.cdn_attachments.push_back(std::move(entry));
            }
        }
    }

    if (result.requests_delivered == result.requests_total) {
        result.status = DeliveryStatus::DELIVERED;
    } else if (result.requests_delivered > 0) {
        result.status = DeliveryStatus::PARTIALLY_DELIVERED;
    } else {
        result.status = DeliveryStatus::FAILED;
    }

    // ===== Follow-up manifest (once, after every batch) =====

    if (config_.send_cdn_manifest && result.delivered() && !result.cdn_attachments.empty()) {
        DeliveryLedger local_ledger;
        DeliveryLedger& effective = ledger ? *ledger : local_ledger;
        size_t dropped = 0;
        const auto trusted = CdnManifest::filter_trusted(result.cdn_attachments, &dropped);
        if (dropped > 0) {
            logger_.warn(std::format("Ignoring {} CDN entries that failed validation", dropped));
        }
        if (!trusted.empty()) {
            result.manifest_delivered = send_manifest(ep, trusted, policy, cancel, effective,
                                                      secrets, result.attempts);
        }
    }

    if (result.delivered()) {
        logger_.info(std::format("Delivered {} request(s) in {} attempt(s)",
                                 result.requests_delivered, result.attempts));
    }
    return result;
}

bool DeliveryClient::send_manifest(const EndpointDescriptor& endpoint,
                                   const std::vector<CdnAttachment>& entries,
                                   const RetryPolicy& policy,
                                   CancellationToken* cancel,
                                   DeliveryLedger& ledger,
                                   std::span<const std::string> secrets,
                                   uint32_t& attempts) const {
    const std::string fp = CdnManifest::fingerprint(entries);
    if (ledger.contains(fp)) {
        logger_.debug("CDN manifest already delivered, skipping");
        return false;
    }

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint.canonical_url;
    request.headers.emplace_back(http::kUserAgentHeader, http::kUserAgent);

    const std::string message(CdnManifest::kFollowUpMessage);
    request.multipart.push_back({"payload_json", build_payload_json(&message, nullptr, std::nullopt),
                                 "", http::kJsonContentType});
    request.multipart.push_back({"files[0]", CdnManifest::render_manifest(entries),
                                 CdnManifest::manifest_filename(), "text/plain"});

    auto res = execute(request, policy, cancel, secrets, "CDN manifest", {}, attempts);
    if (res.is_error()) {
        logger_.log(Logger::Level::WARN,
            std::format("CDN manifest not delivered: {}", res.error_message()), secrets);
        return false;
    }
    ledger.record(fp);
    return true;
}

// ============================================================================
// Destination B: repository content API
// ============================================================================

DeliveryResult DeliveryClient::deliver(const ArchiveTarget& target,
                                       const ArchiveUpdate& update,
                                       const std::string& credential,
                                       const RetryPolicy& policy,
                                       CancellationToken* cancel) const {
    DeliveryResult result;
    result.requests_total = 1;
    const std::vector<std::string> secrets{credential};

    auto checked = ArchiveValidator::validate(target.owner_repo(), target.file_path);
    if (checked.is_error()) {
        fail(result, checked.error_kind(), checked.error_message(), secrets);
        return result;
    }
    const ArchiveTarget& t = checked.value();

    if (credential.empty()) {
        fail(result, ErrorKind::AUTH_ERROR, "Missing repository access token", {});
        return result;
    }
    if (const auto problem = policy.validate(); !problem.empty()) {
        fail(result, ErrorKind::VALIDATION_ERROR, std::format("Invalid retry policy: {}", problem), secrets);
        return result;
    }

    size_t dropped = 0;
    const auto entries = CdnManifest::filter_trusted(update.entries, &dropped);
    if (dropped > 0) {
        logger_.warn(std::format("Ignoring {} CDN entries that failed validation", dropped));
    }
    if (entries.empty()) {
        fail(result, ErrorKind::VALIDATION_ERROR, "No CDN URLs to update", secrets);
        return result;
    }

    const std::string url = std::format("{}/repos/{}/{}/contents/{}",
                                        config_.archive_api_base, t.owner, t.repo, t.file_path);
    const auto with_headers = [&](HttpRequest& req) {
        req.headers.emplace_back(http::kAuthorizationHeader,
                                 std::string(http::kBearerPrefix) + credential);
        req.headers.emplace_back(http::kAcceptHeader, http::kGithubAccept);
        req.headers.emplace_back(http::kUserAgentHeader, http::kUserAgent);
    };

    // ===== Fetch current content =====

    HttpRequest get;
    get.method = "GET";
    get.url = url;
    with_headers(get);

    const auto absent_ok = [](int status) { return status == http::kStatusNotFound; };
    auto current = execute(get, policy, cancel, secrets, "Archive fetch", absent_ok, result.attempts);
    if (current.is_error()) {
        fail(result, current.error_kind(), current.error_message(), secrets);
        return result;
    }

    std::optional<std::string> sha;
    std::vector<CdnAttachment> existing;
    if (current.value().status != http::kStatusNotFound) {
        try {
            const auto doc = JsonValue::parse(current.value().body);
            const auto s = doc.string_or("sha", "");
            if (!s.empty()) sha = s;
            const auto encoded = doc.string_or("content", "");
            if (!encoded.empty()) {
                existing = CdnManifest::parse_archive(base64::decode(encoded));
            }
        } catch (const JsonValue::parse_error&) {
            fail(result, ErrorKind::VALIDATION_ERROR, "Archive fetch returned malformed JSON", secrets);
            return result;
        }
    }

    // Previously archived lines are as untrusted as new ones
    const auto merged = CdnManifest::merge(CdnManifest::filter_trusted(existing), entries);

    const std::string timestamp = utils::format_local_datetime(utils::now());
    const std::string commit_message = logger_.scrubber().scrub(
        update.commit_message.empty() ? CdnManifest::default_commit_message(timestamp)
                                      : update.commit_message,
        secrets);

    JsonValue body;
    body.raw() = glz::json_t::object_t{};
    auto& obj = body.raw().get_object();
    obj["message"] = commit_message;
    obj["content"] = base64::encode(CdnManifest::render_archive(merged, timestamp));
    if (sha) obj["sha"] = *sha;

    // ===== Write back =====

    HttpRequest put;
    put.method = "PUT";
    put.url = url;
    put.body = body.dump();
    put.content_type = http::kJsonContentType;
    with_headers(put);

    auto written = execute(put, policy, cancel, secrets, "Archive update", {}, result.attempts);
    if (written.is_error()) {
        fail(result, written.error_kind(), written.error_message(), secrets);
        return result;
    }

    try {
        const auto doc = JsonValue::parse(written.value().body);
        const auto commit_sha = doc["commit"].string_or("sha", "");
        if (!commit_sha.empty()) result.remote_ids.push_back(commit_sha);
    } catch (const JsonValue::parse_error&) {
        logger_.debug("Archive update response body is not JSON");
    }

    result.requests_delivered = 1;
    result.cdn_attachments = entries;
    result.status = DeliveryStatus::DELIVERED;
    logger_.info(std::format("Archived {} CDN URL(s) to {}:{}", entries.size(), t.owner_repo(), t.file_path));
    return result;
}

} // namespace egress
