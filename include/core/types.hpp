#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace egress {

// ============================================================================
// Destination A: chat webhook
// ============================================================================

enum class WebhookHost {
    PRIMARY_DOMAIN,    // discord.com
    ALTERNATE_DOMAIN   // discordapp.com
};

[[nodiscard]] inline const char* webhook_host_to_string(WebhookHost host) {
    switch (host) {
        case WebhookHost::PRIMARY_DOMAIN:   return "discord.com";
        case WebhookHost::ALTERNATE_DOMAIN: return "discordapp.com";
    }
    return "unknown";
}

/**
 * @brief A destination URL that passed EndpointValidator
 *
 * Only EndpointValidator fills these fields. Constructed once per send
 * call and never persisted. `raw_url`, `token` and `canonical_url` carry
 * the webhook credential: log `redacted()` instead.
 */
struct EndpointDescriptor {
    std::string raw_url;
    WebhookHost host = WebhookHost::PRIMARY_DOMAIN;
    std::string resource_id;     // numeric webhook id
    std::string token;           // webhook resource token (credential)
    std::string canonical_url;   // https://{host}/api/webhooks/{id}/{token}

    [[nodiscard]] std::string redacted() const {
        return std::string("https://") + webhook_host_to_string(host) +
               "/api/webhooks/" + resource_id + "/[REDACTED]";
    }
};

/**
 * @brief Binary part of a webhook message
 *
 * Either `bytes` holds the payload, or `source_path` names a local file the
 * delivery client snapshots before sending.
 */
struct Attachment {
    std::string filename;
    std::string content_type;    // empty = derive from extension
    std::string bytes;
    std::optional<std::string> source_path;
};

struct WebhookPayload {
    std::string message;                      // length-bounded by the client
    std::vector<Attachment> attachments;
    std::optional<std::string> embeds_json;   // JSON array of embed objects
    std::optional<std::string> workflow_json; // sanitized before upload
    std::optional<std::string> username;
};

// ============================================================================
// Destination B: repository content API
// ============================================================================

/**
 * @brief Validated (repository, file path) coordinates
 *
 * Only ArchiveValidator fills these fields.
 */
struct ArchiveTarget {
    std::string owner;
    std::string repo;
    std::string file_path;

    [[nodiscard]] std::string owner_repo() const { return owner + "/" + repo; }
};

/// (filename, url) pair echoed back by the webhook. Untrusted.
struct CdnAttachment {
    std::string filename;
    std::string url;

    bool operator==(const CdnAttachment&) const = default;
};

struct ArchiveUpdate {
    std::vector<CdnAttachment> entries;
    std::string commit_message;   // empty = "Update Discord CDN URLs - <timestamp>"
};

// ============================================================================
// Delivery Result
// ============================================================================

enum class DeliveryStatus {
    DELIVERED,
    PARTIALLY_DELIVERED,
    FAILED
};

[[nodiscard]] inline const char* delivery_status_to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::DELIVERED:           return "delivered";
        case DeliveryStatus::PARTIALLY_DELIVERED: return "partially_delivered";
        case DeliveryStatus::FAILED:              return "failed";
    }
    return "unknown";
}

/**
 * @brief Outcome of one deliver() call
 *
 * `remote_ids` and `cdn_attachments` are echoed by the remote side and are
 * untrusted: never use them as write targets or execution inputs without
 * re-validation.
 */
struct DeliveryResult {
    DeliveryStatus status = DeliveryStatus::FAILED;
    uint32_t attempts = 0;                  // HTTP attempts across all requests
    uint32_t requests_delivered = 0;
    uint32_t requests_total = 0;
    std::vector<std::string> remote_ids;
    std::vector<CdnAttachment> cdn_attachments;
    bool manifest_delivered = false;
    std::optional<EgressError> error;       // scrubbed

    [[nodiscard]] bool delivered() const { return status == DeliveryStatus::DELIVERED; }
};

// ============================================================================
// Filesystem
// ============================================================================

struct WriteIntent {
    std::string target_path;          // absolute, or relative to expected_parent_dir
    bool allow_overwrite = false;     // true = must overwrite an existing regular file
    std::string expected_parent_dir;
};

struct WrittenPath {
    std::string path;                 // final canonical location
    size_t bytes_written = 0;
    bool disambiguated = false;       // a suffixed name was chosen
};

} // namespace egress
