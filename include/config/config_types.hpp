#pragma once

#include "delivery/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace egress {

// ============================================================================
// [delivery]
// ============================================================================

struct DeliveryConfig {
    std::string webhook_url;                 // usually "${EGRESS_WEBHOOK_URL}"
    std::optional<std::string> username;
    std::string staging_dir = "/tmp";
    uint32_t max_attachments_per_request = 10;
    uint32_t max_attachment_mb = 25;
    uint32_t max_message_length = 2000;
    bool collect_cdn_urls = true;
    bool send_cdn_manifest = false;
    uint32_t connection_timeout_s = 10;
    uint32_t read_timeout_s = 60;
    std::string ca_cert_path;
};

// ============================================================================
// [archive]
// ============================================================================

struct ArchiveConfig {
    bool enabled = false;
    std::string repository;                  // "owner/repo"
    std::string file_path = "cdn_urls.md";
    std::string token;                       // usually "${GITHUB_TOKEN}"
    std::string api_base = "https://api.github.com";
    std::string commit_message;
};

// ============================================================================
// [retry]
// ============================================================================

struct RetryConfig {
    uint32_t max_attempts = 3;
    uint32_t base_delay_ms = 1000;
    uint32_t max_delay_ms = 30000;
    uint32_t max_retry_after_ms = 60000;
    std::vector<int> retryable_status;       // empty = 429 and 5xx

    [[nodiscard]] RetryPolicy to_policy() const;
};

// ============================================================================
// [output]
// ============================================================================

struct OutputConfig {
    bool save_local = false;
    std::string directory = "output";
    bool overwrite = false;
};

// ============================================================================
// [logging]
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// [scrubber]
// ============================================================================

struct ScrubberPatternConfig {
    std::string name;
    std::string regex;
    std::string replacement = "[REDACTED]";
};

struct ScrubberConfig {
    std::vector<ScrubberPatternConfig> patterns;
};

// ============================================================================
// Top-level
// ============================================================================

struct EgressConfig {
    DeliveryConfig delivery;
    ArchiveConfig archive;
    RetryConfig retry;
    OutputConfig output;
    LoggingConfig logging;
    ScrubberConfig scrubber;
};

} // namespace egress
