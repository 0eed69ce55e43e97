#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace egress {

/**
 * @brief CDN URL bookkeeping for delivered attachments
 *
 * Two text formats:
 *   manifest  "# Discord CDN URLs\n\n1. name: url\n..."
 *   archive   "# Discord CDN URLs\nLast updated: <ts>\n\n1. name: url\n..."
 *
 * Everything extracted from a webhook response is untrusted. filter_trusted()
 * keeps only entries whose URL is on the CDN allow-list and whose filename
 * cannot break the line format; nothing else is ever written to an archive.
 */
class CdnManifest {
public:
    static constexpr std::string_view kTitle = "# Discord CDN URLs";
    static constexpr std::string_view kFollowUpMessage = "Discord CDN URLs for the uploaded files:";
    static constexpr std::string_view kFilenamePrefix = "cdn_urls";
    static constexpr size_t kMaxUrlLength = 2048;
    static constexpr size_t kMaxFilenameLength = 255;

    /// (filename, url) pairs from a webhook response body; `.json` files skipped
    [[nodiscard]] static std::vector<CdnAttachment> extract(std::string_view response_body,
                                                            bool exclude_json = true);

    [[nodiscard]] static bool is_trusted_cdn_url(std::string_view url);
    [[nodiscard]] static bool is_safe_filename(std::string_view filename);

    /// Entries that pass both checks, in order; `dropped` receives the reject count
    [[nodiscard]] static std::vector<CdnAttachment> filter_trusted(
        const std::vector<CdnAttachment>& entries, size_t* dropped = nullptr);

    [[nodiscard]] static std::string render_manifest(const std::vector<CdnAttachment>& entries);

    /// "cdn_urls-<uuid>.txt"
    [[nodiscard]] static std::string manifest_filename();

    /// Order-sensitive SHA-256 over the entries, used as the ledger key
    [[nodiscard]] static std::string fingerprint(const std::vector<CdnAttachment>& entries);

    // ========================================================================
    // Archive file
    // ========================================================================

    /// Entries from "N. name: https://...cdn.discordapp.com..." lines
    [[nodiscard]] static std::vector<CdnAttachment> parse_archive(std::string_view content);

    /// Existing order kept; an incoming entry replaces the same filename in place
    [[nodiscard]] static std::vector<CdnAttachment> merge(std::vector<CdnAttachment> existing,
                                                          const std::vector<CdnAttachment>& incoming);

    [[nodiscard]] static std::string render_archive(const std::vector<CdnAttachment>& entries,
                                                    std::string_view timestamp);

    [[nodiscard]] static std::string default_commit_message(std::string_view timestamp);
};

} // namespace egress
