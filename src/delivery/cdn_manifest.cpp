#include "delivery/cdn_manifest.hpp"
#include "core/crypto.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace egress {

namespace {

constexpr std::array<std::string_view, 2> kTrustedCdnPrefixes = {
    "https://cdn.discordapp.com/",
    "https://media.discordapp.net/",
};

bool has_control_or_space(std::string_view s) {
    for (const char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7F) return true;
    }
    return false;
}

} // anonymous namespace

std::vector<CdnAttachment> CdnManifest::extract(std::string_view response_body, bool exclude_json) {
    std::vector<CdnAttachment> out;
    JsonValue doc;
    try {
        doc = JsonValue::parse(std::string(response_body));
    } catch (const JsonValue::parse_error&) {
        return out;
    }

    for (const auto& attachment : doc["attachments"].elements()) {
        const JsonValue filename = attachment["filename"];
        const JsonValue url = attachment["url"];
        if (!filename.is_string() || !url.is_string()) continue;

        auto name = filename.get<std::string>();
        if (exclude_json && name.ends_with(".json")) continue;
        out.push_back({std::move(name), url.get<std::string>()});
    }
    return out;
}

bool CdnManifest::is_trusted_cdn_url(std::string_view url) {
    if (url.size() > kMaxUrlLength || has_control_or_space(url)) return false;
    for (const auto prefix : kTrustedCdnPrefixes) {
        if (url.starts_with(prefix) && url.size() > prefix.size()) return true;
    }
    return false;
}

bool CdnManifest::is_safe_filename(std::string_view filename) {
    if (filename.empty() || filename.size() > kMaxFilenameLength) return false;
    for (const char c : filename) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) return false;
    }
    // ": " separates name and url in both line formats
    return filename.find(": ") == std::string_view::npos;
}

std::vector<CdnAttachment> CdnManifest::filter_trusted(const std::vector<CdnAttachment>& entries,
                                                       size_t* dropped) {
    std::vector<CdnAttachment> out;
    out.reserve(entries.size());
    size_t rejected = 0;
    for (const auto& e : entries) {
        if (is_safe_filename(e.filename) && is_trusted_cdn_url(e.url)) {
            out.push_back(e);
        } else {
            ++rejected;
        }
    }
    if (dropped) *dropped = rejected;
    return out;
}

std::string CdnManifest::render_manifest(const std::vector<CdnAttachment>& entries) {
    std::string content = std::format("{}\n\n", kTitle);
    for (size_t i = 0; i < entries.size(); ++i) {
        content += std::format("{}. {}: {}\n", i + 1, entries[i].filename, entries[i].url);
    }
    return content;
}

std::string CdnManifest::manifest_filename() {
    return std::format("{}-{}.txt", kFilenamePrefix, utils::generate_uuid());
}

std::string CdnManifest::fingerprint(const std::vector<CdnAttachment>& entries) {
    std::string material;
    for (const auto& e : entries) {
        material += e.filename;
        material += '\n';
        material += e.url;
        material += '\n';
    }
    return crypto::sha256_hex(material);
}

std::vector<CdnAttachment> CdnManifest::parse_archive(std::string_view content) {
    std::vector<CdnAttachment> out;
    for (auto line : utils::split(std::string(content), '\n')) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find(": https://") == std::string::npos ||
            line.find("cdn.discordapp.com") == std::string::npos) {
            continue;
        }

        const auto sep = line.find(": ");
        std::string name = line.substr(0, sep);
        std::string url = line.substr(sep + 2);

        // Drop the "N. " numbering
        if (const auto dot = name.find(". "); dot != std::string::npos) {
            name = name.substr(dot + 2);
        }
        out = merge(std::move(out), {{std::move(name), std::move(url)}});
    }
    return out;
}

std::vector<CdnAttachment> CdnManifest::merge(std::vector<CdnAttachment> existing,
                                              const std::vector<CdnAttachment>& incoming) {
    for (const auto& entry : incoming) {
        bool replaced = false;
        for (auto& current : existing) {
            if (current.filename == entry.filename) {
                current.url = entry.url;
                replaced = true;
                break;
            }
        }
        if (!replaced) existing.push_back(entry);
    }
    return existing;
}

std::string CdnManifest::render_archive(const std::vector<CdnAttachment>& entries,
                                        std::string_view timestamp) {
    std::string content = std::format("{}\nLast updated: {}\n\n", kTitle, timestamp);
    for (size_t i = 0; i < entries.size(); ++i) {
        content += std::format("{}. {}: {}\n", i + 1, entries[i].filename, entries[i].url);
    }
    return content;
}

std::string CdnManifest::default_commit_message(std::string_view timestamp) {
    return std::format("Update Discord CDN URLs - {}", timestamp);
}

} // namespace egress
