#include "delivery/message_builder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

namespace egress {

namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

// 30 -> "30.0", 29.97 -> "29.97"
std::string format_rate(double fps) {
    if (std::isfinite(fps) && fps == std::floor(fps)) {
        return std::format("{:.1f}", fps);
    }
    return std::format("{}", fps);
}

bool is_blank(std::optional<std::string_view> s) {
    return !s || utils::trim(std::string(*s)).empty();
}

} // anonymous namespace

std::string MessageBuilder::metadata_section(const MessageMetadata& meta,
                                             const SectionOptions& options) {
    std::vector<std::string> lines;

    if (options.include_date && meta.date) {
        lines.push_back(std::format("**Date:** {}", *meta.date));
    }
    if (options.include_time && meta.time) {
        lines.push_back(std::format("**Time:** {}", *meta.time));
    }
    if (options.include_dimensions && meta.dimensions) {
        lines.push_back(std::format("**Dimensions:** {}", *meta.dimensions));
    }
    if (meta.frame_rate) {
        lines.push_back(std::format("**Frame Rate:** {} fps", format_rate(*meta.frame_rate)));
    }
    if (options.include_format && meta.file_format && !meta.file_format->empty()) {
        lines.push_back(std::format("**Format:** {}", upper(*meta.file_format)));
    }

    if (lines.empty()) return {};

    std::string section = std::format("\n\n**{}:**\n", options.title);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) section += '\n';
        section += lines[i];
    }
    return section;
}

std::string MessageBuilder::prompt_section(std::optional<std::string_view> positive,
                                           std::optional<std::string_view> negative,
                                           std::string_view title) {
    const bool has_positive = !is_blank(positive);
    const bool has_negative = !is_blank(negative);
    if (!has_positive && !has_negative) return {};

    std::string section = std::format("\n\n**{}:**\n", title);
    if (has_positive) {
        section += std::format("**Positive:**\n```\n{}\n```\n", utils::trim(std::string(*positive)));
    }
    if (has_negative) {
        section += std::format("**Negative:**\n```\n{}\n```\n", utils::trim(std::string(*negative)));
    }
    return section;
}

std::string MessageBuilder::build(std::string_view base_message,
                                  std::string_view metadata,
                                  std::string_view prompts,
                                  const std::vector<std::string>& additional,
                                  size_t max_length) {
    std::string message(base_message);
    message += metadata;
    message += prompts;
    for (const auto& extra : additional) {
        message += extra;
    }
    return truncate(std::move(message), max_length);
}

std::string MessageBuilder::truncate(std::string message, size_t max_length) {
    if (message.size() <= max_length) return message;
    if (max_length <= kTruncationNotice.size()) {
        return std::string(kTruncationNotice.substr(0, max_length));
    }

    size_t cut = max_length - kTruncationNotice.size();
    // Never split a multi-byte UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    message.resize(cut);
    message += kTruncationNotice;
    return message;
}

std::string MessageBuilder::format_file_size(size_t size_bytes) {
    constexpr double kKiB = 1024.0;
    const auto b = static_cast<double>(size_bytes);
    if (size_bytes < 1024) return std::format("{} bytes", size_bytes);
    if (b < kKiB * kKiB) return std::format("{:.1f} KB", b / kKiB);
    if (b < kKiB * kKiB * kKiB) return std::format("{:.1f} MB", b / (kKiB * kKiB));
    return std::format("{:.2f} GB", b / (kKiB * kKiB * kKiB));
}

} // namespace egress
