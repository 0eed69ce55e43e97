#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace egress {

/// Descriptive fields for the metadata section of a chat message
struct MessageMetadata {
    std::optional<std::string> date;
    std::optional<std::string> time;
    std::optional<std::string> dimensions;   // "1920x1080"
    std::optional<double> frame_rate;
    std::optional<std::string> file_format;  // "png", "mp4", ...
};

/**
 * @brief Assembles chat message text within the platform length limit
 *
 * Sections are Markdown fragments that start with a blank line, so they can
 * be concatenated after any base message. Lengths are measured in bytes,
 * which never undercounts the platform's character limit; truncation backs
 * off to a UTF-8 boundary.
 */
class MessageBuilder {
public:
    static constexpr size_t kMaxMessageLength = 2000;
    static constexpr std::string_view kTruncationNotice = "\n...[Message truncated]";

    struct SectionOptions {
        bool include_date = true;
        bool include_time = true;
        bool include_dimensions = true;
        bool include_format = true;
        std::string title = "Information";
    };

    /// "\n\n**{title}:**\n" plus one "**Key:** value" line per present field; "" if none
    [[nodiscard]] static std::string metadata_section(const MessageMetadata& meta,
                                                      const SectionOptions& options);
    [[nodiscard]] static std::string metadata_section(const MessageMetadata& meta) {
        return metadata_section(meta, SectionOptions{});
    }

    /// Positive/negative prompts in code fences; "" when both are blank
    [[nodiscard]] static std::string prompt_section(std::optional<std::string_view> positive,
                                                    std::optional<std::string_view> negative,
                                                    std::string_view title = "Generation Prompts");

    [[nodiscard]] static std::string build(std::string_view base_message,
                                           std::string_view metadata,
                                           std::string_view prompts,
                                           const std::vector<std::string>& additional = {},
                                           size_t max_length = kMaxMessageLength);

    /// Cut to max_length including the truncation notice
    [[nodiscard]] static std::string truncate(std::string message,
                                              size_t max_length = kMaxMessageLength);

    /// "512 bytes", "1.5 KB", "3.2 MB", "1.25 GB"
    [[nodiscard]] static std::string format_file_size(size_t size_bytes);
};

} // namespace egress
