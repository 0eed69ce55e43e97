#pragma once

#include "core/utils.hpp"

#include <string>
#include <string_view>

namespace egress {

/// MIME type by file extension (case-insensitive); application/octet-stream otherwise
[[nodiscard]] inline std::string content_type_for(std::string_view filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string_view::npos) return "application/octet-stream";
    const std::string ext = utils::to_lower(filename.substr(dot + 1));

    if (ext == "png")                  return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif")                  return "image/gif";
    if (ext == "webp")                 return "image/webp";
    if (ext == "mp4")                  return "video/mp4";
    if (ext == "webm")                 return "video/webm";
    if (ext == "mov")                  return "video/quicktime";
    if (ext == "json")                 return "application/json";
    if (ext == "txt")                  return "text/plain";
    return "application/octet-stream";
}

} // namespace egress
