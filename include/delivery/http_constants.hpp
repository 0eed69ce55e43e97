#pragma once

#include <string>
#include <string_view>

namespace egress::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kUserAgentHeader = "User-Agent";
inline const std::string kAcceptHeader = "Accept";
inline const std::string kRetryAfterHeader = "Retry-After";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kGithubAccept = "application/vnd.github+json";
inline constexpr const char* kUserAgent = "secure-egress";

inline constexpr int kStatusOk = 200;
inline constexpr int kStatusNoContent = 204;
inline constexpr int kStatusUnauthorized = 401;
inline constexpr int kStatusForbidden = 403;
inline constexpr int kStatusNotFound = 404;
inline constexpr int kStatusTooManyRequests = 429;

} // namespace egress::http
