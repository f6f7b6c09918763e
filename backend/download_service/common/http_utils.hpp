#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "domain/errors.hpp"
#include "domain/http_client.hpp"

namespace download_service {

// Thin wrappers over the libcurl URL and date helpers.
std::optional<std::string> resolveUrl(const std::string& base, const std::string& reference);
std::string appendQueryParam(const std::string& url, const std::string& key, const std::string& value);
std::optional<std::string> queryParam(const std::string& url, const std::string& key);
std::optional<std::string> urlPath(const std::string& url);
// Last path segment, percent-decoded.
std::string lastPathSegment(const std::string& url);
std::string percentDecode(std::string_view text);

// Retry-After as delta-seconds or HTTP-date; a date in the past yields zero.
std::optional<std::chrono::milliseconds> parseRetryAfter(
  const std::string& value,
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

// Error for a non-2xx response. 429 carries the parsed Retry-After.
Error responseError(const HttpResponse& response, const std::string& what);

// Replaces every "{name}" in pattern.
std::string fillTemplate(std::string pattern, const std::map<std::string, std::string>& values);

} // namespace download_service
