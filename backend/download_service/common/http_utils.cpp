#include "http_utils.hpp"
#include <cctype>
#include <ctime>
#include <memory>
#include <curl/curl.h>

namespace download_service {

namespace {

struct CurlUrlDeleter {
  void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
  void operator()(char* text) const { curl_free(text); }
};
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

CurlUrlPtr parseUrl(const std::string& url) {
  CurlUrlPtr handle(curl_url());
  if (!handle) return nullptr;
  if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
    return nullptr;
  }
  return handle;
}

std::optional<std::string> getPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
  char* raw = nullptr;
  if (curl_url_get(handle, part, &raw, flags) != CURLUE_OK || raw == nullptr) {
    return std::nullopt;
  }
  CurlString owned(raw);
  return std::string(owned.get());
}

} // namespace

std::optional<std::string> resolveUrl(const std::string& base, const std::string& reference) {
  auto handle = parseUrl(base);
  if (!handle) return std::nullopt;
  // a relative reference is resolved against the URL already held by the handle
  if (curl_url_set(handle.get(), CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }
  return getPart(handle.get(), CURLUPART_URL);
}

std::string appendQueryParam(const std::string& url, const std::string& key, const std::string& value) {
  auto handle = parseUrl(url);
  if (!handle) return url;
  auto pair = key + "=" + value;
  if (curl_url_set(handle.get(), CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE) != CURLUE_OK) {
    return url;
  }
  return getPart(handle.get(), CURLUPART_URL).value_or(url);
}

std::optional<std::string> queryParam(const std::string& url, const std::string& key) {
  auto handle = parseUrl(url);
  if (!handle) return std::nullopt;
  auto query = getPart(handle.get(), CURLUPART_QUERY);
  if (!query) return std::nullopt;

  std::string_view rest(*query);
  while (!rest.empty()) {
    auto amp = rest.find('&');
    auto pair = rest.substr(0, amp);
    auto eq = pair.find('=');
    if (pair.substr(0, eq) == key) {
      return eq == std::string_view::npos ? std::string() : percentDecode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) break;
    rest.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

std::optional<std::string> urlPath(const std::string& url) {
  auto handle = parseUrl(url);
  if (!handle) return std::nullopt;
  return getPart(handle.get(), CURLUPART_PATH);
}

std::string lastPathSegment(const std::string& url) {
  auto path = urlPath(url).value_or(url);
  auto slash = path.find_last_of('/');
  auto segment = slash == std::string::npos ? path : path.substr(slash + 1);
  return percentDecode(segment);
}

std::string percentDecode(std::string_view text) {
  int length = 0;
  char* raw = curl_easy_unescape(nullptr, text.data(), static_cast<int>(text.size()), &length);
  if (raw == nullptr) return std::string(text);
  CurlString owned(raw);
  return std::string(owned.get(), static_cast<size_t>(length));
}

std::optional<std::chrono::milliseconds> parseRetryAfter(
  const std::string& value,
  std::chrono::system_clock::time_point now
) {
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  if (begin == end) return std::nullopt;
  auto text = value.substr(begin, end - begin);

  bool all_digits = true;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      all_digits = false;
      break;
    }
  }
  if (all_digits) {
    if (text.size() > 9) return std::nullopt;
    return std::chrono::seconds(std::stol(text));
  }

  time_t when = curl_getdate(text.c_str(), nullptr);
  if (when == -1) return std::nullopt;
  auto target = std::chrono::system_clock::from_time_t(when);
  if (target <= now) return std::chrono::milliseconds(0);
  return std::chrono::duration_cast<std::chrono::milliseconds>(target - now);
}

Error responseError(const HttpResponse& response, const std::string& what) {
  auto error = makeError(classifyHttpStatus(response.status),
    "HTTP " + std::to_string(response.status) + " for " + what, response.status);
  if (response.status == 429) {
    if (auto value = response.header("retry-after")) {
      error.retry_after = parseRetryAfter(*value);
    }
  }
  return error;
}

std::string fillTemplate(std::string pattern, const std::map<std::string, std::string>& values) {
  for (const auto& [name, value] : values) {
    const auto placeholder = "{" + name + "}";
    size_t pos = 0;
    while ((pos = pattern.find(placeholder, pos)) != std::string::npos) {
      pattern.replace(pos, placeholder.size(), value);
      pos += value.size();
    }
  }
  return pattern;
}

} // namespace download_service
