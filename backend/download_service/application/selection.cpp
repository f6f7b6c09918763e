#include "selection.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <set>
#include "common/file_naming.hpp"

namespace download_service {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::optional<size_t> parseNumber(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace

std::vector<size_t> parseSelection(std::string_view selection, size_t total) {
  auto text = trim(selection);
  if (toLower(text) == "all") {
    std::vector<size_t> all(total);
    for (size_t i = 0; i < total; ++i) all[i] = i;
    return all;
  }

  std::set<size_t> indices;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto part = trim(text.substr(0, comma));
    text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
    if (part.empty()) continue;

    auto dash = part.find('-');
    if (dash != std::string_view::npos) {
      auto start = parseNumber(part.substr(0, dash));
      auto end = parseNumber(part.substr(dash + 1));
      if (!start || !end || *start == 0 || *end == 0) continue;
      auto [low, high] = std::minmax(*start, *end);
      for (size_t i = low; i <= high && i <= total; ++i) {
        indices.insert(i - 1);
      }
    } else if (auto number = parseNumber(part)) {
      if (*number > 0 && *number <= total) indices.insert(*number - 1);
    }
  }
  return {indices.begin(), indices.end()};
}

std::vector<std::string> parseExtensionList(std::string_view list) {
  std::vector<std::string> out;
  while (!list.empty()) {
    auto comma = list.find(',');
    auto part = trim(list.substr(0, comma));
    list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
    while (!part.empty() && part.front() == '.') part.remove_prefix(1);
    if (!part.empty()) out.push_back(toLower(part));
  }
  return out;
}

std::vector<DownloadItem> filterByExtensions(std::vector<DownloadItem> items, const std::vector<std::string>& extensions) {
  if (extensions.empty()) return items;
  std::erase_if(items, [&](const DownloadItem& item) {
    return std::find(extensions.begin(), extensions.end(), toLower(item.extension)) == extensions.end();
  });
  return items;
}

std::vector<DownloadItem> filterAudioFormat(std::vector<DownloadItem> items, const std::string& format) {
  auto wanted = toLower(format);
  if (wanted.empty() || wanted == "all") return items;
  std::erase_if(items, [&](const DownloadItem& item) {
    return item.media_kind == MediaKind::Audio && toLower(item.extension) != wanted;
  });
  return items;
}

} // namespace download_service
