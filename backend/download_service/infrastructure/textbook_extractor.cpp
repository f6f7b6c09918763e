#include "textbook_extractor.hpp"
#include <algorithm>
#include <cstdio>
#include "application/directory_builder.hpp"
#include "common/file_naming.hpp"
#include "common/http_utils.hpp"
#include "common/logger.hpp"
#include "infrastructure/extractor_support.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

namespace {

std::string stemOf(const std::string& file_name) {
  auto dot = file_name.find_last_of('.');
  return dot == std::string::npos || dot == 0 ? file_name : file_name.substr(0, dot);
}

std::string extensionOf(const std::string& file_name) {
  auto dot = file_name.find_last_of('.');
  return dot == std::string::npos || dot == 0 ? std::string() : toLower(file_name.substr(dot + 1));
}

size_t digitCount(size_t value) {
  size_t digits = 1;
  while (value >= 10) {
    value /= 10;
    ++digits;
  }
  return digits;
}

} // namespace

TextbookExtractor::TextbookExtractor(PlatformApi& api, config::DirectoryConfig directory_config)
  : api_(api), directory_config_(std::move(directory_config)) {}

std::string TextbookExtractor::pdfFileName(const std::string& url, const std::string& title) {
  auto name = lastPathSegment(url);
  if (name.empty() || isGenericPdfName(name)) {
    return sanitizeFilename(title + ".pdf");
  }
  return sanitizeFilename(name);
}

boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> TextbookExtractor::extract(
  const std::string& resource_id,
  const ExtractOptions& options
) {
  common::logInfo("Extracting textbook " + resource_id, "TEXTBOOK");
  const std::map<std::string, std::string> params{{"resource_id", resource_id}};
  auto data = co_await api_.fetchJson("TEXTBOOK_DETAILS", params);
  if (!data) co_return std::unexpected(data.error());
  if (!data->is_object()) {
    co_return std::unexpected(makeError(ErrorKind::ParseError, "Textbook " + resource_id + " is not a JSON object"));
  }

  PathMetadata metadata;
  metadata.resource_title = localizedTitle(*data, resource_id);
  if (data->contains("tag_list")) metadata.tags = parseTags((*data)["tag_list"]);
  auto directory = buildDirectory(metadata, options.flatten, directory_config_);
  auto update_time = stringField(*data, "update_time");

  std::vector<DownloadItem> items;
  size_t order = 0;
  for (const auto& ti_item : parseTiItems(*data)) {
    // ti_file_flag varies between uploads; the format tag does not
    if (toLower(ti_item.format) != "pdf") continue;
    auto url = ti_item.firstStorage();
    if (!url) continue;

    auto file_name = pdfFileName(*url, metadata.resource_title);
    DownloadItem item;
    item.id = resource_id + "#pdf" + std::to_string(order);
    item.resource_kind = ResourceKind::Textbook;
    item.media_kind = MediaKind::Document;
    item.title = metadata.resource_title;
    item.url = *url;
    item.expected_size = ti_item.size;
    item.expected_md5 = ti_item.md5;
    item.directory = directory;
    item.base_name = stemOf(file_name);
    item.extension = extensionOf(file_name).empty() ? "pdf" : extensionOf(file_name);
    item.update_time = update_time;
    item.api_order = order++;
    items.push_back(std::move(item));
  }

  auto audio_directory = directory;
  if (!options.flatten && !items.empty()) {
    audio_directory.push_back(sanitizeFilename(items.front().base_name + " - [audio]", directory_config_.max_segment_bytes));
  }
  auto audio = co_await audioItems(resource_id, std::move(audio_directory));
  if (!audio) {
    if (audio.error().kind == ErrorKind::Cancelled) co_return std::unexpected(audio.error());
    common::logWarn("No audio for textbook " + resource_id + ": " + describe(audio.error()), "TEXTBOOK");
  } else {
    items.insert(items.end(), audio->begin(), audio->end());
  }

  sortItems(items);
  common::logInfo("Textbook " + resource_id + ": " + std::to_string(items.size()) + " items", "TEXTBOOK");
  co_return items;
}

boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> TextbookExtractor::audioItems(
  const std::string& resource_id,
  std::vector<std::string> directory
) {
  const std::map<std::string, std::string> params{{"resource_id", resource_id}};
  auto data = co_await api_.fetchJson("TEXTBOOK_AUDIO", params);
  if (!data) {
    if (data.error().kind == ErrorKind::NotFound) co_return std::vector<DownloadItem>{};
    co_return std::unexpected(data.error());
  }
  if (!data->is_array()) {
    co_return std::unexpected(makeError(ErrorKind::ParseError, "Audio list of " + resource_id + " is not an array"));
  }

  std::vector<DownloadItem> items;
  const size_t width = digitCount(data->size());
  size_t position = 0;
  for (const auto& entry : *data) {
    ++position;
    char number[32];
    std::snprintf(number, sizeof(number), "%0*zu", static_cast<int>(width), position);
    auto title = localizedTitle(entry, "audio");
    auto base_name = sanitizeFilename("[" + std::string(number) + "] " + title);

    // one file per format; "source" masters are skipped and non-clip renditions preferred
    std::vector<std::string> formats;
    std::map<std::string, std::vector<TiItem>> by_format;
    for (auto& ti_item : parseTiItems(entry)) {
      if (ti_item.file_flag && *ti_item.file_flag == "source") continue;
      if (!ti_item.firstStorage() || ti_item.format.empty()) continue;
      auto format = toLower(ti_item.format);
      if (!by_format.count(format)) formats.push_back(format);
      by_format[format].push_back(std::move(ti_item));
    }

    for (const auto& format : formats) {
      const auto& group = by_format[format];
      auto best = std::find_if(group.begin(), group.end(), [](const TiItem& ti) {
        return ti.file_flag && ti.file_flag->find("clip") == std::string::npos;
      });
      const auto& chosen = best != group.end() ? *best : group.front();

      DownloadItem item;
      item.id = resource_id + "#audio" + std::to_string(position) + "." + format;
      item.resource_kind = ResourceKind::Textbook;
      item.media_kind = MediaKind::Audio;
      item.title = title;
      item.url = *chosen.firstStorage();
      item.expected_size = chosen.size;
      item.expected_md5 = chosen.md5;
      item.directory = directory;
      item.base_name = base_name;
      item.extension = format;
      item.update_time = stringField(entry, "update_time");
      item.api_order = position - 1;
      items.push_back(std::move(item));
    }
  }
  co_return items;
}

} // namespace download_service
