#include "extractor_support.hpp"
#include <algorithm>
#include "common/file_naming.hpp"

namespace download_service {

namespace {

int mediaOrder(MediaKind kind) {
  switch (kind) {
    case MediaKind::Video: return 0;
    case MediaKind::Document: return 1;
    case MediaKind::Audio: return 2;
  }
  return 3;
}

} // namespace

void sortItems(std::vector<DownloadItem>& items) {
  std::stable_sort(items.begin(), items.end(), [](const DownloadItem& a, const DownloadItem& b) {
    auto ka = mediaOrder(a.media_kind);
    auto kb = mediaOrder(b.media_kind);
    if (ka != kb) return ka < kb;
    return a.api_order < b.api_order;
  });
}

boost::asio::awaitable<PathMetadata> coursePathMetadata(const nlohmann::json& data, ChapterTreeResolver& chapters) {
  PathMetadata metadata;
  metadata.resource_title = localizedTitle(data);
  if (data.is_object() && data.contains("tag_list")) {
    metadata.tags = parseTags(data["tag_list"]);
  }

  std::string tree_id;
  std::string chapter_path;
  if (data.is_object()) {
    auto properties = data.find("custom_properties");
    if (properties != data.end() && properties->is_object()) {
      auto info = properties->find("teachingmaterial_info");
      if (info != properties->end()) tree_id = stringField(*info, "id");
    }
    auto paths = data.find("chapter_paths");
    if (paths != data.end() && paths->is_array() && !paths->empty() && paths->front().is_string()) {
      chapter_path = paths->front().get<std::string>();
    }
  }
  if (!tree_id.empty() && !chapter_path.empty()) {
    metadata.chapter_path = co_await chapters.chapterTitles(tree_id, chapter_path);
  }
  co_return metadata;
}

std::string joinTitle(const std::string& title, const std::string& alias) {
  if (alias.empty()) return title;
  return title + " - " + alias;
}

std::optional<DownloadItem> makeVideoItem(
  const CourseResource& resource,
  const std::string& display_title,
  const std::string& teacher,
  const std::vector<std::string>& directory
) {
  auto variants = videoVariants(resource.ti_items);
  if (variants.empty()) return std::nullopt;

  DownloadItem item;
  item.media_kind = MediaKind::Video;
  item.title = joinTitle(display_title, resource.alias);
  item.url = variants.front().manifest_url;
  item.expected_size = variants.front().estimated_size;
  item.variants = std::move(variants);
  item.directory = directory;
  // the quality tag is appended once a rendition is chosen
  item.base_name = sanitizeFilename(joinTitle(display_title, resource.alias) + " - [" + teacher + "]");
  item.extension = "ts";
  item.update_time = resource.update_time;
  item.api_order = resource.index;
  return item;
}

std::optional<DownloadItem> makeDocumentItem(
  const CourseResource& resource,
  const std::string& display_title,
  const std::string& teacher,
  const std::vector<std::string>& directory
) {
  auto ti_item = bestDocumentItem(resource.ti_items);
  if (!ti_item) return std::nullopt;

  DownloadItem item;
  item.media_kind = MediaKind::Document;
  item.title = joinTitle(display_title, resource.alias);
  item.url = *ti_item->firstStorage();
  item.expected_size = ti_item->size;
  item.expected_md5 = ti_item->md5;
  item.directory = directory;
  item.base_name = sanitizeFilename(joinTitle(display_title, resource.alias) + " - [" + teacher + "]");
  item.extension = ti_item->format.empty() ? "pdf" : toLower(ti_item->format);
  item.update_time = resource.update_time;
  item.api_order = resource.index;
  return item;
}

} // namespace download_service
