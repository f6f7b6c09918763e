#include "sync_classroom_extractor.hpp"
#include <set>
#include "common/logger.hpp"
#include "infrastructure/extractor_support.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

SyncClassroomExtractor::SyncClassroomExtractor(
  PlatformApi& api,
  ChapterTreeResolver& chapters,
  config::DirectoryConfig directory_config
)
  : api_(api), chapters_(chapters), directory_config_(std::move(directory_config)) {}

boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> SyncClassroomExtractor::extract(
  const std::string& resource_id,
  const ExtractOptions& options
) {
  common::logInfo("Extracting sync classroom " + resource_id, "SYNC");
  const std::map<std::string, std::string> params{{"resource_id", resource_id}};
  auto data = co_await api_.fetchJson("COURSE_SYNC", params);
  if (!data) co_return std::unexpected(data.error());
  if (!data->is_object()) {
    co_return std::unexpected(makeError(ErrorKind::ParseError, "Activity " + resource_id + " is not a JSON object"));
  }

  auto metadata = co_await coursePathMetadata(*data, chapters_);
  auto directory = buildDirectory(metadata, options.flatten, directory_config_);
  auto teachers = parseTeachers(data->value("teacher_list", nlohmann::json::array()));
  auto resources = parseCourseResources(*data);
  auto lessons = parseLessonRelations(*data);
  const auto activity_title = localizedTitle(*data, resource_id);

  std::vector<DownloadItem> items;
  std::set<size_t> emitted;
  size_t order = 0;
  for (const auto& lesson : lessons) {
    const auto& name = lesson.title.empty() ? activity_title : lesson.title;
    std::string teacher = directory_config_.unknown_teacher;
    if (!lesson.teacher_ids.empty()) {
      if (auto it = teachers.find(lesson.teacher_ids.front()); it != teachers.end()) teacher = it->second;
    }

    for (const auto& ref : lesson.refs) {
      for (auto index : ref.resolve(resources.size())) {
        // a resource shared by two lessons is downloaded once
        if (!emitted.insert(index).second) continue;
        const auto& resource = resources[index];

        std::optional<DownloadItem> item;
        if (resource.type_code == resource_types::kVideo) {
          item = makeVideoItem(resource, name, teacher, directory);
        } else if (isDocumentType(resource.type_code)) {
          item = makeDocumentItem(resource, name, teacher, directory);
        }
        if (!item) continue;
        item->id = resource_id + "#" + std::to_string(index);
        item->resource_kind = ResourceKind::SyncClassroom;
        item->api_order = order++;
        items.push_back(std::move(*item));
      }
    }
  }

  sortItems(items);
  common::logInfo("Sync classroom " + resource_id + ": " + std::to_string(items.size()) + " items", "SYNC");
  co_return items;
}

} // namespace download_service
