#include "course_extractor.hpp"
#include "common/logger.hpp"
#include "infrastructure/extractor_support.hpp"

namespace download_service {

namespace {

std::string namesFor(const std::vector<std::string>& ids, const std::map<std::string, std::string>& teachers) {
  std::string names;
  for (const auto& id : ids) {
    auto it = teachers.find(id);
    if (it == teachers.end()) continue;
    if (!names.empty()) names += ", ";
    names += it->second;
  }
  return names;
}

} // namespace

CourseExtractor::CourseExtractor(PlatformApi& api, ChapterTreeResolver& chapters, config::DirectoryConfig directory_config)
  : api_(api), chapters_(chapters), directory_config_(std::move(directory_config)) {}

std::map<size_t, std::string> CourseExtractor::teacherMap(
  const nlohmann::json& data,
  const std::vector<LessonRelation>& lessons,
  size_t total_resources
) {
  std::map<size_t, std::string> result;
  auto teachers = parseTeachers(data.value("teacher_list", nlohmann::json::array()));

  for (const auto& lesson : lessons) {
    auto names = namesFor(lesson.teacher_ids, teachers);
    if (names.empty()) continue;
    for (const auto& ref : lesson.refs) {
      for (auto index : ref.resolve(total_resources)) result[index] = names;
    }
  }
  if (!result.empty()) return result;

  if (auto props = data.find("custom_properties"); props != data.end() && props->is_object()) {
    if (auto list = props->find("lesson_teacher_ids"); list != props->end() && list->is_array()) {
      std::vector<std::string> ids;
      for (const auto& id : *list) {
        if (id.is_string()) ids.push_back(id.get<std::string>());
      }
      auto names = namesFor(ids, teachers);
      if (!names.empty()) {
        for (size_t i = 0; i < total_resources; ++i) result[i] = names;
      }
    }
  }
  return result;
}

boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> CourseExtractor::extract(
  const std::string& resource_id,
  const ExtractOptions& options
) {
  common::logInfo("Extracting course " + resource_id, "COURSE");
  const std::map<std::string, std::string> params{{"resource_id", resource_id}};
  auto data = co_await api_.fetchJson("COURSE_QUALITY", params);
  if (!data) co_return std::unexpected(data.error());
  if (!data->is_object()) {
    co_return std::unexpected(makeError(ErrorKind::ParseError, "Course " + resource_id + " is not a JSON object"));
  }

  auto metadata = co_await coursePathMetadata(*data, chapters_);
  auto directory = buildDirectory(metadata, options.flatten, directory_config_);
  auto resources = parseCourseResources(*data);
  auto teachers = teacherMap(*data, parseLessonRelations(*data), resources.size());

  std::vector<DownloadItem> items;
  for (const auto& resource : resources) {
    auto teacher_it = teachers.find(resource.index);
    const auto& teacher = teacher_it != teachers.end() ? teacher_it->second : directory_config_.unknown_teacher;

    std::optional<DownloadItem> item;
    if (resource.type_code == resource_types::kVideo) {
      item = makeVideoItem(resource, resource.title, teacher, directory);
    } else if (isDocumentType(resource.type_code)) {
      item = makeDocumentItem(resource, resource.title, teacher, directory);
    }
    if (!item) {
      common::logDebug("Skipping resource " + std::to_string(resource.index) + " (" + resource.type_code + ")", "COURSE");
      continue;
    }
    item->id = resource_id + "#" + std::to_string(resource.index);
    item->resource_kind = ResourceKind::Course;
    items.push_back(std::move(*item));
  }

  sortItems(items);
  common::logInfo("Course " + resource_id + ": " + std::to_string(items.size()) + " items", "COURSE");
  co_return items;
}

} // namespace download_service
