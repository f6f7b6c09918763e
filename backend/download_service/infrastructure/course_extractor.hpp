#pragma once
#include <map>
#include <string>
#include "common/config/config.hpp"
#include "domain/resource_extractor.hpp"
#include "infrastructure/chapter_tree_resolver.hpp"
#include "infrastructure/platform_api.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

// Quality course pages (qualityCourse?courseId=...).
class CourseExtractor : public ResourceExtractor {
public:
  CourseExtractor(PlatformApi& api, ChapterTreeResolver& chapters, config::DirectoryConfig directory_config);

  ResourceKind kind() const override { return ResourceKind::Course; }

  boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> extract(
    const std::string& resource_id,
    const ExtractOptions& options
  ) override;

  // Resource index -> teacher names, from the lesson relations first, then
  // lesson_teacher_ids. Indices without an entry have no known teacher.
  static std::map<size_t, std::string> teacherMap(
    const nlohmann::json& data,
    const std::vector<LessonRelation>& lessons,
    size_t total_resources
  );

private:
  PlatformApi& api_;
  ChapterTreeResolver& chapters_;
  config::DirectoryConfig directory_config_;
};

} // namespace download_service
