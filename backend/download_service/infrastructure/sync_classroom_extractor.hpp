#pragma once
#include <string>
#include "common/config/config.hpp"
#include "domain/resource_extractor.hpp"
#include "infrastructure/chapter_tree_resolver.hpp"
#include "infrastructure/platform_api.hpp"

namespace download_service {

// Synchronized classroom activities. Resources are grouped by lesson and
// named after the lesson rather than the activity.
class SyncClassroomExtractor : public ResourceExtractor {
public:
  SyncClassroomExtractor(PlatformApi& api, ChapterTreeResolver& chapters, config::DirectoryConfig directory_config);

  ResourceKind kind() const override { return ResourceKind::SyncClassroom; }

  boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> extract(
    const std::string& resource_id,
    const ExtractOptions& options
  ) override;

private:
  PlatformApi& api_;
  ChapterTreeResolver& chapters_;
  config::DirectoryConfig directory_config_;
};

} // namespace download_service
