#include "extractor_factory.hpp"
#include "infrastructure/course_extractor.hpp"
#include "infrastructure/sync_classroom_extractor.hpp"
#include "infrastructure/textbook_extractor.hpp"

namespace download_service {

ExtractorMap makeExtractors(PlatformApi& api, ChapterTreeResolver& chapters, const config::DirectoryConfig& directory_config) {
  ExtractorMap extractors;
  extractors[ResourceKind::Textbook] = std::make_shared<TextbookExtractor>(api, directory_config);
  extractors[ResourceKind::Course] = std::make_shared<CourseExtractor>(api, chapters, directory_config);
  extractors[ResourceKind::SyncClassroom] = std::make_shared<SyncClassroomExtractor>(api, chapters, directory_config);
  return extractors;
}

} // namespace download_service
