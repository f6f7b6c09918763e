#include "directory_builder.hpp"
#include <algorithm>
#include "common/file_naming.hpp"

namespace download_service {

std::vector<std::string> buildDirectory(
  const PathMetadata& metadata,
  bool flatten,
  const config::DirectoryConfig& cfg
) {
  std::vector<std::string> segments;
  if (flatten) {
    return segments;
  }

  bool omit_grade = false;
  if (auto stage = metadata.tags.find(cfg.stage_dimension); stage != metadata.tags.end()) {
    omit_grade = std::find(cfg.stages_without_grade.begin(), cfg.stages_without_grade.end(),
                           stage->second) != cfg.stages_without_grade.end();
  }

  for (const auto& dimension : cfg.tag_order) {
    if (omit_grade && dimension == cfg.grade_dimension) continue;
    auto tag = metadata.tags.find(dimension);
    if (tag == metadata.tags.end() || tag->second.empty()) continue;
    auto placeholder = cfg.tag_defaults.find(dimension);
    if (placeholder != cfg.tag_defaults.end() && placeholder->second == tag->second) continue;
    segments.push_back(sanitizeFilename(tag->second, cfg.max_segment_bytes));
  }
  if (segments.empty()) {
    segments.push_back(sanitizeFilename(cfg.unclassified_dir, cfg.max_segment_bytes));
  }

  std::vector<std::string> chapters;
  for (const auto& title : metadata.chapter_path) {
    chapters.push_back(sanitizeFilename(title, cfg.max_segment_bytes));
  }
  // the title goes into the file name, never the leaf directory
  if (!chapters.empty() && !metadata.resource_title.empty() &&
      chapters.back() == sanitizeFilename(metadata.resource_title, cfg.max_segment_bytes)) {
    chapters.pop_back();
  }
  segments.insert(segments.end(), chapters.begin(), chapters.end());
  return segments;
}

} // namespace download_service
