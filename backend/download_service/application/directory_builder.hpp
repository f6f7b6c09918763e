#pragma once
#include <map>
#include <string>
#include <vector>
#include "common/config/config.hpp"

namespace download_service {

struct PathMetadata {
  std::map<std::string, std::string> tags;   // tag dimension id -> tag name
  std::vector<std::string> chapter_path;     // chapter titles, root first
  std::string resource_title;
};

// Pure: same metadata and flatten flag always give the same segments.
std::vector<std::string> buildDirectory(
  const PathMetadata& metadata,
  bool flatten,
  const config::DirectoryConfig& cfg
);

} // namespace download_service
