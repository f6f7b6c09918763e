#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "infrastructure/platform_api.hpp"

namespace download_service {

// Looks up chapter titles from the root of a chapter tree down to a lesson
// node. Trees are fetched once per id and kept for the process.
class ChapterTreeResolver {
public:
  explicit ChapterTreeResolver(PlatformApi& api) : api_(api) {}

  // chapter_path is the "a/b/c" string from chapter_paths; its last id is
  // the target. An unknown tree or node yields an empty path.
  boost::asio::awaitable<std::vector<std::string>> chapterTitles(
    const std::string& tree_id,
    const std::string& chapter_path
  );

  size_t cachedTrees() const { return cache_.size(); }

  static std::optional<std::vector<std::string>> findPath(const nlohmann::json& nodes, const std::string& target_id);

private:
  PlatformApi& api_;
  std::map<std::string, nlohmann::json> cache_;
};

} // namespace download_service
