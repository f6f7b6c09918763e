#include "chapter_tree_resolver.hpp"
#include "common/logger.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

std::optional<std::vector<std::string>> ChapterTreeResolver::findPath(const nlohmann::json& nodes, const std::string& target_id) {
  if (!nodes.is_array()) return std::nullopt;
  for (const auto& node : nodes) {
    auto title = stringField(node, "title");
    if (title.empty()) title = "未知章节";
    if (stringField(node, "id") == target_id) {
      return std::vector<std::string>{title};
    }
    if (node.is_object() && node.contains("child_nodes")) {
      if (auto below = findPath(node["child_nodes"], target_id)) {
        below->insert(below->begin(), title);
        return below;
      }
    }
  }
  return std::nullopt;
}

boost::asio::awaitable<std::vector<std::string>> ChapterTreeResolver::chapterTitles(
  const std::string& tree_id,
  const std::string& chapter_path
) {
  auto slash = chapter_path.find_last_of('/');
  auto target = slash == std::string::npos ? chapter_path : chapter_path.substr(slash + 1);
  if (tree_id.empty() || target.empty()) co_return std::vector<std::string>{};

  auto cached = cache_.find(tree_id);
  if (cached == cache_.end()) {
    const std::map<std::string, std::string> params{{"tree_id", tree_id}};
    auto tree = co_await api_.fetchJson("CHAPTER_TREE", params);
    if (!tree) {
      common::logWarn("Chapter tree " + tree_id + " unavailable: " + describe(tree.error()), "CHAPTER");
      co_return std::vector<std::string>{};
    }
    cached = cache_.emplace(tree_id, std::move(*tree)).first;
  } else {
    common::logDebug("Chapter tree cache hit: " + tree_id, "CHAPTER");
  }

  const auto& data = cached->second;
  const nlohmann::json* nodes = nullptr;
  if (data.is_object() && data.contains("child_nodes")) {
    nodes = &data["child_nodes"];
  } else if (data.is_array()) {
    nodes = &data;
  }
  if (!nodes) {
    common::logWarn("Chapter tree " + tree_id + " has an unknown shape", "CHAPTER");
    co_return std::vector<std::string>{};
  }

  auto path = findPath(*nodes, target);
  if (!path) {
    common::logWarn("Node " + target + " not found in chapter tree " + tree_id, "CHAPTER");
    co_return std::vector<std::string>{};
  }
  co_return *path;
}

} // namespace download_service
