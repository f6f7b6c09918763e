#pragma once
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "application/directory_builder.hpp"
#include "common/config/config.hpp"
#include "domain/download_item.hpp"
#include "infrastructure/chapter_tree_resolver.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

// Stable: video, then document, then audio; API order within a kind.
void sortItems(std::vector<DownloadItem>& items);

// Tags, chapter titles and title of a course-shaped response.
boost::asio::awaitable<PathMetadata> coursePathMetadata(const nlohmann::json& data, ChapterTreeResolver& chapters);

// "title - alias", without the separator when alias is empty.
std::string joinTitle(const std::string& title, const std::string& alias);

// Video item carrying every known rendition; the quality is settled later.
std::optional<DownloadItem> makeVideoItem(
  const CourseResource& resource,
  const std::string& display_title,
  const std::string& teacher,
  const std::vector<std::string>& directory
);

std::optional<DownloadItem> makeDocumentItem(
  const CourseResource& resource,
  const std::string& display_title,
  const std::string& teacher,
  const std::vector<std::string>& directory
);

} // namespace download_service
