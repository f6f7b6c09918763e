#pragma once
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/download_item.hpp"
#include "domain/errors.hpp"

namespace download_service {

using json = nlohmann::json;

// Cross reference from a lesson or teacher relation into the resource list.
// The API sends either a path such as "$.relations.national_course_resource[0,2]"
// (or "[*]") or a bare index; both end up here.
struct ResourceRef {
  enum class Kind { All, Indices };
  Kind kind{Kind::Indices};
  std::vector<size_t> indices;

  // Indices that exist in a list of `total` resources, in reference order.
  std::vector<size_t> resolve(size_t total) const;
};

std::optional<ResourceRef> parseResourceRef(const json& value);
// Accepts an array of references or a single one.
std::vector<ResourceRef> parseResourceRefs(const json& value);

struct TiItem {
  std::string format;
  std::vector<std::string> storages;
  std::optional<std::string> md5;
  std::optional<uint64_t> size;
  std::optional<std::string> file_flag;
  std::map<std::string, std::string> requirements;

  std::optional<std::string> firstStorage() const;
};

struct CourseResource {
  size_t index{0};
  std::string title;
  std::string alias;
  std::string type_code;
  std::string update_time;
  std::vector<TiItem> ti_items;
};

struct LessonRelation {
  std::string title;
  std::vector<ResourceRef> refs;
  std::vector<std::string> teacher_ids;
};

namespace resource_types {
constexpr const char* kVideo = "assets_video";
constexpr const char* kDocument = "assets_document";
constexpr const char* kCourseware = "coursewares";
constexpr const char* kLessonPlan = "lesson_plandesign";
}

std::expected<json, Error> parseJsonBody(const std::string& body, const std::string& what);

// global_title["zh-CN"], then "title", then fallback.
std::string localizedTitle(const json& node, const std::string& fallback = "");
std::string stringField(const json& node, const char* key);

std::vector<TiItem> parseTiItems(const json& node);
std::map<std::string, std::string> parseTags(const json& tag_list);
std::map<std::string, std::string> parseTeachers(const json& teacher_list);

// relations.national_course_resource, or relations.course_resource.
std::vector<CourseResource> parseCourseResources(const json& data);
// resource_structure.relations
std::vector<LessonRelation> parseLessonRelations(const json& data);

bool isDocumentType(const std::string& type_code);

// m3u8 renditions with a Height requirement, highest first, one per URL.
std::vector<QualityVariant> videoVariants(const std::vector<TiItem>& items);

// The PDF rendition if there is one, else the first stored item.
std::optional<TiItem> bestDocumentItem(const std::vector<TiItem>& items);

} // namespace download_service
