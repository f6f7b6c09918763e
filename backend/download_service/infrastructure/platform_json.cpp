#include "platform_json.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <set>
#include "common/file_naming.hpp"
#include "common/logger.hpp"

namespace download_service {

namespace {

std::optional<size_t> parseIndex(const std::string& text) {
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

std::optional<uint64_t> jsonUnsigned(const json& value) {
  if (value.is_number_unsigned()) return value.get<uint64_t>();
  if (value.is_number_integer() && value.get<int64_t>() >= 0) return static_cast<uint64_t>(value.get<int64_t>());
  if (value.is_string()) {
    auto text = value.get<std::string>();
    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (!text.empty() && ec == std::errc() && ptr == text.data() + text.size()) return parsed;
  }
  return std::nullopt;
}

std::vector<std::string> stringArray(const json& node, const char* key) {
  std::vector<std::string> out;
  if (!node.is_object() || !node.contains(key) || !node[key].is_array()) return out;
  for (const auto& entry : node[key]) {
    if (entry.is_string()) out.push_back(entry.get<std::string>());
  }
  return out;
}

const json& emptyObject() {
  static const json kEmpty = json::object();
  return kEmpty;
}

const json& child(const json& node, const char* key) {
  if (node.is_object()) {
    auto it = node.find(key);
    if (it != node.end()) return *it;
  }
  return emptyObject();
}

} // namespace

std::vector<size_t> ResourceRef::resolve(size_t total) const {
  std::vector<size_t> out;
  if (kind == Kind::All) {
    for (size_t i = 0; i < total; ++i) out.push_back(i);
    return out;
  }
  for (auto index : indices) {
    if (index < total) out.push_back(index);
  }
  return out;
}

std::optional<ResourceRef> parseResourceRef(const json& value) {
  if (value.is_number_integer()) {
    auto number = value.get<int64_t>();
    if (number < 0) return std::nullopt;
    return ResourceRef{.kind = ResourceRef::Kind::Indices, .indices = {static_cast<size_t>(number)}};
  }
  if (!value.is_string()) return std::nullopt;

  auto text = value.get<std::string>();
  if (auto index = parseIndex(text)) {
    return ResourceRef{.kind = ResourceRef::Kind::Indices, .indices = {*index}};
  }

  static const std::regex kIndexList(R"(\[([\d,*\s]+)\]$)");
  std::smatch match;
  if (!std::regex_search(text, match, kIndexList)) return std::nullopt;
  std::string list = match[1].str();
  if (list.find('*') != std::string::npos) {
    return ResourceRef{.kind = ResourceRef::Kind::All, .indices = {}};
  }

  ResourceRef ref;
  size_t pos = 0;
  while (pos <= list.size()) {
    auto comma = list.find(',', pos);
    auto part = list.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
    part.erase(std::remove_if(part.begin(), part.end(), [](unsigned char c) { return std::isspace(c); }), part.end());
    if (auto index = parseIndex(part)) ref.indices.push_back(*index);
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  if (ref.indices.empty()) return std::nullopt;
  return ref;
}

std::vector<ResourceRef> parseResourceRefs(const json& value) {
  std::vector<ResourceRef> refs;
  if (value.is_array()) {
    for (const auto& entry : value) {
      if (auto ref = parseResourceRef(entry)) refs.push_back(std::move(*ref));
    }
  } else if (auto ref = parseResourceRef(value)) {
    refs.push_back(std::move(*ref));
  }
  return refs;
}

std::optional<std::string> TiItem::firstStorage() const {
  for (const auto& storage : storages) {
    if (!storage.empty()) return storage;
  }
  return std::nullopt;
}

std::expected<json, Error> parseJsonBody(const std::string& body, const std::string& what) {
  auto parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected(makeError(ErrorKind::ParseError, "Malformed JSON from " + what));
  }
  return parsed;
}

std::string stringField(const json& node, const char* key) {
  const auto& value = child(node, key);
  return value.is_string() ? value.get<std::string>() : std::string();
}

std::string localizedTitle(const json& node, const std::string& fallback) {
  const auto& global = child(node, "global_title");
  auto title = stringField(global, "zh-CN");
  if (title.empty()) title = stringField(node, "title");
  return title.empty() ? fallback : title;
}

std::vector<TiItem> parseTiItems(const json& node) {
  std::vector<TiItem> items;
  const auto& list = child(node, "ti_items");
  if (!list.is_array()) return items;

  for (const auto& entry : list) {
    if (!entry.is_object()) continue;
    TiItem item;
    item.format = stringField(entry, "ti_format");
    item.storages = stringArray(entry, "ti_storages");
    if (auto md5 = stringField(entry, "ti_md5"); !md5.empty()) item.md5 = toLower(md5);
    item.size = jsonUnsigned(child(entry, "ti_size"));
    if (auto flag = stringField(entry, "ti_file_flag"); !flag.empty()) item.file_flag = flag;

    const auto& requirements = child(child(entry, "custom_properties"), "requirements");
    if (requirements.is_array()) {
      for (const auto& requirement : requirements) {
        auto name = stringField(requirement, "name");
        const auto& value = child(requirement, "value");
        if (name.empty()) continue;
        if (value.is_string()) {
          item.requirements[name] = value.get<std::string>();
        } else if (value.is_number()) {
          item.requirements[name] = value.dump();
        }
      }
    }
    items.push_back(std::move(item));
  }
  return items;
}

std::map<std::string, std::string> parseTags(const json& tag_list) {
  std::map<std::string, std::string> tags;
  if (!tag_list.is_array()) return tags;
  for (const auto& tag : tag_list) {
    auto dimension = stringField(tag, "tag_dimension_id");
    auto name = stringField(tag, "tag_name");
    // first tag per dimension wins
    if (!dimension.empty() && !name.empty()) tags.emplace(dimension, name);
  }
  return tags;
}

std::map<std::string, std::string> parseTeachers(const json& teacher_list) {
  std::map<std::string, std::string> teachers;
  if (!teacher_list.is_array()) return teachers;
  for (const auto& teacher : teacher_list) {
    auto id = stringField(teacher, "id");
    auto name = stringField(teacher, "name");
    if (!id.empty() && !name.empty()) teachers[id] = name;
  }
  return teachers;
}

std::vector<CourseResource> parseCourseResources(const json& data) {
  std::vector<CourseResource> resources;
  const auto& relations = child(data, "relations");
  const json* list = nullptr;
  for (const char* key : {"national_course_resource", "course_resource"}) {
    const auto& candidate = child(relations, key);
    if (candidate.is_array()) {
      list = &candidate;
      break;
    }
  }
  if (!list) return resources;

  for (size_t i = 0; i < list->size(); ++i) {
    const auto& entry = (*list)[i];
    CourseResource resource;
    resource.index = i;
    resource.title = localizedTitle(entry);
    resource.alias = stringField(child(entry, "custom_properties"), "alias_name");
    resource.type_code = stringField(entry, "resource_type_code");
    resource.update_time = stringField(entry, "update_time");
    resource.ti_items = parseTiItems(entry);
    resources.push_back(std::move(resource));
  }
  return resources;
}

std::vector<LessonRelation> parseLessonRelations(const json& data) {
  std::vector<LessonRelation> lessons;
  const auto& relations = child(child(data, "resource_structure"), "relations");
  if (!relations.is_array()) return lessons;
  for (const auto& entry : relations) {
    if (!entry.is_object()) continue;
    LessonRelation lesson;
    lesson.title = stringField(entry, "title");
    if (entry.contains("res_ref")) lesson.refs = parseResourceRefs(entry["res_ref"]);
    lesson.teacher_ids = stringArray(child(entry, "custom_properties"), "teacher_ids");
    lessons.push_back(std::move(lesson));
  }
  return lessons;
}

bool isDocumentType(const std::string& type_code) {
  return type_code == resource_types::kDocument ||
         type_code == resource_types::kCourseware ||
         type_code == resource_types::kLessonPlan;
}

std::vector<QualityVariant> videoVariants(const std::vector<TiItem>& items) {
  std::vector<QualityVariant> variants;
  for (const auto& item : items) {
    if (toLower(item.format) != "m3u8") continue;
    auto height = item.requirements.find("Height");
    if (height == item.requirements.end()) continue;
    auto rank = parseIndex(height->second);
    auto url = item.firstStorage();
    if (!rank || !url) continue;

    QualityVariant variant;
    variant.rank = static_cast<int>(*rank);
    variant.manifest_url = *url;
    if (auto total = item.requirements.find("total_size"); total != item.requirements.end()) {
      variant.estimated_size = jsonUnsigned(json(total->second));
    }
    variants.push_back(std::move(variant));
  }

  std::stable_sort(variants.begin(), variants.end(),
                   [](const QualityVariant& a, const QualityVariant& b) { return a.rank > b.rank; });
  std::set<std::string> seen;
  std::erase_if(variants, [&](const QualityVariant& v) { return !seen.insert(v.manifest_url).second; });
  return variants;
}

std::optional<TiItem> bestDocumentItem(const std::vector<TiItem>& items) {
  for (const auto& item : items) {
    if (toLower(item.format) == "pdf" && item.firstStorage()) return item;
  }
  for (const auto& item : items) {
    if (item.firstStorage()) return item;
  }
  return std::nullopt;
}

} // namespace download_service
