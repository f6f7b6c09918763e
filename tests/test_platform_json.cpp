#include <catch2/catch.hpp>
#include "infrastructure/platform_json.hpp"

using namespace download_service;

TEST_CASE("resource ref forms", "[platform_json]") {
  auto single = parseResourceRef(json(3));
  REQUIRE(single.has_value());
  CHECK(single->resolve(10) == (std::vector<size_t>{3}));

  auto text = parseResourceRef(json("2"));
  CHECK(text->resolve(10) == (std::vector<size_t>{2}));

  auto list = parseResourceRef(json("#/relations/national_course_resource[0, 2,9]"));
  REQUIRE(list.has_value());
  CHECK(list->resolve(5) == (std::vector<size_t>{0, 2}));

  auto all = parseResourceRef(json("#/relations/national_course_resource[*]"));
  CHECK(all->kind == ResourceRef::Kind::All);
  CHECK(all->resolve(3) == (std::vector<size_t>{0, 1, 2}));

  CHECK_FALSE(parseResourceRef(json("#/relations/x")).has_value());
  CHECK_FALSE(parseResourceRef(json(-1)).has_value());
  CHECK(parseResourceRefs(json::array({"1", "bad", 4})).size() == 2u);
}

TEST_CASE("ti items carry checksums and requirements", "[platform_json]") {
  auto node = json::parse(R"({
    "ti_items": [
      {"ti_format": "pdf", "ti_storages": ["", "https://r.example/a.pdf"], "ti_md5": "ABCDEF",
       "ti_size": "1024", "ti_file_flag": "pdf"},
      {"ti_format": "m3u8", "ti_storages": ["https://r.example/720.m3u8"],
       "custom_properties": {"requirements": [{"name": "Height", "value": "720"}, {"name": "total_size", "value": 5000}]}},
      "garbage"
    ]})");
  auto items = parseTiItems(node);
  REQUIRE(items.size() == 2u);
  CHECK(items[0].md5 == "abcdef");
  CHECK(items[0].size == 1024u);
  CHECK(items[0].firstStorage() == "https://r.example/a.pdf");
  CHECK(items[1].requirements.at("Height") == "720");
  CHECK(items[1].requirements.at("total_size") == "5000");
}

TEST_CASE("localized title prefers chinese", "[platform_json]") {
  CHECK(localizedTitle(json::parse(R"({"global_title": {"zh-CN": "数学"}, "title": "Math"})")) == "数学");
  CHECK(localizedTitle(json::parse(R"({"title": "Math"})")) == "Math");
  CHECK(localizedTitle(json::object(), "fallback") == "fallback");
}

TEST_CASE("first tag per dimension wins", "[platform_json]") {
  auto tags = parseTags(json::parse(R"([
    {"tag_dimension_id": "zxxxk", "tag_name": "数学"},
    {"tag_dimension_id": "zxxxk", "tag_name": "物理"},
    {"tag_dimension_id": "zxxnj", "tag_name": "七年级"}
  ])"));
  CHECK(tags.at("zxxxk") == "数学");
  CHECK(tags.at("zxxnj") == "七年级");
}

TEST_CASE("video variants are sorted and deduplicated", "[platform_json]") {
  std::vector<TiItem> items(4);
  items[0].format = "m3u8";
  items[0].storages = {"https://r.example/360.m3u8"};
  items[0].requirements = {{"Height", "360"}};
  items[1].format = "M3U8";
  items[1].storages = {"https://r.example/1080.m3u8"};
  items[1].requirements = {{"Height", "1080"}, {"total_size", "900"}};
  items[2] = items[1];
  items[3].format = "mp4";
  items[3].storages = {"https://r.example/v.mp4"};

  auto variants = videoVariants(items);
  REQUIRE(variants.size() == 2u);
  CHECK(variants[0].rank == 1080);
  CHECK(variants[0].estimated_size == 900u);
  CHECK(variants[1].rank == 360);
}

TEST_CASE("document prefers pdf", "[platform_json]") {
  std::vector<TiItem> items(2);
  items[0].format = "pptx";
  items[0].storages = {"https://r.example/a.pptx"};
  items[1].format = "pdf";
  items[1].storages = {"https://r.example/a.pdf"};
  CHECK(bestDocumentItem(items)->format == "pdf");
  items.pop_back();
  CHECK(bestDocumentItem(items)->format == "pptx");
  CHECK_FALSE(bestDocumentItem({}).has_value());
}

TEST_CASE("malformed body is a parse error", "[platform_json]") {
  auto parsed = parseJsonBody("{not json", "test");
  REQUIRE_FALSE(parsed.has_value());
  CHECK(parsed.error().kind == ErrorKind::ParseError);
}
