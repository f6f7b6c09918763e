#include <catch2/catch.hpp>
#include "application/directory_builder.hpp"
#include "common/config/config.hpp"

using namespace download_service;

namespace {

const config::DirectoryConfig& directoryConfig() {
  return config::Config::getInstance().getDirectory();
}

PathMetadata juniorMath() {
  PathMetadata metadata;
  metadata.tags = {
    {"zxxxd", "初中"},
    {"zxxnj", "七年级"},
    {"zxxxk", "数学"},
    {"zxxbb", "人教版"},
    {"zxxcc", "上册"},
  };
  metadata.chapter_path = {"第一章 有理数", "1.1 正数和负数"};
  metadata.resource_title = "正数和负数";
  return metadata;
}

}

TEST_CASE("tags follow the configured order then chapters", "[directory_builder]") {
  auto segments = buildDirectory(juniorMath(), false, directoryConfig());
  CHECK(segments == (std::vector<std::string>{
    "初中", "七年级", "数学", "人教版", "上册", "第一章 有理数", "1.1 正数和负数"}));
}

TEST_CASE("senior high skips the grade level", "[directory_builder]") {
  auto metadata = juniorMath();
  metadata.tags["zxxxd"] = "高中";
  metadata.tags["zxxnj"] = "高一";
  auto segments = buildDirectory(metadata, false, directoryConfig());
  REQUIRE(segments.size() >= 2u);
  CHECK(segments[0] == "高中");
  CHECK(segments[1] == "数学");
}

TEST_CASE("placeholder and missing tags are left out", "[directory_builder]") {
  PathMetadata metadata;
  metadata.tags = {{"zxxxd", "小学"}, {"zxxnj", "未知年级"}, {"zxxxk", "语文"}};
  auto segments = buildDirectory(metadata, false, directoryConfig());
  CHECK(segments == (std::vector<std::string>{"小学", "语文"}));
}

TEST_CASE("no tags means unclassified", "[directory_builder]") {
  PathMetadata metadata;
  metadata.chapter_path = {"Unit 1"};
  auto segments = buildDirectory(metadata, false, directoryConfig());
  CHECK(segments == (std::vector<std::string>{"未分类资源", "Unit 1"}));
}

TEST_CASE("leaf chapter named like the resource is dropped", "[directory_builder]") {
  auto metadata = juniorMath();
  metadata.resource_title = "1.1 正数和负数";
  auto segments = buildDirectory(metadata, false, directoryConfig());
  CHECK(segments.back() == "第一章 有理数");
}

TEST_CASE("segments are sanitized", "[directory_builder]") {
  PathMetadata metadata;
  metadata.tags = {{"zxxxk", "Math/Physics"}};
  metadata.chapter_path = {"Ch. 1: Intro?"};
  auto segments = buildDirectory(metadata, false, directoryConfig());
  CHECK(segments == (std::vector<std::string>{"Math Physics", "Ch. 1 Intro"}));
}

TEST_CASE("flatten yields no directories and is deterministic", "[directory_builder]") {
  CHECK(buildDirectory(juniorMath(), true, directoryConfig()).empty());
  CHECK(buildDirectory(juniorMath(), false, directoryConfig()) == buildDirectory(juniorMath(), false, directoryConfig()));
}
