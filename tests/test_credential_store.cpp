#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "infrastructure/file_credential_store.hpp"
#include "support/test_runtime.hpp"

using namespace download_service;
using namespace test_support;

TEST_CASE("missing file has no token", "[file_credential_store]") {
  TempDir dir;
  FileCredentialStore store(dir / "config.json", "accesstoken");
  CHECK_FALSE(store.loadToken().has_value());
}

TEST_CASE("saved token is loaded back", "[file_credential_store]") {
  TempDir dir;
  FileCredentialStore store(dir / "nested" / "config.json", "accesstoken");
  REQUIRE(store.saveToken("abc123").has_value());
  CHECK(store.loadToken() == "abc123");

  auto perms = std::filesystem::status(store.path()).permissions();
  CHECK((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none);
  CHECK((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
}

TEST_CASE("other settings are preserved", "[file_credential_store]") {
  TempDir dir;
  writeFile(dir / "config.json", R"({"max_workers": 8, "accesstoken": "old"})");
  FileCredentialStore store(dir / "config.json", "accesstoken");
  CHECK(store.loadToken() == "old");
  REQUIRE(store.saveToken("new").has_value());

  auto saved = nlohmann::json::parse(readFile(dir / "config.json"));
  CHECK(saved["max_workers"] == 8);
  CHECK(saved["accesstoken"] == "new");
  CHECK_FALSE(std::filesystem::exists(dir / "config.json.tmp"));
}

TEST_CASE("malformed file is treated as empty", "[file_credential_store]") {
  TempDir dir;
  writeFile(dir / "config.json", "not json");
  FileCredentialStore store(dir / "config.json", "accesstoken");
  CHECK_FALSE(store.loadToken().has_value());
  REQUIRE(store.saveToken("t").has_value());
  CHECK(store.loadToken() == "t");
}
