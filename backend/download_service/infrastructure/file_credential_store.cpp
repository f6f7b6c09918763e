#include "file_credential_store.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "common/logger.hpp"

namespace download_service {

namespace fs = std::filesystem;

namespace {

nlohmann::json readObject(const fs::path& path) {
  std::ifstream in(path);
  if (!in) return nlohmann::json::object();
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    common::logWarn("Ignoring malformed " + path.string(), "CREDENTIAL");
    return nlohmann::json::object();
  }
  return parsed;
}

} // namespace

FileCredentialStore::FileCredentialStore(fs::path path, std::string key)
  : path_(std::move(path)), key_(std::move(key)) {}

std::optional<std::string> FileCredentialStore::loadToken() {
  auto data = readObject(path_);
  auto it = data.find(key_);
  if (it == data.end() || !it->is_string()) return std::nullopt;
  auto token = it->get<std::string>();
  if (token.empty()) return std::nullopt;
  return token;
}

std::expected<void, std::string> FileCredentialStore::saveToken(const std::string& token) {
  auto data = readObject(path_);
  data[key_] = token;

  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) return std::unexpected("Cannot create " + path_.parent_path().string() + ": " + ec.message());
  }

  auto temp = path_;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out) return std::unexpected("Cannot write " + temp.string());
    out << data.dump(2) << '\n';
    if (!out) return std::unexpected("Write failed for " + temp.string());
  }
  fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) common::logWarn("Cannot restrict permissions on " + temp.string() + ": " + ec.message(), "CREDENTIAL");

  fs::rename(temp, path_, ec);
  if (ec) {
    fs::remove(temp, ec);
    return std::unexpected("Cannot replace " + path_.string());
  }
  common::logInfo("Token saved to " + path_.string(), "CREDENTIAL");
  return {};
}

} // namespace download_service
