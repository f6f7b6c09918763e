#pragma once
#include <filesystem>
#include <string>
#include "domain/credential_store.hpp"

namespace download_service {

// Token kept in the user's JSON config file under one key. Other keys in
// the file are preserved on save.
class FileCredentialStore : public CredentialStore {
public:
  FileCredentialStore(std::filesystem::path path, std::string key);

  std::optional<std::string> loadToken() override;
  std::expected<void, std::string> saveToken(const std::string& token) override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::string key_;
};

} // namespace download_service
