#pragma once
#include <expected>
#include <optional>
#include <string>

namespace download_service {

class CredentialStore {
public:
  virtual ~CredentialStore() = default;
  virtual std::optional<std::string> loadToken() = 0;
  virtual std::expected<void, std::string> saveToken(const std::string& token) = 0;
};

class TokenPrompter {
public:
  virtual ~TokenPrompter() = default;
  // previous_rejected is true when the server refused the last token.
  virtual std::optional<std::string> promptToken(bool previous_rejected) = 0;
  virtual bool confirmSaveToken() = 0;
};

} // namespace download_service
