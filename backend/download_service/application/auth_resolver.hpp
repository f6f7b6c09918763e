#pragma once
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include "common/async_semaphore.hpp"
#include "common/thread_pool.hpp"
#include "domain/credential_store.hpp"
#include "domain/errors.hpp"
#include "domain/http_client.hpp"

namespace download_service {

namespace net = boost::asio;

enum class TokenSource { None, Explicit, Environment, Persisted, Prompted };

const char* tokenSourceLabel(TokenSource source);

struct AuthContext {
  std::string token;
  TokenSource source{TokenSource::None};
  bool valid{false};   // set once the server accepted the token
};

// Token sources read once at startup, highest priority first.
struct AuthSources {
  std::optional<std::string> explicit_token;
  std::optional<std::string> env_token;
  std::optional<std::string> persisted_token;
};

// No token is sent until the server asks for one.
ErrorKind classifyAuthFailure(const HttpResponse& response, const std::string& sent_token);

class AuthResolver {
public:
  AuthResolver(
    net::any_io_executor executor,
    AuthSources sources,
    std::shared_ptr<TokenPrompter> prompter,
    std::shared_ptr<CredentialStore> store,
    common::ThreadPool& blocking_pool
  );

  // Sends the request with the cached token, if any. On 401/403 a token is
  // acquired and the request is retried exactly once.
  net::awaitable<std::expected<HttpResponse, Error>> send(HttpClient& client, HttpRequest request);

  AuthContext context() const;
  std::optional<std::string> currentToken() const;

  // Saves a prompted token that the server accepted, after confirmation.
  std::expected<bool, std::string> persistPromptedToken();

  static std::string applyToken(const std::string& url, const std::string& token);

private:
  net::awaitable<std::optional<std::string>> acquire(const std::string& rejected, uint64_t seen_generation);
  std::optional<std::pair<std::string, TokenSource>> nextCandidate() const;
  void markAccepted(const std::string& token);
  void markRejected(const std::string& token);

  AuthSources sources_;
  std::shared_ptr<TokenPrompter> prompter_;
  std::shared_ptr<CredentialStore> store_;
  common::ThreadPool& blocking_pool_;

  mutable std::shared_mutex mutex_;
  AuthContext context_;
  uint64_t generation_{0};
  std::set<std::string> rejected_;
  bool prompt_declined_{false};

  common::AsyncSemaphore acquire_gate_;
};

} // namespace download_service
