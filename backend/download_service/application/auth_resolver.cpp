#include "auth_resolver.hpp"
#include <mutex>
#include "common/async_bridge.hpp"
#include "common/file_naming.hpp"
#include "common/http_utils.hpp"
#include "common/logger.hpp"

namespace download_service {

const char* tokenSourceLabel(TokenSource source) {
  switch (source) {
    case TokenSource::None: return "none";
    case TokenSource::Explicit: return "command line";
    case TokenSource::Environment: return "environment";
    case TokenSource::Persisted: return "saved config";
    case TokenSource::Prompted: return "prompt";
  }
  return "none";
}

ErrorKind classifyAuthFailure(const HttpResponse& response, const std::string& sent_token) {
  auto body = toLower(response.body.substr(0, 4096));
  auto challenge = toLower(response.header("www-authenticate").value_or(""));
  bool says_invalid = challenge.find("invalid_token") != std::string::npos ||
                      body.find("token_expired") != std::string::npos ||
                      body.find("invalid_token") != std::string::npos ||
                      body.find("token expired") != std::string::npos;
  if (says_invalid || !sent_token.empty()) {
    return ErrorKind::AuthInvalid;
  }
  return ErrorKind::AuthRequired;
}

AuthResolver::AuthResolver(
  net::any_io_executor executor,
  AuthSources sources,
  std::shared_ptr<TokenPrompter> prompter,
  std::shared_ptr<CredentialStore> store,
  common::ThreadPool& blocking_pool
)
  : sources_(std::move(sources)),
    prompter_(std::move(prompter)),
    store_(std::move(store)),
    blocking_pool_(blocking_pool),
    acquire_gate_(std::move(executor), 1) {}

std::string AuthResolver::applyToken(const std::string& url, const std::string& token) {
  if (token.empty()) return url;
  return appendQueryParam(url, "accessToken", token);
}

AuthContext AuthResolver::context() const {
  std::shared_lock lock(mutex_);
  return context_;
}

std::optional<std::string> AuthResolver::currentToken() const {
  std::shared_lock lock(mutex_);
  if (context_.token.empty()) return std::nullopt;
  return context_.token;
}

net::awaitable<std::expected<HttpResponse, Error>> AuthResolver::send(HttpClient& client, HttpRequest request) {
  std::string sent;
  uint64_t generation = 0;
  {
    std::shared_lock lock(mutex_);
    sent = context_.token;
    generation = generation_;
  }

  const std::string target = request.url;
  HttpRequest first = request;
  first.url = applyToken(target, sent);
  auto response = co_await client.send(std::move(first));
  if (!response) co_return response;
  if (response->status != 401 && response->status != 403) {
    if (response->ok() && !sent.empty()) markAccepted(sent);
    co_return response;
  }

  auto failure = classifyAuthFailure(*response, sent);
  common::logDebug(std::string(errorKindLabel(failure)) + " (HTTP " + std::to_string(response->status) +
                   ") for " + target, "AUTH");

  auto token = co_await acquire(failure == ErrorKind::AuthInvalid ? sent : std::string(), generation);
  if (!token) {
    co_return std::unexpected(makeError(ErrorKind::AuthRequired,
      "an access token is required for " + target, response->status));
  }

  HttpRequest retry = std::move(request);
  retry.url = applyToken(target, *token);
  auto second = co_await client.send(std::move(retry));
  if (!second) co_return second;
  if (second->status == 401 || second->status == 403) {
    markRejected(*token);
    co_return std::unexpected(makeError(ErrorKind::AuthInvalid,
      "the access token was rejected for " + target, second->status));
  }
  if (second->ok()) markAccepted(*token);
  co_return second;
}

std::optional<std::pair<std::string, TokenSource>> AuthResolver::nextCandidate() const {
  std::shared_lock lock(mutex_);
  const std::pair<const std::optional<std::string>*, TokenSource> ordered[] = {
    {&sources_.explicit_token, TokenSource::Explicit},
    {&sources_.env_token, TokenSource::Environment},
    {&sources_.persisted_token, TokenSource::Persisted},
  };
  for (const auto& [value, source] : ordered) {
    if (value->has_value() && !(*value)->empty() && rejected_.count(**value) == 0) {
      return std::make_pair(**value, source);
    }
  }
  return std::nullopt;
}

net::awaitable<std::optional<std::string>> AuthResolver::acquire(const std::string& rejected, uint64_t seen_generation) {
  // one acquisition at a time; late arrivals reuse the winner's token
  co_await acquire_gate_.acquire();
  common::SemaphoreGuard guard(acquire_gate_);

  {
    std::unique_lock lock(mutex_);
    if (!rejected.empty()) {
      rejected_.insert(rejected);
      if (context_.token == rejected) context_.valid = false;
    }
    if (generation_ != seen_generation && !context_.token.empty() && rejected_.count(context_.token) == 0) {
      co_return context_.token;
    }
  }

  auto candidate = nextCandidate();
  if (!candidate) {
    if (!prompter_ || prompt_declined_) co_return std::nullopt;
    auto prompter = prompter_;
    bool previous_rejected = !rejected.empty();
    auto prompted = co_await common::offload(blocking_pool_, [prompter, previous_rejected]() {
      return prompter->promptToken(previous_rejected);
    });
    if (!prompted || prompted->empty()) {
      prompt_declined_ = true;
      co_return std::nullopt;
    }
    candidate = std::make_pair(*prompted, TokenSource::Prompted);
  }

  {
    std::unique_lock lock(mutex_);
    context_ = AuthContext{.token = candidate->first, .source = candidate->second, .valid = false};
    ++generation_;
  }
  common::logInfo(std::string("Using access token from ") + tokenSourceLabel(candidate->second), "AUTH");
  co_return candidate->first;
}

void AuthResolver::markAccepted(const std::string& token) {
  std::unique_lock lock(mutex_);
  if (context_.token == token) context_.valid = true;
}

void AuthResolver::markRejected(const std::string& token) {
  std::unique_lock lock(mutex_);
  rejected_.insert(token);
  if (context_.token == token) context_.valid = false;
}

std::expected<bool, std::string> AuthResolver::persistPromptedToken() {
  auto current = context();
  if (current.source != TokenSource::Prompted || !current.valid || !store_ || !prompter_) {
    return false;
  }
  if (!prompter_->confirmSaveToken()) {
    return false;
  }
  auto saved = store_->saveToken(current.token);
  if (!saved) {
    return std::unexpected(saved.error());
  }
  return true;
}

} // namespace download_service
