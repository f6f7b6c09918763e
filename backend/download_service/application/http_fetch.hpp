#pragma once
#include <expected>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include "application/auth_resolver.hpp"
#include "application/retry_policy.hpp"
#include "common/cancellation.hpp"
#include "domain/errors.hpp"
#include "domain/http_client.hpp"

namespace download_service {

// Everything a request needs to go through auth and retry.
struct FetchContext {
  HttpClient& client;
  AuthResolver* auth;          // null for unauthenticated endpoints
  const RetryPolicy& retry;
  const common::CancellationToken& cancel;
};

// One attempt: auth-aware send, non-2xx turned into an error.
boost::asio::awaitable<std::expected<HttpResponse, Error>> fetchOnce(
  const FetchContext& ctx,
  const HttpRequest& request,
  const std::string& what
);

// fetchOnce under the retry policy.
boost::asio::awaitable<std::expected<HttpResponse, Error>> fetchWithRetry(
  const FetchContext& ctx,
  HttpRequest request,
  std::string what
);

} // namespace download_service
