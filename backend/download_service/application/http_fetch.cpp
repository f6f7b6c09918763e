#include "http_fetch.hpp"
#include "common/http_utils.hpp"

namespace download_service {

namespace net = boost::asio;

net::awaitable<std::expected<HttpResponse, Error>> fetchOnce(
  const FetchContext& ctx,
  const HttpRequest& request,
  const std::string& what
) {
  if (ctx.cancel.cancelled()) {
    co_return std::unexpected(makeError(ErrorKind::Cancelled, "cancelled before " + what));
  }
  std::expected<HttpResponse, Error> response;
  if (ctx.auth) {
    response = co_await ctx.auth->send(ctx.client, request);
  } else {
    response = co_await ctx.client.send(request);
  }
  if (!response) co_return response;
  if (!response->ok()) {
    co_return std::unexpected(responseError(*response, what));
  }
  co_return response;
}

net::awaitable<std::expected<HttpResponse, Error>> fetchWithRetry(
  const FetchContext& ctx,
  HttpRequest request,
  std::string what
) {
  co_return co_await ctx.retry.run(
    [&ctx, &request, &what]() { return fetchOnce(ctx, request, what); },
    ctx.cancel, what);
}

} // namespace download_service
