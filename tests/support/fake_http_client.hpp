#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include "domain/http_client.hpp"

namespace test_support {

namespace net = boost::asio;
using download_service::Error;
using download_service::ErrorKind;
using download_service::HttpRequest;
using download_service::HttpResponse;

// Scripted transport. Routes match the exact URL first, then the URL without
// its query string. Unrouted URLs answer 404. A 2xx answer to a request with
// a body sink is streamed into the sink the way the libcurl client does it.
class FakeHttpClient : public download_service::HttpClient {
public:
  using Handler = std::function<std::expected<HttpResponse, Error>(const HttpRequest&)>;

  struct Record {
    HttpRequest request;
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point finished;
  };

  // A handler answer carrying this header is cut after that many body bytes.
  static constexpr const char* kDisconnectAfter = "x-test-disconnect-after";

  void on(const std::string& url, Handler handler, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    routes_[url] = Route{std::move(handler), delay};
  }

  void reply(const std::string& url, int status, std::string body = {},
             std::map<std::string, std::string> headers = {},
             std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    on(url, [status, body, headers](const HttpRequest&) -> std::expected<HttpResponse, Error> {
      return response(status, body, headers);
    }, delay);
  }

  // Serves content and honours "Range: bytes=N-".
  void serveFile(const std::string& url, std::string content,
                 std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    on(url, [content](const HttpRequest& request) { return rangeResponse(request, content); }, delay);
  }

  static HttpResponse response(int status, std::string body = {}, std::map<std::string, std::string> headers = {}) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    r.headers = std::move(headers);
    return r;
  }

  static std::expected<HttpResponse, Error> rangeResponse(const HttpRequest& request, const std::string& content) {
    for (const auto& [name, value] : request.headers) {
      if (name != "Range") continue;
      auto start = std::stoull(value.substr(value.find('=') + 1));
      if (start >= content.size()) return response(416);
      return response(206, content.substr(start),
        {{"content-range", "bytes " + std::to_string(start) + "-" + std::to_string(content.size() - 1) +
                           "/" + std::to_string(content.size())}});
    }
    return response(200, content);
  }

  net::awaitable<std::expected<HttpResponse, Error>> send(HttpRequest request) override {
    Record record{request, std::chrono::steady_clock::now(), {}};
    auto route = find(request.url);

    if (route && route->delay.count() > 0) {
      net::steady_timer timer(co_await net::this_coro::executor);
      timer.expires_after(route->delay);
      boost::system::error_code ec;
      co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    std::expected<HttpResponse, Error> result = route ? route->handler(request) : response(404);
    if (result && request.body_sink && result->ok()) {
      result = deliver(std::move(*result), request);
    }
    record.finished = std::chrono::steady_clock::now();
    records_.push_back(std::move(record));
    completed_.push_back(stripQuery(request.url));
    co_return result;
  }

  const std::vector<Record>& records() const { return records_; }

  // URLs without query, in the order their answers were produced.
  const std::vector<std::string>& completionOrder() const { return completed_; }

  size_t count(const std::string& url) const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(), [&](const Record& r) {
      return r.request.url == url || stripQuery(r.request.url) == url;
    }));
  }

  std::vector<Record> recordsFor(const std::string& url) const {
    std::vector<Record> out;
    for (const auto& r : records_) {
      if (r.request.url == url || stripQuery(r.request.url) == url) out.push_back(r);
    }
    return out;
  }

  static std::string stripQuery(const std::string& url) {
    return url.substr(0, url.find('?'));
  }

  static std::optional<std::string> header(const HttpRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers) {
      if (key == name) return value;
    }
    return std::nullopt;
  }

private:
  struct Route {
    Handler handler;
    std::chrono::milliseconds delay{0};
  };

  const Route* find(const std::string& url) const {
    auto it = routes_.find(url);
    if (it == routes_.end()) it = routes_.find(stripQuery(url));
    return it == routes_.end() ? nullptr : &it->second;
  }

  static std::expected<HttpResponse, Error> deliver(HttpResponse answer, const HttpRequest& request) {
    std::string body = std::move(answer.body);
    answer.body.clear();
    size_t limit = body.size();
    bool disconnect = false;
    if (auto cut = answer.headers.find(kDisconnectAfter); cut != answer.headers.end()) {
      limit = std::min<size_t>(limit, std::stoull(cut->second));
      disconnect = true;
      answer.headers.erase(cut);
    }

    constexpr size_t kChunk = 16 * 1024;
    for (size_t offset = 0; offset < limit; offset += kChunk) {
      if (offset == 0 && request.on_body_start && !request.on_body_start(answer.status)) {
        return std::unexpected(download_service::makeError(ErrorKind::FilesystemError, "sink refused body"));
      }
      auto chunk = std::string_view(body).substr(offset, std::min(kChunk, limit - offset));
      if (!request.body_sink(chunk)) {
        return std::unexpected(download_service::makeError(ErrorKind::FilesystemError, "sink failed"));
      }
      answer.bytes_received += chunk.size();
    }
    if (disconnect) {
      return std::unexpected(download_service::makeError(ErrorKind::NetworkError, "connection reset by test"));
    }
    return answer;
  }

  std::map<std::string, Route> routes_;
  std::vector<Record> records_;
  std::vector<std::string> completed_;
};

} // namespace test_support
