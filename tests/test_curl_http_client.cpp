#include <catch2/catch.hpp>
#include <atomic>
#include "infrastructure/curl_http_client.hpp"
#include "support/mock_http_server.hpp"
#include "support/test_runtime.hpp"

using namespace download_service;
using namespace test_support;

namespace {

const std::string kPayload = patternBytes(100000, 21);

MockResponse route(const MockRequest& req) {
  auto target = std::string(req.target());
  if (target == "/hello") {
    auto res = makeResponse(req, http::status::ok, "hello", "text/plain");
    res.set("X-Served-By", "Mock");
    return res;
  }
  if (target == "/agent") {
    return makeResponse(req, http::status::ok, std::string(req[http::field::user_agent]), "text/plain");
  }
  if (target == "/file") {
    auto range = std::string(req[http::field::range]);
    if (range.empty()) return makeResponse(req, http::status::ok, kPayload);
    auto start = std::stoull(range.substr(range.find('=') + 1));
    auto res = makeResponse(req, http::status::partial_content, kPayload.substr(start));
    res.set(http::field::content_range,
            "bytes " + std::to_string(start) + "-" + std::to_string(kPayload.size() - 1) + "/" +
            std::to_string(kPayload.size()));
    return res;
  }
  return makeResponse(req, http::status::not_found, "missing", "text/plain");
}

class CurlHttpClientTest {
protected:
  std::expected<HttpResponse, Error> send(HttpRequest request) {
    return runSync(ioc, client.send(std::move(request)));
  }

  static HttpRequest get(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.connect_timeout = std::chrono::seconds(2);
    request.timeout = std::chrono::seconds(10);
    return request;
  }

  CurlGlobal curl;
  net::io_context ioc{1};
  common::ThreadPool pool{2};
  common::CancellationToken cancel;
  CurlHttpClient client{pool, cancel, "sed-dl-test/1.0"};
  MockHttpServer server{route};
};

}

TEST_CASE_METHOD(CurlHttpClientTest, "buffers body and lowercases headers", "[curl_http_client]") {
  auto response = send(get(server.url("/hello")));
  REQUIRE(response.has_value());
  CHECK(response->status == 200);
  CHECK(response->body == "hello");
  CHECK(response->header("x-served-by") == "Mock");
  CHECK(response->header("content-type") == "text/plain");
}

TEST_CASE_METHOD(CurlHttpClientTest, "sends the configured user agent", "[curl_http_client]") {
  auto response = send(get(server.url("/agent")));
  REQUIRE(response.has_value());
  CHECK(response->body == "sed-dl-test/1.0");
}

TEST_CASE_METHOD(CurlHttpClientTest, "error status is a response", "[curl_http_client]") {
  auto response = send(get(server.url("/nope")));
  REQUIRE(response.has_value());
  CHECK(response->status == 404);
  CHECK_FALSE(response->ok());
}

TEST_CASE_METHOD(CurlHttpClientTest, "streams bodies into the sink", "[curl_http_client]") {
  std::string received;
  int started_with = 0;
  auto request = get(server.url("/file"));
  request.on_body_start = [&](int status) {
    started_with = status;
    return true;
  };
  request.body_sink = [&](std::string_view chunk) {
    received.append(chunk);
    return true;
  };

  auto response = send(std::move(request));
  REQUIRE(response.has_value());
  CHECK(started_with == 200);
  CHECK(received == kPayload);
  CHECK(response->body.empty());
  CHECK(response->bytes_received == kPayload.size());
}

TEST_CASE_METHOD(CurlHttpClientTest, "range requests get the partial content", "[curl_http_client]") {
  std::string received;
  auto request = get(server.url("/file"));
  request.headers.emplace_back("Range", "bytes=60000-");
  request.body_sink = [&](std::string_view chunk) {
    received.append(chunk);
    return true;
  };

  auto response = send(std::move(request));
  REQUIRE(response.has_value());
  CHECK(response->status == 206);
  CHECK(received == kPayload.substr(60000));
  CHECK(response->header("content-range").has_value());
}

TEST_CASE_METHOD(CurlHttpClientTest, "refused sink aborts the transfer", "[curl_http_client]") {
  auto request = get(server.url("/file"));
  request.body_sink = [](std::string_view) { return false; };
  auto response = send(std::move(request));
  REQUIRE_FALSE(response.has_value());
  CHECK(response.error().kind == ErrorKind::FilesystemError);
}

TEST_CASE_METHOD(CurlHttpClientTest, "refused connection is a network error", "[curl_http_client]") {
  unsigned short port = 0;
  {
    net::io_context probe;
    tcp::acceptor acceptor(probe, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }
  auto response = send(get("http://127.0.0.1:" + std::to_string(port) + "/"));
  REQUIRE_FALSE(response.has_value());
  CHECK(response.error().kind == ErrorKind::NetworkError);
}

TEST_CASE_METHOD(CurlHttpClientTest, "cancelled client does not connect", "[curl_http_client]") {
  std::atomic<int> hits{0};
  MockHttpServer counting([&](const MockRequest& req) {
    ++hits;
    return makeResponse(req, http::status::ok, "x");
  });
  cancel.cancel();
  auto response = send(get(counting.url("/")));
  REQUIRE_FALSE(response.has_value());
  CHECK(response.error().kind == ErrorKind::Cancelled);
  CHECK(hits.load() == 0);
}
