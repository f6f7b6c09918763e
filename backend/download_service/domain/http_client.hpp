#pragma once
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include "domain/errors.hpp"

namespace download_service {

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
  // When set, a 2xx body is streamed here instead of being buffered.
  // Returning false aborts the transfer.
  std::function<bool(std::string_view)> body_sink;
  // Called once with the status before the first 2xx body chunk reaches body_sink.
  std::function<bool(int)> on_body_start;
};

struct HttpResponse {
  int status{0};
  std::map<std::string, std::string> headers;  // lower-case names
  std::string body;
  uint64_t bytes_received{0};

  bool ok() const { return status >= 200 && status < 300; }

  std::optional<std::string> header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    return it->second;
  }
};

// Transport capability consumed by the engine. Implementations report transport
// failures as NetworkError (or Cancelled); HTTP error statuses come back as responses.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual boost::asio::awaitable<std::expected<HttpResponse, Error>> send(HttpRequest request) = 0;
};

} // namespace download_service
