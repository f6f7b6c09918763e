#include "curl_http_client.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include "common/async_bridge.hpp"
#include "common/logger.hpp"

namespace download_service {

namespace {

struct EasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct TransferContext {
  const HttpRequest* request;
  const common::CancellationToken* cancel;
  HttpResponse response;
  bool body_started{false};
  bool sink_failed{false};
};

std::string trimmed(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  return s.substr(start);
}

} // namespace

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

CurlGlobal::~CurlGlobal() {
  curl_global_cleanup();
}

CurlHttpClient::CurlHttpClient(common::ThreadPool& pool, const common::CancellationToken& cancel, std::string user_agent)
  : pool_(pool), cancel_(cancel), user_agent_(std::move(user_agent)) {}

boost::asio::awaitable<std::expected<HttpResponse, Error>> CurlHttpClient::send(HttpRequest request) {
  co_return co_await common::offload(pool_, [this, request = std::move(request)]() {
    return perform(request);
  });
}

std::expected<HttpResponse, Error> CurlHttpClient::perform(const HttpRequest& request) const {
  if (cancel_.cancelled()) {
    return std::unexpected(makeError(ErrorKind::Cancelled, "cancelled before " + request.url));
  }

  EasyHandle curl(curl_easy_init());
  if (!curl) {
    return std::unexpected(makeError(ErrorKind::NetworkError, "Failed to initialize CURL handle"));
  }

  TransferContext ctx{.request = &request, .cancel = &cancel_, .response = {}};
  char error_buffer[CURL_ERROR_SIZE] = {0};

  HeaderList headers;
  for (const auto& [name, value] : request.headers) {
    auto line = name + ": " + value;
    auto* appended = curl_slist_append(headers.get(), line.c_str());
    if (!appended) {
      return std::unexpected(makeError(ErrorKind::NetworkError, "Failed to build request headers"));
    }
    headers.release();
    headers.reset(appended);
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
  if (request.body_sink) {
    // streamed bodies may legitimately take longer than the timeout; abort only on a stall
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                     std::max(1L, static_cast<long>(request.timeout.count() / 1000)));
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  }
  if (request.method == "HEAD") {
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
  } else if (request.method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

  auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    if (cancel_.cancelled()) {
      return std::unexpected(makeError(ErrorKind::Cancelled, "cancelled during " + request.url));
    }
    if (ctx.sink_failed) {
      return std::unexpected(makeError(ErrorKind::FilesystemError, "Failed to write body of " + request.url));
    }
    std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
    common::logDebug("curl error " + std::to_string(res) + " on " + request.url + ": " + detail, "HTTP");
    return std::unexpected(makeError(ErrorKind::NetworkError, detail + " (" + request.url + ")"));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  ctx.response.status = static_cast<int>(http_code);
  return std::move(ctx.response);
}

size_t CurlHttpClient::headerCallback(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  const size_t length = size * nmemb;
  std::string line(data, length);

  if (line.rfind("HTTP/", 0) == 0) {
    // a new header block starts after every redirect
    ctx->response.headers.clear();
    auto space = line.find(' ');
    if (space != std::string::npos) {
      ctx->response.status = std::atoi(line.c_str() + space + 1);
    }
    return length;
  }
  auto colon = line.find(':');
  if (colon == std::string::npos) return length;

  std::string name = line.substr(0, colon);
  for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  ctx->response.headers[name] = trimmed(line.substr(colon + 1));
  return length;
}

size_t CurlHttpClient::writeCallback(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  const size_t length = size * nmemb;
  ctx->response.bytes_received += length;

  const auto& request = *ctx->request;
  if (request.body_sink && ctx->response.ok()) {
    if (!ctx->body_started) {
      ctx->body_started = true;
      if (request.on_body_start && !request.on_body_start(ctx->response.status)) {
        ctx->sink_failed = true;
        return 0;
      }
    }
    if (!request.body_sink(std::string_view(data, length))) {
      ctx->sink_failed = true;
      return 0;
    }
    return length;
  }
  ctx->response.body.append(data, length);
  return length;
}

int CurlHttpClient::progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* ctx = static_cast<TransferContext*>(clientp);
  return ctx->cancel->cancelled() ? 1 : 0;
}

} // namespace download_service
