#pragma once
#include <string>
#include <curl/curl.h>
#include "common/cancellation.hpp"
#include "common/thread_pool.hpp"
#include "domain/http_client.hpp"

namespace download_service {

// curl_global_init/cleanup for the lifetime of the process.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// HttpClient on libcurl easy handles. Each request gets its own handle and
// runs on the blocking pool; the calling coroutine resumes on its executor.
class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient(common::ThreadPool& pool, const common::CancellationToken& cancel, std::string user_agent);

  boost::asio::awaitable<std::expected<HttpResponse, Error>> send(HttpRequest request) override;

  // Blocking variant used by send(); exposed for callers already off the scheduler.
  std::expected<HttpResponse, Error> perform(const HttpRequest& request) const;

private:
  static size_t headerCallback(char* data, size_t size, size_t nmemb, void* userdata);
  static size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata);
  static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);

  common::ThreadPool& pool_;
  const common::CancellationToken& cancel_;
  std::string user_agent_;
};

} // namespace download_service
