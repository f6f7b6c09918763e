#pragma once
#include <expected>
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "application/http_fetch.hpp"
#include "common/config/config.hpp"
#include "domain/errors.hpp"

namespace download_service {

// JSON endpoints of the platform. Each template is tried against every
// server prefix in turn; a 404 or an exhausted transient failure moves on
// to the next prefix.
class PlatformApi {
public:
  PlatformApi(FetchContext fetch, const config::NetworkConfig& network, config::UrlTemplates templates);

  boost::asio::awaitable<std::expected<nlohmann::json, Error>> fetchJson(
    const std::string& template_key,
    const std::map<std::string, std::string>& params
  );

  const FetchContext& fetchContext() const { return fetch_; }

private:
  FetchContext fetch_;
  std::vector<std::string> prefixes_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds timeout_;
  config::UrlTemplates templates_;
};

} // namespace download_service
