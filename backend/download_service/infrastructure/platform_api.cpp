#include "platform_api.hpp"
#include "common/http_utils.hpp"
#include "common/logger.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

PlatformApi::PlatformApi(FetchContext fetch, const config::NetworkConfig& network, config::UrlTemplates templates)
  : fetch_(fetch),
    prefixes_(network.server_prefixes),
    connect_timeout_(network.connect_timeout),
    timeout_(network.timeout),
    templates_(std::move(templates)) {
  if (prefixes_.empty()) prefixes_.push_back("");
}

boost::asio::awaitable<std::expected<nlohmann::json, Error>> PlatformApi::fetchJson(
  const std::string& template_key,
  const std::map<std::string, std::string>& params
) {
  auto pattern = templates_.find(template_key);
  if (pattern == templates_.end()) {
    co_return std::unexpected(makeError(ErrorKind::UnsupportedKind, "No URL template named " + template_key));
  }

  Error last_error = makeError(ErrorKind::NotFound, "No server answered for " + template_key);
  for (const auto& prefix : prefixes_) {
    auto values = params;
    values["prefix"] = prefix;
    HttpRequest request;
    request.url = fillTemplate(pattern->second, values);
    request.connect_timeout = connect_timeout_;
    request.timeout = timeout_;
    request.headers.emplace_back("Accept", "application/json");

    auto response = co_await fetchWithRetry(fetch_, request, request.url);
    if (!response) {
      last_error = response.error();
      if (last_error.kind == ErrorKind::NotFound || last_error.kind == ErrorKind::NetworkError) {
        common::logDebug("Server '" + prefix + "' failed: " + describe(last_error), "API");
        continue;
      }
      co_return std::unexpected(last_error);
    }
    co_return parseJsonBody(response->body, request.url);
  }
  co_return std::unexpected(last_error);
}

} // namespace download_service
