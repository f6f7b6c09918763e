#pragma once
#include <expected>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "domain/download_item.hpp"
#include "domain/errors.hpp"

namespace download_service {

struct ExtractOptions {
  bool flatten{false};
};

class ResourceExtractor {
public:
  virtual ~ResourceExtractor() = default;
  virtual ResourceKind kind() const = 0;
  // Items come back in presentation order (see sortItems).
  virtual boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> extract(
    const std::string& resource_id,
    const ExtractOptions& options
  ) = 0;
};

} // namespace download_service
