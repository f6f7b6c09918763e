#pragma once
#include <string>
#include <vector>
#include "common/config/config.hpp"
#include "domain/resource_extractor.hpp"
#include "infrastructure/platform_api.hpp"

namespace download_service {

// E-textbooks: the PDF renditions plus the companion audio tracks.
class TextbookExtractor : public ResourceExtractor {
public:
  TextbookExtractor(PlatformApi& api, config::DirectoryConfig directory_config);

  ResourceKind kind() const override { return ResourceKind::Textbook; }

  boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> extract(
    const std::string& resource_id,
    const ExtractOptions& options
  ) override;

  // File name for a PDF URL; placeholders become "<title>.pdf".
  static std::string pdfFileName(const std::string& url, const std::string& title);

private:
  boost::asio::awaitable<std::expected<std::vector<DownloadItem>, Error>> audioItems(
    const std::string& resource_id,
    std::vector<std::string> directory
  );

  PlatformApi& api_;
  config::DirectoryConfig directory_config_;
};

} // namespace download_service
