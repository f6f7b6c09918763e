#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "domain/download_item.hpp"

namespace download_service {

// "all" or a list such as "1,3,5-8". One-based; reversed ranges are accepted,
// out-of-range and malformed parts are ignored. Result is sorted, zero-based.
std::vector<size_t> parseSelection(std::string_view selection, size_t total);

// "pdf, .TS" -> {"pdf", "ts"}
std::vector<std::string> parseExtensionList(std::string_view list);

std::vector<DownloadItem> filterByExtensions(std::vector<DownloadItem> items, const std::vector<std::string>& extensions);

// Only audio items are affected; "all" keeps every format.
std::vector<DownloadItem> filterAudioFormat(std::vector<DownloadItem> items, const std::string& format);

} // namespace download_service
