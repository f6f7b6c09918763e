#pragma once
#include <map>
#include <memory>
#include "common/config/config.hpp"
#include "domain/resource_extractor.hpp"
#include "infrastructure/chapter_tree_resolver.hpp"
#include "infrastructure/platform_api.hpp"

namespace download_service {

using ExtractorMap = std::map<ResourceKind, std::shared_ptr<ResourceExtractor>>;

// One extractor per resource kind, sharing the API client and chapter cache.
ExtractorMap makeExtractors(PlatformApi& api, ChapterTreeResolver& chapters, const config::DirectoryConfig& directory_config);

} // namespace download_service
