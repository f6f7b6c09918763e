#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/download_item.hpp"

namespace download_service {

struct QualityPolicy {
  enum class Mode { Best, Worst, Exact };
  Mode mode{Mode::Best};
  int value{0};

  // "best", "worst", "720" or "720p"
  static std::optional<QualityPolicy> parse(const std::string& text);
  std::string label() const;
};

struct QualitySelection {
  QualityVariant variant;
  bool fell_back{false};
};

// Exact requests that are unavailable resolve to the nearest rank; equal
// distance goes to the lower rank. fell_back marks that case.
std::optional<QualitySelection> selectVariant(
  const std::vector<QualityVariant>& variants,
  const QualityPolicy& policy
);

// Distinct ranks offered by the video items, highest first.
std::vector<int> offeredRanks(const std::vector<DownloadItem>& items);

std::string fallbackNotice(const QualityPolicy& policy, const std::vector<int>& chosen_ranks);

} // namespace download_service
