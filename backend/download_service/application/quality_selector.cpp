#include "quality_selector.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <set>
#include "common/file_naming.hpp"

namespace download_service {

std::optional<QualityPolicy> QualityPolicy::parse(const std::string& text) {
  auto lower = toLower(text);
  if (lower == "best" || lower.empty()) return QualityPolicy{.mode = Mode::Best, .value = 0};
  if (lower == "worst") return QualityPolicy{.mode = Mode::Worst, .value = 0};
  if (!lower.empty() && lower.back() == 'p') lower.pop_back();
  if (lower.empty() || lower.size() > 5) return std::nullopt;
  for (char c : lower) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  int value = std::stoi(lower);
  if (value <= 0) return std::nullopt;
  return QualityPolicy{.mode = Mode::Exact, .value = value};
}

std::string QualityPolicy::label() const {
  switch (mode) {
    case Mode::Best: return "best";
    case Mode::Worst: return "worst";
    case Mode::Exact: return std::to_string(value) + "p";
  }
  return "best";
}

namespace {

bool rankedBelow(const QualityVariant& a, const QualityVariant& b) {
  if (a.rank != b.rank) return a.rank < b.rank;
  return a.bandwidth < b.bandwidth;
}

} // namespace

std::optional<QualitySelection> selectVariant(
  const std::vector<QualityVariant>& variants,
  const QualityPolicy& policy
) {
  if (variants.empty()) return std::nullopt;

  switch (policy.mode) {
    case QualityPolicy::Mode::Best:
      return QualitySelection{*std::max_element(variants.begin(), variants.end(), rankedBelow), false};
    case QualityPolicy::Mode::Worst:
      return QualitySelection{*std::min_element(variants.begin(), variants.end(), rankedBelow), false};
    case QualityPolicy::Mode::Exact:
      break;
  }

  const QualityVariant* best = nullptr;
  for (const auto& variant : variants) {
    if (variant.rank == policy.value) {
      if (!best || best->rank != policy.value || variant.bandwidth > best->bandwidth) {
        best = &variant;
      }
      continue;
    }
    if (best && best->rank == policy.value) continue;
    if (!best) {
      best = &variant;
      continue;
    }
    auto distance = std::abs(variant.rank - policy.value);
    auto best_distance = std::abs(best->rank - policy.value);
    if (distance < best_distance || (distance == best_distance && variant.rank < best->rank)) {
      best = &variant;
    }
  }
  return QualitySelection{*best, best->rank != policy.value};
}

std::vector<int> offeredRanks(const std::vector<DownloadItem>& items) {
  std::set<int, std::greater<int>> ranks;
  for (const auto& item : items) {
    if (item.media_kind != MediaKind::Video) continue;
    for (const auto& variant : item.variants) ranks.insert(variant.rank);
  }
  return {ranks.begin(), ranks.end()};
}

std::string fallbackNotice(const QualityPolicy& policy, const std::vector<int>& chosen_ranks) {
  std::set<int> unique(chosen_ranks.begin(), chosen_ranks.end());
  std::string chosen;
  for (auto it = unique.rbegin(); it != unique.rend(); ++it) {
    if (!chosen.empty()) chosen += ", ";
    chosen += std::to_string(*it) + "p";
  }
  return "Requested quality " + policy.label() + " is not available, using nearest: " + chosen;
}

} // namespace download_service
