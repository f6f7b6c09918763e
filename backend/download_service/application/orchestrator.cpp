#include "orchestrator.hpp"
#include <algorithm>
#include <map>
#include <set>
#include "application/selection.hpp"
#include "common/async_bridge.hpp"
#include "common/async_semaphore.hpp"
#include "common/file_naming.hpp"
#include "common/http_utils.hpp"
#include "common/logger.hpp"

namespace download_service {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::string withSuffix(const fs::path& path, int n) {
  return path.stem().string() + " (" + std::to_string(n) + ")" + path.extension().string();
}

} // namespace

std::expected<ResolvedInput, Error> resolveInput(
  const std::string& raw_input,
  const std::optional<ResourceKind>& kind_hint,
  const std::vector<config::ApiEndpointConfig>& endpoints
) {
  auto input = trim(raw_input);
  if (input.empty()) {
    return std::unexpected(makeError(ErrorKind::ParseError, "Empty input"));
  }

  if (input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0) {
    for (const auto& endpoint : endpoints) {
      if (input.find("/" + endpoint.path_key) == std::string::npos) continue;
      auto kind = parseResourceKind(endpoint.resource_type);
      if (!kind) {
        return std::unexpected(makeError(ErrorKind::UnsupportedKind, "Unknown resource type " + endpoint.resource_type));
      }
      auto id = queryParam(input, endpoint.id_param);
      if (!id || id->empty()) {
        return std::unexpected(makeError(ErrorKind::ParseError,
          "URL has no '" + endpoint.id_param + "' parameter: " + input));
      }
      return ResolvedInput{.kind = *kind, .id = *id};
    }
    return std::unexpected(makeError(ErrorKind::UnsupportedKind, "Unsupported URL: " + input));
  }

  if (isResourceId(input)) {
    if (!kind_hint) {
      return std::unexpected(makeError(ErrorKind::UnsupportedKind,
        "A bare id needs a resource type (--type): " + input));
    }
    return ResolvedInput{.kind = *kind_hint, .id = input};
  }
  return std::unexpected(makeError(ErrorKind::UnsupportedKind, "Not a URL or resource id: " + input));
}

size_t TaskSummary::count(TransferStatus status) const {
  return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
    [status](const TransferOutcome& outcome) { return outcome.status == status; }));
}

Orchestrator::Orchestrator(
  ExtractorMap extractors,
  TransferManager& transfers,
  Notifier& notifier,
  common::ThreadPool& blocking_pool,
  std::vector<config::ApiEndpointConfig> endpoints,
  fs::path output_root,
  TransferOptions transfer_options
)
  : extractors_(std::move(extractors)),
    transfers_(transfers),
    notifier_(notifier),
    blocking_pool_(blocking_pool),
    endpoints_(std::move(endpoints)),
    output_root_(std::move(output_root)),
    transfer_options_(transfer_options) {}

size_t Orchestrator::submit(Task task) {
  tasks_.push_back(std::move(task));
  return tasks_.size() - 1;
}

net::awaitable<std::vector<TaskSummary>> Orchestrator::runAll() {
  auto tasks = std::move(tasks_);
  tasks_.clear();
  std::vector<TaskSummary> summaries(tasks.size());
  co_await common::forEachConcurrent(tasks.size(), tasks.size(), [&](size_t index) -> net::awaitable<void> {
    summaries[index] = co_await run(tasks[index]);
  });
  co_return summaries;
}

net::awaitable<std::expected<std::vector<DownloadItem>, Error>> Orchestrator::expand(const Task& task) {
  auto resolved = resolveInput(task.input, task.kind_hint, endpoints_);
  if (!resolved) co_return std::unexpected(resolved.error());

  auto extractor = extractors_.find(resolved->kind);
  if (extractor == extractors_.end() || !extractor->second) {
    co_return std::unexpected(makeError(ErrorKind::UnsupportedKind,
      std::string("No extractor for ") + resourceKindLabel(resolved->kind)));
  }
  co_return co_await extractor->second->extract(resolved->id, ExtractOptions{.flatten = task.options.flatten});
}

std::vector<DownloadItem> Orchestrator::applyFilters(
  std::vector<DownloadItem> items,
  const std::string& selection,
  const TaskOptions& options,
  const std::string& label
) {
  const size_t total = items.size();
  std::vector<DownloadItem> selected;
  for (auto index : parseSelection(selection, total)) {
    selected.push_back(std::move(items[index]));
  }
  selected = filterByExtensions(std::move(selected), options.extensions);
  selected = filterAudioFormat(std::move(selected), options.audio_format);

  if (selected.size() != total) {
    notifier_.info(label + ": " + std::to_string(total) + " -> " + std::to_string(selected.size()) + " available");
  }
  if (selected.empty() && total > 0) {
    notifier_.info(label + ": no items matched filter");
  }
  return selected;
}

void Orchestrator::assignPaths(std::vector<DownloadItem>& items, const QualityPolicy& quality) {
  std::vector<int> fallback_ranks;
  for (auto& item : items) {
    if (item.media_kind == MediaKind::Video && !item.variants.empty()) {
      if (auto selection = selectVariant(item.variants, quality)) {
        item.url = selection->variant.manifest_url;
        item.expected_size = selection->variant.estimated_size;
        item.selected_quality = selection->variant.rank;
        if (selection->fell_back) fallback_ranks.push_back(selection->variant.rank);
      }
    }
  }
  if (!fallback_ranks.empty()) {
    notifier_.info(fallbackNotice(quality, fallback_ranks));
  }

  std::set<std::string> taken;
  for (auto& item : items) {
    auto name = item.base_name;
    if (item.selected_quality) name += " [" + std::to_string(*item.selected_quality) + "p]";
    fs::path relative;
    for (const auto& segment : item.directory) relative /= segment;
    relative /= sanitizeFilename(item.extension.empty() ? name : name + "." + item.extension);

    auto candidate = relative;
    for (int n = 2; !taken.insert(candidate.lexically_normal().string()).second; ++n) {
      candidate = relative.parent_path() / withSuffix(relative, n);
    }
    item.relative_path = candidate;
  }
}

net::awaitable<TaskSummary> Orchestrator::run(const Task& task, SelectionPrompter* prompter) {
  TaskSummary summary;
  summary.input = task.input;

  auto items = co_await expand(task);
  if (!items) {
    summary.extraction_error = items.error();
    if (items.error().kind != ErrorKind::Cancelled) {
      notifier_.error("Could not resolve " + task.input + ": " + describe(items.error()));
    }
    co_return summary;
  }
  summary.total_items = items->size();
  if (items->empty()) {
    notifier_.info(task.input + ": no downloadable items found");
    co_return summary;
  }

  std::string selection = task.options.selection.empty() ? "all" : task.options.selection;
  if (prompter) {
    auto listed = *items;
    auto input = task.input;
    selection = co_await common::offload(blocking_pool_, [prompter, input, listed]() {
      return prompter->chooseItems(input, listed);
    });
  }

  auto selected = applyFilters(std::move(*items), selection, task.options, task.input);
  summary.selected_items = selected.size();
  if (selected.empty()) co_return summary;

  auto quality = task.options.quality;
  if (auto ranks = offeredRanks(selected); prompter && ranks.size() > 1) {
    auto input = task.input;
    auto chosen = co_await common::offload(blocking_pool_, [prompter, input, ranks, quality]() {
      return prompter->chooseQuality(input, ranks, quality);
    });
    if (chosen) quality = QualityPolicy{.mode = QualityPolicy::Mode::Exact, .value = *chosen};
  }
  assignPaths(selected, quality);

  std::vector<TransferJob> jobs;
  for (auto& item : selected) {
    auto destination = secureJoin(output_root_, item.relative_path);
    if (!destination) {
      TransferOutcome outcome;
      outcome.name = item.relative_path.string();
      outcome.status = TransferStatus::Failed;
      outcome.error = destination.error();
      notifier_.warn(outcome.name + ": " + describe(destination.error()));
      summary.outcomes.push_back(std::move(outcome));
      continue;
    }
    jobs.push_back(TransferJob{.item = std::move(item), .destination = *destination});
  }

  auto options = transfer_options_;
  options.force = options.force || task.options.force;
  options.quality = quality;
  auto outcomes = co_await transfers_.transferAll(std::move(jobs), options);
  for (auto& outcome : outcomes) {
    if (outcome.status == TransferStatus::Failed && outcome.error && outcome.error->kind != ErrorKind::Cancelled) {
      notifier_.warn("Failed to download " + outcome.name + ": " + describe(*outcome.error));
    }
    summary.outcomes.push_back(std::move(outcome));
  }
  co_return summary;
}

} // namespace download_service
