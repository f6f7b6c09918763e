#pragma once
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include "application/quality_selector.hpp"
#include "application/transfer_manager.hpp"
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "domain/download_item.hpp"
#include "domain/notifier.hpp"
#include "domain/resource_extractor.hpp"
#include "infrastructure/extractor_factory.hpp"

namespace download_service {

struct TaskOptions {
  std::string selection{"all"};
  std::vector<std::string> extensions;
  std::string audio_format{"mp3"};
  QualityPolicy quality;
  bool flatten{false};
  bool force{false};
};

struct Task {
  std::string input;                        // URL or bare resource id
  std::optional<ResourceKind> kind_hint;
  TaskOptions options;
};

struct ResolvedInput {
  ResourceKind kind{ResourceKind::Course};
  std::string id;
};

// Maps a page URL or a bare id (with a kind hint) onto a resource kind and id.
std::expected<ResolvedInput, Error> resolveInput(
  const std::string& input,
  const std::optional<ResourceKind>& kind_hint,
  const std::vector<config::ApiEndpointConfig>& endpoints
);

struct TaskSummary {
  std::string input;
  std::optional<Error> extraction_error;
  size_t total_items{0};
  size_t selected_items{0};
  std::vector<TransferOutcome> outcomes;

  size_t count(TransferStatus status) const;
  size_t completed() const { return count(TransferStatus::Completed); }
  size_t skipped() const { return count(TransferStatus::Skipped); }
  size_t failed() const { return count(TransferStatus::Failed); }
  bool ok() const { return !extraction_error && failed() == 0; }
};

// Interactive item choice. Blocking; the orchestrator calls it off the scheduler.
class SelectionPrompter {
public:
  virtual ~SelectionPrompter() = default;
  // Returns a selection such as "all" or "1,3,5-8".
  virtual std::string chooseItems(const std::string& input, const std::vector<DownloadItem>& items) = 0;
  // Asked only when the selected videos come in more than one quality.
  // ranks is highest first; nullopt keeps `current`.
  virtual std::optional<int> chooseQuality(
    const std::string& input,
    const std::vector<int>& ranks,
    const QualityPolicy& current
  ) = 0;
};

class Orchestrator {
public:
  Orchestrator(
    ExtractorMap extractors,
    TransferManager& transfers,
    Notifier& notifier,
    common::ThreadPool& blocking_pool,
    std::vector<config::ApiEndpointConfig> endpoints,
    std::filesystem::path output_root,
    TransferOptions transfer_options
  );

  // Queues a task; the handle indexes the summaries returned by runAll.
  size_t submit(Task task);
  size_t pending() const { return tasks_.size(); }

  // Runs every submitted task concurrently. A failing task never stops the others.
  net::awaitable<std::vector<TaskSummary>> runAll();

  net::awaitable<TaskSummary> run(const Task& task, SelectionPrompter* prompter = nullptr);

  // Extraction only, in presentation order. Shared by batch and interactive runs.
  net::awaitable<std::expected<std::vector<DownloadItem>, Error>> expand(const Task& task);

  // Selection, extension and audio filters; reports "N -> M available".
  std::vector<DownloadItem> applyFilters(
    std::vector<DownloadItem> items,
    const std::string& selection,
    const TaskOptions& options,
    const std::string& label
  );

  // Settles video quality and relative paths. One fallback notice per call.
  void assignPaths(std::vector<DownloadItem>& items, const QualityPolicy& quality);

private:
  ExtractorMap extractors_;
  TransferManager& transfers_;
  Notifier& notifier_;
  common::ThreadPool& blocking_pool_;
  std::vector<config::ApiEndpointConfig> endpoints_;
  std::filesystem::path output_root_;
  TransferOptions transfer_options_;
  std::vector<Task> tasks_;
};

} // namespace download_service
