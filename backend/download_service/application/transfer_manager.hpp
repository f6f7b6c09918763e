#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include "application/http_fetch.hpp"
#include "application/path_lock_registry.hpp"
#include "application/quality_selector.hpp"
#include "application/stream_resolver.hpp"
#include "common/async_semaphore.hpp"
#include "common/thread_pool.hpp"
#include "domain/download_item.hpp"

namespace download_service {

struct TransferOptions {
  bool force{false};
  QualityPolicy quality;
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
};

struct TransferJob {
  DownloadItem item;
  std::filesystem::path destination;
};

struct TransferProgress {
  std::atomic<uint64_t> bytes{0};
  std::atomic<size_t> active{0};
  std::atomic<size_t> completed{0};
  std::atomic<size_t> skipped{0};
  std::atomic<size_t> failed{0};
};

using StateListener = std::function<void(const DownloadItem&, TransferState)>;

// Moves bytes for download items. Direct files are written to "<dest>.tmp",
// resumed with Range requests and renamed into place only after the size
// and MD5 check; videos go through the StreamResolver. At most max_workers
// transfers run at once, shared by every caller of this instance.
class TransferManager {
public:
  TransferManager(
    net::any_io_executor executor,
    FetchContext fetch,
    StreamResolver& streams,
    PathLockRegistry& locks,
    common::ThreadPool& blocking_pool,
    size_t max_workers
  );

  net::awaitable<TransferOutcome> transfer(TransferJob job, TransferOptions options);
  net::awaitable<std::vector<TransferOutcome>> transferAll(std::vector<TransferJob> jobs, TransferOptions options);

  void setStateListener(StateListener listener) { listener_ = std::move(listener); }
  const TransferProgress& progress() const { return progress_; }
  size_t maxWorkers() const { return max_workers_; }

  // Whether the file at path already satisfies the item's size and MD5.
  static bool isComplete(const std::filesystem::path& path, const DownloadItem& item);

  static std::filesystem::path tempPath(const std::filesystem::path& destination);

private:
  net::awaitable<std::expected<uint64_t, Error>> downloadDirect(const TransferJob& job, const TransferOptions& options);
  net::awaitable<std::expected<HttpResponse, Error>> fetchRange(
    const TransferJob& job,
    const TransferOptions& options,
    uint64_t& written
  );
  net::awaitable<std::expected<uint64_t, Error>> downloadStream(const TransferJob& job, const TransferOptions& options);
  void notify(const DownloadItem& item, TransferState state);

  FetchContext fetch_;
  StreamResolver& streams_;
  PathLockRegistry& locks_;
  common::ThreadPool& blocking_pool_;
  size_t max_workers_;
  common::AsyncSemaphore slots_;
  TransferProgress progress_;
  StateListener listener_;
};

} // namespace download_service
