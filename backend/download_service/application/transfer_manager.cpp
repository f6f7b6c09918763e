#include "transfer_manager.hpp"
#include <algorithm>
#include <fstream>
#include <memory>
#include "common/async_bridge.hpp"
#include "common/file_naming.hpp"
#include "common/http_utils.hpp"
#include "common/logger.hpp"
#include "infrastructure/hls_crypto.hpp"

namespace download_service {

namespace fs = std::filesystem;

namespace {

// Destination of one streamed body. Opened by the first 2xx chunk so that a
// 206 appends to the partial file and a 200 starts it over.
struct SinkState {
  fs::path path;
  std::ofstream out;
  bool started{false};
  uint64_t bytes{0};
};

class ActiveCount {
public:
  explicit ActiveCount(std::atomic<size_t>& counter) : counter_(counter) { ++counter_; }
  ~ActiveCount() { --counter_; }
  ActiveCount(const ActiveCount&) = delete;
  ActiveCount& operator=(const ActiveCount&) = delete;

private:
  std::atomic<size_t>& counter_;
};

uint64_t sizeOrZero(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return 0;
  auto size = fs::file_size(path, ec);
  return ec ? 0 : size;
}

void removeQuietly(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) common::logWarn("Cannot remove " + path.string() + ": " + ec.message(), "TRANSFER");
}

// Runs on the blocking pool; MD5 of a large file takes a while.
std::expected<void, Error> verifyTemp(const fs::path& temp, const DownloadItem& item) {
  std::error_code ec;
  auto size = fs::file_size(temp, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorKind::FilesystemError, "Cannot stat " + temp.string() + ": " + ec.message()));
  }
  if (size == 0) {
    removeQuietly(temp);
    return std::unexpected(makeError(ErrorKind::ChecksumMismatch, "Server sent an empty file"));
  }
  if (item.expected_size) {
    if (size < *item.expected_size) {
      return std::unexpected(makeError(ErrorKind::NetworkError,
        "Incomplete transfer: " + std::to_string(size) + " of " + std::to_string(*item.expected_size) + " bytes"));
    }
    if (size > *item.expected_size) {
      removeQuietly(temp);
      return std::unexpected(makeError(ErrorKind::ChecksumMismatch,
        "Size " + std::to_string(size) + " exceeds the declared " + std::to_string(*item.expected_size) + " bytes"));
    }
  }
  if (item.expected_md5) {
    auto digest = md5HexFile(temp);
    if (!digest) return std::unexpected(digest.error());
    if (*digest != toLower(*item.expected_md5)) {
      removeQuietly(temp);
      return std::unexpected(makeError(ErrorKind::ChecksumMismatch,
        "MD5 " + *digest + " does not match " + *item.expected_md5));
    }
  }
  return {};
}

} // namespace

TransferManager::TransferManager(
  net::any_io_executor executor,
  FetchContext fetch,
  StreamResolver& streams,
  PathLockRegistry& locks,
  common::ThreadPool& blocking_pool,
  size_t max_workers
)
  : fetch_(fetch),
    streams_(streams),
    locks_(locks),
    blocking_pool_(blocking_pool),
    max_workers_(std::max<size_t>(max_workers, 1)),
    slots_(std::move(executor), std::max<size_t>(max_workers, 1)) {}

fs::path TransferManager::tempPath(const fs::path& destination) {
  auto temp = destination;
  temp += SEDDL_TEMP_FILE_SUFFIX;
  return temp;
}

bool TransferManager::isComplete(const fs::path& path, const DownloadItem& item) {
  auto size = sizeOrZero(path);
  if (size == 0) return false;
  if (item.media_kind == MediaKind::Video) return true;
  if (item.expected_size && size != *item.expected_size) return false;
  if (item.expected_md5) {
    auto digest = md5HexFile(path);
    if (!digest || *digest != toLower(*item.expected_md5)) return false;
  }
  return true;
}

void TransferManager::notify(const DownloadItem& item, TransferState state) {
  common::logDebug(item.relative_path.string() + " -> " + transferStateLabel(state), "TRANSFER");
  if (listener_) listener_(item, state);
}

net::awaitable<TransferOutcome> TransferManager::transfer(TransferJob job, TransferOptions options) {
  TransferOutcome outcome;
  outcome.name = job.item.relative_path.empty() ? job.destination.filename().string() : job.item.relative_path.string();
  outcome.path = job.destination;
  notify(job.item, TransferState::Pending);

  auto fail = [&](Error error) {
    outcome.status = TransferStatus::Failed;
    outcome.error = std::move(error);
    ++progress_.failed;
    notify(job.item, TransferState::Failed);
    common::logWarn(outcome.name + ": " + describe(*outcome.error), "TRANSFER");
  };

  // path first, so a writer waiting on a busy path does not hold a slot
  auto lease = co_await locks_.lock(job.destination);
  co_await slots_.acquire();
  common::SemaphoreGuard slot(slots_);
  ActiveCount active(progress_.active);

  if (fetch_.cancel.cancelled()) {
    fail(makeError(ErrorKind::Cancelled, "cancelled before start"));
    co_return outcome;
  }
  notify(job.item, TransferState::Resolving);

  std::error_code ec;
  if (job.destination.has_parent_path()) {
    fs::create_directories(job.destination.parent_path(), ec);
    if (ec) {
      fail(makeError(ErrorKind::FilesystemError, "Cannot create " + job.destination.parent_path().string() + ": " + ec.message()));
      co_return outcome;
    }
  }

  if (!options.force) {
    auto destination = job.destination;
    auto item = job.item;
    bool complete = co_await common::offload(blocking_pool_, [destination, item]() {
      return isComplete(destination, item);
    });
    if (complete) {
      outcome.status = TransferStatus::Skipped;
      ++progress_.skipped;
      notify(job.item, TransferState::Completed);
      common::logInfo("Already complete: " + outcome.name, "TRANSFER");
      co_return outcome;
    }
  }

  std::expected<uint64_t, Error> result;
  if (job.item.media_kind == MediaKind::Video) {
    result = co_await downloadStream(job, options);
  } else {
    result = co_await downloadDirect(job, options);
  }
  if (!result) {
    fail(result.error());
    co_return outcome;
  }

  outcome.status = TransferStatus::Completed;
  outcome.bytes_transferred = *result;
  ++progress_.completed;
  notify(job.item, TransferState::Completed);
  common::logInfo("Saved " + outcome.name + " (" + std::to_string(*result) + " bytes)", "TRANSFER");
  co_return outcome;
}

net::awaitable<std::vector<TransferOutcome>> TransferManager::transferAll(std::vector<TransferJob> jobs, TransferOptions options) {
  std::vector<TransferOutcome> outcomes(jobs.size());
  co_await common::forEachConcurrent(jobs.size(), max_workers_, [&](size_t index) -> net::awaitable<void> {
    outcomes[index] = co_await transfer(jobs[index], options);
  });
  co_return outcomes;
}

net::awaitable<std::expected<uint64_t, Error>> TransferManager::downloadStream(const TransferJob& job, const TransferOptions& options) {
  notify(job.item, TransferState::Downloading);
  ResolveRequest request;
  request.manifest_url = job.item.url;
  if (job.item.selected_quality) {
    request.policy = QualityPolicy{.mode = QualityPolicy::Mode::Exact, .value = *job.item.selected_quality};
    request.notify_fallback = false;
  } else {
    request.policy = options.quality;
  }
  request.destination = job.destination;
  request.on_bytes = [this](uint64_t bytes) { progress_.bytes += bytes; };

  auto result = co_await streams_.resolve(std::move(request));
  if (!result) co_return std::unexpected(result.error());

  notify(job.item, TransferState::Verifying);
  if (sizeOrZero(job.destination) == 0) {
    removeQuietly(job.destination);
    co_return std::unexpected(makeError(ErrorKind::ManifestError, "Stream produced an empty file"));
  }
  co_return result->bytes_written;
}

net::awaitable<std::expected<HttpResponse, Error>> TransferManager::fetchRange(
  const TransferJob& job,
  const TransferOptions& options,
  uint64_t& written
) {
  if (fetch_.cancel.cancelled()) {
    co_return std::unexpected(makeError(ErrorKind::Cancelled, "cancelled during " + job.item.url));
  }

  const auto temp = tempPath(job.destination);
  const auto& expected_size = job.item.expected_size;
  uint64_t offset = sizeOrZero(temp);
  if (expected_size && offset > *expected_size) {
    removeQuietly(temp);
    offset = 0;
  }
  if (expected_size && offset > 0 && offset == *expected_size) {
    // a previous run received every byte but stopped before the rename
    HttpResponse done;
    done.status = 206;
    co_return done;
  }

  auto sink = std::make_shared<SinkState>();
  sink->path = temp;

  HttpRequest request;
  request.url = job.item.url;
  request.connect_timeout = options.connect_timeout;
  request.timeout = options.timeout;
  if (offset > 0) {
    request.headers.emplace_back("Range", "bytes=" + std::to_string(offset) + "-");
    common::logDebug("Resuming " + temp.string() + " at " + std::to_string(offset), "TRANSFER");
  }
  request.on_body_start = [sink, offset](int status) {
    sink->started = true;
    auto mode = std::ios::binary | (status == 206 && offset > 0 ? std::ios::app : std::ios::trunc);
    sink->out.open(sink->path, mode);
    return sink->out.good();
  };
  request.body_sink = [sink, this](std::string_view chunk) {
    sink->out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!sink->out) return false;
    sink->bytes += chunk.size();
    progress_.bytes += chunk.size();
    return true;
  };

  std::expected<HttpResponse, Error> response;
  if (fetch_.auth) {
    response = co_await fetch_.auth->send(fetch_.client, std::move(request));
  } else {
    response = co_await fetch_.client.send(std::move(request));
  }
  if (sink->out.is_open()) sink->out.close();
  written += sink->bytes;

  if (!response) co_return response;
  if (response->status == 416) co_return response;
  if (!response->ok()) co_return std::unexpected(responseError(*response, job.item.url));

  if (!sink->started && response->status == 200) {
    // empty 200 body: the partial file is stale either way
    std::ofstream truncate(temp, std::ios::binary | std::ios::trunc);
  }
  auto size = sizeOrZero(temp);
  if (expected_size && size < *expected_size) {
    co_return std::unexpected(makeError(ErrorKind::NetworkError,
      "Connection closed at " + std::to_string(size) + " of " + std::to_string(*expected_size) + " bytes"));
  }
  co_return response;
}

net::awaitable<std::expected<uint64_t, Error>> TransferManager::downloadDirect(const TransferJob& job, const TransferOptions& options) {
  const auto temp = tempPath(job.destination);
  uint64_t written = 0;
  bool restarted = false;

  for (;;) {
    notify(job.item, TransferState::Downloading);
    auto response = co_await fetch_.retry.run(
      [&]() { return fetchRange(job, options, written); },
      fetch_.cancel, job.item.url);
    if (!response) co_return std::unexpected(response.error());
    if (response->status != 416) break;

    // the partial no longer matches what the server has
    removeQuietly(temp);
    if (restarted) {
      co_return std::unexpected(makeError(ErrorKind::NetworkError, "Range not satisfiable after restart", 416));
    }
    restarted = true;
  }

  notify(job.item, TransferState::Verifying);
  auto item = job.item;
  auto verified = co_await common::offload(blocking_pool_, [temp, item]() {
    return verifyTemp(temp, item);
  });
  if (!verified) co_return std::unexpected(verified.error());

  std::error_code ec;
  fs::rename(temp, job.destination, ec);
  if (ec) {
    co_return std::unexpected(makeError(ErrorKind::FilesystemError,
      "Cannot rename " + temp.string() + ": " + ec.message()));
  }
  co_return written;
}

} // namespace download_service
