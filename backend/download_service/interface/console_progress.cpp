#include "console_progress.hpp"
#include <cstdio>
#include <iterator>

namespace download_service {

namespace net = boost::asio;

namespace {

constexpr const char* kClearLine = "\r\033[2K";

std::string displayName(const DownloadItem& item) {
  if (!item.relative_path.empty()) return item.relative_path.generic_string();
  return item.extension.empty() ? item.base_name : item.base_name + "." + item.extension;
}

} // namespace

std::string formatBytes(uint64_t bytes) {
  static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  if (bytes < 1024) return std::to_string(bytes) + " B";
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(units)) {
    value /= 1024.0;
    ++unit;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
  return buffer;
}

ConsoleProgress::ConsoleProgress(
  net::any_io_executor executor,
  std::ostream& out,
  const TransferProgress& progress,
  bool terminal,
  std::chrono::milliseconds interval
)
  : out_(out),
    progress_(progress),
    terminal_(terminal),
    interval_(interval),
    timer_(executor),
    last_sample_(std::chrono::steady_clock::now()) {}

void ConsoleProgress::onState(const DownloadItem& item, TransferState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto name = displayName(item);
  switch (state) {
    case TransferState::Pending:
      ++queued_;
      break;
    case TransferState::Downloading:
      downloading_.insert(name);
      current_ = name;
      break;
    case TransferState::Completed:
      if (downloading_.erase(name) > 0) {
        emitLine("[+] " + name);
      } else {
        emitLine("[=] " + name + " (already complete)");
      }
      break;
    case TransferState::Failed:
      downloading_.erase(name);
      break;
    default:
      break;
  }
  if (state == TransferState::Completed || state == TransferState::Failed) {
    if (current_ == name) current_ = downloading_.empty() ? std::string() : *downloading_.begin();
  }
}

void ConsoleProgress::start() {
  if (!terminal_) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  net::co_spawn(timer_.get_executor(), redrawLoop(), net::detached);
}

void ConsoleProgress::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  timer_.cancel();
  clearLine();
  for (const auto& line : held_) out_ << line << '\n';
  held_.clear();
  out_ << std::flush;
}

void ConsoleProgress::setPaused(bool paused) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (paused_ == paused) return;
  paused_ = paused;
  if (paused_) {
    clearLine();
    return;
  }
  for (const auto& line : held_) out_ << line << '\n';
  held_.clear();
  out_ << std::flush;
}

std::string ConsoleProgress::statusLine(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return composeStatus(now);
}

net::awaitable<void> ConsoleProgress::redrawLoop() {
  for (;;) {
    timer_.expires_after(interval_);
    boost::system::error_code ec;
    co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) co_return;
    drawStatus(std::chrono::steady_clock::now());
  }
}

std::string ConsoleProgress::composeStatus(std::chrono::steady_clock::time_point now) {
  const uint64_t bytes = progress_.bytes.load();
  const double seconds = std::chrono::duration<double>(now - last_sample_).count();
  // short windows give a jumpy rate
  if (seconds >= 0.25) {
    rate_ = static_cast<double>(bytes - last_bytes_) / seconds;
    last_bytes_ = bytes;
    last_sample_ = now;
  }
  const size_t done = progress_.completed.load() + progress_.skipped.load() + progress_.failed.load();

  std::string line = "[" + std::to_string(done) + "/" + std::to_string(queued_) + "] " +
                     std::to_string(progress_.active.load()) + " active | " + formatBytes(bytes) + " | " +
                     formatBytes(static_cast<uint64_t>(rate_)) + "/s";
  if (!current_.empty()) line += " | " + current_;
  return line;
}

void ConsoleProgress::drawStatus(std::chrono::steady_clock::time_point now) {
  if (paused_ || !running_) return;
  out_ << kClearLine << composeStatus(now) << std::flush;
  drawn_ = true;
}

void ConsoleProgress::emitLine(const std::string& line) {
  if (paused_) {
    held_.push_back(line);
    return;
  }
  clearLine();
  out_ << line << std::endl;
  drawStatus(std::chrono::steady_clock::now());
}

void ConsoleProgress::clearLine() {
  if (!drawn_) return;
  out_ << kClearLine << std::flush;
  drawn_ = false;
}

} // namespace download_service
