#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include "application/transfer_manager.hpp"

namespace download_service {

// "512 B", "1.5 KiB", "12.3 MiB"
std::string formatBytes(uint64_t bytes);

// Prints one line per finished item and, on a terminal, keeps a status line
// with the aggregate counts, bytes and rate redrawn in place.
class ConsoleProgress {
public:
  ConsoleProgress(
    boost::asio::any_io_executor executor,
    std::ostream& out,
    const TransferProgress& progress,
    bool terminal,
    std::chrono::milliseconds interval = std::chrono::milliseconds(500)
  );

  ConsoleProgress(const ConsoleProgress&) = delete;
  ConsoleProgress& operator=(const ConsoleProgress&) = delete;

  // Install as the TransferManager state listener.
  void onState(const DownloadItem& item, TransferState state);

  void start();
  // Cancels the redraw timer and clears the status line.
  void stop();

  // Nothing is written while paused; finished item lines are held until resumed.
  // Safe to call from any thread.
  void setPaused(bool paused);

  // "[done/queued] N active | bytes | rate | current item"
  std::string statusLine(std::chrono::steady_clock::time_point now);

private:
  boost::asio::awaitable<void> redrawLoop();
  std::string composeStatus(std::chrono::steady_clock::time_point now);
  void drawStatus(std::chrono::steady_clock::time_point now);
  void emitLine(const std::string& line);
  void clearLine();

  std::ostream& out_;
  const TransferProgress& progress_;
  bool terminal_;
  std::chrono::milliseconds interval_;
  boost::asio::steady_timer timer_;

  std::mutex mutex_;
  bool running_{false};
  bool paused_{false};
  bool drawn_{false};
  size_t queued_{0};
  std::set<std::string> downloading_;
  std::string current_;
  std::vector<std::string> held_;
  uint64_t last_bytes_{0};
  std::chrono::steady_clock::time_point last_sample_;
  double rate_{0.0};
};

} // namespace download_service
