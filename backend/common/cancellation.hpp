#pragma once

#include <atomic>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>

namespace common {

namespace net = boost::asio;

// Process-wide interrupt flag. Set from the signal handler coroutine, read by
// coroutines and by libcurl progress callbacks on pool threads.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic_bool cancelled_{false};
};

// Parks the calling coroutine for `duration`. Returns false if cancelled first.
inline net::awaitable<bool> sleepFor(std::chrono::steady_clock::duration duration, const CancellationToken& token) {
  constexpr auto kSlice = std::chrono::milliseconds(100);
  auto executor = co_await net::this_coro::executor;
  net::steady_timer timer(executor);
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!token.cancelled()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) co_return true;
    auto remaining = deadline - now;
    timer.expires_after(remaining < kSlice ? remaining : std::chrono::steady_clock::duration(kSlice));
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
  }
  co_return false;
}

} // namespace common
