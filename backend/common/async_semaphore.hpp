#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <utility>
#include <boost/asio.hpp>

namespace common {

namespace net = boost::asio;

// Counting semaphore for coroutines running on a single scheduler thread.
// A waiter parks on a timer and is resumed by release(); no thread blocks.
class AsyncSemaphore {
public:
  AsyncSemaphore(net::any_io_executor executor, size_t count);

  AsyncSemaphore(const AsyncSemaphore&) = delete;
  AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

  net::awaitable<void> acquire();
  void release();

  size_t available() const { return count_; }
  size_t waiting() const { return waiters_.size(); }

private:
  net::any_io_executor executor_;
  size_t count_;
  std::deque<std::shared_ptr<net::steady_timer>> waiters_;
};

// Releases one unit on scope exit.
class SemaphoreGuard {
public:
  explicit SemaphoreGuard(AsyncSemaphore& semaphore) : semaphore_(&semaphore) {}
  ~SemaphoreGuard() { if (semaphore_) semaphore_->release(); }

  SemaphoreGuard(SemaphoreGuard&& other) noexcept : semaphore_(other.semaphore_) { other.semaphore_ = nullptr; }
  SemaphoreGuard(const SemaphoreGuard&) = delete;
  SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;
  SemaphoreGuard& operator=(SemaphoreGuard&&) = delete;

private:
  AsyncSemaphore* semaphore_;
};

// Runs fn(i) for every i in [0, count) with at most `limit` in flight and
// returns once all have finished. The first exception is rethrown afterwards.
template <typename Fn>
net::awaitable<void> forEachConcurrent(size_t count, size_t limit, Fn fn) {
  if (count == 0) co_return;
  auto executor = co_await net::this_coro::executor;
  const size_t workers = std::min(count, std::max<size_t>(limit, 1));
  size_t next = 0;
  std::exception_ptr first_error;
  AsyncSemaphore done(executor, 0);

  for (size_t w = 0; w < workers; ++w) {
    net::co_spawn(executor,
      [&]() -> net::awaitable<void> {
        while (next < count) {
          size_t index = next++;
          co_await fn(index);
        }
      },
      [&](std::exception_ptr error) {
        if (error && !first_error) first_error = error;
        done.release();
      });
  }
  for (size_t w = 0; w < workers; ++w) {
    co_await done.acquire();
  }
  if (first_error) std::rethrow_exception(first_error);
}

} // namespace common
