#include "async_semaphore.hpp"

namespace common {

AsyncSemaphore::AsyncSemaphore(net::any_io_executor executor, size_t count)
  : executor_(std::move(executor)), count_(count) {}

net::awaitable<void> AsyncSemaphore::acquire() {
  if (count_ > 0) {
    --count_;
    co_return;
  }

  auto timer = std::make_shared<net::steady_timer>(executor_, net::steady_timer::time_point::max());
  waiters_.push_back(timer);

  // release() hands the unit over by cancelling the timer
  boost::system::error_code ec;
  co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
}

void AsyncSemaphore::release() {
  if (!waiters_.empty()) {
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->cancel();
    return;
  }
  ++count_;
}

} // namespace common
