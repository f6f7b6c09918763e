#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <boost/asio.hpp>
#include "common/thread_pool.hpp"

namespace common {

namespace net = boost::asio;

// Runs fn on the blocking pool and resumes the calling coroutine on its own
// executor once fn returns. Exceptions thrown by fn are rethrown at the co_await.
template <typename Fn>
net::awaitable<std::invoke_result_t<Fn>> offload(ThreadPool& pool, Fn fn) {
  using Result = std::invoke_result_t<Fn>;
  static_assert(std::is_default_constructible_v<Result>, "offload result must be default constructible");

  // tracked, so the io_context keeps running while the pool holds the work
  auto executor = net::prefer(co_await net::this_coro::executor, net::execution::outstanding_work.tracked);
  co_return co_await net::async_initiate<const net::use_awaitable_t<>&, void(std::exception_ptr, Result)>(
    [&pool, executor](auto handler, Fn work) {
      pool.commit([handler = std::move(handler), work = std::move(work), executor]() mutable {
        std::exception_ptr error;
        Result result{};
        try {
          result = work();
        } catch (...) {
          error = std::current_exception();
        }
        net::post(executor, [handler = std::move(handler), error, result = std::move(result)]() mutable {
          std::move(handler)(error, std::move(result));
        });
      });
    },
    net::use_awaitable, std::move(fn));
}

} // namespace common
