#pragma once
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <boost/asio.hpp>
#include "common/cancellation.hpp"
#include "common/config/config.hpp"
#include "common/logger.hpp"
#include "domain/errors.hpp"

namespace download_service {

struct RetryOptions {
  int max_retries{3};
  int rate_limit_retries{3};
  std::chrono::milliseconds backoff_base{500};
  std::chrono::milliseconds backoff_cap{8000};
};

RetryOptions retryOptionsFrom(const config::NetworkConfig& cfg);

class RetryPolicy {
public:
  // jitter returns a fraction in [0, 1); defaults to a seeded uniform source.
  explicit RetryPolicy(RetryOptions options, std::function<double()> jitter = nullptr);

  const RetryOptions& options() const { return options_; }

  // Capped exponential delay for the given zero-based retry, with the upper
  // half randomized ("equal jitter").
  std::chrono::milliseconds backoffDelay(int attempt) const;

  // Runs op until it succeeds, fails permanently or exhausts its budget.
  // 429 waits exactly the server's Retry-After; transient failures back off.
  template <typename Op>
  boost::asio::awaitable<typename std::invoke_result_t<Op>::value_type> run(
    Op op,
    const common::CancellationToken& cancel,
    std::string what
  ) const {
    int transient_attempts = 0;
    int rate_limit_attempts = 0;
    for (;;) {
      auto result = co_await op();
      if (result) co_return result;

      const Error& error = result.error();
      std::chrono::milliseconds delay{0};
      if (error.kind == ErrorKind::RateLimited) {
        if (rate_limit_attempts >= options_.rate_limit_retries) co_return result;
        delay = error.retry_after.value_or(backoffDelay(rate_limit_attempts));
        ++rate_limit_attempts;
      } else if (isRetryable(error)) {
        if (transient_attempts >= options_.max_retries) co_return result;
        delay = backoffDelay(transient_attempts);
        ++transient_attempts;
      } else {
        co_return result;
      }

      common::logDebug(what + ": " + describe(error) + ", retrying in " +
                       std::to_string(delay.count()) + "ms", "RETRY");
      if (!co_await common::sleepFor(delay, cancel)) {
        co_return std::unexpected(makeError(ErrorKind::Cancelled, "interrupted while waiting to retry " + what));
      }
    }
  }

private:
  RetryOptions options_;
  std::function<double()> jitter_;
};

} // namespace download_service
