#include "retry_policy.hpp"
#include <algorithm>

namespace download_service {

RetryOptions retryOptionsFrom(const config::NetworkConfig& cfg) {
  return RetryOptions{
    .max_retries = cfg.max_retries,
    .rate_limit_retries = cfg.rate_limit_retries,
    .backoff_base = cfg.backoff_base,
    .backoff_cap = cfg.backoff_cap,
  };
}

RetryPolicy::RetryPolicy(RetryOptions options, std::function<double()> jitter)
  : options_(options), jitter_(std::move(jitter)) {
  if (!jitter_) {
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    auto mutex = std::make_shared<std::mutex>();
    jitter_ = [engine, mutex]() {
      std::lock_guard<std::mutex> lock(*mutex);
      return std::uniform_real_distribution<double>(0.0, 1.0)(*engine);
    };
  }
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int attempt) const {
  auto base = options_.backoff_base.count();
  auto cap = options_.backoff_cap.count();
  long long delay = base;
  for (int i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  delay = std::min<long long>(delay, cap);
  auto half = delay / 2;
  auto jittered = half + static_cast<long long>(static_cast<double>(delay - half) * jitter_());
  return std::chrono::milliseconds(jittered);
}

} // namespace download_service
