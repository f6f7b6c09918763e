#include "path_lock_registry.hpp"

namespace download_service {

std::string PathLockRegistry::keyFor(const std::filesystem::path& path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  return (ec ? path : absolute).lexically_normal().string();
}

net::awaitable<PathLockRegistry::Lease> PathLockRegistry::lock(const std::filesystem::path& path) {
  auto key = keyFor(path);
  auto it = held_.find(key);
  if (it == held_.end()) {
    held_.emplace(key, std::deque<std::shared_ptr<net::steady_timer>>{});
    co_return Lease(this, key);
  }

  auto timer = std::make_shared<net::steady_timer>(executor_, net::steady_timer::time_point::max());
  it->second.push_back(timer);
  // ownership is handed over by release() cancelling the timer
  boost::system::error_code ec;
  co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
  co_return Lease(this, key);
}

bool PathLockRegistry::isHeld(const std::filesystem::path& path) const {
  return held_.count(keyFor(path)) > 0;
}

void PathLockRegistry::release(const std::string& key) {
  auto it = held_.find(key);
  if (it == held_.end()) return;
  if (it->second.empty()) {
    held_.erase(it);
    return;
  }
  auto next = std::move(it->second.front());
  it->second.pop_front();
  next->cancel();
}

} // namespace download_service
