#pragma once
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio.hpp>

namespace download_service {

namespace net = boost::asio;

// Registry of destination paths currently being written. A second writer for
// the same path parks until the first lease is released. Scheduler thread only.
class PathLockRegistry {
public:
  class Lease {
  public:
    Lease() = default;
    Lease(PathLockRegistry* registry, std::string key) : registry_(registry), key_(std::move(key)) {}
    ~Lease() { release(); }

    Lease(Lease&& other) noexcept : registry_(other.registry_), key_(std::move(other.key_)) { other.registry_ = nullptr; }
    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        release();
        registry_ = other.registry_;
        key_ = std::move(other.key_);
        other.registry_ = nullptr;
      }
      return *this;
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

  private:
    void release() {
      if (registry_) registry_->release(key_);
      registry_ = nullptr;
    }

    PathLockRegistry* registry_{nullptr};
    std::string key_;
  };

  explicit PathLockRegistry(net::any_io_executor executor) : executor_(std::move(executor)) {}

  net::awaitable<Lease> lock(const std::filesystem::path& path);
  bool isHeld(const std::filesystem::path& path) const;
  size_t heldCount() const { return held_.size(); }

private:
  static std::string keyFor(const std::filesystem::path& path);
  void release(const std::string& key);

  net::any_io_executor executor_;
  std::map<std::string, std::deque<std::shared_ptr<net::steady_timer>>> held_;
};

} // namespace download_service
