#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include "application/http_fetch.hpp"
#include "application/quality_selector.hpp"
#include "common/thread_pool.hpp"
#include "domain/errors.hpp"
#include "domain/notifier.hpp"
#include "infrastructure/hls_crypto.hpp"
#include "infrastructure/m3u8_parser.hpp"

namespace download_service {

struct StreamOptions {
  size_t segment_workers{8};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
};

struct ResolveRequest {
  std::string manifest_url;
  QualityPolicy policy;
  // false when the caller already announced a fallback for this item
  bool notify_fallback{true};
  std::filesystem::path destination;
  std::function<void(uint64_t)> on_bytes;
};

struct StreamResult {
  std::filesystem::path path;
  size_t segments{0};
  size_t reused_segments{0};
  uint64_t bytes_written{0};
  std::optional<int> quality;
};

// Rebuilds one media file from an (optionally AES-128 encrypted) HLS stream.
// Decrypted segments are kept in "<destination>.segments/" until the merge,
// so an interrupted run fetches only the missing ones. The merge writes
// "<destination>.tmp" and renames it into place.
class StreamResolver {
public:
  StreamResolver(FetchContext fetch, Notifier& notifier, common::ThreadPool& blocking_pool, StreamOptions options);

  boost::asio::awaitable<std::expected<StreamResult, Error>> resolve(ResolveRequest request);

  // Content key behind an EXT-X-KEY URI. Uses the platform's nonce/sign
  // exchange when "/signs" is served, the raw key body otherwise.
  boost::asio::awaitable<std::expected<AesBlock, Error>> fetchKey(const std::string& key_url);

  static std::filesystem::path segmentDirectory(const std::filesystem::path& destination);
  static std::string segmentFileName(size_t index);

private:
  boost::asio::awaitable<std::expected<std::string, Error>> fetchBody(const std::string& url, const std::string& what);
  boost::asio::awaitable<std::expected<M3u8Playlist, Error>> fetchPlaylist(const std::string& url);

  FetchContext fetch_;
  Notifier& notifier_;
  common::ThreadPool& blocking_pool_;
  StreamOptions options_;
  std::map<std::string, AesBlock> key_cache_;
};

} // namespace download_service
