#include "stream_resolver.hpp"
#include <cstdio>
#include <fstream>
#include <vector>
#include "common/async_bridge.hpp"
#include "common/async_semaphore.hpp"
#include "common/http_utils.hpp"
#include "common/logger.hpp"
#include "domain/download_item.hpp"
#include "infrastructure/platform_json.hpp"

namespace download_service {

namespace fs = std::filesystem;
namespace net = boost::asio;

namespace {

bool passesThrough(const Error& error) {
  return error.kind == ErrorKind::Cancelled || error.kind == ErrorKind::AuthRequired ||
         error.kind == ErrorKind::AuthInvalid;
}

Error recast(Error error, ErrorKind kind) {
  if (passesThrough(error)) return error;
  error.message = std::string(errorKindLabel(error.kind)) + ": " + error.message;
  error.kind = kind;
  return error;
}

std::expected<void, Error> writeFileAtomically(const fs::path& path, std::string_view data) {
  auto temp = path;
  temp += SEDDL_TEMP_FILE_SUFFIX;
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) return std::unexpected(makeError(ErrorKind::FilesystemError, "Cannot open " + temp.string()));
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) return std::unexpected(makeError(ErrorKind::FilesystemError, "Write failed for " + temp.string()));
  }
  std::error_code ec;
  fs::rename(temp, path, ec);
  if (ec) return std::unexpected(makeError(ErrorKind::FilesystemError, "Cannot rename " + temp.string() + ": " + ec.message()));
  return {};
}

// Decrypts when a key is given, then writes the part. Returns the plain size.
std::expected<uint64_t, Error> storeSegment(
  const fs::path& part,
  std::string data,
  const std::optional<AesBlock>& key,
  const AesBlock& iv
) {
  if (key) {
    auto decrypted = aes128CbcDecrypt(data, *key, iv);
    if (!decrypted) return std::unexpected(decrypted.error());
    data = std::move(*decrypted);
  }
  auto written = writeFileAtomically(part, data);
  if (!written) return std::unexpected(written.error());
  return static_cast<uint64_t>(data.size());
}

struct MergeResult {
  bool ok{false};
  uint64_t bytes{0};
  std::string message;
};

// Concatenates the parts in index order into destination.tmp, then renames.
MergeResult mergeSegments(const fs::path& segment_dir, size_t count, const fs::path& destination) {
  auto temp = destination;
  temp += SEDDL_TEMP_FILE_SUFFIX;
  MergeResult result;
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      result.message = "Cannot open " + temp.string();
      return result;
    }
    std::vector<char> buffer(256 * 1024);
    for (size_t i = 0; i < count; ++i) {
      auto part = segment_dir / StreamResolver::segmentFileName(i);
      std::ifstream in(part, std::ios::binary);
      if (!in) {
        result.message = "Missing segment " + part.string();
        return result;
      }
      while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got <= 0) break;
        out.write(buffer.data(), got);
        result.bytes += static_cast<uint64_t>(got);
      }
      if (!out) {
        result.message = "Write failed for " + temp.string();
        return result;
      }
    }
  }
  std::error_code ec;
  fs::rename(temp, destination, ec);
  if (ec) {
    result.message = "Cannot rename " + temp.string() + ": " + ec.message();
    return result;
  }
  fs::remove_all(segment_dir, ec);
  if (ec) common::logWarn("Cannot remove " + segment_dir.string() + ": " + ec.message(), "HLS");
  result.ok = true;
  return result;
}

} // namespace

StreamResolver::StreamResolver(FetchContext fetch, Notifier& notifier, common::ThreadPool& blocking_pool, StreamOptions options)
  : fetch_(fetch), notifier_(notifier), blocking_pool_(blocking_pool), options_(options) {}

fs::path StreamResolver::segmentDirectory(const fs::path& destination) {
  auto dir = destination;
  dir += SEDDL_SEGMENT_DIR_SUFFIX;
  return dir;
}

std::string StreamResolver::segmentFileName(size_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "%05zu.ts", index);
  return name;
}

net::awaitable<std::expected<std::string, Error>> StreamResolver::fetchBody(const std::string& url, const std::string& what) {
  HttpRequest request;
  request.url = url;
  request.connect_timeout = options_.connect_timeout;
  request.timeout = options_.timeout;
  auto response = co_await fetchWithRetry(fetch_, request, what);
  if (!response) co_return std::unexpected(response.error());
  co_return std::move(response->body);
}

net::awaitable<std::expected<M3u8Playlist, Error>> StreamResolver::fetchPlaylist(const std::string& url) {
  auto body = co_await fetchBody(url, "playlist " + url);
  if (!body) co_return std::unexpected(recast(body.error(), ErrorKind::ManifestError));
  co_return parsePlaylist(*body);
}

net::awaitable<std::expected<AesBlock, Error>> StreamResolver::fetchKey(const std::string& key_url) {
  if (auto cached = key_cache_.find(key_url); cached != key_cache_.end()) {
    co_return cached->second;
  }

  std::string raw_key;
  auto signs = co_await fetchBody(key_url + "/signs", "key nonce");
  if (!signs) {
    if (signs.error().kind != ErrorKind::NotFound) {
      co_return std::unexpected(recast(signs.error(), ErrorKind::DecryptError));
    }
    // plain HLS key server
    auto direct = co_await fetchBody(key_url, "key " + key_url);
    if (!direct) co_return std::unexpected(recast(direct.error(), ErrorKind::DecryptError));
    raw_key = std::move(*direct);
  } else {
    auto nonce_json = parseJsonBody(*signs, "key nonce");
    auto nonce = nonce_json ? stringField(*nonce_json, "nonce") : std::string();
    if (nonce.empty()) {
      co_return std::unexpected(makeError(ErrorKind::DecryptError, "Key service returned no nonce for " + key_url));
    }
    auto sign = md5Hex(nonce + lastPathSegment(key_url)).substr(0, 16);
    auto signed_url = appendQueryParam(appendQueryParam(key_url, "nonce", nonce), "sign", sign);

    auto wrapped = co_await fetchBody(signed_url, "key " + key_url);
    if (!wrapped) co_return std::unexpected(recast(wrapped.error(), ErrorKind::DecryptError));
    auto key_json = parseJsonBody(*wrapped, "key");
    auto encoded = key_json ? stringField(*key_json, "key") : std::string();
    if (encoded.empty()) {
      co_return std::unexpected(makeError(ErrorKind::DecryptError, "Key service returned no key for " + key_url));
    }
    auto ciphertext = base64Decode(encoded);
    if (!ciphertext) co_return std::unexpected(recast(ciphertext.error(), ErrorKind::DecryptError));
    auto unwrapped = aes128EcbDecrypt(*ciphertext, sign);
    if (!unwrapped) co_return std::unexpected(unwrapped.error());
    raw_key = std::move(*unwrapped);
  }

  auto key = toKeyBlock(raw_key);
  if (!key) co_return std::unexpected(key.error());
  key_cache_[key_url] = *key;
  co_return *key;
}

net::awaitable<std::expected<StreamResult, Error>> StreamResolver::resolve(ResolveRequest request) {
  StreamResult result;
  result.path = request.destination;

  auto media_url = request.manifest_url;
  auto playlist = co_await fetchPlaylist(media_url);
  if (!playlist) co_return std::unexpected(playlist.error());

  if (playlist->is_master) {
    std::vector<QualityVariant> variants;
    for (const auto& entry : playlist->variants) {
      auto url = resolveUrl(media_url, entry.uri);
      if (!url) continue;
      QualityVariant variant;
      variant.rank = entry.height > 0 ? entry.height : static_cast<int>(entry.bandwidth / 1000);
      variant.manifest_url = *url;
      variant.bandwidth = entry.bandwidth;
      variants.push_back(std::move(variant));
    }
    auto selection = selectVariant(variants, request.policy);
    if (!selection) {
      co_return std::unexpected(makeError(ErrorKind::ManifestError, "No usable variant in " + media_url));
    }
    if (selection->fell_back && request.notify_fallback) {
      notifier_.info(fallbackNotice(request.policy, {selection->variant.rank}));
    }
    result.quality = selection->variant.rank;
    media_url = selection->variant.manifest_url;
    common::logDebug("Selected " + std::to_string(selection->variant.rank) + "p: " + media_url, "HLS");

    playlist = co_await fetchPlaylist(media_url);
    if (!playlist) co_return std::unexpected(playlist.error());
    if (playlist->is_master) {
      co_return std::unexpected(makeError(ErrorKind::ManifestError, "Nested master playlist at " + media_url));
    }
  }

  const auto& segments = playlist->segments;
  if (segments.empty()) {
    co_return std::unexpected(makeError(ErrorKind::ManifestError, "Playlist has no segments: " + media_url));
  }

  std::vector<std::optional<AesBlock>> keys(playlist->keys.size());
  for (size_t k = 0; k < playlist->keys.size(); ++k) {
    const auto& key = playlist->keys[k];
    if (key.method != "AES-128") {
      co_return std::unexpected(makeError(ErrorKind::DecryptError, "Unsupported encryption " + key.method));
    }
    auto key_url = resolveUrl(media_url, key.uri);
    if (!key_url) {
      co_return std::unexpected(makeError(ErrorKind::ManifestError, "Bad key URI " + key.uri));
    }
    auto block = co_await fetchKey(*key_url);
    if (!block) co_return std::unexpected(block.error());
    keys[k] = *block;
  }

  const auto segment_dir = segmentDirectory(request.destination);
  std::error_code ec;
  fs::create_directories(segment_dir, ec);
  if (ec) {
    co_return std::unexpected(makeError(ErrorKind::FilesystemError, "Cannot create " + segment_dir.string() + ": " + ec.message()));
  }

  std::optional<Error> failure;
  size_t reused = 0;
  uint64_t fetched_bytes = 0;
  co_await common::forEachConcurrent(segments.size(), options_.segment_workers,
    [&](size_t index) -> net::awaitable<void> {
      if (failure) co_return;
      if (fetch_.cancel.cancelled()) {
        failure = makeError(ErrorKind::Cancelled, "cancelled while fetching segments");
        co_return;
      }
      const auto& segment = segments[index];
      const auto part = segment_dir / segmentFileName(index);
      std::error_code size_ec;
      if (fs::exists(part, size_ec) && fs::file_size(part, size_ec) > 0 && !size_ec) {
        ++reused;
        co_return;
      }

      auto url = resolveUrl(media_url, segment.uri);
      if (!url) {
        failure = makeError(ErrorKind::ManifestError, "Bad segment URI " + segment.uri);
        co_return;
      }
      auto body = co_await fetchBody(*url, "segment " + std::to_string(index));
      if (!body) {
        if (!failure) failure = recast(body.error(), ErrorKind::SegmentFetchError);
        co_return;
      }

      std::optional<AesBlock> key;
      AesBlock iv{};
      if (segment.key_index) {
        key = keys[*segment.key_index];
        iv = sequenceIv(segment.sequence);
        if (const auto& explicit_iv = playlist->keys[*segment.key_index].iv) {
          auto parsed = parseHexIv(*explicit_iv);
          if (!parsed) {
            if (!failure) failure = parsed.error();
            co_return;
          }
          iv = *parsed;
        }
      }

      auto stored = co_await common::offload(blocking_pool_,
        [part, key, iv, data = std::move(*body)]() mutable {
          return storeSegment(part, std::move(data), key, iv);
        });
      if (!stored) {
        if (!failure) {
          failure = stored.error();
          if (failure->kind == ErrorKind::DecryptError) failure->message += " (segment " + std::to_string(index) + ")";
        }
        co_return;
      }
      fetched_bytes += *stored;
      if (request.on_bytes) request.on_bytes(*stored);
    });

  if (failure) co_return std::unexpected(*failure);
  if (fetch_.cancel.cancelled()) {
    co_return std::unexpected(makeError(ErrorKind::Cancelled, "cancelled before merge"));
  }

  const size_t count = segments.size();
  const auto destination = request.destination;
  auto merged = co_await common::offload(blocking_pool_, [segment_dir, count, destination]() {
    return mergeSegments(segment_dir, count, destination);
  });
  if (!merged.ok) {
    co_return std::unexpected(makeError(ErrorKind::FilesystemError, merged.message));
  }

  result.segments = count;
  result.reused_segments = reused;
  result.bytes_written = merged.bytes;
  common::logInfo("Merged " + std::to_string(count) + " segments (" + std::to_string(reused) +
                  " reused, " + std::to_string(fetched_bytes) + " bytes fetched) into " +
                  destination.string(), "HLS");
  co_return result;
}

} // namespace download_service
