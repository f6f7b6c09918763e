#include <catch2/catch.hpp>
#include <algorithm>
#include "application/transfer_manager.hpp"
#include "infrastructure/hls_crypto.hpp"
#include "support/engine_fixture.hpp"

using namespace download_service;
using namespace test_support;
using std::chrono::milliseconds;

namespace {

DownloadItem fileItem(const std::string& url, const std::string& content) {
  DownloadItem item;
  item.id = url;
  item.media_kind = MediaKind::Document;
  item.url = url;
  item.expected_size = content.size();
  item.expected_md5 = md5Hex(content);
  item.base_name = "file";
  item.extension = "pdf";
  return item;
}

class TransferManagerTest {
protected:
  TransferManager makeManager(size_t max_workers) {
    return TransferManager(fx.ioc.get_executor(), fx.fetch, streams, locks, fx.pool, max_workers);
  }

  TransferOutcome transfer(TransferManager& manager, DownloadItem item, const std::filesystem::path& destination,
                           TransferOptions options = {}) {
    return fx.run(manager.transfer(TransferJob{std::move(item), destination}, options));
  }

  EngineFixture fx;
  StreamResolver streams{fx.fetch, fx.notifier, fx.pool, StreamOptions{.segment_workers = 2}};
  PathLockRegistry locks{fx.ioc.get_executor()};
};

}

TEST_CASE_METHOD(TransferManagerTest, "verified file is renamed into place", "[transfer_manager]") {
  const auto content = patternBytes(40000, 1);
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto manager = makeManager(2);
  const auto destination = fx.dir / "sub" / "a.pdf";

  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", content), destination);
  REQUIRE(outcome.status == TransferStatus::Completed);
  CHECK(outcome.bytes_transferred == content.size());
  CHECK(readFile(destination) == content);
  CHECK_FALSE(std::filesystem::exists(TransferManager::tempPath(destination)));
  CHECK(manager.progress().completed.load() == 1u);
}

TEST_CASE_METHOD(TransferManagerTest, "checksum mismatch leaves nothing behind", "[transfer_manager]") {
  const auto content = patternBytes(1000, 2);
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto item = fileItem("https://f.test/a.pdf", content);
  item.expected_md5 = md5Hex("something else");
  auto manager = makeManager(2);
  const auto destination = fx.dir / "a.pdf";

  auto outcome = transfer(manager, item, destination);
  REQUIRE(outcome.status == TransferStatus::Failed);
  REQUIRE(outcome.error.has_value());
  CHECK(outcome.error->kind == ErrorKind::ChecksumMismatch);
  CHECK_FALSE(std::filesystem::exists(destination));
  CHECK_FALSE(std::filesystem::exists(TransferManager::tempPath(destination)));
}

TEST_CASE_METHOD(TransferManagerTest, "oversized body is a checksum mismatch", "[transfer_manager]") {
  const auto content = patternBytes(1000, 3);
  fx.http.serveFile("https://f.test/a.pdf", content + "extra");
  auto item = fileItem("https://f.test/a.pdf", content);
  item.expected_md5.reset();
  auto manager = makeManager(1);

  auto outcome = transfer(manager, item, fx.dir / "a.pdf");
  REQUIRE(outcome.error.has_value());
  CHECK(outcome.error->kind == ErrorKind::ChecksumMismatch);
}

TEST_CASE_METHOD(TransferManagerTest, "resumes a partial temp file with a range request", "[transfer_manager]") {
  const auto content = patternBytes(100000, 4);
  const auto destination = fx.dir / "a.pdf";
  writeFile(TransferManager::tempPath(destination), content.substr(0, 40000));
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto manager = makeManager(1);

  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", content), destination);
  REQUIRE(outcome.status == TransferStatus::Completed);
  CHECK(outcome.bytes_transferred == 60000u);
  CHECK(readFile(destination) == content);

  auto requests = fx.http.recordsFor("https://f.test/a.pdf");
  REQUIRE(requests.size() == 1u);
  CHECK(FakeHttpClient::header(requests[0].request, "Range") == "bytes=40000-");
}

TEST_CASE_METHOD(TransferManagerTest, "dropped connection is resumed where it stopped", "[transfer_manager]") {
  const auto content = patternBytes(70000, 5);
  int calls = 0;
  fx.http.on("https://f.test/a.pdf", [&](const HttpRequest& request) -> std::expected<HttpResponse, Error> {
    if (++calls == 1) {
      return FakeHttpClient::response(200, content, {{FakeHttpClient::kDisconnectAfter, "30000"}});
    }
    return FakeHttpClient::rangeResponse(request, content);
  });
  auto manager = makeManager(1);
  const auto destination = fx.dir / "a.pdf";

  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", content), destination);
  REQUIRE(outcome.status == TransferStatus::Completed);
  CHECK(readFile(destination) == content);
  CHECK(outcome.bytes_transferred == content.size());

  auto requests = fx.http.recordsFor("https://f.test/a.pdf");
  REQUIRE(requests.size() == 2u);
  CHECK_FALSE(FakeHttpClient::header(requests[0].request, "Range").has_value());
  CHECK(FakeHttpClient::header(requests[1].request, "Range") == "bytes=30000-");
}

TEST_CASE_METHOD(TransferManagerTest, "complete file is skipped on rerun", "[transfer_manager]") {
  const auto content = patternBytes(5000, 6);
  const auto destination = fx.dir / "a.pdf";
  writeFile(destination, content);
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto manager = makeManager(1);

  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", content), destination);
  CHECK(outcome.status == TransferStatus::Skipped);
  CHECK(outcome.bytes_transferred == 0u);
  CHECK(fx.http.count("https://f.test/a.pdf") == 0u);
  CHECK(manager.progress().skipped.load() == 1u);
}

TEST_CASE_METHOD(TransferManagerTest, "corrupt existing file is downloaded again", "[transfer_manager]") {
  const auto content = patternBytes(5000, 7);
  const auto destination = fx.dir / "a.pdf";
  writeFile(destination, patternBytes(5000, 8));
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto manager = makeManager(1);

  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", content), destination);
  CHECK(outcome.status == TransferStatus::Completed);
  CHECK(readFile(destination) == content);
}

TEST_CASE_METHOD(TransferManagerTest, "force downloads even when complete", "[transfer_manager]") {
  const auto content = patternBytes(5000, 9);
  const auto destination = fx.dir / "a.pdf";
  writeFile(destination, content);
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto manager = makeManager(1);

  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", content), destination, TransferOptions{.force = true});
  CHECK(outcome.status == TransferStatus::Completed);
  CHECK(outcome.bytes_transferred == content.size());
  CHECK(fx.http.count("https://f.test/a.pdf") == 1u);
}

TEST_CASE_METHOD(TransferManagerTest, "unsatisfiable range restarts from scratch", "[transfer_manager]") {
  const auto content = std::string("fresh");
  const auto destination = fx.dir / "a.pdf";
  writeFile(TransferManager::tempPath(destination), "stale partial bytes");
  fx.http.serveFile("https://f.test/a.pdf", content);
  auto item = fileItem("https://f.test/a.pdf", content);
  item.expected_size.reset();
  auto manager = makeManager(1);

  auto outcome = transfer(manager, item, destination);
  REQUIRE(outcome.status == TransferStatus::Completed);
  CHECK(readFile(destination) == content);
  CHECK(fx.http.count("https://f.test/a.pdf") == 2u);
}

TEST_CASE_METHOD(TransferManagerTest, "rate limit waits retry after while others proceed", "[transfer_manager]") {
  const auto slow = patternBytes(1000, 10);
  const auto fast = patternBytes(1000, 11);
  int calls = 0;
  fx.http.on("https://f.test/slow.pdf", [&](const HttpRequest& request) -> std::expected<HttpResponse, Error> {
    if (++calls == 1) return FakeHttpClient::response(429, {}, {{"retry-after", "2"}});
    return FakeHttpClient::rangeResponse(request, slow);
  });
  fx.http.serveFile("https://f.test/fast.pdf", fast, milliseconds(50));
  auto manager = makeManager(2);

  std::vector<TransferJob> jobs{
    {fileItem("https://f.test/slow.pdf", slow), fx.dir / "slow.pdf"},
    {fileItem("https://f.test/fast.pdf", fast), fx.dir / "fast.pdf"},
  };
  auto outcomes = fx.run(manager.transferAll(std::move(jobs), TransferOptions{}));
  REQUIRE(outcomes.size() == 2u);
  CHECK(outcomes[0].status == TransferStatus::Completed);
  CHECK(outcomes[1].status == TransferStatus::Completed);

  auto slow_requests = fx.http.recordsFor("https://f.test/slow.pdf");
  REQUIRE(slow_requests.size() == 2u);
  CHECK(slow_requests[1].started - slow_requests[0].finished >= milliseconds(2000));

  const auto& order = fx.http.completionOrder();
  REQUIRE(order.size() == 3u);
  CHECK(order[1] == "https://f.test/fast.pdf");
  CHECK(order[2] == "https://f.test/slow.pdf");
}

TEST_CASE_METHOD(TransferManagerTest, "permanent failure is not retried", "[transfer_manager]") {
  fx.http.reply("https://f.test/gone.pdf", 404);
  auto manager = makeManager(1);
  auto outcome = transfer(manager, fileItem("https://f.test/gone.pdf", "x"), fx.dir / "gone.pdf");
  REQUIRE(outcome.error.has_value());
  CHECK(outcome.error->kind == ErrorKind::NotFound);
  CHECK(fx.http.count("https://f.test/gone.pdf") == 1u);
}

TEST_CASE_METHOD(TransferManagerTest, "writers of the same path are serialized", "[transfer_manager]") {
  const auto content = patternBytes(3000, 12);
  fx.http.serveFile("https://f.test/a.pdf", content, milliseconds(80));
  auto manager = makeManager(4);
  const auto destination = fx.dir / "a.pdf";

  std::vector<TransferJob> jobs{
    {fileItem("https://f.test/a.pdf", content), destination},
    {fileItem("https://f.test/a.pdf", content), destination},
  };
  auto outcomes = fx.run(manager.transferAll(std::move(jobs), TransferOptions{}));
  REQUIRE(outcomes.size() == 2u);
  CHECK(outcomes[0].status == TransferStatus::Completed);
  CHECK(outcomes[1].status == TransferStatus::Skipped);
  CHECK(fx.http.count("https://f.test/a.pdf") == 1u);
  CHECK(locks.heldCount() == 0u);
}

TEST_CASE_METHOD(TransferManagerTest, "concurrency stays within max workers", "[transfer_manager]") {
  auto manager = makeManager(2);
  size_t peak = 0;
  manager.setStateListener([&](const DownloadItem&, TransferState state) {
    if (state == TransferState::Downloading) peak = std::max(peak, manager.progress().active.load());
  });

  std::vector<TransferJob> jobs;
  for (int i = 0; i < 6; ++i) {
    auto url = "https://f.test/" + std::to_string(i) + ".pdf";
    auto content = patternBytes(500, i);
    fx.http.serveFile(url, content, milliseconds(30));
    jobs.push_back({fileItem(url, content), fx.dir / (std::to_string(i) + ".pdf")});
  }
  auto outcomes = fx.run(manager.transferAll(std::move(jobs), TransferOptions{}));
  CHECK(peak == 2u);
  for (const auto& outcome : outcomes) CHECK(outcome.status == TransferStatus::Completed);
}

TEST_CASE_METHOD(TransferManagerTest, "video items go through the stream resolver", "[transfer_manager]") {
  fx.http.reply("https://v.test/720.m3u8", 200,
    "#EXTM3U\n#EXT-X-TARGETDURATION:10\n#EXTINF:10,\na.ts\n#EXTINF:10,\nb.ts\n#EXT-X-ENDLIST\n");
  fx.http.reply("https://v.test/a.ts", 200, "aaa");
  fx.http.reply("https://v.test/b.ts", 200, "bb");
  DownloadItem item;
  item.media_kind = MediaKind::Video;
  item.url = "https://v.test/720.m3u8";
  item.selected_quality = 720;
  auto manager = makeManager(1);
  const auto destination = fx.dir / "lesson [720p].ts";

  auto outcome = transfer(manager, item, destination);
  REQUIRE(outcome.status == TransferStatus::Completed);
  CHECK(outcome.bytes_transferred == 5u);
  CHECK(readFile(destination) == "aaabb");

  auto again = transfer(manager, item, destination);
  CHECK(again.status == TransferStatus::Skipped);
}

TEST_CASE_METHOD(TransferManagerTest, "cancelled transfer fails as cancelled", "[transfer_manager]") {
  fx.http.serveFile("https://f.test/a.pdf", "abc");
  fx.cancel.cancel();
  auto manager = makeManager(1);
  auto outcome = transfer(manager, fileItem("https://f.test/a.pdf", "abc"), fx.dir / "a.pdf");
  REQUIRE(outcome.error.has_value());
  CHECK(outcome.error->kind == ErrorKind::Cancelled);
  CHECK(fx.http.count("https://f.test/a.pdf") == 0u);
}
