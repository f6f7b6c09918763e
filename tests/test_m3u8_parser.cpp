#include <catch2/catch.hpp>
#include "infrastructure/m3u8_parser.hpp"

using namespace download_service;

TEST_CASE("parses quoted attribute lists", "[m3u8_parser]") {
  auto attrs = parseAttributeList(R"(METHOD=AES-128,URI="https://k.example/key?a=1,b=2",IV=0x0A)");
  CHECK(attrs["METHOD"] == "AES-128");
  CHECK(attrs["URI"] == "https://k.example/key?a=1,b=2");
  CHECK(attrs["IV"] == "0x0A");
}

TEST_CASE("parses master playlist variants", "[m3u8_parser]") {
  auto playlist = parsePlaylist(
    "#EXTM3U\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360\n"
    "360/index.m3u8\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=2500000,RESOLUTION=1280x720,CODECS=\"avc1.4d401f,mp4a.40.2\"\n"
    "720/index.m3u8\n");
  REQUIRE(playlist.has_value());
  CHECK(playlist->is_master);
  REQUIRE(playlist->variants.size() == 2u);
  CHECK(playlist->variants[0].height == 360);
  CHECK(playlist->variants[1].uri == "720/index.m3u8");
  CHECK(playlist->variants[1].bandwidth == 2500000);
  CHECK(playlist->variants[1].width == 1280);
}

TEST_CASE("parses encrypted media playlist", "[m3u8_parser]") {
  auto playlist = parsePlaylist(
    "\xEF\xBB\xBF#EXTM3U\r\n"
    "#EXT-X-VERSION:3\r\n"
    "#EXT-X-MEDIA-SEQUENCE:7\r\n"
    "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"\r\n"
    "#EXTINF:4.5,\r\n"
    "s0.ts\r\n"
    "#EXT-X-KEY:METHOD=AES-128,URI=\"key2.bin\",IV=0x000102030405060708090a0b0c0d0e0f\r\n"
    "#EXTINF:3,\r\n"
    "s1.ts\r\n"
    "#EXT-X-KEY:METHOD=NONE\r\n"
    "#EXTINF:2,\r\n"
    "s2.ts\r\n"
    "#EXT-X-ENDLIST\r\n");
  REQUIRE(playlist.has_value());
  CHECK_FALSE(playlist->is_master);
  CHECK(playlist->end_list);
  CHECK(playlist->media_sequence == 7u);
  REQUIRE(playlist->segments.size() == 3u);
  REQUIRE(playlist->keys.size() == 2u);

  CHECK(playlist->segments[0].sequence == 7u);
  CHECK(playlist->segments[0].duration == Approx(4.5));
  CHECK(playlist->segments[0].key_index == 0u);
  CHECK(playlist->segments[1].sequence == 8u);
  CHECK(playlist->segments[1].key_index == 1u);
  CHECK(playlist->keys[1].iv == "0x000102030405060708090a0b0c0d0e0f");
  CHECK_FALSE(playlist->segments[2].key_index.has_value());
}

TEST_CASE("rejects malformed playlists", "[m3u8_parser]") {
  CHECK(parsePlaylist("").error().kind == ErrorKind::ManifestError);
  CHECK(parsePlaylist("<html>not found</html>").error().kind == ErrorKind::ManifestError);
  CHECK(parsePlaylist("#EXTM3U\n#EXT-X-KEY:METHOD=AES-128\ns.ts\n").error().kind == ErrorKind::ManifestError);
  CHECK(parsePlaylist("#EXTM3U\n#EXT-X-MEDIA-SEQUENCE:abc\n").error().kind == ErrorKind::ManifestError);
  CHECK(parsePlaylist("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\n").error().kind == ErrorKind::ManifestError);
}
