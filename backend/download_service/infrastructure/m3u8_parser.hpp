#pragma once
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "domain/errors.hpp"

namespace download_service {

struct M3u8Key {
  std::string method;              // NONE, AES-128, SAMPLE-AES
  std::string uri;
  std::optional<std::string> iv;   // raw attribute text
};

struct M3u8Segment {
  std::string uri;
  double duration{0.0};
  uint64_t sequence{0};
  std::optional<size_t> key_index;  // into M3u8Playlist::keys
};

struct M3u8Variant {
  std::string uri;
  long bandwidth{0};
  int width{0};
  int height{0};
};

struct M3u8Playlist {
  bool is_master{false};
  std::vector<M3u8Variant> variants;
  std::vector<M3u8Segment> segments;
  std::vector<M3u8Key> keys;
  uint64_t media_sequence{0};
  bool end_list{false};
};

// Quoted values keep their content without the quotes.
std::map<std::string, std::string> parseAttributeList(std::string_view text);

std::expected<M3u8Playlist, Error> parsePlaylist(std::string_view text);

} // namespace download_service
