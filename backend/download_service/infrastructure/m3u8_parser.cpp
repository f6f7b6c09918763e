#include "m3u8_parser.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace download_service {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool startsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

template <typename T>
std::optional<T> toNumber(std::string_view s) {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace

std::map<std::string, std::string> parseAttributeList(std::string_view text) {
  std::map<std::string, std::string> attributes;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && (text[pos] == ',' || std::isspace(static_cast<unsigned char>(text[pos])))) ++pos;
    auto eq = text.find('=', pos);
    if (eq == std::string_view::npos) break;
    std::string name(trim(text.substr(pos, eq - pos)));
    pos = eq + 1;

    std::string value;
    if (pos < text.size() && text[pos] == '"') {
      auto close = text.find('"', pos + 1);
      if (close == std::string_view::npos) {
        value = std::string(text.substr(pos + 1));
        pos = text.size();
      } else {
        value = std::string(text.substr(pos + 1, close - pos - 1));
        pos = close + 1;
      }
    } else {
      auto comma = text.find(',', pos);
      auto end = comma == std::string_view::npos ? text.size() : comma;
      value = std::string(trim(text.substr(pos, end - pos)));
      pos = end;
    }
    if (!name.empty()) attributes[name] = std::move(value);
  }
  return attributes;
}

std::expected<M3u8Playlist, Error> parsePlaylist(std::string_view text) {
  M3u8Playlist playlist;
  bool header_seen = false;
  std::optional<size_t> current_key;
  std::optional<M3u8Variant> pending_variant;
  std::optional<double> pending_duration;
  uint64_t next_sequence = 0;
  bool sequence_fixed = false;

  size_t pos = 0;
  while (pos <= text.size()) {
    auto newline = text.find('\n', pos);
    auto line = trim(text.substr(pos, newline == std::string_view::npos ? std::string_view::npos : newline - pos));
    pos = newline == std::string_view::npos ? text.size() + 1 : newline + 1;
    if (line.empty()) continue;

    if (!header_seen) {
      // tolerate a UTF-8 BOM before the header
      if (startsWith(line, "\xEF\xBB\xBF")) line.remove_prefix(3);
      if (line != "#EXTM3U") {
        return std::unexpected(makeError(ErrorKind::ManifestError, "Missing #EXTM3U header"));
      }
      header_seen = true;
      continue;
    }

    if (startsWith(line, "#EXT-X-STREAM-INF:")) {
      auto attrs = parseAttributeList(line.substr(18));
      M3u8Variant variant;
      if (auto it = attrs.find("BANDWIDTH"); it != attrs.end()) {
        variant.bandwidth = toNumber<long>(it->second).value_or(0);
      }
      if (auto it = attrs.find("RESOLUTION"); it != attrs.end()) {
        auto x = it->second.find_first_of("xX");
        if (x != std::string::npos) {
          variant.width = toNumber<int>(std::string_view(it->second).substr(0, x)).value_or(0);
          variant.height = toNumber<int>(std::string_view(it->second).substr(x + 1)).value_or(0);
        }
      }
      pending_variant = variant;
      playlist.is_master = true;
    } else if (startsWith(line, "#EXT-X-MEDIA-SEQUENCE:")) {
      auto value = toNumber<uint64_t>(trim(line.substr(22)));
      if (!value) {
        return std::unexpected(makeError(ErrorKind::ManifestError, "Invalid media sequence"));
      }
      if (!sequence_fixed) {
        playlist.media_sequence = *value;
        next_sequence = *value;
      }
    } else if (startsWith(line, "#EXT-X-KEY:")) {
      auto attrs = parseAttributeList(line.substr(11));
      M3u8Key key;
      key.method = attrs.count("METHOD") ? attrs["METHOD"] : "NONE";
      if (attrs.count("URI")) key.uri = attrs["URI"];
      if (attrs.count("IV")) key.iv = attrs["IV"];
      if (key.method == "NONE") {
        current_key.reset();
      } else {
        if (key.uri.empty()) {
          return std::unexpected(makeError(ErrorKind::ManifestError, "EXT-X-KEY without URI"));
        }
        playlist.keys.push_back(std::move(key));
        current_key = playlist.keys.size() - 1;
      }
    } else if (startsWith(line, "#EXTINF:")) {
      auto value = line.substr(8);
      auto comma = value.find(',');
      auto number = std::string(trim(value.substr(0, comma)));
      char* end = nullptr;
      double duration = std::strtod(number.c_str(), &end);
      if (end == number.c_str()) {
        return std::unexpected(makeError(ErrorKind::ManifestError, "Invalid EXTINF duration"));
      }
      pending_duration = duration;
    } else if (line == "#EXT-X-ENDLIST") {
      playlist.end_list = true;
    } else if (line.front() == '#') {
      continue;
    } else if (pending_variant) {
      pending_variant->uri = std::string(line);
      playlist.variants.push_back(*pending_variant);
      pending_variant.reset();
    } else {
      M3u8Segment segment;
      segment.uri = std::string(line);
      segment.duration = pending_duration.value_or(0.0);
      segment.sequence = next_sequence++;
      segment.key_index = current_key;
      playlist.segments.push_back(std::move(segment));
      pending_duration.reset();
      sequence_fixed = true;
    }
  }

  if (!header_seen) {
    return std::unexpected(makeError(ErrorKind::ManifestError, "Empty playlist"));
  }
  if (playlist.is_master && playlist.variants.empty()) {
    return std::unexpected(makeError(ErrorKind::ManifestError, "Master playlist lists no variants"));
  }
  return playlist;
}

} // namespace download_service
