#include "file_naming.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace download_service {

namespace {

bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isIllegal(char c) {
  switch (c) {
    case '\\': case '/': case '*': case '?': case ':':
    case '"': case '<': case '>': case '|':
      return true;
    default:
      return static_cast<unsigned char>(c) < 0x20;
  }
}

bool isWindowsReserved(std::string_view stem) {
  static const std::array<std::string_view, 22> kReserved = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
  };
  std::string upper(stem);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return std::find(kReserved.begin(), kReserved.end(), upper) != kReserved.end();
}

// Position of the extension dot, or npos for names like ".bashrc" or "name".
size_t extensionDot(std::string_view name) {
  auto dot = name.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
    return std::string_view::npos;
  }
  return dot;
}

std::string_view trimSpaces(std::string_view s) {
  while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
  return s;
}

} // namespace

std::string toLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

std::string truncateUtf8(std::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) return std::string(text);
  size_t cut = max_bytes;
  // step back over continuation bytes so the cut lands on a sequence start
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(text.substr(0, cut));
}

std::string sanitizeFilename(std::string_view input, size_t max_bytes) {
  auto trimmed = trimSpaces(input);
  if (trimmed.empty()) return "unknown";

  std::string name;
  auto dot = extensionDot(trimmed);
  auto stem = dot == std::string_view::npos ? trimmed : trimmed.substr(0, dot);
  if (isWindowsReserved(stem)) {
    name = "_";
  }
  name.append(trimmed);

  std::string collapsed;
  collapsed.reserve(name.size());
  bool pending_space = false;
  for (char c : name) {
    if (isIllegal(c) || isSpace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !collapsed.empty()) {
      collapsed.push_back(' ');
    }
    pending_space = false;
    collapsed.push_back(c);
  }

  std::string_view view(collapsed);
  while (!view.empty() && (view.front() == '.' || isSpace(view.front()))) view.remove_prefix(1);
  while (!view.empty() && (view.back() == '.' || isSpace(view.back()))) view.remove_suffix(1);
  if (view.empty()) return "unnamed";

  std::string result(view);
  if (result.size() <= max_bytes) return result;

  auto ext_dot = extensionDot(result);
  if (ext_dot != std::string::npos && result.size() - ext_dot < max_bytes) {
    auto ext = result.substr(ext_dot);
    return truncateUtf8(std::string_view(result).substr(0, ext_dot), max_bytes - ext.size()) + ext;
  }
  return truncateUtf8(result, max_bytes);
}

bool isGenericPdfName(std::string_view filename) {
  static const std::regex kDigits(R"(^\d+\.pdf$)");
  static const std::regex kHash(R"(^[a-f0-9]{32}\.pdf$)");
  auto lower = toLower(filename);
  if (lower == "pdf.pdf" || lower == "document.pdf" || lower == "file.pdf") {
    return true;
  }
  return std::regex_match(lower, kDigits) || std::regex_match(lower, kHash);
}

bool isResourceId(std::string_view text) {
  static const std::regex kUuid(R"(^[a-f0-9]{8}-([a-f0-9]{4}-){3}[a-f0-9]{12}$)");
  return std::regex_match(std::string(text), kUuid);
}

std::expected<std::filesystem::path, Error> secureJoin(
  const std::filesystem::path& base,
  const std::filesystem::path& relative
) {
  std::filesystem::path result = base;
  for (const auto& part : relative) {
    if (part == "..") {
      return std::unexpected(makeError(ErrorKind::FilesystemError,
        "path traversal rejected: " + relative.string()));
    }
    if (part.empty() || part == "." || part == relative.root_name() || part == relative.root_directory()) {
      continue;
    }
    result /= part;
  }
  return result;
}

} // namespace download_service
