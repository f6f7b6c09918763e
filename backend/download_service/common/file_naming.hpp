#pragma once
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include "domain/errors.hpp"

namespace download_service {

constexpr size_t kMaxFilenameBytes = 200;

// Makes one path component safe on every target filesystem.
std::string sanitizeFilename(std::string_view name, size_t max_bytes = kMaxFilenameBytes);

// Cuts at most max_bytes without splitting a UTF-8 sequence.
std::string truncateUtf8(std::string_view text, size_t max_bytes);

// pdf.pdf, document.pdf, file.pdf, <digits>.pdf, <32 hex>.pdf
bool isGenericPdfName(std::string_view filename);

bool isResourceId(std::string_view text);

std::string toLower(std::string_view text);

// Appends components below base; rejects ".." and absolute parts.
std::expected<std::filesystem::path, Error> secureJoin(
  const std::filesystem::path& base,
  const std::filesystem::path& relative
);

} // namespace download_service
