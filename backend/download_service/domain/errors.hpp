#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace download_service {

enum class ErrorKind {
  NotFound,
  ParseError,
  UnsupportedKind,
  AuthRequired,
  AuthInvalid,
  RateLimited,
  NetworkError,
  ChecksumMismatch,
  FilesystemError,
  ManifestError,
  SegmentFetchError,
  DecryptError,
  Cancelled
};

struct Error {
  ErrorKind kind{ErrorKind::NetworkError};
  std::string message;
  int http_status{0};
  std::optional<std::chrono::milliseconds> retry_after;
};

inline const char* errorKindLabel(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::ParseError: return "ParseError";
    case ErrorKind::UnsupportedKind: return "UnsupportedKind";
    case ErrorKind::AuthRequired: return "AuthRequired";
    case ErrorKind::AuthInvalid: return "AuthInvalid";
    case ErrorKind::RateLimited: return "RateLimited";
    case ErrorKind::NetworkError: return "NetworkError";
    case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
    case ErrorKind::FilesystemError: return "FilesystemError";
    case ErrorKind::ManifestError: return "ManifestError";
    case ErrorKind::SegmentFetchError: return "SegmentFetchError";
    case ErrorKind::DecryptError: return "DecryptError";
    case ErrorKind::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

inline Error makeError(ErrorKind kind, std::string message, int http_status = 0) {
  return Error{.kind = kind, .message = std::move(message), .http_status = http_status, .retry_after = std::nullopt};
}

// Maps a non-success HTTP status onto the taxonomy.
inline ErrorKind classifyHttpStatus(int status) {
  if (status == 401) return ErrorKind::AuthRequired;
  if (status == 403) return ErrorKind::AuthInvalid;
  if (status == 404 || status == 410) return ErrorKind::NotFound;
  if (status == 429) return ErrorKind::RateLimited;
  return ErrorKind::NetworkError;
}

// Transient statuses are retried with backoff; 429 has its own schedule.
inline bool isTransientStatus(int status) {
  return status == 408 || status == 425 || (status >= 500 && status <= 599);
}

inline bool isRetryable(const Error& error) {
  if (error.kind == ErrorKind::RateLimited) return true;
  if (error.kind != ErrorKind::NetworkError) return false;
  return error.http_status == 0 || isTransientStatus(error.http_status);
}

inline std::string describe(const Error& error) {
  std::string out = std::string(errorKindLabel(error.kind)) + ": " + error.message;
  if (error.http_status != 0) {
    out += " (HTTP " + std::to_string(error.http_status) + ")";
  }
  return out;
}

} // namespace download_service
