#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/errors.hpp"

namespace download_service {

enum class ResourceKind { Textbook, Course, SyncClassroom };

enum class MediaKind { Video, Document, Audio };

struct QualityVariant {
  int rank{0};                  // vertical resolution, e.g. 720
  std::string manifest_url;
  std::optional<uint64_t> estimated_size;
  long bandwidth{0};
};

struct DownloadItem {
  std::string id;
  ResourceKind resource_kind{ResourceKind::Course};
  MediaKind media_kind{MediaKind::Document};
  std::string title;
  std::string url;              // direct file URL, or manifest URL for video
  std::optional<uint64_t> expected_size;
  std::optional<std::string> expected_md5;
  std::vector<QualityVariant> variants;  // video only, highest first

  std::vector<std::string> directory;    // sanitized segments below the output root
  std::string base_name;                 // sanitized, without extension
  std::string extension;                 // without the leading dot
  std::string update_time;
  size_t api_order{0};

  std::filesystem::path relative_path;   // assigned once before transfer
  std::optional<int> selected_quality;
};

enum class TransferState { Pending, Resolving, Downloading, Verifying, Completed, Failed };

enum class TransferStatus { Completed, Skipped, Failed };

struct TransferOutcome {
  std::string name;
  std::filesystem::path path;
  TransferStatus status{TransferStatus::Failed};
  uint64_t bytes_transferred{0};
  std::optional<Error> error;
};

#define SEDDL_TEMP_FILE_SUFFIX ".tmp"
#define SEDDL_SEGMENT_DIR_SUFFIX ".segments"

inline const char* resourceKindLabel(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::Textbook: return "textbook";
    case ResourceKind::Course: return "course";
    case ResourceKind::SyncClassroom: return "sync_classroom";
  }
  return "unknown";
}

inline const char* mediaKindLabel(MediaKind kind) {
  switch (kind) {
    case MediaKind::Video: return "video";
    case MediaKind::Document: return "document";
    case MediaKind::Audio: return "audio";
  }
  return "unknown";
}

inline const char* transferStateLabel(TransferState state) {
  switch (state) {
    case TransferState::Pending: return "pending";
    case TransferState::Resolving: return "resolving";
    case TransferState::Downloading: return "downloading";
    case TransferState::Verifying: return "verifying";
    case TransferState::Completed: return "completed";
    case TransferState::Failed: return "failed";
  }
  return "unknown";
}

// Accepts the config names ("course") as well as the page names ("qualityCourse").
inline std::optional<ResourceKind> parseResourceKind(const std::string& text) {
  if (text == "textbook" || text == "tchMaterial") return ResourceKind::Textbook;
  if (text == "course" || text == "qualityCourse") return ResourceKind::Course;
  if (text == "sync_classroom" || text == "syncClassroom" || text == "syncClassroom/classActivity") {
    return ResourceKind::SyncClassroom;
  }
  return std::nullopt;
}

} // namespace download_service
