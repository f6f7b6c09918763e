#pragma once
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace download_service {

struct CliOptions {
  std::vector<std::string> urls;
  std::vector<std::string> ids;
  std::optional<std::string> type;
  std::optional<std::string> batch_file;
  bool interactive{false};
  bool prompt_each{false};              // batch inputs still ask for items and quality
  std::optional<std::string> token;
  bool token_help{false};
  std::optional<std::string> output;
  std::optional<size_t> workers;
  std::string select{"all"};
  std::string filter_ext;
  std::optional<std::string> audio_format;
  std::optional<std::string> video_quality;
  bool flat{false};
  bool force_redownload{false};
  std::optional<std::string> config_path;
  std::optional<std::string> log_file;
  bool verbose{false};
  bool help{false};
};

// Usage errors come back as the message to print before the usage text.
std::expected<CliOptions, std::string> parseCommandLine(int argc, const char* const argv[]);
std::string usageText();

// Inputs listed in a batch file: one URL or id per line, '#' starts a comment.
std::expected<std::vector<std::string>, std::string> readBatchFile(const std::string& path);

extern const char* const kTokenHelp;

} // namespace download_service
