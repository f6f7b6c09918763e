#pragma once

#include <cstddef>
#include <string>
#include <chrono>
#include <map>
#include <vector>
#include <expected>
#include <filesystem>

namespace config {

struct NetworkConfig {
  std::vector<std::string> server_prefixes;
  std::chrono::milliseconds connect_timeout;
  std::chrono::milliseconds timeout;
  int max_retries;
  int rate_limit_retries;
  std::chrono::milliseconds backoff_base;
  std::chrono::milliseconds backoff_cap;
  std::string user_agent;
};

struct DownloadConfig {
  size_t max_workers;
  size_t segment_workers;
  std::string output_dir;
  std::string video_quality;
  std::string audio_format;
};

struct DirectoryConfig {
  std::vector<std::string> tag_order;
  std::map<std::string, std::string> tag_defaults;
  std::string unclassified_dir;
  std::string grade_dimension;
  std::string stage_dimension;
  std::vector<std::string> stages_without_grade;
  std::string unknown_teacher;
  size_t max_segment_bytes;
};

// One entry per platform page kind, keyed by the URL path fragment.
struct ApiEndpointConfig {
  std::string path_key;
  std::string id_param;
  std::string resource_type;
  std::string template_key;
};

using UrlTemplates = std::map<std::string, std::string>;

struct CredentialConfig {
  std::string config_dir_name;
  std::string config_file_name;
  std::string token_key;
  std::string token_env;
};

#define SEDDL_CONFIG_DIR ".sed-dl"
#define SEDDL_CONFIG_FILE "config.json"

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overlays values from a JSON file. Missing file is not an error.
std::expected<void, std::string> loadFromFile(const std::filesystem::path& path);

// Getters
const NetworkConfig& getNetwork() const { return network_; }
const DownloadConfig& getDownload() const { return download_; }
const DirectoryConfig& getDirectory() const { return directory_; }
const UrlTemplates& getUrlTemplates() const { return url_templates_; }
const std::vector<ApiEndpointConfig>& getApiEndpoints() const { return api_endpoints_; }
const CredentialConfig& getCredential() const { return credential_; }
std::filesystem::path getDefaultConfigPath() const;

// Command line overrides
void setOutputDir(std::string dir) { download_.output_dir = std::move(dir); }
void setMaxWorkers(size_t workers) { download_.max_workers = workers; }
void setVideoQuality(std::string quality) { download_.video_quality = std::move(quality); }
void setAudioFormat(std::string format) { download_.audio_format = std::move(format); }

private:
  Config();

  NetworkConfig network_;
  DownloadConfig download_;
  DirectoryConfig directory_;
  UrlTemplates url_templates_;
  std::vector<ApiEndpointConfig> api_endpoints_;
  CredentialConfig credential_;
};

// Clamp applied to every worker count coming from a file or the command line.
constexpr size_t kMinWorkers = 1;
constexpr size_t kMaxWorkers = 16;

} // namespace config
