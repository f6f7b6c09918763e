#include "config/config.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <algorithm>
#include <nlohmann/json.hpp>

namespace config {

  Config::Config() {
    network_ = {
      .server_prefixes = {"s-file-1", "s-file-2", "s-file-3"},
      .connect_timeout = std::chrono::seconds(10),
      .timeout = std::chrono::seconds(60),
      .max_retries = 3,
      .rate_limit_retries = 3,
      .backoff_base = std::chrono::milliseconds(500),
      .backoff_cap = std::chrono::seconds(8),
      .user_agent = "sed-dl/1.0"
    };

    download_ = {
      .max_workers = 5,
      .segment_workers = 8,
      .output_dir = "downloads",
      .video_quality = "best",
      .audio_format = "mp3"
    };

    directory_ = {
      .tag_order = {"zxxxd", "zxxnj", "zxxxk", "zxxbb", "zxxcc"},
      .tag_defaults = {
        {"zxxxd", "未知学段"},
        {"zxxnj", "未知年级"},
        {"zxxxk", "未知学科"},
        {"zxxbb", "未知版本"},
        {"zxxcc", "未知册次"},
      },
      .unclassified_dir = "未分类资源",
      .grade_dimension = "zxxnj",
      .stage_dimension = "zxxxd",
      .stages_without_grade = {"高中"},
      .unknown_teacher = "未知教师",
      .max_segment_bytes = 200
    };

    url_templates_ = {
      {"TEXTBOOK_DETAILS", "https://{prefix}.ykt.cbern.com.cn/zxx/ndrv2/resources/tch_material/details/{resource_id}.json"},
      {"TEXTBOOK_AUDIO", "https://{prefix}.ykt.cbern.com.cn/zxx/ndrs/resources/{resource_id}/relation_audios.json"},
      {"COURSE_QUALITY", "https://{prefix}.ykt.cbern.com.cn/zxx/ndrv2/resources/{resource_id}.json"},
      {"COURSE_SYNC", "https://{prefix}.ykt.cbern.com.cn/zxx/ndrv2/national_lesson/resources/details/{resource_id}.json"},
      {"CHAPTER_TREE", "https://{prefix}.ykt.cbern.com.cn/zxx/ndrv2/national_lesson/trees/{tree_id}.json"},
    };

    api_endpoints_ = {
      {.path_key = "tchMaterial", .id_param = "contentId", .resource_type = "textbook", .template_key = "TEXTBOOK_DETAILS"},
      {.path_key = "qualityCourse", .id_param = "courseId", .resource_type = "course", .template_key = "COURSE_QUALITY"},
      {.path_key = "syncClassroom/classActivity", .id_param = "activityId", .resource_type = "sync_classroom", .template_key = "COURSE_SYNC"},
    };

    credential_ = {
      .config_dir_name = SEDDL_CONFIG_DIR,
      .config_file_name = SEDDL_CONFIG_FILE,
      .token_key = "accesstoken",
      .token_env = "ACCESS_TOKEN"
    };
  }

  std::filesystem::path Config::getDefaultConfigPath() const {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
    return base / credential_.config_dir_name / credential_.config_file_name;
  }

  std::expected<void, std::string> Config::loadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return {};
    }

    std::ifstream in(path);
    if (!in) {
      return std::unexpected("Failed to open config file: " + path.string());
    }

    nlohmann::json j;
    try {
      j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      return std::unexpected("Invalid config file " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
      return std::unexpected("Config file root must be an object: " + path.string());
    }

    try {
      if (j.contains("server_prefixes")) {
        network_.server_prefixes = j.at("server_prefixes").get<std::vector<std::string>>();
      }
      if (j.contains("connect_timeout")) {
        network_.connect_timeout = std::chrono::seconds(j.at("connect_timeout").get<int>());
      }
      if (j.contains("timeout")) {
        network_.timeout = std::chrono::seconds(j.at("timeout").get<int>());
      }
      if (j.contains("max_retries")) {
        network_.max_retries = std::max(0, j.at("max_retries").get<int>());
      }
      if (j.contains("rate_limit_retries")) {
        network_.rate_limit_retries = std::max(0, j.at("rate_limit_retries").get<int>());
      }
      if (j.contains("user_agent")) {
        network_.user_agent = j.at("user_agent").get<std::string>();
      }
      if (j.contains("max_workers")) {
        download_.max_workers = std::clamp<size_t>(j.at("max_workers").get<size_t>(), kMinWorkers, kMaxWorkers);
      }
      if (j.contains("segment_workers")) {
        download_.segment_workers = std::max<size_t>(1, j.at("segment_workers").get<size_t>());
      }
      if (j.contains("default_output_dir")) {
        download_.output_dir = j.at("default_output_dir").get<std::string>();
      }
      if (j.contains("default_video_quality")) {
        download_.video_quality = j.at("default_video_quality").get<std::string>();
      }
      if (j.contains("default_audio_format")) {
        download_.audio_format = j.at("default_audio_format").get<std::string>();
      }
      if (j.contains("url_templates")) {
        for (const auto& [key, value] : j.at("url_templates").items()) {
          url_templates_[key] = value.get<std::string>();
        }
      }
      if (j.contains("stages_without_grade")) {
        directory_.stages_without_grade = j.at("stages_without_grade").get<std::vector<std::string>>();
      }
    } catch (const nlohmann::json::exception& e) {
      return std::unexpected("Invalid value in config file " + path.string() + ": " + e.what());
    }

    return {};
  }
}
