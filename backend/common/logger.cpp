#include "logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace common {

static constexpr size_t kMaxLogBytes = 4 * 1024 * 1024;
static std::atomic<LogLevel> gMinLevel{LogLevel::Warn};
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::filesystem::path gLogPath;
static size_t gLogBytes = 0;

static const char* levelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

bool initLogFile(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(gLogMutex);
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  gLogFile.open(path, std::ios::trunc);
  if (!gLogFile) {
    return false;
  }
  gLogPath = path;
  gLogFile << "sed-dl log start " << timestamp() << "\n";
  gLogFile.flush();
  gLogBytes = static_cast<size_t>(gLogFile.tellp());
  return true;
}

void closeLogFile() {
  std::lock_guard<std::mutex> lock(gLogMutex);
  if (gLogFile.is_open()) {
    gLogFile.close();
  }
}

void setLogLevel(LogLevel level) { gMinLevel.store(level); }

LogLevel logLevel() { return gMinLevel.load(); }

void setLogLevelFromString(const std::string& level) {
  std::string l;
  l.reserve(level.size());
  for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (l == "debug") setLogLevel(LogLevel::Debug);
  else if (l == "info") setLogLevel(LogLevel::Info);
  else if (l == "error") setLogLevel(LogLevel::Error);
  else setLogLevel(LogLevel::Warn);
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
  bool to_console = level >= gMinLevel.load();
  std::lock_guard<std::mutex> lock(gLogMutex);
  // the file sink keeps every level
  if (!to_console && !gLogFile.is_open()) return;
  std::string line = timestamp() + " " + levelName(level) + " [" + tag + "] " + msg;

  if (to_console) {
    std::clog << line << std::endl;
  }
  if (!gLogFile.is_open()) return;

  if (gLogBytes + line.size() + 1 > kMaxLogBytes) {
    gLogFile.close();
    std::error_code ec;
    auto rotated = gLogPath;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    std::filesystem::rename(gLogPath, rotated, ec);
    gLogFile.open(gLogPath, std::ios::trunc);
    gLogBytes = 0;
    if (!gLogFile) return;
  }
  gLogFile << line << '\n';
  gLogFile.flush();
  gLogBytes += line.size() + 1;
}

void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace common
