#pragma once

#include <string>
#include <filesystem>

namespace common {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Diagnostic log. Console lines go to std::clog; the file sink is optional.
bool initLogFile(const std::filesystem::path& path);
void closeLogFile();
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();

void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace common
