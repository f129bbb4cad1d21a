#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace regflow::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug, info, warn/warning and error in any case.
LogLevel ParseLogLevelString(const std::string& value);

// Process-wide logger. Console lines look like "[component] level: message";
// debug and info go to stdout, warn and error to stderr. When a debug log file
// is enabled every message at or above the threshold is also appended there
// with a timestamp.
class Logger {
 public:
  void SetThreshold(LogLevel level);
  LogLevel Threshold() const;

  // Opens (appending) the debug log at `path`. Throws std::runtime_error
  // when the file cannot be opened.
  void EnableFile(const std::string& path);
  void DisableFile();

  // Suppresses console output; the debug log file is unaffected.
  void SetConsoleEnabled(bool enabled);

  void Log(LogLevel level, std::string_view component, std::string_view message);

 private:
  mutable std::mutex mutex_;
  LogLevel threshold_{LogLevel::kInfo};
  bool console_{true};
  std::ofstream file_;
};

Logger& GetLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

}  // namespace regflow::util
