#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace regflow::util {

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

const char* ConsoleTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevelString(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + value);
}

void Logger::SetThreshold(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  threshold_ = level;
}

LogLevel Logger::Threshold() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return threshold_;
}

void Logger::EnableFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  file_.open(path, std::ios::app);
  if (!file_) {
    throw std::runtime_error("failed to open debug log: " + path);
  }
  file_ << "---- regflow debug log started " << FormatTimestamp() << " ----\n";
  file_.flush();
}

void Logger::DisableFile() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
}

void Logger::SetConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_ = enabled;
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(threshold_)) {
    return;
  }
  if (console_) {
    auto& stream = (level >= LogLevel::kWarn) ? std::cerr : std::cout;
    stream << "[" << component << "] " << ConsoleTag(level) << ": " << message << "\n";
  }
  if (file_.is_open()) {
    file_ << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] [" << component
          << "] " << message << '\n';
    file_.flush();
  }
}

Logger& GetLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kDebug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kInfo, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kWarn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kError, component, message);
}

}  // namespace regflow::util
