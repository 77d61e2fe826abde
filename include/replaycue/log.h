#pragma once

#include <functional>
#include <string>

namespace replaycue {

/**
 * Severity levels, ordered from most to least severe.
 */
enum class LogLevel {
  kError = 0,
  kWarn = 1,
  kInfo = 2,
  kDebug = 3,
};

const char* LogLevelName(LogLevel level);

using LogCallback = std::function<void(LogLevel, const std::string&)>;

/**
 * Level-filtered log sink shared by the controller and its components.
 *
 * Without a callback, messages are written to stderr with a "[replaycue]" prefix.
 * The callback may be invoked from the controller's I/O thread and from the
 * output-capture reader thread, so it must be thread-safe.
 */
class Logger {
 public:
  Logger() = default;
  Logger(LogCallback callback, LogLevel level);

  void Log(LogLevel level, const std::string& message) const;
  void Error(const std::string& message) const { Log(LogLevel::kError, message); }
  void Warn(const std::string& message) const { Log(LogLevel::kWarn, message); }
  void Info(const std::string& message) const { Log(LogLevel::kInfo, message); }
  void Debug(const std::string& message) const { Log(LogLevel::kDebug, message); }

  bool Enabled(LogLevel level) const { return level <= level_; }

 private:
  LogCallback callback_;
  LogLevel level_ = LogLevel::kInfo;
};

}  // namespace replaycue
