#include "replaycue/log.h"

#include <iostream>
#include <mutex>

namespace replaycue {
namespace {

std::mutex& StderrMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kDebug:
      return "debug";
  }
  return "unknown";
}

Logger::Logger(LogCallback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void Logger::Log(LogLevel level, const std::string& message) const {
  if (!Enabled(level)) {
    return;
  }
  if (callback_) {
    try {
      callback_(level, message);
      return;
    } catch (const std::exception& e) {
      std::lock_guard<std::mutex> lock(StderrMutex());
      std::cerr << "[replaycue] log callback threw: " << e.what() << std::endl;
    } catch (...) {
      std::lock_guard<std::mutex> lock(StderrMutex());
      std::cerr << "[replaycue] log callback threw" << std::endl;
    }
  }
  std::lock_guard<std::mutex> lock(StderrMutex());
  std::cerr << "[replaycue] " << LogLevelName(level) << ": " << message << std::endl;
}

}  // namespace replaycue
