// Routes controller log lines into spdlog (stderr console plus rotating file).
#pragma once

#include "replaycue/log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace replaycue_examples {

inline std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                                  const std::string& file = std::string()) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 5 * 1024 * 1024, 3));
    } catch (const spdlog::spdlog_ex& ex) {
      std::cerr << "log file disabled: " << ex.what() << std::endl;
    }
  }
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  logger->set_level(spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

inline replaycue::LogCallback MakeLogCallback(std::shared_ptr<spdlog::logger> logger) {
  return [logger](replaycue::LogLevel level, const std::string& message) {
    switch (level) {
      case replaycue::LogLevel::kError:
        logger->error(message);
        break;
      case replaycue::LogLevel::kWarn:
        logger->warn(message);
        break;
      case replaycue::LogLevel::kInfo:
        logger->info(message);
        break;
      case replaycue::LogLevel::kDebug:
        logger->debug(message);
        break;
    }
  };
}

}  // namespace replaycue_examples
