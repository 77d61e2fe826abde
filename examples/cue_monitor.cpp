// Example: print cue datagrams as they arrive, without a controller.
#include "replaycue/cue_listener.h"

#include "spdlog_sink.h"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  auto logger = replaycue_examples::MakeLogger("cue_monitor");

  replaycue::CueListenerConfig config;
  if (argc > 1) {
    config.port = static_cast<uint16_t>(std::atoi(argv[1]));
  }
  if (argc > 2) {
    config.bind_address = argv[2];
  }

  replaycue::CueListener listener(
      config, replaycue::Logger(replaycue_examples::MakeLogCallback(logger),
                                replaycue::LogLevel::kDebug));
  listener.SetCueCallback(
      [logger](const std::string& command) { logger->info("cue: {}", command); });
  if (!listener.Start()) {
    logger->error("Failed to start cue listener: {}", listener.GetLastError());
    return 1;
  }
  logger->info("Listening on udp {}:{}. Press Enter to stop.", config.bind_address,
               listener.port());
  std::string line;
  std::getline(std::cin, line);
  listener.Stop();

  const auto metrics = listener.GetMetrics();
  logger->info("received={} triggered={} ignored={} parse_errors={}", metrics.datagrams_received,
               metrics.cues_triggered, metrics.ignored_commands, metrics.parse_errors);
  return 0;
}
