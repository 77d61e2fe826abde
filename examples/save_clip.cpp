// Example: connect, save one replay and print the clip path.
#include "replaycue/replaycue.h"

#include "spdlog_sink.h"

#include <chrono>
#include <cstdlib>
#include <future>
#include <optional>
#include <memory>
#include <string>

int main(int argc, char** argv) {
  auto logger = replaycue_examples::MakeLogger("save_clip");

  replaycue::Config config;
  if (argc > 1) {
    config.host = argv[1];
  }
  if (argc > 2) {
    config.port = static_cast<uint16_t>(std::atoi(argv[2]));
  }
  if (const char* secret = std::getenv("REPLAYCUE_PASSWORD")) {
    config.password = secret;
  }
  config.save_delay = std::chrono::milliseconds(0);
  config.reconnect.max_attempts = 3;
  config.log_callback = replaycue_examples::MakeLogCallback(logger);

  replaycue::Controller controller(config);
  if (!controller.Start()) {
    logger->error("Failed to start controller: {}", controller.GetLastError());
    return 1;
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
  bool buffering_requested = false;
  while (std::chrono::steady_clock::now() < deadline) {
    auto notification = controller.WaitNotification(std::chrono::milliseconds(250));
    if (!notification) {
      continue;
    }
    if (notification->type == replaycue::NotificationType::kConnectionStateChanged &&
        notification->connection == replaycue::ConnectionStatus::kReady && !buffering_requested) {
      buffering_requested = true;
      auto started = std::make_shared<std::promise<std::optional<replaycue::Error>>>();
      controller.StartBuffering(
          [started](const std::optional<replaycue::Error>& error) { started->set_value(error); });
      const auto error = started->get_future().get();
      if (error) {
        logger->error("Could not start replay buffer: {}", error->ToString());
        break;
      }
      controller.SaveCue([logger](const std::optional<replaycue::Error>& save_error) {
        if (save_error) {
          logger->error("Save failed: {}", save_error->ToString());
        }
      });
    } else if (notification->type == replaycue::NotificationType::kClipSaved) {
      logger->info("Saved clip: {}", notification->clip_path);
      controller.Stop();
      return 0;
    } else if (notification->type == replaycue::NotificationType::kError) {
      logger->warn("{}", notification->error.ToString());
      if (controller.GetReplayState().phase == replaycue::ReplayPhase::kFaulted) {
        break;
      }
    }
  }

  logger->error("No clip saved");
  controller.Stop();
  return 1;
}
