// Interactive instant-replay console: buffer, save on cue, play back.
#include "replaycue/cue_listener.h"
#include "replaycue/replaycue.h"

#include "spdlog_sink.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorGreen = "\033[32m";
const char* kColorYellow = "\033[33m";
const char* kColorCyan = "\033[36m";
const char* kColorRed = "\033[31m";

std::atomic<bool> g_running{true};

void PrintMenu() {
  std::cout << kColorBold << "Commands:\n" << kColorReset;
  std::cout << "  b. Start replay buffer\n";
  std::cout << "  s. Save replay (cue)\n";
  std::cout << "  p. Play saved clip\n";
  std::cout << "  l. Play a list of clips\n";
  std::cout << "  x. Stop playback / dismiss clip\n";
  std::cout << "  d. Set save delay (ms)\n";
  std::cout << "  i. Show state\n";
  std::cout << "  m. Show metrics\n";
  std::cout << "  q. Quit\n";
  std::cout << kColorBold << "> " << kColorReset << std::flush;
}

void PrintState(const replaycue::Controller& controller) {
  const auto state = controller.GetReplayState();
  std::cout << kColorCyan << "connection: " << kColorReset
            << replaycue::ConnectionStatusName(controller.GetConnectionStatus()) << "\n";
  std::cout << kColorCyan << "replay:     " << kColorReset
            << replaycue::ReplayPhaseName(state.phase) << " (cycle " << state.save_cycle << ")\n";
  if (state.clip) {
    std::cout << kColorCyan << "clip:       " << kColorReset << state.clip->path << "\n";
  }
  if (state.fault) {
    std::cout << kColorRed << "fault:      " << state.fault->ToString() << kColorReset << "\n";
  }
  std::cout << kColorCyan << "save delay: " << kColorReset
            << controller.GetSaveDelay().count() << " ms\n";
}

void PrintMetrics(const replaycue::Controller& controller,
                  const replaycue::CueListener& listener) {
  const auto m = controller.GetMetrics();
  std::cout << "frames rx/tx=" << m.frames_received << "/" << m.frames_sent
            << " requests=" << m.requests_sent << " timed_out=" << m.requests_timed_out
            << " cancelled=" << m.requests_cancelled << " reconnects=" << m.reconnect_attempts
            << " events=" << m.events_received << " dropped=" << m.events_dropped
            << " rejected=" << m.state_transition_errors << "\n";
  const auto cues = listener.GetMetrics();
  std::cout << "cues received=" << cues.datagrams_received << " triggered=" << cues.cues_triggered
            << " ignored=" << cues.ignored_commands << " bad=" << cues.parse_errors << "\n";
}

replaycue::Controller::CommandCallback Report(const std::string& what) {
  return [what](const std::optional<replaycue::Error>& error) {
    if (error) {
      std::cout << kColorRed << "\n✗ " << what << ": " << error->ToString() << kColorReset
                << std::endl;
    } else {
      std::cout << kColorGreen << "\n✓ " << what << kColorReset << std::endl;
    }
  };
}

void WatchNotifications(replaycue::Controller& controller) {
  while (g_running) {
    auto notification = controller.WaitNotification(std::chrono::milliseconds(200));
    if (!notification) {
      continue;
    }
    switch (notification->type) {
      case replaycue::NotificationType::kConnectionStateChanged:
        std::cout << kColorYellow << "\n[connection] "
                  << replaycue::ConnectionStatusName(notification->connection) << kColorReset
                  << std::endl;
        break;
      case replaycue::NotificationType::kReplayStateChanged:
        std::cout << kColorYellow << "\n[replay] "
                  << replaycue::ReplayPhaseName(notification->old_phase) << " -> "
                  << replaycue::ReplayPhaseName(notification->new_phase) << kColorReset
                  << std::endl;
        break;
      case replaycue::NotificationType::kClipSaved:
        std::cout << kColorGreen << "\n[clip] " << notification->clip_path << kColorReset
                  << std::endl;
        break;
      case replaycue::NotificationType::kError:
        std::cout << kColorRed << "\n[error] " << notification->error.ToString() << kColorReset
                  << std::endl;
        break;
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc > 1 && std::string(argv[1]) == "--help") {
    std::cout << "Usage: " << argv[0] << " [host] [port] [password] [cue_port]\n";
    return 0;
  }

  auto logger = replaycue_examples::MakeLogger("replay_console", "logs/replay_console.log");
  logger->set_level(spdlog::level::info);

  replaycue::Config config;
  if (argc > 1) {
    config.host = argv[1];
  }
  if (argc > 2) {
    config.port = static_cast<uint16_t>(std::atoi(argv[2]));
  }
  if (argc > 3) {
    config.password = argv[3];
  } else if (const char* secret = std::getenv("REPLAYCUE_PASSWORD")) {
    config.password = secret;
  }
  config.auto_start_buffering = true;
  config.log_callback = replaycue_examples::MakeLogCallback(logger);
  config.log_level = replaycue::LogLevel::kDebug;

  replaycue::Controller controller(config);
  if (!controller.Start()) {
    logger->error("Failed to start controller: {}", controller.GetLastError());
    return 1;
  }

  replaycue::CueListenerConfig cue_config;
  if (argc > 4) {
    cue_config.port = static_cast<uint16_t>(std::atoi(argv[4]));
  }
  replaycue::CueListener listener(cue_config,
                                  replaycue::Logger(config.log_callback, replaycue::LogLevel::kInfo));
  listener.SetCueCallback([&controller](const std::string& command) {
    controller.SaveCue(Report("cue '" + command + "' saved replay"));
  });
  if (!listener.Start()) {
    logger->warn("Cue listener disabled: {}", listener.GetLastError());
  } else {
    logger->info("Listening for cues on udp {}:{}", cue_config.bind_address, listener.port());
  }

  std::thread watcher([&controller]() { WatchNotifications(controller); });

  PrintMenu();
  std::string line;
  while (g_running && std::getline(std::cin, line)) {
    if (line.empty()) {
      PrintMenu();
      continue;
    }
    switch (line[0]) {
      case 'b':
        controller.StartBuffering(Report("replay buffer started"));
        break;
      case 's':
        controller.SaveCue(Report("save cue accepted"));
        break;
      case 'p':
        controller.Play(Report("playing clip"));
        break;
      case 'l': {
        std::cout << "Clip paths (space separated): " << std::flush;
        std::string paths_line;
        std::getline(std::cin, paths_line);
        std::istringstream ss(paths_line);
        std::vector<std::string> paths;
        std::string path;
        while (ss >> path) {
          paths.push_back(path);
        }
        controller.PlayClips(std::move(paths), Report("playing clip list"));
        break;
      }
      case 'x':
        controller.StopPlayback(Report("playback stopped"));
        break;
      case 'd': {
        std::cout << "Delay in ms (0-30000): " << std::flush;
        long long delay = 0;
        if (!(std::cin >> delay)) {
          std::cin.clear();
        }
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        const auto applied = controller.SetSaveDelay(std::chrono::milliseconds(delay));
        std::cout << "save delay " << applied.count() << " ms\n";
        break;
      }
      case 'i':
        PrintState(controller);
        break;
      case 'm':
        PrintMetrics(controller, listener);
        break;
      case 'q':
        g_running = false;
        break;
      default:
        std::cout << "unknown command\n";
        break;
    }
    if (g_running) {
      PrintMenu();
    }
  }

  g_running = false;
  listener.Stop();
  controller.Stop();
  watcher.join();
  spdlog::shutdown();
  return 0;
}
