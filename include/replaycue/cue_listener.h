#pragma once

#include "replaycue/log.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace replaycue {

/// Default UDP port for cue datagrams.
constexpr uint16_t kDefaultCuePort = 34512;

struct CueListenerConfig {
  /// IPv4 address to bind (loopback by default).
  std::string bind_address = "127.0.0.1";
  /// UDP port; 0 picks an ephemeral port (see CueListener::port()).
  uint16_t port = kDefaultCuePort;
  /// Commands that count as a save cue (case-insensitive).
  std::vector<std::string> trigger_commands = {"Scored", "EpicSave"};

  bool Validate(std::string* error = nullptr) const;
};

struct CueListenerMetrics {
  uint64_t datagrams_received = 0;
  uint64_t cues_triggered = 0;
  uint64_t ignored_commands = 0;
  uint64_t parse_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Extract the command name from a cue datagram.
 *
 * Accepts a JSON object with a string "cmd" field or a bare command word.
 * Surrounding whitespace is ignored.
 */
std::optional<std::string> ParseCueCommand(const std::string& datagram);

/**
 * Listens for cue datagrams from an external trigger (game integration,
 * stream deck script) and reports the ones that should save a replay.
 */
class CueListener {
 public:
  using CueCallback = std::function<void(const std::string& command)>;

  explicit CueListener(CueListenerConfig config, Logger logger = Logger());
  ~CueListener();

  CueListener(const CueListener&) = delete;
  CueListener& operator=(const CueListener&) = delete;

  /// Bind the socket and start the receive thread.
  bool Start();
  void Stop();

  void SetCueCallback(CueCallback cb);

  /// True when command matches one of the trigger commands.
  bool IsTriggerCommand(const std::string& command) const;

  /// Bound port (valid after Start()).
  uint16_t port() const { return bound_port_; }
  std::string GetLastError() const;
  CueListenerMetrics GetMetrics() const;

 private:
  void RecvLoop();
  void HandleDatagram(const std::string& datagram);

  CueListenerConfig config_;
  Logger logger_;
  int fd_ = -1;
  uint16_t bound_port_ = 0;
  std::atomic<bool> running_{false};
  std::thread recv_thread_;

  mutable std::mutex mutex_;
  CueCallback cue_cb_;
  std::string last_error_;

  std::atomic<uint64_t> datagrams_received_{0};
  std::atomic<uint64_t> cues_triggered_{0};
  std::atomic<uint64_t> ignored_commands_{0};
  std::atomic<uint64_t> parse_errors_{0};
  std::atomic<uint64_t> callback_exceptions_{0};
};

}  // namespace replaycue
