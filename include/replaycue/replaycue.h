#pragma once

#include "replaycue/log.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boost {
namespace asio {
class io_context;
}  // namespace asio
}  // namespace boost

namespace replaycue {

class Controller;
class Transport;

#ifdef REPLAYCUE_TESTING
namespace test {
size_t GetPendingRequestCount(Controller& controller);
uint64_t GetConnectionEpoch(Controller& controller);
bool IsSaveDelayPending(Controller& controller);
}  // namespace test
#endif

/**
 * Default control endpoint port.
 */
constexpr uint16_t kDefaultPort = 4455;

/**
 * Range of protocol rpc versions this library can speak.
 */
constexpr int kMinSupportedRpcVersion = 1;
constexpr int kMaxSupportedRpcVersion = 1;

/**
 * Event subscription categories (bit flags sent in Identify/Reidentify).
 */
constexpr uint32_t kEventSubscriptionNone = 0;
constexpr uint32_t kEventSubscriptionGeneral = 1u << 0;
constexpr uint32_t kEventSubscriptionInputs = 1u << 3;
constexpr uint32_t kEventSubscriptionOutputs = 1u << 6;
constexpr uint32_t kEventSubscriptionMediaInputs = 1u << 8;

/**
 * Upper bound for the delay between a save cue and the save request.
 */
constexpr std::chrono::milliseconds kMaxSaveDelay{30000};

/**
 * Error taxonomy reported by asynchronous operations and notifications.
 */
enum class ErrorKind {
  /// Transport-level failure (resolve, connect, socket error, heartbeat loss).
  kConnection,
  /// A frame could not be written because the transport is not connected.
  kSend,
  /// Handshake or credential rejection.
  kAuth,
  /// Negotiated rpc version outside the configured range.
  kVersionMismatch,
  /// Request deadline elapsed before a response arrived.
  kRequestTimeout,
  /// Remote end answered with a failure status (status_code holds it).
  kRequestRejected,
  /// Malformed or out-of-sequence wire message; connection-fatal.
  kProtocolViolation,
  /// A single message failed schema validation.
  kMalformedMessage,
  /// Input could not be applied in the current replay state; never fatal.
  kStateTransition,
  /// The playback source does not exist on the remote end.
  kSourceNotFound,
  /// Request invalidated by disconnect or reconnect.
  kCancelled,
};

const char* ErrorKindName(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::kConnection;
  std::string message;
  /// Remote request status code, when the error came from a response.
  int status_code = 0;

  std::string ToString() const;
};

/**
 * Connection status of the controller's single live connection.
 */
enum class ConnectionStatus {
  kDisconnected,
  kHandshaking,
  kReady,
  kClosing,
};

const char* ConnectionStatusName(ConnectionStatus status);

/**
 * Replay capture lifecycle phases.
 */
enum class ReplayPhase {
  kIdle,
  kBuffering,
  kSaveRequested,
  kSaved,
  kPlaying,
  kFaulted,
};

const char* ReplayPhaseName(ReplayPhase phase);

/**
 * A clip produced by a confirmed replay buffer save.
 */
struct SavedClip {
  /// Absolute path reported by the remote application.
  std::string path;
  /// Local time the save confirmation was received.
  std::chrono::system_clock::time_point captured_at;
  /// Clip duration, if the remote end reported it.
  std::optional<std::chrono::milliseconds> duration;
};

/**
 * Snapshot of the authoritative replay state.
 */
struct ReplayState {
  ReplayPhase phase = ReplayPhase::kIdle;
  /// Set while in kSaved and kPlaying (for single-clip playback).
  std::optional<SavedClip> clip;
  /// Set while in kFaulted.
  std::optional<Error> fault;
  /// Incremented each time kSaveRequested is entered.
  uint64_t save_cycle = 0;
};

/**
 * Per-request-type deadlines.
 */
struct RequestTimeouts {
  /// Deadline applied to request types without an override.
  std::chrono::milliseconds default_timeout{10000};
  /// Overrides keyed by request type (e.g. "SaveReplayBuffer").
  std::map<std::string, std::chrono::milliseconds> per_request_type;

  std::chrono::milliseconds For(const std::string& request_type) const;
};

/**
 * Reconnect backoff parameters.
 */
struct BackoffPolicy {
  /// First retry delay.
  std::chrono::milliseconds min_delay{500};
  /// Cap for the retry delay.
  std::chrono::milliseconds max_delay{30000};
  /// Growth factor applied after each consecutive failure.
  double multiplier = 2.0;
  /// Consecutive attempts before giving up (0 = retry forever).
  int max_attempts = 10;
  /// A reconnect must stay up this long before the backoff resets.
  std::chrono::milliseconds grace_period{10000};
};

/**
 * Kind of the remote playback source the saved clip is handed to.
 */
enum class SourceKind {
  /// VLC video source; settings carry a playlist.
  kVlcSource,
  /// Media source; settings carry a single local file.
  kMediaSource,
};

/**
 * Process streams the output capture can redirect (bit flags).
 */
constexpr unsigned kCaptureNone = 0;
constexpr unsigned kCaptureStdout = 1u << 0;
constexpr unsigned kCaptureStderr = 1u << 1;

/**
 * Controller configuration: connection target, timing, automation and logging.
 */
struct Config {
  /// Remote control endpoint host name or address.
  std::string host = "127.0.0.1";
  /// Remote control endpoint port.
  uint16_t port = kDefaultPort;
  /// Shared secret; empty when the remote end has authentication disabled.
  std::string password;
  /// Event categories requested in addition to the ones the controller needs.
  uint32_t event_subscriptions = kEventSubscriptionNone;
  /// Lowest acceptable negotiated rpc version.
  int rpc_version_min = kMinSupportedRpcVersion;
  /// Highest rpc version requested in Identify.
  int rpc_version_max = kMaxSupportedRpcVersion;

  /// Resolve + TCP connect + WebSocket upgrade deadline.
  std::chrono::milliseconds connect_timeout{5000};
  /// Deadline from transport open until Identified.
  std::chrono::milliseconds handshake_timeout{5000};
  /// WebSocket ping interval (0 disables heartbeats).
  std::chrono::milliseconds heartbeat_interval{5000};
  /// Unanswered pings tolerated before the connection is declared lost.
  int heartbeat_max_missed = 2;

  /// Request deadlines.
  RequestTimeouts request_timeouts;
  /// Reconnect supervision.
  BackoffPolicy reconnect;

  /// Name of the playback source that receives saved clips.
  std::string source_name = "Replay";
  /// Kind of the playback source.
  SourceKind source_kind = SourceKind::kVlcSource;
  /// Create the playback source in the current program scene when missing.
  bool create_source_if_missing = false;
  /// Restart playback after pointing the source at new media.
  bool restart_source_on_set = true;

  /// Delay between a save cue and the SaveReplayBuffer request (0-30 s).
  std::chrono::milliseconds save_delay{3000};
  /// Issue start-buffering after every successful handshake.
  bool auto_start_buffering = false;
  /// Play each saved clip as soon as it is confirmed.
  bool auto_play_saved_clips = false;

  /// Streams redirected into the log while the controller runs. The log
  /// callback should not write to a captured stream: what it writes there is
  /// read back once more and never reaches the terminal.
  unsigned capture_streams = kCaptureNone;
  /// Maximum queued notifications before the oldest is dropped.
  size_t notification_queue_capacity = 256;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;
  /// Messages above this level are discarded.
  LogLevel log_level = LogLevel::kInfo;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Outbound notification kinds delivered to the host application.
 */
enum class NotificationType {
  kConnectionStateChanged,
  kReplayStateChanged,
  kClipSaved,
  kError,
};

struct Notification {
  NotificationType type = NotificationType::kError;
  /// kConnectionStateChanged: the new status.
  ConnectionStatus connection = ConnectionStatus::kDisconnected;
  /// kReplayStateChanged: previous and new phase.
  ReplayPhase old_phase = ReplayPhase::kIdle;
  ReplayPhase new_phase = ReplayPhase::kIdle;
  /// kClipSaved: path of the saved clip.
  std::string clip_path;
  /// kError: what went wrong.
  Error error;
};

/**
 * Counters for frame flow, requests and error reporting.
 */
struct ControllerMetrics {
  uint64_t frames_received = 0;
  uint64_t frames_sent = 0;
  uint64_t decode_errors = 0;
  uint64_t unknown_messages = 0;
  uint64_t unmatched_responses = 0;
  uint64_t events_received = 0;
  uint64_t events_dropped = 0;
  uint64_t requests_sent = 0;
  uint64_t requests_timed_out = 0;
  uint64_t requests_cancelled = 0;
  uint64_t state_transition_errors = 0;
  uint64_t reconnect_attempts = 0;
  uint64_t notifications_dropped = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Creates the transport for each connection attempt. Callbacks of the returned
 * transport must run on the supplied io_context.
 */
using TransportFactory =
    std::function<std::shared_ptr<Transport>(boost::asio::io_context&)>;

/**
 * Instant-replay controller driving a remote recording application.
 *
 * All protocol work happens on one internal I/O thread; the public methods post
 * commands to it and return immediately. Completion callbacks run on the I/O
 * thread and must neither block nor call Stop().
 */
class Controller {
 public:
  using CommandCallback = std::function<void(const std::optional<Error>&)>;

  /// Construct a controller using the WebSocket transport.
  explicit Controller(Config config);
  /// Construct a controller with a custom transport factory.
  Controller(Config config, TransportFactory transport_factory);
  /// Disconnect and stop the I/O thread.
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  /// Validate the configuration, start the I/O thread and begin connecting.
  bool Start();
  /// Disconnect without scheduling a reconnect and stop the I/O thread.
  void Stop();

  /// Start the remote replay buffer; Idle -> Buffering on success.
  void StartBuffering(CommandCallback cb = nullptr);
  /// Save cue: Buffering -> SaveRequested, then issue SaveReplayBuffer.
  void SaveCue(CommandCallback cb = nullptr);
  /// Play the saved clip through the playback source: Saved -> Playing.
  void Play(CommandCallback cb = nullptr);
  /// Stop playback (Playing -> Buffering) or dismiss a saved clip.
  void StopPlayback(CommandCallback cb = nullptr);
  /// Play a list of clips through the playback source.
  void PlayClips(std::vector<std::string> paths, CommandCallback cb = nullptr);

  /// Set the save delay, clamped to [0, kMaxSaveDelay]; returns the applied value.
  std::chrono::milliseconds SetSaveDelay(std::chrono::milliseconds delay);
  /// Return the current save delay.
  std::chrono::milliseconds GetSaveDelay() const;
  /// Change the extra event subscription mask (sends Reidentify when connected).
  void UpdateEventSubscriptions(uint32_t mask);

  /// Wait up to timeout for the next notification.
  std::optional<Notification> WaitNotification(std::chrono::milliseconds timeout);

  /// Return the current connection status.
  ConnectionStatus GetConnectionStatus() const;
  /// Return a snapshot of the replay state.
  ReplayState GetReplayState() const;
  /// Return the rpc version negotiated by the last handshake (0 if none).
  int GetNegotiatedRpcVersion() const;
  /// Return the last Start() or fatal connection error message, if any.
  std::string GetLastError() const;
  /// Return metrics for frames, requests, and errors.
  ControllerMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef REPLAYCUE_TESTING
  friend size_t test::GetPendingRequestCount(Controller& controller);
  friend uint64_t test::GetConnectionEpoch(Controller& controller);
  friend bool test::IsSaveDelayPending(Controller& controller);
#endif
};

}  // namespace replaycue
