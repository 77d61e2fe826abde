#include "replaycue/replaycue.h"

#include <sstream>

namespace replaycue {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConnection:
      return "ConnectionError";
    case ErrorKind::kSend:
      return "SendError";
    case ErrorKind::kAuth:
      return "AuthError";
    case ErrorKind::kVersionMismatch:
      return "VersionMismatch";
    case ErrorKind::kRequestTimeout:
      return "RequestTimeout";
    case ErrorKind::kRequestRejected:
      return "RequestRejected";
    case ErrorKind::kProtocolViolation:
      return "ProtocolViolation";
    case ErrorKind::kMalformedMessage:
      return "MalformedMessage";
    case ErrorKind::kStateTransition:
      return "StateTransitionError";
    case ErrorKind::kSourceNotFound:
      return "SourceNotFound";
    case ErrorKind::kCancelled:
      return "Cancelled";
  }
  return "Unknown";
}

std::string Error::ToString() const {
  std::ostringstream oss;
  oss << ErrorKindName(kind);
  if (status_code != 0) {
    oss << " (" << status_code << ")";
  }
  if (!message.empty()) {
    oss << ": " << message;
  }
  return oss.str();
}

const char* ConnectionStatusName(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kDisconnected:
      return "Disconnected";
    case ConnectionStatus::kHandshaking:
      return "Handshaking";
    case ConnectionStatus::kReady:
      return "Ready";
    case ConnectionStatus::kClosing:
      return "Closing";
  }
  return "Unknown";
}

const char* ReplayPhaseName(ReplayPhase phase) {
  switch (phase) {
    case ReplayPhase::kIdle:
      return "Idle";
    case ReplayPhase::kBuffering:
      return "Buffering";
    case ReplayPhase::kSaveRequested:
      return "SaveRequested";
    case ReplayPhase::kSaved:
      return "Saved";
    case ReplayPhase::kPlaying:
      return "Playing";
    case ReplayPhase::kFaulted:
      return "Faulted";
  }
  return "Unknown";
}

std::chrono::milliseconds RequestTimeouts::For(const std::string& request_type) const {
  auto it = per_request_type.find(request_type);
  if (it != per_request_type.end()) {
    return it->second;
  }
  return default_timeout;
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (host.empty()) {
    return fail("host must not be empty");
  }
  if (port == 0) {
    return fail("port must be non-zero");
  }
  if (rpc_version_min < kMinSupportedRpcVersion || rpc_version_max > kMaxSupportedRpcVersion ||
      rpc_version_min > rpc_version_max) {
    std::ostringstream oss;
    oss << "rpc version range must lie within [" << kMinSupportedRpcVersion << ", "
        << kMaxSupportedRpcVersion << "] with min <= max";
    return fail(oss.str());
  }
  if (connect_timeout.count() <= 0 || handshake_timeout.count() <= 0) {
    return fail("connect_timeout and handshake_timeout must be positive");
  }
  if (heartbeat_interval.count() < 0) {
    return fail("heartbeat_interval must not be negative");
  }
  if (heartbeat_interval.count() > 0 && heartbeat_max_missed <= 0) {
    return fail("heartbeat_max_missed must be positive");
  }
  if (request_timeouts.default_timeout.count() <= 0) {
    return fail("request_timeouts.default_timeout must be positive");
  }
  for (const auto& entry : request_timeouts.per_request_type) {
    if (entry.first.empty() || entry.second.count() <= 0) {
      return fail("request timeout overrides need a request type and a positive deadline");
    }
  }
  if (reconnect.min_delay.count() <= 0 || reconnect.max_delay < reconnect.min_delay) {
    return fail("reconnect delays must be positive with max_delay >= min_delay");
  }
  if (reconnect.multiplier < 1.0) {
    return fail("reconnect.multiplier must be >= 1.0");
  }
  if (reconnect.max_attempts < 0) {
    return fail("reconnect.max_attempts must not be negative (0 = unlimited)");
  }
  if (reconnect.grace_period.count() < 0) {
    return fail("reconnect.grace_period must not be negative");
  }
  if (source_name.empty()) {
    return fail("source_name must not be empty");
  }
  if (save_delay.count() < 0 || save_delay > kMaxSaveDelay) {
    return fail("save_delay must be between 0 and 30000 ms");
  }
  if ((capture_streams & ~(kCaptureStdout | kCaptureStderr)) != 0) {
    return fail("capture_streams has unknown bits");
  }
  if (capture_streams != kCaptureNone && !log_callback) {
    // The default sink writes to stderr, which would be captured again.
    return fail("capture_streams requires a log_callback");
  }
  if (notification_queue_capacity == 0) {
    return fail("notification_queue_capacity must be positive");
  }
  return true;
}

}  // namespace replaycue
