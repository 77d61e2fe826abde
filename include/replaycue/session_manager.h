#pragma once

#include "replaycue/log.h"
#include "replaycue/protocol.h"
#include "replaycue/replaycue.h"
#include "replaycue/transport.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace replaycue {

struct HandshakeOptions {
  Endpoint endpoint;
  std::string password;
  uint32_t event_subscriptions = 0;
  int rpc_version_min = kMinSupportedRpcVersion;
  int rpc_version_max = kMaxSupportedRpcVersion;
  std::chrono::milliseconds handshake_timeout{5000};
};

struct HandshakeResult {
  /// Unset on success.
  std::optional<Error> error;
  int negotiated_rpc_version = 0;
  std::string server_version;
  /// The error came from the handshake deadline rather than a rejection.
  bool timed_out = false;

  bool ok() const { return !error.has_value(); }
};

/**
 * Runs connect + Hello/Identify/Identified over a transport.
 *
 * The owner forwards decoded frames and the close notification while the
 * handshake is running. The done callback fires exactly once; on failure the
 * transport has already been closed.
 */
class SessionManager {
 public:
  using DoneCallback = std::function<void(const HandshakeResult&)>;

  SessionManager(boost::asio::io_context& io, HandshakeOptions options,
                 std::shared_ptr<Transport> transport, Logger logger = Logger());
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  void Begin(DoneCallback done);
  void OnMessage(const IncomingMessage& message);
  /// A frame failed to decode during the handshake.
  void OnProtocolViolation(const std::string& reason);
  void OnClosed(const CloseInfo& info);
  /// Stop the handshake without reporting (owner is shutting down).
  void Abort();

  bool finished() const { return phase_ == Phase::kDone; }

 private:
  enum class Phase {
    kIdle,
    kConnecting,
    kAwaitingHello,
    kAwaitingIdentified,
    kDone,
  };

  void OnConnected(const std::optional<Error>& error);
  void OnDeadline();
  void HandleHello(const HelloMessage& hello);
  void HandleIdentified(const IdentifiedMessage& identified);
  void Fail(ErrorKind kind, const std::string& message);
  void Finish(HandshakeResult result);

  HandshakeOptions options_;
  std::shared_ptr<Transport> transport_;
  Logger logger_;
  boost::asio::steady_timer deadline_;
  DoneCallback done_;
  Phase phase_ = Phase::kIdle;
  bool sent_authentication_ = false;
  bool timed_out_ = false;
  std::string server_version_;
  /// Expires with this object; async completions check it before touching it.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace replaycue
