#include "replaycue/session_manager.h"

#include <algorithm>
#include <sstream>

namespace replaycue {

SessionManager::SessionManager(boost::asio::io_context& io, HandshakeOptions options,
                               std::shared_ptr<Transport> transport, Logger logger)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      logger_(std::move(logger)),
      deadline_(io) {}

SessionManager::~SessionManager() {
  deadline_.cancel();
  alive_.reset();
}

void SessionManager::Begin(DoneCallback done) {
  done_ = std::move(done);
  phase_ = Phase::kConnecting;
  sent_authentication_ = false;
  timed_out_ = false;
  std::weak_ptr<bool> alive = alive_;
  transport_->AsyncConnect(options_.endpoint,
                           [this, alive](const std::optional<Error>& error) {
                             if (alive.expired()) {
                               return;
                             }
                             OnConnected(error);
                           });
}

void SessionManager::OnConnected(const std::optional<Error>& error) {
  if (phase_ != Phase::kConnecting) {
    return;
  }
  if (error) {
    HandshakeResult result;
    result.error = error;
    Finish(std::move(result));
    return;
  }
  phase_ = Phase::kAwaitingHello;
  deadline_.expires_after(options_.handshake_timeout);
  std::weak_ptr<bool> alive = alive_;
  deadline_.async_wait([this, alive](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || alive.expired()) {
      return;
    }
    OnDeadline();
  });
}

void SessionManager::OnDeadline() {
  if (phase_ != Phase::kAwaitingHello && phase_ != Phase::kAwaitingIdentified) {
    return;
  }
  std::ostringstream oss;
  oss << "handshake not completed within " << options_.handshake_timeout.count() << " ms ("
      << (phase_ == Phase::kAwaitingHello ? "no Hello" : "no Identified") << ")";
  timed_out_ = true;
  Fail(ErrorKind::kAuth, oss.str());
}

void SessionManager::OnMessage(const IncomingMessage& message) {
  if (phase_ == Phase::kDone || phase_ == Phase::kIdle) {
    return;
  }
  if (const auto* hello = std::get_if<HelloMessage>(&message)) {
    if (phase_ != Phase::kAwaitingHello) {
      Fail(ErrorKind::kProtocolViolation, "unexpected Hello during handshake");
      return;
    }
    HandleHello(*hello);
    return;
  }
  if (const auto* identified = std::get_if<IdentifiedMessage>(&message)) {
    if (phase_ != Phase::kAwaitingIdentified) {
      Fail(ErrorKind::kProtocolViolation, "Identified received before Identify was sent");
      return;
    }
    HandleIdentified(*identified);
    return;
  }
  if (const auto* unknown = std::get_if<UnknownMessage>(&message)) {
    logger_.Warn("ignoring unknown opcode " + std::to_string(unknown->op) +
                 " during handshake");
    return;
  }
  Fail(ErrorKind::kProtocolViolation, "session message received before Identified");
}

void SessionManager::OnProtocolViolation(const std::string& reason) {
  if (phase_ == Phase::kDone) {
    return;
  }
  Fail(ErrorKind::kProtocolViolation, reason);
}

void SessionManager::HandleHello(const HelloMessage& hello) {
  server_version_ = hello.server_version;
  logger_.Debug("Hello from server " + hello.server_version + " (rpc " +
                std::to_string(hello.rpc_version) + ")");
  if (hello.rpc_version < options_.rpc_version_min) {
    std::ostringstream oss;
    oss << "server rpc version " << hello.rpc_version << " is below the supported minimum "
        << options_.rpc_version_min;
    Fail(ErrorKind::kVersionMismatch, oss.str());
    return;
  }
  IdentifyMessage identify;
  identify.rpc_version = std::min(hello.rpc_version, options_.rpc_version_max);
  identify.event_subscriptions = options_.event_subscriptions;
  if (hello.authentication.has_value()) {
    if (options_.password.empty()) {
      Fail(ErrorKind::kAuth, "server requires authentication but no password is configured");
      return;
    }
    identify.authentication = ComputeAuthResponse(
        options_.password, hello.authentication->salt, hello.authentication->challenge);
    sent_authentication_ = true;
  } else if (!options_.password.empty()) {
    logger_.Debug("server has authentication disabled, password not used");
  }
  std::string error;
  if (!transport_->Send(EncodeIdentify(identify), &error)) {
    Fail(ErrorKind::kConnection, "failed to send Identify: " + error);
    return;
  }
  phase_ = Phase::kAwaitingIdentified;
}

void SessionManager::HandleIdentified(const IdentifiedMessage& identified) {
  const int version = identified.negotiated_rpc_version;
  if (version < options_.rpc_version_min || version > options_.rpc_version_max) {
    std::ostringstream oss;
    oss << "negotiated rpc version " << version << " outside supported range ["
        << options_.rpc_version_min << ", " << options_.rpc_version_max << "]";
    Fail(ErrorKind::kVersionMismatch, oss.str());
    return;
  }
  HandshakeResult result;
  result.negotiated_rpc_version = version;
  result.server_version = server_version_;
  Finish(std::move(result));
}

void SessionManager::OnClosed(const CloseInfo& info) {
  if (phase_ == Phase::kDone) {
    return;
  }
  std::ostringstream oss;
  oss << "connection closed during handshake (code " << info.code << ")";
  if (!info.reason.empty()) {
    oss << ": " << info.reason;
  }
  ErrorKind kind = ErrorKind::kConnection;
  if (info.code == kCloseCodeAuthenticationFailed) {
    kind = ErrorKind::kAuth;
  } else if (info.code == kCloseCodeUnsupportedRpcVersion) {
    kind = ErrorKind::kVersionMismatch;
  } else if (phase_ == Phase::kAwaitingIdentified && sent_authentication_ && !info.local) {
    // Servers may drop the socket instead of sending a close code.
    kind = ErrorKind::kAuth;
  }
  Fail(kind, oss.str());
}

void SessionManager::Abort() {
  phase_ = Phase::kDone;
  deadline_.cancel();
  done_ = nullptr;
}

void SessionManager::Fail(ErrorKind kind, const std::string& message) {
  if (phase_ == Phase::kDone) {
    return;
  }
  HandshakeResult result;
  result.error = Error{kind, message, 0};
  result.server_version = server_version_;
  result.timed_out = timed_out_;
  Finish(std::move(result));
}

void SessionManager::Finish(HandshakeResult result) {
  phase_ = Phase::kDone;
  deadline_.cancel();
  if (!result.ok()) {
    logger_.Warn("handshake failed: " + result.error->ToString());
    transport_->Close("handshake failed");
  } else {
    logger_.Info("session identified (rpc " + std::to_string(result.negotiated_rpc_version) +
                 ", server " + result.server_version + ")");
  }
  DoneCallback done = std::move(done_);
  done_ = nullptr;
  if (done) {
    done(result);
  }
}

}  // namespace replaycue
