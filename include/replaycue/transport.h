#pragma once

#include "replaycue/log.h"
#include "replaycue/replaycue.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace replaycue {

struct Endpoint {
  std::string host;
  uint16_t port = 0;
};

/**
 * Why a connection ended.
 */
struct CloseInfo {
  /// WebSocket close code, or 0 when the socket failed without a close frame.
  int code = 0;
  std::string reason;
  /// True when the local side initiated the close.
  bool local = false;
};

struct TransportOptions {
  std::chrono::milliseconds connect_timeout{5000};
  /// Ping interval (0 disables heartbeats).
  std::chrono::milliseconds heartbeat_interval{5000};
  /// Unanswered pings tolerated before the connection is failed.
  int heartbeat_max_missed = 2;
  std::string path = "/";
};

/**
 * One connection to the control endpoint carrying text frames.
 *
 * Implementations deliver all callbacks on the io_context they were created
 * with. After a successful connect, the close callback fires exactly once when
 * the connection ends for any reason, including a local Close().
 */
class Transport {
 public:
  using ConnectCallback = std::function<void(const std::optional<Error>&)>;
  using FrameCallback = std::function<void(const std::string&)>;
  using CloseCallback = std::function<void(const CloseInfo&)>;

  virtual ~Transport() = default;

  /// Install frame and close handlers (before AsyncConnect).
  virtual void SetHandlers(FrameCallback on_frame, CloseCallback on_close) = 0;
  /// Resolve, connect and upgrade; reports kConnection on failure.
  virtual void AsyncConnect(const Endpoint& endpoint, ConnectCallback done) = 0;
  /// Queue a text frame; fails with an error message when not connected.
  virtual bool Send(const std::string& frame, std::string* error) = 0;
  /// Close the connection and release the socket. Idempotent.
  virtual void Close(const std::string& reason) = 0;
  virtual bool IsOpen() const = 0;
};

/**
 * Create a WebSocket transport (Boost.Beast) bound to io.
 */
std::shared_ptr<Transport> MakeWebSocketTransport(boost::asio::io_context& io,
                                                  TransportOptions options,
                                                  Logger logger);

}  // namespace replaycue
