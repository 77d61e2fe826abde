#include "replaycue/protocol.h"
#include "replaycue/transport.h"

#include <algorithm>
#include <deque>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace replaycue {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

constexpr const char* kUserAgent = "replaycue";

// Boost.Beast WebSocket client. All members are touched only from the
// io_context thread; every async operation holds a shared_ptr to keep the
// transport alive until it completes.
class WebSocketTransport : public Transport,
                           public std::enable_shared_from_this<WebSocketTransport> {
 public:
  WebSocketTransport(asio::io_context& io, TransportOptions options, Logger logger)
      : options_(std::move(options)),
        logger_(std::move(logger)),
        resolver_(io),
        ws_(io),
        heartbeat_timer_(io) {}

  void SetHandlers(FrameCallback on_frame, CloseCallback on_close) override {
    on_frame_ = std::move(on_frame);
    on_close_ = std::move(on_close);
  }

  void AsyncConnect(const Endpoint& endpoint, ConnectCallback done) override {
    connect_done_ = std::move(done);
    host_ = endpoint.host + ":" + std::to_string(endpoint.port);
    logger_.Debug("connecting to " + host_);
    auto self = shared_from_this();
    resolver_.async_resolve(
        endpoint.host, std::to_string(endpoint.port),
        [self](const beast::error_code& ec, tcp::resolver::results_type results) {
          self->OnResolve(ec, results);
        });
  }

  bool Send(const std::string& frame, std::string* error) override {
    if (!open_ || closing_) {
      if (error) {
        *error = "transport not connected";
      }
      return false;
    }
    write_queue_.push_back(Outgoing{false, frame});
    if (!writing_) {
      DoWrite();
    }
    return true;
  }

  void Close(const std::string& reason) override {
    if (closing_ || closed_reported_) {
      return;
    }
    closing_ = true;
    close_reason_ = reason;
    heartbeat_timer_.cancel();
    if (!open_) {
      // Still connecting: abort the pending resolve/connect/handshake.
      resolver_.cancel();
      CloseSocket();
      return;
    }
    open_ = false;
    // Drop queued frames that have not started writing.
    while (write_queue_.size() > (writing_ ? 1u : 0u)) {
      write_queue_.pop_back();
    }
    if (writing_) {
      close_after_write_ = true;
      return;
    }
    StartClose();
  }

  bool IsOpen() const override { return open_ && !closing_; }

 private:
  struct Outgoing {
    bool ping = false;
    std::string data;
  };

  void OnResolve(const beast::error_code& ec, tcp::resolver::results_type results) {
    if (ec) {
      FailConnect("resolve " + host_ + " failed: " + ec.message());
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(options_.connect_timeout);
    auto self = shared_from_this();
    beast::get_lowest_layer(ws_).async_connect(
        results, [self](const beast::error_code& ec, const tcp::endpoint&) {
          self->OnTcpConnect(ec);
        });
  }

  void OnTcpConnect(const beast::error_code& ec) {
    if (ec) {
      FailConnect("connect to " + host_ + " failed: " + ec.message());
      return;
    }
    // The websocket stream manages its own timeouts from here on.
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = options_.connect_timeout;
    timeouts.idle_timeout = websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
      req.set(beast::http::field::user_agent, kUserAgent);
      req.set(beast::http::field::sec_websocket_protocol, kWebSocketSubprotocol);
    }));
    auto self = shared_from_this();
    ws_.async_handshake(host_, options_.path, [self](const beast::error_code& ec) {
      self->OnHandshake(ec);
    });
  }

  void OnHandshake(const beast::error_code& ec) {
    if (ec) {
      FailConnect("websocket upgrade with " + host_ + " failed: " + ec.message());
      return;
    }
    if (closing_) {
      FailConnect("connection closed locally during connect");
      return;
    }
    open_ = true;
    connected_ = true;
    ws_.text(true);
    auto weak = weak_from_this();
    ws_.control_callback([weak](websocket::frame_type kind, beast::string_view) {
      auto self = weak.lock();
      if (self && kind == websocket::frame_type::pong) {
        self->missed_pongs_ = 0;
      }
    });
    logger_.Info("connected to " + host_);
    DoRead();
    ScheduleHeartbeat();
    ConnectCallback done = std::move(connect_done_);
    connect_done_ = nullptr;
    if (done) {
      done(std::nullopt);
    }
  }

  void FailConnect(const std::string& message) {
    CloseSocket();
    ConnectCallback done = std::move(connect_done_);
    connect_done_ = nullptr;
    logger_.Warn(message);
    if (done) {
      done(Error{ErrorKind::kConnection, message, 0});
    }
  }

  void DoRead() {
    auto self = shared_from_this();
    ws_.async_read(read_buffer_, [self](const beast::error_code& ec, std::size_t) {
      self->OnRead(ec);
    });
  }

  void OnRead(const beast::error_code& ec) {
    if (ec) {
      CloseInfo info;
      if (ec == websocket::error::closed) {
        info.code = static_cast<int>(ws_.reason().code);
        info.reason = std::string(ws_.reason().reason.c_str());
      } else {
        info.reason = ec.message();
      }
      ReportClosed(info);
      return;
    }
    std::string frame = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    missed_pongs_ = 0;
    if (on_frame_) {
      on_frame_(frame);
    }
    if (!closed_reported_) {
      DoRead();
    }
  }

  void DoWrite() {
    writing_ = true;
    auto self = shared_from_this();
    const Outgoing& next = write_queue_.front();
    if (next.ping) {
      ws_.async_ping(websocket::ping_data{}, [self](const beast::error_code& ec) {
        self->OnWrite(ec);
      });
      return;
    }
    ws_.async_write(asio::buffer(next.data),
                    [self](const beast::error_code& ec, std::size_t) { self->OnWrite(ec); });
  }

  void OnWrite(const beast::error_code& ec) {
    if (!write_queue_.empty()) {
      write_queue_.pop_front();
    }
    if (ec) {
      writing_ = false;
      write_queue_.clear();
      if (!closed_reported_) {
        CloseInfo info;
        info.reason = "write failed: " + ec.message();
        ReportClosed(info);
      }
      return;
    }
    if (close_after_write_) {
      writing_ = false;
      write_queue_.clear();
      close_after_write_ = false;
      StartClose();
      return;
    }
    if (write_queue_.empty()) {
      writing_ = false;
      return;
    }
    DoWrite();
  }

  void StartClose() {
    auto self = shared_from_this();
    websocket::close_reason reason(websocket::close_code::normal);
    // Close frame reasons are limited to 123 bytes.
    reason.reason.assign(close_reason_.data(),
                         std::min<std::size_t>(close_reason_.size(), 120));
    ws_.async_close(reason, [self](const beast::error_code& ec) {
      if (ec) {
        self->logger_.Debug("websocket close: " + ec.message());
      }
      CloseInfo info;
      info.code = static_cast<int>(websocket::close_code::normal);
      self->ReportClosed(info);
    });
  }

  void ScheduleHeartbeat() {
    if (options_.heartbeat_interval.count() <= 0) {
      return;
    }
    heartbeat_timer_.expires_after(options_.heartbeat_interval);
    auto weak = weak_from_this();
    heartbeat_timer_.async_wait([weak](const boost::system::error_code& ec) {
      auto self = weak.lock();
      if (!self || ec == asio::error::operation_aborted) {
        return;
      }
      self->OnHeartbeat();
    });
  }

  void OnHeartbeat() {
    if (!open_ || closing_) {
      return;
    }
    if (missed_pongs_ >= options_.heartbeat_max_missed) {
      std::ostringstream oss;
      oss << "heartbeat lost: " << missed_pongs_ << " ping(s) unanswered";
      logger_.Warn(oss.str());
      CloseInfo info;
      info.reason = oss.str();
      ReportClosed(info);
      return;
    }
    ++missed_pongs_;
    write_queue_.push_back(Outgoing{true, {}});
    if (!writing_) {
      DoWrite();
    }
    ScheduleHeartbeat();
  }

  void CloseSocket() {
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
  }

  void ReportClosed(CloseInfo info) {
    if (closed_reported_) {
      return;
    }
    closed_reported_ = true;
    open_ = false;
    heartbeat_timer_.cancel();
    CloseSocket();
    if (closing_) {
      info.local = true;
      if (info.reason.empty()) {
        info.reason = close_reason_;
      }
    }
    logger_.Debug("connection to " + host_ + " closed (code " + std::to_string(info.code) +
                  "): " + info.reason);
    if (!connected_) {
      return;
    }
    CloseCallback on_close = on_close_;
    if (on_close) {
      on_close(info);
    }
  }

  TransportOptions options_;
  Logger logger_;
  tcp::resolver resolver_;
  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer read_buffer_;
  asio::steady_timer heartbeat_timer_;
  std::deque<Outgoing> write_queue_;
  std::string host_;
  std::string close_reason_;
  FrameCallback on_frame_;
  CloseCallback on_close_;
  ConnectCallback connect_done_;
  int missed_pongs_ = 0;
  bool connected_ = false;
  bool open_ = false;
  bool closing_ = false;
  bool writing_ = false;
  bool close_after_write_ = false;
  bool closed_reported_ = false;
};

}  // namespace

std::shared_ptr<Transport> MakeWebSocketTransport(boost::asio::io_context& io,
                                                  TransportOptions options,
                                                  Logger logger) {
  return std::make_shared<WebSocketTransport>(io, std::move(options), std::move(logger));
}

}  // namespace replaycue
