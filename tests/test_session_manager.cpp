// Tests for the Hello/Identify/Identified handshake.
#include "replaycue/session_manager.h"

#include "fake_server.h"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

namespace {

class SessionManagerTest : public ::testing::Test {
 protected:
  replaycue::HandshakeResult Run(replaycue::fake::FakeServer& server,
                                 replaycue::HandshakeOptions options = Options()) {
    transport_ = server.Factory()(io_);
    replaycue::SessionManager session(io_, options, transport_);
    transport_->SetHandlers(
        [&session](const std::string& frame) {
          replaycue::IncomingMessage message;
          std::string error;
          if (!replaycue::DecodeIncoming(frame, &message, &error)) {
            session.OnProtocolViolation(error);
            return;
          }
          session.OnMessage(message);
        },
        [&session](const replaycue::CloseInfo& info) { session.OnClosed(info); });
    std::optional<replaycue::HandshakeResult> result;
    session.Begin([&](const replaycue::HandshakeResult& r) { result = r; });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!result && std::chrono::steady_clock::now() < deadline) {
      io_.restart();
      io_.run_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(session.finished());
    transport_->SetHandlers(nullptr, nullptr);
    return result.value_or(replaycue::HandshakeResult());
  }

  static replaycue::HandshakeOptions Options() {
    replaycue::HandshakeOptions options;
    options.endpoint = replaycue::Endpoint{"127.0.0.1", 4455};
    options.event_subscriptions = replaycue::kEventSubscriptionOutputs;
    options.handshake_timeout = std::chrono::milliseconds(100);
    return options;
  }

  boost::asio::io_context io_;
  std::shared_ptr<replaycue::Transport> transport_;
};

}  // namespace

TEST_F(SessionManagerTest, IdentifiesWithoutAuthentication) {
  replaycue::fake::FakeServer server;
  const auto result = Run(server);
  ASSERT_TRUE(result.ok()) << result.error->ToString();
  EXPECT_EQ(result.negotiated_rpc_version, 1);
  EXPECT_EQ(result.server_version, "5.0.0-fake");
  const auto identifies = server.identifies();
  ASSERT_EQ(identifies.size(), 1u);
  EXPECT_FALSE(identifies[0].authentication.has_value());
  EXPECT_EQ(identifies[0].event_subscriptions, replaycue::kEventSubscriptionOutputs);
  EXPECT_TRUE(transport_->IsOpen());
}

TEST_F(SessionManagerTest, AuthenticatesWithPassword) {
  replaycue::fake::ServerOptions server_options;
  server_options.password = "supersecretpassword";
  replaycue::fake::FakeServer server(server_options);
  auto options = Options();
  options.password = "supersecretpassword";
  const auto result = Run(server, options);
  ASSERT_TRUE(result.ok()) << result.error->ToString();
  ASSERT_EQ(server.identifies().size(), 1u);
  EXPECT_EQ(server.identifies()[0].authentication.value(),
            "1Ct943GAT+6YQUUX47Ia/ncufilbe6+oD6lY+5kaCu4=");
}

TEST_F(SessionManagerTest, WrongPasswordIsAuthError) {
  replaycue::fake::ServerOptions server_options;
  server_options.password = "right";
  replaycue::fake::FakeServer server(server_options);
  auto options = Options();
  options.password = "wrong";
  const auto result = Run(server, options);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, replaycue::ErrorKind::kAuth);
  EXPECT_FALSE(result.timed_out);
  EXPECT_FALSE(transport_->IsOpen());
}

TEST_F(SessionManagerTest, MissingPasswordIsAuthError) {
  replaycue::fake::ServerOptions server_options;
  server_options.password = "right";
  replaycue::fake::FakeServer server(server_options);
  const auto result = Run(server);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, replaycue::ErrorKind::kAuth);
  EXPECT_TRUE(server.identifies().empty());
}

TEST_F(SessionManagerTest, OldServerIsVersionMismatch) {
  replaycue::fake::ServerOptions server_options;
  server_options.hello_rpc_version = 0;
  replaycue::fake::FakeServer server(server_options);
  const auto result = Run(server);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, replaycue::ErrorKind::kVersionMismatch);
}

TEST_F(SessionManagerTest, NegotiatedVersionOutsideRangeIsVersionMismatch) {
  replaycue::fake::ServerOptions server_options;
  server_options.identified_rpc_version = 2;
  replaycue::fake::FakeServer server(server_options);
  const auto result = Run(server);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, replaycue::ErrorKind::kVersionMismatch);
}

TEST_F(SessionManagerTest, SilentServerTimesOut) {
  replaycue::fake::ServerOptions server_options;
  server_options.silent = true;
  replaycue::fake::FakeServer server(server_options);
  const auto result = Run(server);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, replaycue::ErrorKind::kAuth);
  EXPECT_TRUE(result.timed_out);
  EXPECT_NE(result.error->message.find("no Hello"), std::string::npos);
}

TEST_F(SessionManagerTest, RefusedConnectionIsConnectionError) {
  replaycue::fake::ServerOptions server_options;
  server_options.refuse_all = true;
  replaycue::fake::FakeServer server(server_options);
  const auto result = Run(server);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error->kind, replaycue::ErrorKind::kConnection);
}
