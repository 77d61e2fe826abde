// Tests for the UDP cue listener.
#include "replaycue/cue_listener.h"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

void SendDatagram(uint16_t port, const std::string& payload) {
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  ASSERT_GE(fd, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  const ssize_t sent = ::sendto(fd, payload.data(), payload.size(), 0,
                                reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  ::close(fd);
  ASSERT_EQ(sent, static_cast<ssize_t>(payload.size()));
}

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

replaycue::CueListenerConfig EphemeralConfig() {
  replaycue::CueListenerConfig config;
  config.port = 0;
  return config;
}

}  // namespace

TEST(ParseCueCommandTest, AcceptsJsonAndBareWords) {
  EXPECT_EQ(replaycue::ParseCueCommand(R"({"cmd":"Scored"})").value(), "Scored");
  EXPECT_EQ(replaycue::ParseCueCommand("  EpicSave\n").value(), "EpicSave");
  EXPECT_EQ(replaycue::ParseCueCommand(R"({"cmd":" Demo ","team":1})").value(), "Demo");
}

TEST(ParseCueCommandTest, RejectsGarbage) {
  EXPECT_FALSE(replaycue::ParseCueCommand("").has_value());
  EXPECT_FALSE(replaycue::ParseCueCommand("two words").has_value());
  EXPECT_FALSE(replaycue::ParseCueCommand(R"({"cmd":5})").has_value());
  EXPECT_FALSE(replaycue::ParseCueCommand(R"({"cmd":"Scored")").has_value());
  EXPECT_FALSE(replaycue::ParseCueCommand(R"({"other":"x"})").has_value());
}

TEST(CueListenerConfigTest, Validation) {
  replaycue::CueListenerConfig config;
  EXPECT_TRUE(config.Validate());
  config.bind_address = "localhost";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("bind_address"), std::string::npos);
  config.bind_address = "0.0.0.0";
  config.trigger_commands.clear();
  EXPECT_FALSE(config.Validate(&error));
}

TEST(CueListenerTest, TriggerMatchingIgnoresCase) {
  replaycue::CueListener listener(EphemeralConfig());
  EXPECT_TRUE(listener.IsTriggerCommand("scored"));
  EXPECT_TRUE(listener.IsTriggerCommand("EPICSAVE"));
  EXPECT_FALSE(listener.IsTriggerCommand("Kickoff"));
}

TEST(CueListenerTest, FiresCallbackForTriggerDatagrams) {
  replaycue::CueListener listener(EphemeralConfig());
  std::mutex mutex;
  std::vector<std::string> cues;
  listener.SetCueCallback([&](const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex);
    cues.push_back(command);
  });
  ASSERT_TRUE(listener.Start()) << listener.GetLastError();
  ASSERT_NE(listener.port(), 0);

  SendDatagram(listener.port(), R"({"cmd":"Scored"})");
  SendDatagram(listener.port(), "Kickoff");
  SendDatagram(listener.port(), "{not json");
  SendDatagram(listener.port(), "EpicSave");

  EXPECT_TRUE(WaitUntil([&]() { return listener.GetMetrics().datagrams_received >= 4; }));
  listener.Stop();

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(cues, (std::vector<std::string>{"Scored", "EpicSave"}));
  const auto metrics = listener.GetMetrics();
  EXPECT_EQ(metrics.cues_triggered, 2u);
  EXPECT_EQ(metrics.ignored_commands, 1u);
  EXPECT_EQ(metrics.parse_errors, 1u);
}

TEST(CueListenerTest, CallbackExceptionIsCounted) {
  replaycue::CueListener listener(EphemeralConfig());
  listener.SetCueCallback([](const std::string&) { throw std::runtime_error("handler failed"); });
  ASSERT_TRUE(listener.Start());
  SendDatagram(listener.port(), "Scored");
  EXPECT_TRUE(WaitUntil([&]() { return listener.GetMetrics().callback_exceptions == 1; }));
  listener.Stop();
}

TEST(CueListenerTest, StartFailsWhenPortInUse) {
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  ASSERT_GE(fd, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(0);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len), 0);

  replaycue::CueListenerConfig config;
  config.port = ntohs(bound.sin_port);
  replaycue::CueListener second(config);
  EXPECT_FALSE(second.Start());
  EXPECT_NE(second.GetLastError().find("bind"), std::string::npos);
  ::close(fd);
}
