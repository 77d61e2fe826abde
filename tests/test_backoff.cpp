// Tests for reconnect backoff and supervision.
#include "replaycue/reconnect.h"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

namespace {

replaycue::BackoffPolicy FastPolicy() {
  replaycue::BackoffPolicy policy;
  policy.min_delay = std::chrono::milliseconds(5);
  policy.max_delay = std::chrono::milliseconds(20);
  policy.multiplier = 2.0;
  policy.max_attempts = 3;
  policy.grace_period = std::chrono::milliseconds(10);
  return policy;
}

void RunFor(boost::asio::io_context& io, std::chrono::milliseconds duration) {
  io.restart();
  io.run_for(duration);
}

}  // namespace

TEST(BackoffTest, GrowsGeometricallyAndCaps) {
  replaycue::BackoffPolicy policy;
  policy.min_delay = std::chrono::milliseconds(500);
  policy.max_delay = std::chrono::milliseconds(3000);
  policy.multiplier = 2.0;
  policy.max_attempts = 0;
  replaycue::Backoff backoff(policy);
  EXPECT_EQ(backoff.NextDelay().count(), 500);
  EXPECT_EQ(backoff.NextDelay().count(), 1000);
  EXPECT_EQ(backoff.NextDelay().count(), 2000);
  EXPECT_EQ(backoff.NextDelay().count(), 3000);
  EXPECT_EQ(backoff.NextDelay().count(), 3000);
  EXPECT_FALSE(backoff.Exhausted());
}

TEST(BackoffTest, ExhaustsAfterMaxAttemptsAndResets) {
  replaycue::Backoff backoff(FastPolicy());
  backoff.NextDelay();
  backoff.NextDelay();
  EXPECT_FALSE(backoff.Exhausted());
  backoff.NextDelay();
  EXPECT_TRUE(backoff.Exhausted());
  backoff.Reset();
  EXPECT_FALSE(backoff.Exhausted());
  EXPECT_EQ(backoff.NextDelay().count(), 5);
}

TEST(ReconnectSupervisorTest, FiresAttemptAfterDelay) {
  boost::asio::io_context io;
  replaycue::ReconnectSupervisor supervisor(io, FastPolicy());
  int attempts = 0;
  EXPECT_TRUE(supervisor.ScheduleReconnect([&]() { ++attempts; }));
  EXPECT_TRUE(supervisor.retry_pending());
  EXPECT_EQ(supervisor.last_delay().count(), 5);
  RunFor(io, std::chrono::milliseconds(100));
  EXPECT_EQ(attempts, 1);
  EXPECT_FALSE(supervisor.retry_pending());
}

TEST(ReconnectSupervisorTest, GivesUpWhenBudgetExhausted) {
  boost::asio::io_context io;
  replaycue::ReconnectSupervisor supervisor(io, FastPolicy());
  int attempts = 0;
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(supervisor.ScheduleReconnect([&]() { ++attempts; }));
    RunFor(io, std::chrono::milliseconds(100));
  }
  EXPECT_FALSE(supervisor.ScheduleReconnect([&]() { ++attempts; }));
  EXPECT_EQ(attempts, 3);
  EXPECT_EQ(supervisor.total_attempts(), 3u);
}

TEST(ReconnectSupervisorTest, StopCancelsPendingAttempt) {
  boost::asio::io_context io;
  replaycue::ReconnectSupervisor supervisor(io, FastPolicy());
  int attempts = 0;
  supervisor.ScheduleReconnect([&]() { ++attempts; });
  supervisor.Stop();
  RunFor(io, std::chrono::milliseconds(50));
  EXPECT_EQ(attempts, 0);
  EXPECT_FALSE(supervisor.retry_pending());
}

TEST(ReconnectSupervisorTest, StableConnectionResetsBackoff) {
  boost::asio::io_context io;
  replaycue::ReconnectSupervisor supervisor(io, FastPolicy());
  supervisor.ScheduleReconnect([]() {});
  supervisor.ScheduleReconnect([]() {});
  EXPECT_EQ(supervisor.attempts(), 2);
  supervisor.OnConnected();
  RunFor(io, std::chrono::milliseconds(100));
  EXPECT_EQ(supervisor.attempts(), 0);
}

TEST(ReconnectSupervisorTest, DropWithinGracePeriodKeepsBackoff) {
  boost::asio::io_context io;
  replaycue::ReconnectSupervisor supervisor(io, FastPolicy());
  supervisor.ScheduleReconnect([]() {});
  RunFor(io, std::chrono::milliseconds(50));
  supervisor.OnConnected();
  supervisor.OnDisconnected();
  RunFor(io, std::chrono::milliseconds(50));
  EXPECT_EQ(supervisor.attempts(), 1);
  EXPECT_TRUE(supervisor.ScheduleReconnect([]() {}));
  EXPECT_EQ(supervisor.last_delay().count(), 10);
}
