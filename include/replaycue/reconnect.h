#pragma once

#include "replaycue/log.h"
#include "replaycue/replaycue.h"

#include <chrono>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace replaycue {

/**
 * Exponential backoff: min_delay * multiplier^k capped at max_delay.
 */
class Backoff {
 public:
  explicit Backoff(BackoffPolicy policy);

  /// Delay for the next attempt; advances the attempt counter.
  std::chrono::milliseconds NextDelay();
  void Reset() { attempts_ = 0; }

  int attempts() const { return attempts_; }
  /// True once max_attempts consecutive attempts have been handed out.
  bool Exhausted() const;

  const BackoffPolicy& policy() const { return policy_; }

 private:
  BackoffPolicy policy_;
  int attempts_ = 0;
};

/**
 * Schedules reconnect attempts after connection loss.
 *
 * The backoff is reset only once a connection has stayed up for the grace
 * period, so a server that accepts and immediately drops connections still
 * sees growing delays. Not thread-safe: owned by the I/O thread.
 */
class ReconnectSupervisor {
 public:
  using AttemptFn = std::function<void()>;

  ReconnectSupervisor(boost::asio::io_context& io, BackoffPolicy policy,
                      Logger logger = Logger());

  ReconnectSupervisor(const ReconnectSupervisor&) = delete;
  ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

  /**
   * Arm the retry timer.
   *
   * @return false when the attempt budget is exhausted (nothing scheduled).
   */
  bool ScheduleReconnect(AttemptFn attempt);
  /// A handshake completed; start the grace timer.
  void OnConnected();
  /// The connection dropped; cancel the grace timer.
  void OnDisconnected();
  /// Cancel all timers and pending attempts.
  void Stop();

  int attempts() const { return backoff_.attempts(); }
  uint64_t total_attempts() const { return total_attempts_; }
  bool retry_pending() const { return retry_pending_; }
  std::chrono::milliseconds last_delay() const { return last_delay_; }

 private:
  Backoff backoff_;
  Logger logger_;
  boost::asio::steady_timer retry_timer_;
  boost::asio::steady_timer grace_timer_;
  bool retry_pending_ = false;
  uint64_t total_attempts_ = 0;
  std::chrono::milliseconds last_delay_{0};
  /// Bumped by Stop/OnConnected so stale timer completions are ignored.
  uint64_t generation_ = 0;
};

}  // namespace replaycue
