#include "replaycue/reconnect.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace replaycue {

Backoff::Backoff(BackoffPolicy policy) : policy_(std::move(policy)) {}

std::chrono::milliseconds Backoff::NextDelay() {
  const double base = static_cast<double>(policy_.min_delay.count());
  const double cap = static_cast<double>(policy_.max_delay.count());
  const double scaled = base * std::pow(std::max(policy_.multiplier, 1.0), attempts_);
  ++attempts_;
  const double delay = std::min(scaled, cap);
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool Backoff::Exhausted() const {
  return policy_.max_attempts > 0 && attempts_ >= policy_.max_attempts;
}

ReconnectSupervisor::ReconnectSupervisor(boost::asio::io_context& io, BackoffPolicy policy,
                                         Logger logger)
    : backoff_(std::move(policy)),
      logger_(std::move(logger)),
      retry_timer_(io),
      grace_timer_(io) {}

bool ReconnectSupervisor::ScheduleReconnect(AttemptFn attempt) {
  grace_timer_.cancel();
  if (backoff_.Exhausted()) {
    std::ostringstream oss;
    oss << "giving up after " << backoff_.attempts() << " reconnect attempt(s)";
    logger_.Error(oss.str());
    retry_pending_ = false;
    return false;
  }
  last_delay_ = backoff_.NextDelay();
  ++total_attempts_;
  retry_pending_ = true;
  std::ostringstream oss;
  oss << "reconnecting in " << last_delay_.count() << " ms (attempt " << backoff_.attempts();
  if (backoff_.policy().max_attempts > 0) {
    oss << "/" << backoff_.policy().max_attempts;
  }
  oss << ")";
  logger_.Info(oss.str());

  const uint64_t generation = ++generation_;
  retry_timer_.expires_after(last_delay_);
  retry_timer_.async_wait(
      [this, generation, attempt](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || generation != generation_) {
          return;
        }
        retry_pending_ = false;
        attempt();
      });
  return true;
}

void ReconnectSupervisor::OnConnected() {
  retry_timer_.cancel();
  retry_pending_ = false;
  const uint64_t generation = ++generation_;
  if (backoff_.policy().grace_period.count() == 0) {
    backoff_.Reset();
    return;
  }
  grace_timer_.expires_after(backoff_.policy().grace_period);
  grace_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || generation != generation_) {
      return;
    }
    if (backoff_.attempts() > 0) {
      logger_.Debug("connection stable, reconnect backoff reset");
    }
    backoff_.Reset();
  });
}

void ReconnectSupervisor::OnDisconnected() {
  ++generation_;
  grace_timer_.cancel();
}

void ReconnectSupervisor::Stop() {
  ++generation_;
  retry_timer_.cancel();
  grace_timer_.cancel();
  retry_pending_ = false;
}

}  // namespace replaycue
