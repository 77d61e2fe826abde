#pragma once

#include "replaycue/log.h"
#include "replaycue/protocol.h"
#include "replaycue/replaycue.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace replaycue {

/**
 * Terminal outcome of a single request.
 */
struct RequestResult {
  std::string request_id;
  std::string request_type;
  /// Unset on success.
  std::optional<Error> error;
  /// Remote status code (0 when no response arrived).
  int status_code = 0;
  std::string comment;
  nlohmann::json response_data;

  bool ok() const { return !error.has_value(); }
};

/**
 * Terminal outcome of a request batch.
 */
struct BatchResult {
  std::string request_id;
  /// Set when the batch as a whole failed (send error, timeout, cancel).
  std::optional<Error> error;
  /// Per-request outcomes in execution order.
  std::vector<RequestResult> results;

  bool ok() const { return !error.has_value(); }
};

/// One entry of a request batch.
struct BatchEntry {
  std::string request_type;
  nlohmann::json request_data;
};

struct DispatcherStats {
  uint64_t requests_sent = 0;
  uint64_t responses_matched = 0;
  uint64_t unmatched_responses = 0;
  uint64_t timed_out = 0;
  uint64_t rejected = 0;
  uint64_t cancelled = 0;
  uint64_t send_failures = 0;
};

/**
 * Correlates outgoing requests with their responses.
 *
 * Each connection epoch has its own correlation id sequence. Responses are
 * matched strictly by id, every request resolves exactly once (response,
 * rejection, timeout or cancellation), and any number of requests may be in
 * flight. Not thread-safe: owned by the I/O thread.
 */
class RequestDispatcher {
 public:
  using SendFn = std::function<bool(const std::string& frame, std::string* error)>;
  using ResultCallback = std::function<void(const RequestResult&)>;
  using BatchCallback = std::function<void(const BatchResult&)>;

  RequestDispatcher(boost::asio::io_context& io, RequestTimeouts timeouts,
                    Logger logger = Logger());
  ~RequestDispatcher();

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;

  /// Start a new connection epoch; ids restart from 1.
  void BeginEpoch(SendFn send);
  /// Cancel every pending request and detach from the transport.
  void EndEpoch(const std::string& reason);

  /**
   * Encode and send a request. The callback always runs after Submit returns,
   * including when the send fails.
   *
   * @return The correlation id assigned to the request.
   */
  std::string Submit(const std::string& request_type, nlohmann::json request_data,
                     ResultCallback cb);
  /// Send a request batch; the deadline is the longest per-type deadline.
  std::string SubmitBatch(const std::vector<BatchEntry>& requests,
                          bool halt_on_failure, BatchCallback cb);

  /// Resolve the pending request matching the response id.
  bool HandleResponse(const RequestResponseMessage& response);
  /// Resolve the pending batch matching the response id.
  bool HandleBatchResponse(const RequestBatchResponseMessage& response);

  /// Resolve all pending requests with kCancelled.
  void CancelAll(const std::string& reason);

  bool connected() const { return static_cast<bool>(send_); }
  size_t pending_count() const { return pending_.size(); }
  uint64_t epoch() const { return epoch_; }
  DispatcherStats stats() const;

 private:
  struct Pending {
    std::string id;
    std::string request_type;
    bool batch = false;
    ResultCallback cb;
    BatchCallback batch_cb;
    std::unique_ptr<boost::asio::steady_timer> timer;
  };

  std::string NextId();
  void Track(const std::shared_ptr<Pending>& pending,
             std::chrono::milliseconds timeout);
  void Expire(const std::string& id, const Pending* expected);
  void FailLater(const std::shared_ptr<Pending>& pending, Error error);
  void Resolve(const std::shared_ptr<Pending>& pending, Error error);
  std::shared_ptr<Pending> Take(const std::string& id);

  boost::asio::io_context& io_;
  RequestTimeouts timeouts_;
  Logger logger_;
  SendFn send_;
  uint64_t epoch_ = 0;
  uint64_t next_id_ = 1;
  std::unordered_map<std::string, std::shared_ptr<Pending>> pending_;

  std::atomic<uint64_t> requests_sent_{0};
  std::atomic<uint64_t> responses_matched_{0};
  std::atomic<uint64_t> unmatched_responses_{0};
  std::atomic<uint64_t> timed_out_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> cancelled_{0};
  std::atomic<uint64_t> send_failures_{0};
};

}  // namespace replaycue
