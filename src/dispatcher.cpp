#include "replaycue/dispatcher.h"

#include <algorithm>
#include <sstream>

#include <boost/asio/post.hpp>

namespace replaycue {
namespace {

RequestResult ToResult(const RequestResponseMessage& response) {
  RequestResult result;
  result.request_id = response.request_id;
  result.request_type = response.request_type;
  result.status_code = response.status.code;
  result.comment = response.status.comment;
  result.response_data = response.response_data;
  if (!response.status.result) {
    Error error;
    error.kind = ErrorKind::kRequestRejected;
    error.status_code = response.status.code;
    error.message = response.request_type + " rejected";
    if (!response.status.comment.empty()) {
      error.message += ": " + response.status.comment;
    }
    result.error = std::move(error);
  }
  return result;
}

}  // namespace

RequestDispatcher::RequestDispatcher(boost::asio::io_context& io,
                                     RequestTimeouts timeouts, Logger logger)
    : io_(io), timeouts_(std::move(timeouts)), logger_(std::move(logger)) {}

RequestDispatcher::~RequestDispatcher() {
  for (auto& entry : pending_) {
    if (entry.second->timer) {
      entry.second->timer->cancel();
    }
  }
  pending_.clear();
}

void RequestDispatcher::BeginEpoch(SendFn send) {
  if (!pending_.empty()) {
    CancelAll("superseded by a new connection");
  }
  ++epoch_;
  next_id_ = 1;
  send_ = std::move(send);
}

void RequestDispatcher::EndEpoch(const std::string& reason) {
  send_ = nullptr;
  CancelAll(reason);
}

std::string RequestDispatcher::NextId() {
  return std::to_string(next_id_++);
}

std::string RequestDispatcher::Submit(const std::string& request_type,
                                      nlohmann::json request_data, ResultCallback cb) {
  auto pending = std::make_shared<Pending>();
  pending->id = NextId();
  pending->request_type = request_type;
  pending->cb = std::move(cb);

  if (!send_) {
    send_failures_.fetch_add(1);
    FailLater(pending, Error{ErrorKind::kSend, "not connected", 0});
    return pending->id;
  }

  RequestMessage message;
  message.request_type = request_type;
  message.request_id = pending->id;
  message.request_data = std::move(request_data);
  const std::string frame = EncodeRequest(message);

  Track(pending, timeouts_.For(request_type));
  std::string send_error;
  if (!send_(frame, &send_error)) {
    Take(pending->id);
    send_failures_.fetch_add(1);
    FailLater(pending, Error{ErrorKind::kSend, send_error, 0});
    return pending->id;
  }
  requests_sent_.fetch_add(1);
  logger_.Debug("request " + pending->id + " " + request_type + " sent");
  return pending->id;
}

std::string RequestDispatcher::SubmitBatch(const std::vector<BatchEntry>& requests,
                                           bool halt_on_failure, BatchCallback cb) {
  auto pending = std::make_shared<Pending>();
  pending->id = NextId();
  pending->request_type = "RequestBatch";
  pending->batch = true;
  pending->batch_cb = std::move(cb);

  if (!send_) {
    send_failures_.fetch_add(1);
    FailLater(pending, Error{ErrorKind::kSend, "not connected", 0});
    return pending->id;
  }

  RequestBatchMessage message;
  message.request_id = pending->id;
  message.halt_on_failure = halt_on_failure;
  std::chrono::milliseconds timeout = timeouts_.default_timeout;
  for (const auto& entry : requests) {
    RequestMessage request;
    request.request_type = entry.request_type;
    request.request_data = entry.request_data;
    message.requests.push_back(std::move(request));
    timeout = std::max(timeout, timeouts_.For(entry.request_type));
  }
  const std::string frame = EncodeRequestBatch(message);

  Track(pending, timeout);
  std::string send_error;
  if (!send_(frame, &send_error)) {
    Take(pending->id);
    send_failures_.fetch_add(1);
    FailLater(pending, Error{ErrorKind::kSend, send_error, 0});
    return pending->id;
  }
  requests_sent_.fetch_add(1);
  logger_.Debug("request batch " + pending->id + " sent (" +
                std::to_string(requests.size()) + " requests)");
  return pending->id;
}

void RequestDispatcher::Track(const std::shared_ptr<Pending>& pending,
                              std::chrono::milliseconds timeout) {
  pending->timer = std::make_unique<boost::asio::steady_timer>(io_, timeout);
  pending_[pending->id] = pending;
  const std::string id = pending->id;
  const Pending* expected = pending.get();
  pending->timer->async_wait([this, id, expected](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    Expire(id, expected);
  });
}

void RequestDispatcher::Expire(const std::string& id, const Pending* expected) {
  auto it = pending_.find(id);
  if (it == pending_.end() || it->second.get() != expected) {
    return;
  }
  std::shared_ptr<Pending> pending = Take(id);
  timed_out_.fetch_add(1);
  logger_.Warn("request " + id + " " + pending->request_type + " timed out");
  Resolve(pending, Error{ErrorKind::kRequestTimeout,
                         pending->request_type + " timed out", 0});
}

std::shared_ptr<RequestDispatcher::Pending> RequestDispatcher::Take(const std::string& id) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return nullptr;
  }
  std::shared_ptr<Pending> pending = std::move(it->second);
  pending_.erase(it);
  if (pending->timer) {
    pending->timer->cancel();
  }
  return pending;
}

void RequestDispatcher::FailLater(const std::shared_ptr<Pending>& pending, Error error) {
  boost::asio::post(io_, [this, pending, error]() { Resolve(pending, error); });
}

void RequestDispatcher::Resolve(const std::shared_ptr<Pending>& pending, Error error) {
  try {
    if (pending->batch) {
      if (pending->batch_cb) {
        BatchResult result;
        result.request_id = pending->id;
        result.error = std::move(error);
        pending->batch_cb(result);
      }
      return;
    }
    if (pending->cb) {
      RequestResult result;
      result.request_id = pending->id;
      result.request_type = pending->request_type;
      result.status_code = error.status_code;
      result.error = std::move(error);
      pending->cb(result);
    }
  } catch (const std::exception& e) {
    logger_.Error("request callback threw: " + std::string(e.what()));
  } catch (...) {
    logger_.Error("request callback threw");
  }
}

bool RequestDispatcher::HandleResponse(const RequestResponseMessage& response) {
  auto it = pending_.find(response.request_id);
  if (it == pending_.end() || it->second->batch) {
    unmatched_responses_.fetch_add(1);
    logger_.Debug("unmatched response id '" + response.request_id + "' (" +
                  response.request_type + ")");
    return false;
  }
  std::shared_ptr<Pending> pending = Take(response.request_id);
  responses_matched_.fetch_add(1);
  RequestResult result = ToResult(response);
  result.request_id = pending->id;
  if (result.error) {
    rejected_.fetch_add(1);
    logger_.Debug("request " + pending->id + " rejected with status " +
                  std::to_string(result.status_code));
  }
  if (pending->cb) {
    try {
      pending->cb(result);
    } catch (const std::exception& e) {
      logger_.Error("request callback threw: " + std::string(e.what()));
    } catch (...) {
      logger_.Error("request callback threw");
    }
  }
  return true;
}

bool RequestDispatcher::HandleBatchResponse(const RequestBatchResponseMessage& response) {
  auto it = pending_.find(response.request_id);
  if (it == pending_.end() || !it->second->batch) {
    unmatched_responses_.fetch_add(1);
    logger_.Debug("unmatched batch response id '" + response.request_id + "'");
    return false;
  }
  std::shared_ptr<Pending> pending = Take(response.request_id);
  responses_matched_.fetch_add(1);
  BatchResult batch;
  batch.request_id = pending->id;
  for (const auto& entry : response.results) {
    RequestResult result = ToResult(entry);
    if (result.error) {
      rejected_.fetch_add(1);
    }
    batch.results.push_back(std::move(result));
  }
  if (pending->batch_cb) {
    try {
      pending->batch_cb(batch);
    } catch (const std::exception& e) {
      logger_.Error("batch callback threw: " + std::string(e.what()));
    } catch (...) {
      logger_.Error("batch callback threw");
    }
  }
  return true;
}

void RequestDispatcher::CancelAll(const std::string& reason) {
  if (pending_.empty()) {
    return;
  }
  std::vector<std::shared_ptr<Pending>> cancelled;
  cancelled.reserve(pending_.size());
  for (auto& entry : pending_) {
    cancelled.push_back(entry.second);
  }
  pending_.clear();
  // Resolve in submission order.
  std::sort(cancelled.begin(), cancelled.end(),
            [](const std::shared_ptr<Pending>& a, const std::shared_ptr<Pending>& b) {
              return std::stoull(a->id) < std::stoull(b->id);
            });
  std::ostringstream oss;
  oss << "cancelling " << cancelled.size() << " pending request(s): " << reason;
  logger_.Info(oss.str());
  for (const auto& pending : cancelled) {
    if (pending->timer) {
      pending->timer->cancel();
    }
    cancelled_.fetch_add(1);
    Resolve(pending, Error{ErrorKind::kCancelled, reason, 0});
  }
}

DispatcherStats RequestDispatcher::stats() const {
  DispatcherStats stats;
  stats.requests_sent = requests_sent_.load();
  stats.responses_matched = responses_matched_.load();
  stats.unmatched_responses = unmatched_responses_.load();
  stats.timed_out = timed_out_.load();
  stats.rejected = rejected_.load();
  stats.cancelled = cancelled_.load();
  stats.send_failures = send_failures_.load();
  return stats;
}

}  // namespace replaycue
