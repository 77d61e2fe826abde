#include "replaycue/replaycue.h"
#include "replaycue/channel.h"
#include "replaycue/dispatcher.h"
#include "replaycue/events.h"
#include "replaycue/output_capture.h"
#include "replaycue/protocol.h"
#include "replaycue/reconnect.h"
#include "replaycue/replay_state.h"
#include "replaycue/session_manager.h"
#include "replaycue/source_controller.h"
#include "replaycue/transport.h"
#ifdef REPLAYCUE_TESTING
#include "replaycue/test_hooks.h"
#endif

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace replaycue {
namespace {

constexpr const char* kBufferStartedState = "OBS_WEBSOCKET_OUTPUT_STARTED";
constexpr const char* kBufferStoppedState = "OBS_WEBSOCKET_OUTPUT_STOPPED";
constexpr const char* kStdoutTag = "[stdout] ";
constexpr const char* kStderrTag = "[stderr] ";

std::chrono::milliseconds ClampSaveDelay(std::chrono::milliseconds delay) {
  return std::max(std::chrono::milliseconds(0), std::min(delay, kMaxSaveDelay));
}

Notification MakeErrorNotification(const Error& error) {
  Notification notification;
  notification.type = NotificationType::kError;
  notification.error = error;
  return notification;
}

}  // namespace

struct ControllerMetricsAtomic {
  std::atomic<uint64_t> frames_received{0};
  std::atomic<uint64_t> frames_sent{0};
  std::atomic<uint64_t> decode_errors{0};
  std::atomic<uint64_t> unknown_messages{0};
  std::atomic<uint64_t> events_received{0};
  std::atomic<uint64_t> state_transition_errors{0};
  std::atomic<uint64_t> reconnect_attempts{0};
  std::atomic<uint64_t> notifications_dropped{0};
  std::atomic<uint64_t> callback_exceptions{0};
};

struct Controller::Impl {
  Impl(Config config, TransportFactory factory)
      : config_(std::move(config)),
        factory_(std::move(factory)),
        logger_(config_.log_callback, config_.log_level),
        dispatcher_(io_, config_.request_timeouts, logger_),
        bus_(logger_),
        supervisor_(io_, config_.reconnect, logger_),
        source_(dispatcher_,
                SourceOptions{config_.source_name, config_.source_kind,
                              config_.create_source_if_missing,
                              config_.restart_source_on_set},
                logger_),
        save_timer_(io_),
        subscriptions_(config_.event_subscriptions),
        save_delay_ms_(ClampSaveDelay(config_.save_delay).count()),
        notifications_(config_.notification_queue_capacity) {
    machine_.SetChangeCallback([this](ReplayPhase old_phase, ReplayPhase new_phase) {
      logger_.Info(std::string("replay state ") + ReplayPhaseName(old_phase) + " -> " +
                   ReplayPhaseName(new_phase));
      Notification notification;
      notification.type = NotificationType::kReplayStateChanged;
      notification.old_phase = old_phase;
      notification.new_phase = new_phase;
      Notify(std::move(notification));
    });
    bus_.Subscribe(EventKind::kReplayBufferSaved, [this](const Event& event) {
      OnReplayBufferSaved(std::get<ReplayBufferSavedEvent>(event.payload));
    });
    bus_.Subscribe(EventKind::kReplayBufferStateChanged, [this](const Event& event) {
      OnReplayBufferStateChanged(std::get<ReplayBufferStateChangedEvent>(event.payload));
    });
    bus_.Subscribe(EventKind::kMediaInputPlaybackStarted, [this](const Event& event) {
      const auto& started = std::get<MediaInputPlaybackStartedEvent>(event.payload);
      if (started.input_name == config_.source_name) {
        logger_.Debug("playback started on '" + started.input_name + "'");
      }
    });
    bus_.Subscribe(EventKind::kMediaInputPlaybackEnded, [this](const Event& event) {
      OnPlaybackEnded(std::get<MediaInputPlaybackEndedEvent>(event.payload));
    });
    bus_.Subscribe(EventKind::kInputRemoved, [this](const Event& event) {
      const auto& removed = std::get<InputRemovedEvent>(event.payload);
      if (removed.input_name == config_.source_name) {
        logger_.Warn("playback source '" + removed.input_name + "' was removed remotely");
      }
    });
    bus_.Subscribe(EventKind::kExitStarted, [this](const Event&) {
      logger_.Info("remote application is shutting down");
    });
  }

  ~Impl() { Stop(); }

  bool Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.exchange(true)) {
      return true;
    }
    std::string error;
    if (!config_.Validate(&error)) {
      SetLastError("invalid config: " + error);
      logger_.Error(GetLastError());
      running_ = false;
      return false;
    }
    if (config_.capture_streams != kCaptureNone) {
      Logger logger = logger_;
      const bool started = capture_.Start(
          config_.capture_streams, [logger](unsigned stream, const std::string& line) {
            // A tagged line is our own log output read back from a captured
            // stream the log callback writes to; logging it again never ends.
            if (line.find(kStdoutTag) != std::string::npos ||
                line.find(kStderrTag) != std::string::npos) {
              return;
            }
            logger.Info((stream == kCaptureStdout ? kStdoutTag : kStderrTag) + line);
          });
      if (!started) {
        SetLastError("output capture failed: " + capture_.last_error());
        logger_.Error(GetLastError());
        running_ = false;
        return false;
      }
    }
    SetLastError(std::string());
    notifications_.Reopen();
    io_.restart();
    work_.emplace(boost::asio::make_work_guard(io_));
    try {
      io_thread_ = std::thread([this]() { RunIo(); });
    } catch (const std::exception& ex) {
      SetLastError(std::string("thread start failed: ") + ex.what());
      logger_.Error(GetLastError());
      work_.reset();
      capture_.Stop();
      running_ = false;
      return false;
    }
    boost::asio::post(io_, [this]() {
      stopping_ = false;
      Connect();
    });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
      return;
    }
    if (std::this_thread::get_id() == io_thread_.get_id()) {
      logger_.Error("Stop() called from the I/O thread; ignored");
      return;
    }
    boost::asio::post(io_, [this]() { Shutdown(); });
    work_.reset();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    running_ = false;
    notifications_.Close();
    capture_.Stop();
  }

  void RunIo() {
    while (true) {
      try {
        io_.run();
        return;
      } catch (const std::exception& ex) {
        logger_.Error(std::string("I/O loop exception: ") + ex.what());
      }
    }
  }

  // Runs fn on the I/O thread, or fails the callback when not running. Holding
  // the lifecycle lock keeps fn ahead of a concurrent Stop's shutdown handler.
  template <typename Fn>
  void Post(const CommandCallback& cb, Fn fn) {
    if (!PostIfRunning(std::move(fn))) {
      Complete(cb, Error{ErrorKind::kSend, "controller not running", 0});
    }
  }

  template <typename Fn>
  bool PostIfRunning(Fn fn) {
    if (io_.get_executor().running_in_this_thread()) {
      // Called from a callback; Stop cannot finish before this handler returns.
      boost::asio::post(io_, std::move(fn));
      return true;
    }
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
      return false;
    }
    boost::asio::post(io_, std::move(fn));
    return true;
  }

  // ---- connection lifecycle (I/O thread) ----

  uint32_t SubscriptionMask() const {
    return subscriptions_ | bus_.RequiredSubscriptionMask();
  }

  void Connect() {
    if (stopping_) {
      return;
    }
    const uint64_t generation = ++generation_;
    if (factory_) {
      transport_ = factory_(io_);
    } else {
      TransportOptions options;
      options.connect_timeout = config_.connect_timeout;
      options.heartbeat_interval = config_.heartbeat_interval;
      options.heartbeat_max_missed = config_.heartbeat_max_missed;
      transport_ = MakeWebSocketTransport(io_, options, logger_);
    }
    if (!transport_) {
      HandleConnectionLoss(Error{ErrorKind::kConnection, "transport factory returned null", 0});
      return;
    }
    transport_->SetHandlers(
        [this, generation](const std::string& frame) {
          if (generation == generation_) {
            OnFrame(frame);
          }
        },
        [this, generation](const CloseInfo& info) {
          if (generation == generation_) {
            OnTransportClosed(info);
          }
        });

    HandshakeOptions options;
    options.endpoint = Endpoint{config_.host, config_.port};
    options.password = config_.password;
    options.event_subscriptions = SubscriptionMask();
    options.rpc_version_min = config_.rpc_version_min;
    options.rpc_version_max = config_.rpc_version_max;
    options.handshake_timeout = config_.handshake_timeout;
    session_ = std::make_unique<SessionManager>(io_, options, transport_, logger_);
    SetStatus(ConnectionStatus::kHandshaking);
    session_->Begin([this, generation](const HandshakeResult& result) {
      if (generation == generation_) {
        OnHandshakeDone(result);
      }
    });
  }

  bool Handshaking() const { return session_ && !session_->finished(); }

  void OnHandshakeDone(const HandshakeResult& result) {
    RetireSession();
    if (!result.ok()) {
      const Error& error = *result.error;
      const bool rejected =
          error.kind == ErrorKind::kVersionMismatch ||
          (error.kind == ErrorKind::kAuth && !result.timed_out);
      if (rejected) {
        Fault(error);
      } else {
        HandleConnectionLoss(error);
      }
      return;
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      negotiated_rpc_version_ = result.negotiated_rpc_version;
    }
    event_sequence_ = 0;
    std::weak_ptr<Transport> weak = transport_;
    dispatcher_.BeginEpoch([this, weak](const std::string& frame, std::string* error) {
      auto transport = weak.lock();
      if (!transport) {
        if (error) {
          *error = "transport released";
        }
        return false;
      }
      if (!transport->Send(frame, error)) {
        return false;
      }
      metrics_.frames_sent.fetch_add(1);
      return true;
    });
    supervisor_.OnConnected();
    SetStatus(ConnectionStatus::kReady);

    if (config_.create_source_if_missing) {
      source_.EnsureSource([this](const std::optional<Error>& error) {
        if (error && error->kind != ErrorKind::kCancelled) {
          logger_.Warn("playback source check failed: " + error->ToString());
          Notify(MakeErrorNotification(*error));
        }
      });
    }
    if (config_.auto_start_buffering) {
      DoStartBuffering(nullptr);
    }
  }

  void OnTransportClosed(const CloseInfo& info) {
    if (Handshaking()) {
      session_->OnClosed(info);
      return;
    }
    std::ostringstream oss;
    oss << "connection closed (code " << info.code << ")";
    if (!info.reason.empty()) {
      oss << ": " << info.reason;
    }
    HandleConnectionLoss(Error{ErrorKind::kConnection, oss.str(), 0});
  }

  // Tears down the current connection; local bookkeeping only.
  void DropConnection(const std::string& reason) {
    ++generation_;
    if (session_) {
      session_->Abort();
      RetireSession();
    }
    if (transport_) {
      transport_->Close(reason);
      transport_.reset();
    }
    supervisor_.OnDisconnected();
  }

  void HandleConnectionLoss(const Error& error) {
    if (stopping_) {
      return;
    }
    logger_.Warn("connection lost: " + error.ToString());
    DropConnection(error.message);
    CancelSaveDelay(Error{ErrorKind::kCancelled, "connection lost", 0});
    // Replay state first, so cancelled requests observe Idle.
    ApplyInput(ReplayInput::kConnectionLost);
    dispatcher_.EndEpoch("connection lost");
    SetStatus(ConnectionStatus::kDisconnected);

    if (supervisor_.ScheduleReconnect([this]() { Connect(); })) {
      metrics_.reconnect_attempts.fetch_add(1);
      return;
    }
    std::ostringstream oss;
    oss << "reconnect abandoned after " << supervisor_.attempts()
        << " attempt(s); last error: " << error.ToString();
    Fault(Error{ErrorKind::kConnection, oss.str(), 0});
  }

  void Fault(const Error& error) {
    logger_.Error("session failed: " + error.ToString());
    DropConnection(error.message);
    supervisor_.Stop();
    CancelSaveDelay(Error{ErrorKind::kCancelled, error.message, 0});
    ReplayInputContext context;
    context.error = error;
    ApplyInput(ReplayInput::kFatalError, context);
    dispatcher_.EndEpoch(error.message);
    SetStatus(ConnectionStatus::kDisconnected);
    SetLastError(error.ToString());
    Notify(MakeErrorNotification(error));
  }

  void Shutdown() {
    stopping_ = true;
    supervisor_.Stop();
    if (transport_ || session_) {
      SetStatus(ConnectionStatus::kClosing);
    }
    DropConnection("controller stopped");
    CancelSaveDelay(Error{ErrorKind::kCancelled, "controller stopped", 0});
    ApplyInput(ReplayInput::kConnectionLost);
    dispatcher_.EndEpoch("controller stopped");
    SetStatus(ConnectionStatus::kDisconnected);
  }

  void RetireSession() {
    if (!session_) {
      return;
    }
    // The session may be on the call stack; destroy it from a fresh handler.
    std::shared_ptr<SessionManager> retired(std::move(session_));
    boost::asio::post(io_, [retired]() {});
  }

  // ---- inbound frames (I/O thread) ----

  void OnFrame(const std::string& frame) {
    metrics_.frames_received.fetch_add(1);
    IncomingMessage message;
    std::string error;
    if (!DecodeIncoming(frame, &message, &error)) {
      metrics_.decode_errors.fetch_add(1);
      logger_.Warn("malformed frame: " + error);
      if (Handshaking()) {
        session_->OnProtocolViolation("malformed frame: " + error);
        return;
      }
      HandleConnectionLoss(Error{ErrorKind::kProtocolViolation, "malformed frame: " + error, 0});
      return;
    }
    if (Handshaking()) {
      session_->OnMessage(message);
      return;
    }
    if (const auto* event = std::get_if<EventMessage>(&message)) {
      OnEvent(*event);
    } else if (const auto* response = std::get_if<RequestResponseMessage>(&message)) {
      dispatcher_.HandleResponse(*response);
    } else if (const auto* batch = std::get_if<RequestBatchResponseMessage>(&message)) {
      dispatcher_.HandleBatchResponse(*batch);
    } else if (const auto* unknown = std::get_if<UnknownMessage>(&message)) {
      metrics_.unknown_messages.fetch_add(1);
      logger_.Warn("ignoring message with unknown opcode " + std::to_string(unknown->op));
    } else {
      HandleConnectionLoss(Error{ErrorKind::kProtocolViolation,
                                 "handshake message received on an identified session", 0});
    }
  }

  void OnEvent(const EventMessage& message) {
    metrics_.events_received.fetch_add(1);
    Event event;
    std::string error;
    if (!ParseEvent(message, ++event_sequence_, &event, &error)) {
      metrics_.decode_errors.fetch_add(1);
      HandleConnectionLoss(Error{ErrorKind::kProtocolViolation,
                                 message.event_type + ": " + error, 0});
      return;
    }
    bus_.Publish(std::move(event));
  }

  void OnReplayBufferSaved(const ReplayBufferSavedEvent& saved) {
    ReplayInputContext context;
    context.clip_path = saved.saved_replay_path;
    const Transition transition = ApplyInput(ReplayInput::kSaveConfirmed, context);
    if (transition.outcome != TransitionOutcome::kApplied) {
      const std::string message = "stale save confirmation for " +
                                  saved.saved_replay_path + " discarded while " +
                                  ReplayPhaseName(machine_.phase());
      logger_.Info(message);
      Notify(MakeErrorNotification(Error{ErrorKind::kStateTransition, message, 0}));
      return;
    }
    if (save_delay_pending_) {
      // Confirmed before our own request went out (saved remotely).
      save_delay_pending_ = false;
      save_timer_.cancel();
      CommandCallback pending = std::move(pending_save_cb_);
      pending_save_cb_ = nullptr;
      Complete(pending, std::nullopt);
    }
    logger_.Info("clip saved: " + saved.saved_replay_path);
    Notification notification;
    notification.type = NotificationType::kClipSaved;
    notification.clip_path = saved.saved_replay_path;
    Notify(std::move(notification));
    if (config_.auto_play_saved_clips) {
      DoPlay(nullptr);
    }
  }

  void OnReplayBufferStateChanged(const ReplayBufferStateChangedEvent& changed) {
    ReplayInput input;
    if (changed.output_state == kBufferStartedState) {
      input = ReplayInput::kBufferStarted;
    } else if (changed.output_state == kBufferStoppedState) {
      input = ReplayInput::kBufferStopped;
    } else {
      logger_.Debug("replay buffer state " + changed.output_state);
      return;
    }
    const Transition transition = ApplyInput(input);
    if (transition.outcome == TransitionOutcome::kApplied &&
        input == ReplayInput::kBufferStopped) {
      CancelSaveDelay(Error{ErrorKind::kCancelled, "replay buffer stopped", 0});
    }
  }

  void OnPlaybackEnded(const MediaInputPlaybackEndedEvent& ended) {
    if (ended.input_name != config_.source_name) {
      return;
    }
    ApplyInput(ReplayInput::kPlaybackFinished);
  }

  // ---- commands (I/O thread) ----

  void DoStartBuffering(CommandCallback cb) {
    if (NextTransition(machine_.phase(), ReplayInput::kStartBuffering).outcome ==
        TransitionOutcome::kRejected) {
      RejectCommand(ReplayInput::kStartBuffering, cb);
      return;
    }
    dispatcher_.Submit(
        "StartReplayBuffer", nlohmann::json::object(),
        [this, cb](const RequestResult& result) {
          if (result.ok() || result.status_code == kRequestStatusOutputRunning) {
            ApplyInput(ReplayInput::kStartBuffering);
            Complete(cb, std::nullopt);
            return;
          }
          logger_.Warn("start buffering failed: " + result.error->ToString());
          Complete(cb, result.error);
        });
  }

  void DoSaveCue(CommandCallback cb) {
    const Transition transition = ApplyInput(ReplayInput::kSaveCue);
    if (transition.outcome == TransitionOutcome::kCoalesced) {
      logger_.Info("save cue ignored: save already in progress (cycle " +
                   std::to_string(machine_.save_cycle()) + ")");
      Complete(cb, std::nullopt);
      return;
    }
    if (transition.outcome == TransitionOutcome::kRejected) {
      RejectCommand(ReplayInput::kSaveCue, cb, false);
      return;
    }
    const uint64_t cycle = machine_.save_cycle();
    const std::chrono::milliseconds delay(save_delay_ms_.load());
    if (delay.count() == 0) {
      IssueSave(cycle, std::move(cb));
      return;
    }
    logger_.Info("save cue accepted, saving in " + std::to_string(delay.count()) + " ms");
    save_delay_pending_ = true;
    pending_save_cb_ = std::move(cb);
    save_timer_.expires_after(delay);
    save_timer_.async_wait([this, cycle](const boost::system::error_code& ec) {
      if (ec == boost::asio::error::operation_aborted || !save_delay_pending_) {
        return;
      }
      save_delay_pending_ = false;
      CommandCallback pending = std::move(pending_save_cb_);
      pending_save_cb_ = nullptr;
      if (machine_.phase() != ReplayPhase::kSaveRequested || machine_.save_cycle() != cycle) {
        Complete(pending, Error{ErrorKind::kCancelled, "save cue superseded", 0});
        return;
      }
      IssueSave(cycle, std::move(pending));
    });
  }

  void IssueSave(uint64_t cycle, CommandCallback cb) {
    dispatcher_.Submit(
        "SaveReplayBuffer", nlohmann::json::object(),
        [this, cycle, cb](const RequestResult& result) {
          if (result.ok()) {
            Complete(cb, std::nullopt);
            return;
          }
          const Error& error = *result.error;
          if (error.kind != ErrorKind::kCancelled) {
            ReplayInputContext context;
            context.save_cycle = cycle;
            const Transition transition = ApplyInput(ReplayInput::kSaveFailed, context);
            if (transition.outcome == TransitionOutcome::kApplied) {
              logger_.Warn("save failed, cue may be retried: " + error.ToString());
              Notify(MakeErrorNotification(error));
            }
          }
          Complete(cb, error);
        });
  }

  void CancelSaveDelay(const Error& reason) {
    if (!save_delay_pending_) {
      return;
    }
    save_delay_pending_ = false;
    save_timer_.cancel();
    CommandCallback pending = std::move(pending_save_cb_);
    pending_save_cb_ = nullptr;
    Complete(pending, reason);
  }

  void DoPlay(CommandCallback cb) {
    const ReplayState before = machine_.state();
    const Transition transition = ApplyInput(ReplayInput::kPlay);
    if (transition.outcome != TransitionOutcome::kApplied || !before.clip) {
      RejectCommand(ReplayInput::kPlay, cb, false);
      return;
    }
    const uint64_t token = ++playback_token_;
    source_.SetMedia(before.clip->path, [this, cb, token](const std::optional<Error>& error) {
      OnPlaybackIssued(token, error, cb);
    });
  }

  void DoPlayClips(const std::vector<std::string>& paths, CommandCallback cb) {
    if (paths.empty()) {
      logger_.Debug("play clips: empty list ignored");
      Complete(cb, std::nullopt);
      return;
    }
    const Transition transition = ApplyInput(ReplayInput::kPlayHighlights);
    if (transition.outcome != TransitionOutcome::kApplied) {
      RejectCommand(ReplayInput::kPlayHighlights, cb, false);
      return;
    }
    const uint64_t token = ++playback_token_;
    source_.SetPlaylist(paths, [this, cb, token](const std::optional<Error>& error) {
      OnPlaybackIssued(token, error, cb);
    });
  }

  void OnPlaybackIssued(uint64_t token, const std::optional<Error>& error,
                        const CommandCallback& cb) {
    if (error && error->kind != ErrorKind::kCancelled && token == playback_token_ &&
        machine_.phase() == ReplayPhase::kPlaying) {
      logger_.Warn("playback failed: " + error->ToString());
      ApplyInput(ReplayInput::kPlaybackFailed);
      Notify(MakeErrorNotification(*error));
    }
    Complete(cb, error);
  }

  void DoStopPlayback(CommandCallback cb) {
    const Transition transition = ApplyInput(ReplayInput::kStop);
    if (transition.outcome != TransitionOutcome::kApplied) {
      RejectCommand(ReplayInput::kStop, cb, false);
      return;
    }
    if (transition.action != ReplayAction::kIssueStopMedia) {
      Complete(cb, std::nullopt);
      return;
    }
    source_.StopMedia([this, cb](const std::optional<Error>& error) { Complete(cb, error); });
  }

  void DoUpdateSubscriptions(uint32_t mask) {
    subscriptions_ = mask;
    if (!transport_ || Handshaking() || GetConnectionStatus() != ConnectionStatus::kReady) {
      return;
    }
    ReidentifyMessage reidentify;
    reidentify.event_subscriptions = SubscriptionMask();
    std::string error;
    if (!transport_->Send(EncodeReidentify(reidentify), &error)) {
      logger_.Warn("Reidentify failed: " + error);
      return;
    }
    metrics_.frames_sent.fetch_add(1);
    logger_.Debug("Reidentify sent (subscriptions " +
                  std::to_string(reidentify.event_subscriptions) + ")");
  }

  // ---- state helpers ----

  Transition ApplyInput(ReplayInput input,
                        const ReplayInputContext& context = ReplayInputContext()) {
    const Transition transition = machine_.Apply(input, context);
    if (transition.outcome == TransitionOutcome::kRejected) {
      metrics_.state_transition_errors.fetch_add(1);
      logger_.Debug(std::string("replay input ") + ReplayInputName(input) +
                    " not applicable while " + ReplayPhaseName(machine_.phase()));
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    replay_snapshot_ = machine_.state();
    return transition;
  }

  // Reports a command the current phase does not accept.
  void RejectCommand(ReplayInput input, const CommandCallback& cb, bool count = true) {
    if (count) {
      metrics_.state_transition_errors.fetch_add(1);
    }
    const Error error{ErrorKind::kStateTransition,
                      std::string(ReplayInputName(input)) + " not accepted while " +
                          ReplayPhaseName(machine_.phase()),
                      0};
    logger_.Warn(error.message);
    Notify(MakeErrorNotification(error));
    Complete(cb, error);
  }

  void Complete(const CommandCallback& cb, const std::optional<Error>& error) {
    if (!cb) {
      return;
    }
    try {
      cb(error);
    } catch (const std::exception& ex) {
      metrics_.callback_exceptions.fetch_add(1);
      logger_.Error(std::string("command callback threw: ") + ex.what());
    } catch (...) {
      metrics_.callback_exceptions.fetch_add(1);
      logger_.Error("command callback threw");
    }
  }

  void Notify(Notification notification) {
    if (!notifications_.Push(std::move(notification))) {
      metrics_.notifications_dropped.fetch_add(1);
    }
  }

  void SetStatus(ConnectionStatus status) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (status_ == status) {
        return;
      }
      status_ = status;
    }
    logger_.Info(std::string("connection ") + ConnectionStatusName(status));
    Notification notification;
    notification.type = NotificationType::kConnectionStateChanged;
    notification.connection = status;
    Notify(std::move(notification));
  }

  void SetLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = error;
  }

  std::string GetLastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
  }

  ConnectionStatus GetConnectionStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
  }

  ReplayState GetReplayState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return replay_snapshot_;
  }

  int GetNegotiatedRpcVersion() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return negotiated_rpc_version_;
  }

  ControllerMetrics GetMetrics() const {
    const DispatcherStats requests = dispatcher_.stats();
    const EventBusStats events = bus_.stats();
    ControllerMetrics snapshot;
    snapshot.frames_received = metrics_.frames_received.load();
    snapshot.frames_sent = metrics_.frames_sent.load();
    snapshot.decode_errors = metrics_.decode_errors.load();
    snapshot.unknown_messages = metrics_.unknown_messages.load();
    snapshot.unmatched_responses = requests.unmatched_responses;
    snapshot.events_received = metrics_.events_received.load();
    snapshot.events_dropped = events.dropped;
    snapshot.requests_sent = requests.requests_sent;
    snapshot.requests_timed_out = requests.timed_out;
    snapshot.requests_cancelled = requests.cancelled;
    snapshot.state_transition_errors = metrics_.state_transition_errors.load();
    snapshot.reconnect_attempts = metrics_.reconnect_attempts.load();
    snapshot.notifications_dropped = metrics_.notifications_dropped.load();
    snapshot.callback_exceptions =
        metrics_.callback_exceptions.load() + events.handler_exceptions;
    return snapshot;
  }

  // Evaluates fn on the I/O thread (or inline when it is not running).
  template <typename T, typename Fn>
  T Query(Fn fn) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
      return fn();
    }
    std::promise<T> promise;
    std::future<T> result = promise.get_future();
    boost::asio::post(io_, [&promise, &fn]() { promise.set_value(fn()); });
    return result.get();
  }

  Config config_;
  TransportFactory factory_;
  Logger logger_;

  boost::asio::io_context io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};

  // Owned by the I/O thread.
  RequestDispatcher dispatcher_;
  EventBus bus_;
  ReplayStateMachine machine_;
  ReconnectSupervisor supervisor_;
  SourceController source_;
  std::unique_ptr<SessionManager> session_;
  std::shared_ptr<Transport> transport_;
  boost::asio::steady_timer save_timer_;
  bool save_delay_pending_ = false;
  CommandCallback pending_save_cb_;
  uint64_t generation_ = 0;
  uint64_t event_sequence_ = 0;
  uint64_t playback_token_ = 0;
  bool stopping_ = false;
  uint32_t subscriptions_ = kEventSubscriptionNone;

  std::atomic<int64_t> save_delay_ms_;
  Channel<Notification> notifications_;

  mutable std::mutex state_mutex_;
  ConnectionStatus status_ = ConnectionStatus::kDisconnected;
  ReplayState replay_snapshot_;
  int negotiated_rpc_version_ = 0;
  std::string last_error_;

  ControllerMetricsAtomic metrics_;
  OutputCapture capture_;
};

Controller::Controller(Config config) : impl_(new Impl(std::move(config), nullptr)) {}

Controller::Controller(Config config, TransportFactory transport_factory)
    : impl_(new Impl(std::move(config), std::move(transport_factory))) {}

Controller::~Controller() = default;

bool Controller::Start() { return impl_->Start(); }
void Controller::Stop() { impl_->Stop(); }

void Controller::StartBuffering(CommandCallback cb) {
  Impl* impl = impl_.get();
  impl->Post(cb, [impl, cb]() { impl->DoStartBuffering(cb); });
}

void Controller::SaveCue(CommandCallback cb) {
  Impl* impl = impl_.get();
  impl->Post(cb, [impl, cb]() { impl->DoSaveCue(cb); });
}

void Controller::Play(CommandCallback cb) {
  Impl* impl = impl_.get();
  impl->Post(cb, [impl, cb]() { impl->DoPlay(cb); });
}

void Controller::StopPlayback(CommandCallback cb) {
  Impl* impl = impl_.get();
  impl->Post(cb, [impl, cb]() { impl->DoStopPlayback(cb); });
}

void Controller::PlayClips(std::vector<std::string> paths, CommandCallback cb) {
  Impl* impl = impl_.get();
  impl->Post(cb, [impl, paths = std::move(paths), cb]() { impl->DoPlayClips(paths, cb); });
}

std::chrono::milliseconds Controller::SetSaveDelay(std::chrono::milliseconds delay) {
  const std::chrono::milliseconds clamped = ClampSaveDelay(delay);
  if (clamped != delay) {
    impl_->logger_.Warn("save delay " + std::to_string(delay.count()) + " ms clamped to " +
                        std::to_string(clamped.count()) + " ms");
  }
  impl_->save_delay_ms_ = clamped.count();
  return clamped;
}

std::chrono::milliseconds Controller::GetSaveDelay() const {
  return std::chrono::milliseconds(impl_->save_delay_ms_.load());
}

void Controller::UpdateEventSubscriptions(uint32_t mask) {
  Impl* impl = impl_.get();
  auto update = [impl, mask]() { impl->DoUpdateSubscriptions(mask); };
  if (impl->io_.get_executor().running_in_this_thread()) {
    boost::asio::post(impl->io_, std::move(update));
    return;
  }
  std::lock_guard<std::mutex> lifecycle(impl->lifecycle_mutex_);
  if (!impl->running_) {
    impl->subscriptions_ = mask;
    return;
  }
  boost::asio::post(impl->io_, std::move(update));
}

std::optional<Notification> Controller::WaitNotification(std::chrono::milliseconds timeout) {
  return impl_->notifications_.Pop(timeout);
}

ConnectionStatus Controller::GetConnectionStatus() const {
  return impl_->GetConnectionStatus();
}

ReplayState Controller::GetReplayState() const { return impl_->GetReplayState(); }

int Controller::GetNegotiatedRpcVersion() const { return impl_->GetNegotiatedRpcVersion(); }

std::string Controller::GetLastError() const { return impl_->GetLastError(); }

ControllerMetrics Controller::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef REPLAYCUE_TESTING
namespace test {

size_t GetPendingRequestCount(Controller& controller) {
  Controller::Impl* impl = controller.impl_.get();
  return impl->Query<size_t>([impl]() { return impl->dispatcher_.pending_count(); });
}

uint64_t GetConnectionEpoch(Controller& controller) {
  Controller::Impl* impl = controller.impl_.get();
  return impl->Query<uint64_t>([impl]() { return impl->dispatcher_.epoch(); });
}

bool IsSaveDelayPending(Controller& controller) {
  Controller::Impl* impl = controller.impl_.get();
  return impl->Query<bool>([impl]() { return impl->save_delay_pending_; });
}

}  // namespace test
#endif

}  // namespace replaycue
