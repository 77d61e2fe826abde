// End-to-end controller tests against the scripted fake server.
#include "replaycue/replaycue.h"
#include "replaycue/protocol.h"
#include "replaycue/source_controller.h"
#include "replaycue/test_hooks.h"

#include "fake_server.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using replaycue::ConnectionStatus;
using replaycue::ErrorKind;
using replaycue::NotificationType;
using replaycue::ReplayPhase;
using replaycue::fake::FakeServer;
using replaycue::fake::ServerOptions;

namespace {

constexpr uint32_t kControllerSubscriptions =
    replaycue::kEventSubscriptionGeneral | replaycue::kEventSubscriptionInputs |
    replaycue::kEventSubscriptionOutputs | replaycue::kEventSubscriptionMediaInputs;

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

class ControllerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (controller_) {
      controller_->Stop();
    }
  }

  static replaycue::Config FastConfig() {
    replaycue::Config config;
    config.save_delay = std::chrono::milliseconds(0);
    config.handshake_timeout = std::chrono::milliseconds(500);
    config.reconnect.min_delay = std::chrono::milliseconds(10);
    config.reconnect.max_delay = std::chrono::milliseconds(40);
    config.reconnect.max_attempts = 5;
    config.reconnect.grace_period = std::chrono::milliseconds(0);
    config.request_timeouts.default_timeout = std::chrono::milliseconds(2000);
    config.log_callback = [](replaycue::LogLevel, const std::string&) {};
    config.log_level = replaycue::LogLevel::kDebug;
    return config;
  }

  void Launch(replaycue::Config config = FastConfig()) {
    controller_ = std::make_unique<replaycue::Controller>(config, server_->Factory());
    ASSERT_TRUE(controller_->Start()) << controller_->GetLastError();
  }

  void LaunchReady(replaycue::Config config = FastConfig()) {
    Launch(config);
    ASSERT_TRUE(WaitForStatus(ConnectionStatus::kReady));
  }

  bool WaitForStatus(ConnectionStatus status) {
    return WaitUntil([&]() { return controller_->GetConnectionStatus() == status; });
  }

  bool WaitForPhase(ReplayPhase phase) {
    return WaitUntil([&]() { return controller_->GetReplayState().phase == phase; });
  }

  // Runs a command and waits for its completion callback.
  std::optional<replaycue::Error> Await(
      const std::function<void(replaycue::Controller::CommandCallback)>& command) {
    auto promise = std::make_shared<std::promise<std::optional<replaycue::Error>>>();
    auto future = promise->get_future();
    command([promise](const std::optional<replaycue::Error>& error) { promise->set_value(error); });
    if (future.wait_for(std::chrono::seconds(3)) != std::future_status::ready) {
      ADD_FAILURE() << "command did not complete";
      return replaycue::Error{ErrorKind::kCancelled, "test timeout", 0};
    }
    return future.get();
  }

  std::optional<replaycue::Error> StartBuffering() {
    return Await([&](replaycue::Controller::CommandCallback cb) {
      controller_->StartBuffering(std::move(cb));
    });
  }

  std::optional<replaycue::Error> SaveCue() {
    return Await([&](replaycue::Controller::CommandCallback cb) {
      controller_->SaveCue(std::move(cb));
    });
  }

  std::optional<replaycue::Error> Play() {
    return Await([&](replaycue::Controller::CommandCallback cb) {
      controller_->Play(std::move(cb));
    });
  }

  // Pops notifications until one satisfies pred.
  std::optional<replaycue::Notification> NextMatching(
      const std::function<bool(const replaycue::Notification&)>& pred) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
      auto notification = controller_->WaitNotification(std::chrono::milliseconds(50));
      if (notification && pred(*notification)) {
        return notification;
      }
    }
    return std::nullopt;
  }

  std::optional<replaycue::Notification> NextError(ErrorKind kind) {
    return NextMatching([kind](const replaycue::Notification& n) {
      return n.type == NotificationType::kError && n.error.kind == kind;
    });
  }

  // Brings the controller to Saved with the given clip.
  void SaveClip(const std::string& path) {
    ASSERT_FALSE(StartBuffering().has_value());
    ASSERT_FALSE(SaveCue().has_value());
    server_->EmitEvent("ReplayBufferSaved", {{"savedReplayPath", path}});
    ASSERT_TRUE(WaitForPhase(ReplayPhase::kSaved));
  }

  std::unique_ptr<FakeServer> server_ = std::make_unique<FakeServer>();
  std::unique_ptr<replaycue::Controller> controller_;
};

}  // namespace

TEST_F(ControllerTest, CommandsBeforeStartFailImmediately) {
  controller_ = std::make_unique<replaycue::Controller>(FastConfig(), server_->Factory());
  const auto error = SaveCue();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kSend);
  EXPECT_EQ(controller_->GetConnectionStatus(), ConnectionStatus::kDisconnected);
}

TEST_F(ControllerTest, ConnectsAndIdentifies) {
  LaunchReady();
  EXPECT_EQ(controller_->GetNegotiatedRpcVersion(), 1);
  ASSERT_EQ(server_->identifies().size(), 1u);
  EXPECT_EQ(server_->identifies()[0].event_subscriptions, kControllerSubscriptions);
  EXPECT_EQ(replaycue::test::GetConnectionEpoch(*controller_), 1u);

  auto handshaking = NextMatching([](const replaycue::Notification& n) {
    return n.type == NotificationType::kConnectionStateChanged;
  });
  ASSERT_TRUE(handshaking.has_value());
  EXPECT_EQ(handshaking->connection, ConnectionStatus::kHandshaking);
  auto ready = NextMatching([](const replaycue::Notification& n) {
    return n.type == NotificationType::kConnectionStateChanged;
  });
  ASSERT_TRUE(ready.has_value());
  EXPECT_EQ(ready->connection, ConnectionStatus::kReady);
}

TEST_F(ControllerTest, StartTwiceIsHarmless) {
  LaunchReady();
  EXPECT_TRUE(controller_->Start());
  EXPECT_EQ(server_->connection_attempts(), 1);
}

TEST_F(ControllerTest, StartBufferingEntersBuffering) {
  LaunchReady();
  EXPECT_FALSE(StartBuffering().has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);
  EXPECT_EQ(server_->RequestCount("StartReplayBuffer"), 1u);
}

TEST_F(ControllerTest, AlreadyRunningBufferCountsAsSuccess) {
  server_->SetResponse("StartReplayBuffer",
                       replaycue::fake::Reject(replaycue::kRequestStatusOutputRunning));
  LaunchReady();
  EXPECT_FALSE(StartBuffering().has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);
}

TEST_F(ControllerTest, RemoteBufferEventsDrivePhase) {
  LaunchReady();
  server_->EmitEvent("ReplayBufferStateChanged",
                     {{"outputActive", true}, {"outputState", "OBS_WEBSOCKET_OUTPUT_STARTED"}});
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kBuffering));
  server_->EmitEvent("ReplayBufferStateChanged",
                     {{"outputActive", false}, {"outputState", "OBS_WEBSOCKET_OUTPUT_STOPPED"}});
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kIdle));
}

TEST_F(ControllerTest, SaveCueProducesClip) {
  LaunchReady();
  ASSERT_FALSE(StartBuffering().has_value());
  ASSERT_FALSE(SaveCue().has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kSaveRequested);
  EXPECT_EQ(controller_->GetReplayState().save_cycle, 1u);

  server_->EmitEvent("ReplayBufferSaved", {{"savedReplayPath", "/clips/goal.mkv"}});
  auto saved = NextMatching([](const replaycue::Notification& n) {
    return n.type == NotificationType::kClipSaved;
  });
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->clip_path, "/clips/goal.mkv");
  const auto state = controller_->GetReplayState();
  EXPECT_EQ(state.phase, ReplayPhase::kSaved);
  ASSERT_TRUE(state.clip.has_value());
  EXPECT_EQ(state.clip->path, "/clips/goal.mkv");
}

TEST_F(ControllerTest, DuplicateConfirmationIsDiscarded) {
  LaunchReady();
  SaveClip("/clips/first.mkv");
  server_->EmitEvent("ReplayBufferSaved", {{"savedReplayPath", "/clips/second.mkv"}});
  ASSERT_TRUE(NextError(ErrorKind::kStateTransition).has_value());
  const auto state = controller_->GetReplayState();
  EXPECT_EQ(state.phase, ReplayPhase::kSaved);
  EXPECT_EQ(state.clip->path, "/clips/first.mkv");
}

TEST_F(ControllerTest, CuesCoalesceWhileSaveInFlight) {
  server_->SetResponse("SaveReplayBuffer", replaycue::fake::Hold());
  LaunchReady();
  ASSERT_FALSE(StartBuffering().has_value());
  controller_->SaveCue();
  ASSERT_TRUE(server_->WaitForRequest("SaveReplayBuffer").has_value());
  EXPECT_FALSE(SaveCue().has_value());
  EXPECT_FALSE(SaveCue().has_value());
  EXPECT_EQ(server_->RequestCount("SaveReplayBuffer"), 1u);
  EXPECT_EQ(controller_->GetReplayState().save_cycle, 1u);
  EXPECT_EQ(replaycue::test::GetPendingRequestCount(*controller_), 1u);
}

TEST_F(ControllerTest, SaveTimeoutReturnsToBufferingAndRetrySucceeds) {
  auto config = FastConfig();
  config.request_timeouts.per_request_type["SaveReplayBuffer"] = std::chrono::milliseconds(100);
  server_->SetResponse("SaveReplayBuffer", replaycue::fake::Hold());
  LaunchReady(config);
  ASSERT_FALSE(StartBuffering().has_value());

  const auto error = SaveCue();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kRequestTimeout);
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);
  EXPECT_EQ(controller_->GetMetrics().requests_timed_out, 1u);

  server_->ClearResponse("SaveReplayBuffer");
  EXPECT_FALSE(SaveCue().has_value());
  EXPECT_EQ(controller_->GetReplayState().save_cycle, 2u);
  server_->EmitEvent("ReplayBufferSaved", {{"savedReplayPath", "/clips/retry.mkv"}});
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kSaved));
}

TEST_F(ControllerTest, PlayPointsSourceAtClipUntilPlaybackEnds) {
  LaunchReady();
  SaveClip("/clips/goal.mkv");
  EXPECT_FALSE(Play().has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kPlaying);

  const auto set = server_->WaitForRequest("SetInputSettings");
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->request_data["inputName"], "Replay");
  EXPECT_EQ(set->request_data["inputSettings"]["playlist"][0]["value"], "/clips/goal.mkv");
  ASSERT_EQ(server_->batches().size(), 1u);
  EXPECT_EQ(server_->batches()[0].requests[1].request_type, "TriggerMediaInputAction");

  server_->EmitEvent("MediaInputPlaybackEnded", {{"inputName", "Other"}});
  server_->EmitEvent("MediaInputPlaybackEnded", {{"inputName", "Replay"}});
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kBuffering));
  EXPECT_FALSE(controller_->GetReplayState().clip.has_value());
}

TEST_F(ControllerTest, BufferStoppedDuringPlaybackReturnsToIdle) {
  LaunchReady();
  SaveClip("/clips/goal.mkv");
  ASSERT_FALSE(Play().has_value());
  const auto errors_before = controller_->GetMetrics().state_transition_errors;

  server_->EmitEvent("ReplayBufferStateChanged",
                     {{"outputActive", false}, {"outputState", "OBS_WEBSOCKET_OUTPUT_STOPPED"}});
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kIdle));
  EXPECT_FALSE(controller_->GetReplayState().clip.has_value());

  // The clip keeps playing after the buffer went away; its end is not an error.
  server_->EmitEvent("MediaInputPlaybackEnded", {{"inputName", "Replay"}});
  const auto error = SaveCue();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kStateTransition);
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kIdle);
  EXPECT_EQ(controller_->GetMetrics().state_transition_errors, errors_before + 1);
}

TEST_F(ControllerTest, MissingSourceFailsPlayback) {
  server_->SetResponse("SetInputSettings",
                       replaycue::fake::Reject(replaycue::kRequestStatusResourceNotFound));
  LaunchReady();
  SaveClip("/clips/goal.mkv");
  const auto error = Play();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kSourceNotFound);
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);
}

TEST_F(ControllerTest, StopPlaybackStopsMedia) {
  LaunchReady();
  SaveClip("/clips/goal.mkv");
  ASSERT_FALSE(Play().has_value());
  EXPECT_FALSE(Await([&](replaycue::Controller::CommandCallback cb) {
                 controller_->StopPlayback(std::move(cb));
               }).has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);
  const auto stop = server_->WaitForRequest("TriggerMediaInputAction", 2);
  ASSERT_TRUE(stop.has_value());
  EXPECT_EQ(stop->request_data["mediaAction"], replaycue::kMediaActionStop);
}

TEST_F(ControllerTest, StopDismissesSavedClip) {
  LaunchReady();
  SaveClip("/clips/goal.mkv");
  EXPECT_FALSE(Await([&](replaycue::Controller::CommandCallback cb) {
                 controller_->StopPlayback(std::move(cb));
               }).has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);
  EXPECT_EQ(server_->RequestCount("TriggerMediaInputAction"), 0u);
}

TEST_F(ControllerTest, PlayClipsSendsPlaylist) {
  LaunchReady();
  ASSERT_FALSE(StartBuffering().has_value());
  EXPECT_FALSE(Await([&](replaycue::Controller::CommandCallback cb) {
                 controller_->PlayClips({}, std::move(cb));
               }).has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kBuffering);

  EXPECT_FALSE(Await([&](replaycue::Controller::CommandCallback cb) {
                 controller_->PlayClips({"/clips/a.mkv", "/clips/b.mkv"}, std::move(cb));
               }).has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kPlaying);
  const auto set = server_->WaitForRequest("SetInputSettings");
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->request_data["inputSettings"]["playlist"].size(), 2u);
}

TEST_F(ControllerTest, RejectedCommandReportsStateTransitionError) {
  LaunchReady();
  const auto error = Play();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kStateTransition);
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kIdle);
  EXPECT_GE(controller_->GetMetrics().state_transition_errors, 1u);
  ASSERT_TRUE(NextError(ErrorKind::kStateTransition).has_value());
}

TEST_F(ControllerTest, WrongPasswordFaultsWithoutRetry) {
  ServerOptions options;
  options.password = "right";
  server_ = std::make_unique<FakeServer>(options);
  auto config = FastConfig();
  config.password = "wrong";
  Launch(config);

  ASSERT_TRUE(NextError(ErrorKind::kAuth).has_value());
  const auto state = controller_->GetReplayState();
  EXPECT_EQ(state.phase, ReplayPhase::kFaulted);
  ASSERT_TRUE(state.fault.has_value());
  EXPECT_EQ(state.fault->kind, ErrorKind::kAuth);
  EXPECT_EQ(controller_->GetConnectionStatus(), ConnectionStatus::kDisconnected);
  EXPECT_EQ(replaycue::test::GetPendingRequestCount(*controller_), 0u);
  EXPECT_NE(controller_->GetLastError().find("AuthError"), std::string::npos);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(server_->connection_attempts(), 1);
}

TEST_F(ControllerTest, VersionMismatchFaults) {
  ServerOptions options;
  options.identified_rpc_version = 2;
  server_ = std::make_unique<FakeServer>(options);
  Launch();
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kFaulted));
  EXPECT_EQ(controller_->GetReplayState().fault->kind, ErrorKind::kVersionMismatch);
}

TEST_F(ControllerTest, DropDuringSaveCancelsAndDiscardsStaleConfirmation) {
  server_->SetResponse("SaveReplayBuffer", replaycue::fake::Hold());
  LaunchReady();
  ASSERT_FALSE(StartBuffering().has_value());

  auto promise = std::make_shared<std::promise<std::optional<replaycue::Error>>>();
  auto future = promise->get_future();
  controller_->SaveCue(
      [promise](const std::optional<replaycue::Error>& error) { promise->set_value(error); });
  ASSERT_TRUE(server_->WaitForRequest("SaveReplayBuffer").has_value());

  server_->Drop();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(3)), std::future_status::ready);
  const auto error = future.get();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kCancelled);

  ASSERT_TRUE(server_->WaitForConnections(2));
  ASSERT_TRUE(WaitForStatus(ConnectionStatus::kReady));
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kIdle);
  EXPECT_EQ(replaycue::test::GetConnectionEpoch(*controller_), 2u);
  EXPECT_GE(controller_->GetMetrics().requests_cancelled, 1u);

  server_->EmitEvent("ReplayBufferSaved", {{"savedReplayPath", "/clips/late.mkv"}});
  ASSERT_TRUE(NextError(ErrorKind::kStateTransition).has_value());
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kIdle);
  EXPECT_FALSE(controller_->GetReplayState().clip.has_value());
}

TEST_F(ControllerTest, ReconnectsAfterRefusedAttempts) {
  ServerOptions options;
  options.refuse_connections = 2;
  server_ = std::make_unique<FakeServer>(options);
  LaunchReady();
  EXPECT_EQ(server_->connection_attempts(), 3);
  EXPECT_EQ(controller_->GetMetrics().reconnect_attempts, 2u);
}

TEST_F(ControllerTest, GivesUpAfterMaxAttempts) {
  ServerOptions options;
  options.refuse_all = true;
  server_ = std::make_unique<FakeServer>(options);
  auto config = FastConfig();
  config.reconnect.max_attempts = 2;
  Launch(config);
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kFaulted));
  EXPECT_EQ(controller_->GetReplayState().fault->kind, ErrorKind::kConnection);
  EXPECT_EQ(server_->connection_attempts(), 3);
}

TEST_F(ControllerTest, MalformedFrameForcesReconnect) {
  LaunchReady();
  server_->PushFrame("{not json");
  ASSERT_TRUE(server_->WaitForConnections(2));
  ASSERT_TRUE(WaitForStatus(ConnectionStatus::kReady));
  EXPECT_EQ(controller_->GetMetrics().decode_errors, 1u);
}

TEST_F(ControllerTest, UnknownTrafficIsCountedNotFatal) {
  LaunchReady();
  server_->EmitEvent("SceneCreated", {{"sceneName", "Main"}});
  server_->PushFrame(R"({"op":42,"d":{}})");
  ASSERT_TRUE(WaitUntil([&]() {
    const auto metrics = controller_->GetMetrics();
    return metrics.events_dropped == 1 && metrics.unknown_messages == 1;
  }));
  EXPECT_EQ(server_->connections(), 1);
  EXPECT_EQ(controller_->GetConnectionStatus(), ConnectionStatus::kReady);
}

TEST_F(ControllerTest, SaveDelayDefersRequest) {
  LaunchReady();
  EXPECT_EQ(controller_->SetSaveDelay(std::chrono::milliseconds(60000)).count(), 30000);
  EXPECT_EQ(controller_->SetSaveDelay(std::chrono::milliseconds(-5)).count(), 0);
  controller_->SetSaveDelay(std::chrono::milliseconds(200));
  EXPECT_EQ(controller_->GetSaveDelay().count(), 200);
  ASSERT_FALSE(StartBuffering().has_value());

  controller_->SaveCue();
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kSaveRequested));
  EXPECT_TRUE(replaycue::test::IsSaveDelayPending(*controller_));
  EXPECT_EQ(server_->RequestCount("SaveReplayBuffer"), 0u);
  ASSERT_TRUE(server_->WaitForRequest("SaveReplayBuffer").has_value());
  EXPECT_FALSE(replaycue::test::IsSaveDelayPending(*controller_));
}

TEST_F(ControllerTest, DropDuringSaveDelayCancelsSave) {
  auto config = FastConfig();
  config.save_delay = std::chrono::milliseconds(5000);
  LaunchReady(config);
  ASSERT_FALSE(StartBuffering().has_value());

  auto promise = std::make_shared<std::promise<std::optional<replaycue::Error>>>();
  auto future = promise->get_future();
  controller_->SaveCue(
      [promise](const std::optional<replaycue::Error>& error) { promise->set_value(error); });
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kSaveRequested));
  server_->Drop();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(3)), std::future_status::ready);
  const auto error = future.get();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kCancelled);
  EXPECT_EQ(server_->RequestCount("SaveReplayBuffer"), 0u);
}

TEST_F(ControllerTest, AutomationStartsBufferingAndPlaysClips) {
  auto config = FastConfig();
  config.auto_start_buffering = true;
  config.auto_play_saved_clips = true;
  LaunchReady(config);
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kBuffering));
  ASSERT_FALSE(SaveCue().has_value());
  server_->EmitEvent("ReplayBufferSaved", {{"savedReplayPath", "/clips/auto.mkv"}});
  ASSERT_TRUE(WaitForPhase(ReplayPhase::kPlaying));
  ASSERT_TRUE(server_->WaitForRequest("SetInputSettings").has_value());
}

TEST_F(ControllerTest, CreatesMissingSourceAfterHandshake) {
  server_->SetResponse("GetInputSettings",
                       replaycue::fake::Reject(replaycue::kRequestStatusResourceNotFound));
  replaycue::fake::ScriptedResponse scene;
  scene.data = {{"currentProgramSceneName", "Game"}};
  server_->SetResponse("GetCurrentProgramScene", scene);
  auto config = FastConfig();
  config.create_source_if_missing = true;
  config.source_kind = replaycue::SourceKind::kMediaSource;
  LaunchReady(config);

  const auto create = server_->WaitForRequest("CreateInput");
  ASSERT_TRUE(create.has_value());
  EXPECT_EQ(create->request_data["sceneName"], "Game");
  EXPECT_EQ(create->request_data["inputName"], "Replay");
  EXPECT_EQ(create->request_data["inputKind"], replaycue::kMediaSourceInputKind);
}

TEST_F(ControllerTest, ReidentifySendsUpdatedMask) {
  LaunchReady();
  controller_->UpdateEventSubscriptions(1u << 2);
  ASSERT_TRUE(server_->WaitForReidentify(1));
  EXPECT_EQ(server_->reidentifies()[0].event_subscriptions,
            kControllerSubscriptions | (1u << 2));
}

TEST_F(ControllerTest, ThrowingCompletionCallbackIsCounted) {
  LaunchReady();
  controller_->StartBuffering(
      [](const std::optional<replaycue::Error>&) { throw std::runtime_error("host bug"); });
  ASSERT_TRUE(WaitUntil([&]() { return controller_->GetMetrics().callback_exceptions == 1; }));
  EXPECT_EQ(controller_->GetConnectionStatus(), ConnectionStatus::kReady);
}

TEST_F(ControllerTest, FullNotificationQueueDropsOldest) {
  auto config = FastConfig();
  config.notification_queue_capacity = 1;
  LaunchReady(config);
  ASSERT_FALSE(StartBuffering().has_value());
  EXPECT_GE(controller_->GetMetrics().notifications_dropped, 1u);
  auto last = controller_->WaitNotification(std::chrono::milliseconds(100));
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->type, NotificationType::kReplayStateChanged);
  EXPECT_EQ(last->new_phase, ReplayPhase::kBuffering);
}

TEST_F(ControllerTest, StopDisconnectsAndAllowsRestart) {
  LaunchReady();
  ASSERT_FALSE(StartBuffering().has_value());
  controller_->Stop();
  EXPECT_EQ(controller_->GetConnectionStatus(), ConnectionStatus::kDisconnected);
  EXPECT_EQ(controller_->GetReplayState().phase, ReplayPhase::kIdle);
  const auto error = SaveCue();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::kSend);

  ASSERT_TRUE(controller_->Start());
  ASSERT_TRUE(WaitForStatus(ConnectionStatus::kReady));
  EXPECT_EQ(server_->connections(), 2);
}

TEST_F(ControllerTest, CapturedStdoutDoesNotFeedBackThroughLogCallback) {
  auto mutex = std::make_shared<std::mutex>();
  auto messages = std::make_shared<std::vector<std::string>>();
  replaycue::Config config = FastConfig();
  config.capture_streams = replaycue::kCaptureStdout;
  config.log_callback = [mutex, messages](replaycue::LogLevel, const std::string& message) {
    {
      std::lock_guard<std::mutex> lock(*mutex);
      messages->push_back(message);
    }
    // A console logger on stdout writes straight back into the capture.
    std::fwrite(message.data(), 1, message.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
  };
  LaunchReady(config);

  auto marker_count = [&]() {
    std::lock_guard<std::mutex> lock(*mutex);
    size_t count = 0;
    for (const auto& message : *messages) {
      if (message.find("clip marker") != std::string::npos) {
        ++count;
      }
    }
    return count;
  };
  std::fputs("clip marker\n", stdout);
  std::fflush(stdout);
  ASSERT_TRUE(WaitUntil([&]() { return marker_count() > 0; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(marker_count(), 1u);
  {
    std::lock_guard<std::mutex> lock(*mutex);
    for (const auto& message : *messages) {
      if (message.find("clip marker") != std::string::npos) {
        EXPECT_EQ(message, "[stdout] clip marker");
      }
    }
  }
}
