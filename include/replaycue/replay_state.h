#pragma once

#include "replaycue/replaycue.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace replaycue {

/**
 * Inputs that drive the replay state machine.
 */
enum class ReplayInput {
  /// Start-buffering command confirmed by the remote end.
  kStartBuffering,
  /// Remote replay buffer reported started.
  kBufferStarted,
  /// Remote replay buffer reported stopped.
  kBufferStopped,
  /// External save cue.
  kSaveCue,
  /// Save-confirmed event carrying the clip path.
  kSaveConfirmed,
  /// SaveReplayBuffer request rejected or timed out.
  kSaveFailed,
  /// Play the saved clip.
  kPlay,
  /// Play a list of clips.
  kPlayHighlights,
  /// Playback request failed.
  kPlaybackFailed,
  /// Playback source finished playing.
  kPlaybackFinished,
  /// Stop command.
  kStop,
  /// Connection lost or reset.
  kConnectionLost,
  /// Reconnect abandoned or session rejected.
  kFatalError,
};

const char* ReplayInputName(ReplayInput input);

constexpr int kReplayPhaseCount = 6;
constexpr int kReplayInputCount = 13;

/**
 * Side effect the owner performs after a transition.
 */
enum class ReplayAction {
  kNone,
  kIssueSave,
  kIssueSetMedia,
  kIssuePlayHighlights,
  kIssueStopMedia,
  kEmitClip,
};

enum class TransitionOutcome {
  /// The phase changed (or was re-entered along a defined edge).
  kApplied,
  /// Defined no-op: the input is valid but the phase stays.
  kUnchanged,
  /// A save cue arrived while a save is already in flight.
  kCoalesced,
  /// No edge exists for this (phase, input) pair.
  kRejected,
};

struct Transition {
  TransitionOutcome outcome = TransitionOutcome::kRejected;
  ReplayPhase next = ReplayPhase::kIdle;
  ReplayAction action = ReplayAction::kNone;
};

/**
 * The transition table: pure function of (phase, input).
 */
Transition NextTransition(ReplayPhase phase, ReplayInput input);

/**
 * Context attached to an input.
 */
struct ReplayInputContext {
  /// kSaveConfirmed: saved clip path.
  std::string clip_path;
  /// kSaveFailed: the save cycle the failed request belonged to (0 = current).
  uint64_t save_cycle = 0;
  /// kFatalError: the cause.
  std::optional<Error> error;
};

/**
 * Holds the authoritative ReplayState and applies inputs via NextTransition.
 *
 * A clip is created only by kSaveConfirmed while in kSaveRequested, so a
 * duplicate or late confirmation is rejected instead of reapplied. A kSaveFailed
 * from an older save cycle is rejected as stale. Not thread-safe: owned by the
 * I/O thread.
 */
class ReplayStateMachine {
 public:
  using ChangeCallback = std::function<void(ReplayPhase old_phase, ReplayPhase new_phase)>;

  ReplayStateMachine() = default;

  Transition Apply(ReplayInput input,
                   const ReplayInputContext& context = ReplayInputContext());

  void SetChangeCallback(ChangeCallback cb) { change_cb_ = std::move(cb); }

  const ReplayState& state() const { return state_; }
  ReplayPhase phase() const { return state_.phase; }
  uint64_t save_cycle() const { return state_.save_cycle; }

 private:
  ReplayState state_;
  ChangeCallback change_cb_;
};

}  // namespace replaycue
