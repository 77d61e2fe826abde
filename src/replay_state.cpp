#include "replaycue/replay_state.h"

#include <chrono>

namespace replaycue {
namespace {

Transition Applied(ReplayPhase next, ReplayAction action = ReplayAction::kNone) {
  return Transition{TransitionOutcome::kApplied, next, action};
}

Transition Unchanged(ReplayPhase phase) {
  return Transition{TransitionOutcome::kUnchanged, phase, ReplayAction::kNone};
}

Transition Rejected(ReplayPhase phase) {
  return Transition{TransitionOutcome::kRejected, phase, ReplayAction::kNone};
}

}  // namespace

const char* ReplayInputName(ReplayInput input) {
  switch (input) {
    case ReplayInput::kStartBuffering:
      return "StartBuffering";
    case ReplayInput::kBufferStarted:
      return "BufferStarted";
    case ReplayInput::kBufferStopped:
      return "BufferStopped";
    case ReplayInput::kSaveCue:
      return "SaveCue";
    case ReplayInput::kSaveConfirmed:
      return "SaveConfirmed";
    case ReplayInput::kSaveFailed:
      return "SaveFailed";
    case ReplayInput::kPlay:
      return "Play";
    case ReplayInput::kPlayHighlights:
      return "PlayHighlights";
    case ReplayInput::kPlaybackFailed:
      return "PlaybackFailed";
    case ReplayInput::kPlaybackFinished:
      return "PlaybackFinished";
    case ReplayInput::kStop:
      return "Stop";
    case ReplayInput::kConnectionLost:
      return "ConnectionLost";
    case ReplayInput::kFatalError:
      return "FatalError";
  }
  return "Unknown";
}

Transition NextTransition(ReplayPhase phase, ReplayInput input) {
  // Edges valid from every phase.
  if (input == ReplayInput::kConnectionLost) {
    return Applied(ReplayPhase::kIdle);
  }
  if (input == ReplayInput::kFatalError) {
    return Applied(ReplayPhase::kFaulted);
  }
  switch (phase) {
    case ReplayPhase::kIdle:
      switch (input) {
        case ReplayInput::kStartBuffering:
        case ReplayInput::kBufferStarted:
          return Applied(ReplayPhase::kBuffering);
        case ReplayInput::kPlaybackFinished:
          // Playback that outlived a stopped buffer.
          return Unchanged(phase);
        default:
          return Rejected(phase);
      }
    case ReplayPhase::kBuffering:
      switch (input) {
        case ReplayInput::kStartBuffering:
        case ReplayInput::kBufferStarted:
          return Unchanged(phase);
        case ReplayInput::kBufferStopped:
          return Applied(ReplayPhase::kIdle);
        case ReplayInput::kSaveCue:
          return Applied(ReplayPhase::kSaveRequested, ReplayAction::kIssueSave);
        case ReplayInput::kPlayHighlights:
          return Applied(ReplayPhase::kPlaying, ReplayAction::kIssuePlayHighlights);
        default:
          return Rejected(phase);
      }
    case ReplayPhase::kSaveRequested:
      switch (input) {
        case ReplayInput::kStartBuffering:
        case ReplayInput::kBufferStarted:
          return Unchanged(phase);
        case ReplayInput::kSaveCue:
          return Transition{TransitionOutcome::kCoalesced, phase, ReplayAction::kNone};
        case ReplayInput::kSaveConfirmed:
          return Applied(ReplayPhase::kSaved, ReplayAction::kEmitClip);
        case ReplayInput::kSaveFailed:
          return Applied(ReplayPhase::kBuffering);
        case ReplayInput::kBufferStopped:
          return Applied(ReplayPhase::kIdle);
        default:
          return Rejected(phase);
      }
    case ReplayPhase::kSaved:
      switch (input) {
        case ReplayInput::kStartBuffering:
        case ReplayInput::kBufferStarted:
          return Unchanged(phase);
        case ReplayInput::kPlay:
          return Applied(ReplayPhase::kPlaying, ReplayAction::kIssueSetMedia);
        case ReplayInput::kPlayHighlights:
          return Applied(ReplayPhase::kPlaying, ReplayAction::kIssuePlayHighlights);
        case ReplayInput::kStop:
          return Applied(ReplayPhase::kBuffering);
        case ReplayInput::kBufferStopped:
          return Applied(ReplayPhase::kIdle);
        default:
          return Rejected(phase);
      }
    case ReplayPhase::kPlaying:
      switch (input) {
        case ReplayInput::kStartBuffering:
        case ReplayInput::kBufferStarted:
          return Unchanged(phase);
        case ReplayInput::kPlaybackFinished:
        case ReplayInput::kPlaybackFailed:
          return Applied(ReplayPhase::kBuffering);
        case ReplayInput::kStop:
          return Applied(ReplayPhase::kBuffering, ReplayAction::kIssueStopMedia);
        case ReplayInput::kBufferStopped:
          return Applied(ReplayPhase::kIdle);
        default:
          return Rejected(phase);
      }
    case ReplayPhase::kFaulted:
      return Rejected(phase);
  }
  return Rejected(phase);
}

Transition ReplayStateMachine::Apply(ReplayInput input, const ReplayInputContext& context) {
  Transition transition = NextTransition(state_.phase, input);
  if (transition.outcome == TransitionOutcome::kApplied &&
      input == ReplayInput::kSaveFailed && context.save_cycle != 0 &&
      context.save_cycle != state_.save_cycle) {
    // Failure of a request from an earlier save cycle.
    transition.outcome = TransitionOutcome::kRejected;
    transition.next = state_.phase;
    transition.action = ReplayAction::kNone;
  }
  if (transition.outcome != TransitionOutcome::kApplied) {
    return transition;
  }

  const ReplayPhase old_phase = state_.phase;
  state_.phase = transition.next;
  switch (transition.next) {
    case ReplayPhase::kSaveRequested:
      ++state_.save_cycle;
      state_.clip.reset();
      break;
    case ReplayPhase::kSaved: {
      SavedClip clip;
      clip.path = context.clip_path;
      clip.captured_at = std::chrono::system_clock::now();
      state_.clip = std::move(clip);
      break;
    }
    case ReplayPhase::kPlaying:
      if (input == ReplayInput::kPlayHighlights) {
        state_.clip.reset();
      }
      break;
    case ReplayPhase::kFaulted:
      state_.clip.reset();
      state_.fault = context.error;
      break;
    case ReplayPhase::kIdle:
    case ReplayPhase::kBuffering:
      state_.clip.reset();
      break;
  }
  if (transition.next != ReplayPhase::kFaulted) {
    state_.fault.reset();
  }
  if (old_phase != state_.phase && change_cb_) {
    change_cb_(old_phase, state_.phase);
  }
  return transition;
}

}  // namespace replaycue
