#pragma once

#include "replaycue/log.h"
#include "replaycue/protocol.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace replaycue {

/**
 * Event kinds the controller understands; anything else is kUnrecognized.
 */
enum class EventKind {
  kReplayBufferSaved,
  kReplayBufferStateChanged,
  kMediaInputPlaybackStarted,
  kMediaInputPlaybackEnded,
  kInputRemoved,
  kExitStarted,
  kUnrecognized,
};

const char* EventKindName(EventKind kind);

/// Subscription category that must be enabled to receive events of a kind.
uint32_t SubscriptionMaskFor(EventKind kind);

struct ReplayBufferSavedEvent {
  std::string saved_replay_path;
};

struct ReplayBufferStateChangedEvent {
  bool output_active = false;
  std::string output_state;
};

struct MediaInputPlaybackStartedEvent {
  std::string input_name;
};

struct MediaInputPlaybackEndedEvent {
  std::string input_name;
};

struct InputRemovedEvent {
  std::string input_name;
};

struct ExitStartedEvent {};

struct UnrecognizedEvent {
  std::string event_type;
  nlohmann::json raw;
};

using EventPayload = std::variant<ReplayBufferSavedEvent,
                                  ReplayBufferStateChangedEvent,
                                  MediaInputPlaybackStartedEvent,
                                  MediaInputPlaybackEndedEvent,
                                  InputRemovedEvent,
                                  ExitStartedEvent,
                                  UnrecognizedEvent>;

/**
 * A decoded event. Immutable once constructed.
 */
struct Event {
  EventKind kind = EventKind::kUnrecognized;
  EventPayload payload;
  /// Receipt order within the connection.
  uint64_t sequence = 0;
};

/**
 * Build a typed event from an Event frame.
 *
 * @return false when a known event type is missing a required field.
 */
bool ParseEvent(const EventMessage& message, uint64_t sequence, Event* out,
                std::string* error = nullptr);

struct EventBusStats {
  uint64_t published = 0;
  uint64_t dropped = 0;
  uint64_t handler_exceptions = 0;
};

/**
 * Routes decoded events to the handlers subscribed to their kind.
 *
 * Delivery is synchronous and in handler-registration order. Events with no
 * subscriber are dropped and counted. Not thread-safe: used from the I/O thread.
 */
class EventBus {
 public:
  using Handler = std::function<void(const Event&)>;
  using SubscriptionId = uint64_t;

  explicit EventBus(Logger logger = Logger());

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId Subscribe(EventKind kind, Handler handler);
  bool Unsubscribe(SubscriptionId id);

  /// Deliver an event; returns the number of handlers invoked.
  size_t Publish(Event event);

  /// Union of the subscription categories needed by the current handlers.
  uint32_t RequiredSubscriptionMask() const;
  size_t HandlerCount(EventKind kind) const;
  EventBusStats stats() const;

 private:
  struct Entry {
    SubscriptionId id = 0;
    Handler handler;
  };

  Logger logger_;
  std::map<EventKind, std::vector<Entry>> handlers_;
  SubscriptionId next_id_ = 1;
  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> handler_exceptions_{0};
};

}  // namespace replaycue
