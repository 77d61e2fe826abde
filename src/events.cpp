#include "replaycue/events.h"
#include "replaycue/replaycue.h"

#include <algorithm>

namespace replaycue {
namespace {

bool ReadString(const nlohmann::json& data, const char* key, std::string* out,
                std::string* error) {
  auto it = data.find(key);
  if (it == data.end() || !it->is_string()) {
    if (error) {
      *error = std::string("event field '") + key + "' missing or not a string";
    }
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

}  // namespace

const char* EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kReplayBufferSaved:
      return "ReplayBufferSaved";
    case EventKind::kReplayBufferStateChanged:
      return "ReplayBufferStateChanged";
    case EventKind::kMediaInputPlaybackStarted:
      return "MediaInputPlaybackStarted";
    case EventKind::kMediaInputPlaybackEnded:
      return "MediaInputPlaybackEnded";
    case EventKind::kInputRemoved:
      return "InputRemoved";
    case EventKind::kExitStarted:
      return "ExitStarted";
    case EventKind::kUnrecognized:
      return "Unrecognized";
  }
  return "Unrecognized";
}

uint32_t SubscriptionMaskFor(EventKind kind) {
  switch (kind) {
    case EventKind::kReplayBufferSaved:
    case EventKind::kReplayBufferStateChanged:
      return kEventSubscriptionOutputs;
    case EventKind::kMediaInputPlaybackStarted:
    case EventKind::kMediaInputPlaybackEnded:
      return kEventSubscriptionMediaInputs;
    case EventKind::kInputRemoved:
      return kEventSubscriptionInputs;
    case EventKind::kExitStarted:
      return kEventSubscriptionGeneral;
    case EventKind::kUnrecognized:
      return kEventSubscriptionNone;
  }
  return kEventSubscriptionNone;
}

bool ParseEvent(const EventMessage& message, uint64_t sequence, Event* out,
                std::string* error) {
  const nlohmann::json& data = message.event_data;
  Event event;
  event.sequence = sequence;
  if (message.event_type == "ReplayBufferSaved") {
    ReplayBufferSavedEvent payload;
    if (!ReadString(data, "savedReplayPath", &payload.saved_replay_path, error)) {
      return false;
    }
    event.kind = EventKind::kReplayBufferSaved;
    event.payload = std::move(payload);
  } else if (message.event_type == "ReplayBufferStateChanged") {
    ReplayBufferStateChangedEvent payload;
    auto active = data.find("outputActive");
    if (active == data.end() || !active->is_boolean()) {
      if (error) {
        *error = "event field 'outputActive' missing or not a boolean";
      }
      return false;
    }
    payload.output_active = active->get<bool>();
    if (!ReadString(data, "outputState", &payload.output_state, error)) {
      return false;
    }
    event.kind = EventKind::kReplayBufferStateChanged;
    event.payload = std::move(payload);
  } else if (message.event_type == "MediaInputPlaybackStarted") {
    MediaInputPlaybackStartedEvent payload;
    if (!ReadString(data, "inputName", &payload.input_name, error)) {
      return false;
    }
    event.kind = EventKind::kMediaInputPlaybackStarted;
    event.payload = std::move(payload);
  } else if (message.event_type == "MediaInputPlaybackEnded") {
    MediaInputPlaybackEndedEvent payload;
    if (!ReadString(data, "inputName", &payload.input_name, error)) {
      return false;
    }
    event.kind = EventKind::kMediaInputPlaybackEnded;
    event.payload = std::move(payload);
  } else if (message.event_type == "InputRemoved") {
    InputRemovedEvent payload;
    if (!ReadString(data, "inputName", &payload.input_name, error)) {
      return false;
    }
    event.kind = EventKind::kInputRemoved;
    event.payload = std::move(payload);
  } else if (message.event_type == "ExitStarted") {
    event.kind = EventKind::kExitStarted;
    event.payload = ExitStartedEvent{};
  } else {
    event.kind = EventKind::kUnrecognized;
    event.payload = UnrecognizedEvent{message.event_type, data};
  }
  *out = std::move(event);
  return true;
}

EventBus::EventBus(Logger logger) : logger_(std::move(logger)) {}

EventBus::SubscriptionId EventBus::Subscribe(EventKind kind, Handler handler) {
  const SubscriptionId id = next_id_++;
  handlers_[kind].push_back(Entry{id, std::move(handler)});
  return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
  for (auto& entry : handlers_) {
    auto& list = entry.second;
    auto it = std::find_if(list.begin(), list.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it != list.end()) {
      list.erase(it);
      return true;
    }
  }
  return false;
}

size_t EventBus::Publish(Event event) {
  published_.fetch_add(1);
  auto it = handlers_.find(event.kind);
  if (it == handlers_.end() || it->second.empty()) {
    dropped_.fetch_add(1);
    logger_.Debug(std::string("event ") + EventKindName(event.kind) +
                  " has no subscriber, dropped");
    return 0;
  }
  // Handlers may subscribe or unsubscribe while running.
  const std::vector<Entry> handlers = it->second;
  for (const auto& entry : handlers) {
    try {
      entry.handler(event);
    } catch (const std::exception& e) {
      handler_exceptions_.fetch_add(1);
      logger_.Error(std::string("event handler threw: ") + e.what());
    } catch (...) {
      handler_exceptions_.fetch_add(1);
      logger_.Error(std::string("event handler threw for ") + EventKindName(event.kind));
    }
  }
  return handlers.size();
}

uint32_t EventBus::RequiredSubscriptionMask() const {
  uint32_t mask = kEventSubscriptionNone;
  for (const auto& entry : handlers_) {
    if (!entry.second.empty()) {
      mask |= SubscriptionMaskFor(entry.first);
    }
  }
  return mask;
}

size_t EventBus::HandlerCount(EventKind kind) const {
  auto it = handlers_.find(kind);
  return it == handlers_.end() ? 0 : it->second.size();
}

EventBusStats EventBus::stats() const {
  EventBusStats stats;
  stats.published = published_.load();
  stats.dropped = dropped_.load();
  stats.handler_exceptions = handler_exceptions_.load();
  return stats;
}

}  // namespace replaycue
