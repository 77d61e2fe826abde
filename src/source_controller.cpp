#include "replaycue/source_controller.h"

namespace replaycue {

using nlohmann::json;

SourceController::SourceController(RequestDispatcher& dispatcher, SourceOptions options,
                                   Logger logger)
    : dispatcher_(dispatcher), options_(std::move(options)), logger_(std::move(logger)) {}

const char* SourceController::InputKindFor(SourceKind kind) {
  return kind == SourceKind::kVlcSource ? kVlcSourceInputKind : kMediaSourceInputKind;
}

json SourceController::BuildInputSettings(SourceKind kind,
                                          const std::vector<std::string>& paths) {
  json settings;
  if (kind == SourceKind::kVlcSource) {
    json playlist = json::array();
    for (const auto& path : paths) {
      playlist.push_back({{"value", path}, {"hidden", false}, {"selected", false}});
    }
    settings["playlist"] = std::move(playlist);
    settings["loop"] = false;
    return settings;
  }
  settings["local_file"] = paths.empty() ? std::string() : paths.front();
  settings["is_local_file"] = true;
  settings["looping"] = false;
  return settings;
}

std::optional<Error> SourceController::MapError(const RequestResult& result) const {
  if (result.ok()) {
    return std::nullopt;
  }
  if (result.status_code == kRequestStatusResourceNotFound) {
    return Error{ErrorKind::kSourceNotFound,
                 "playback source '" + options_.source_name + "' not found",
                 result.status_code};
  }
  return result.error;
}

void SourceController::SetMedia(const std::string& path, DoneCallback done) {
  SetPlaylist(std::vector<std::string>{path}, std::move(done));
}

void SourceController::SetPlaylist(const std::vector<std::string>& paths, DoneCallback done) {
  if (paths.empty()) {
    done(Error{ErrorKind::kMalformedMessage, "no clips to play", 0});
    return;
  }
  if (options_.source_kind == SourceKind::kMediaSource && paths.size() > 1) {
    logger_.Warn("media source '" + options_.source_name + "' plays only the first of " +
                 std::to_string(paths.size()) + " clips");
  }
  json set_settings;
  set_settings["inputName"] = options_.source_name;
  set_settings["inputSettings"] = BuildInputSettings(options_.source_kind, paths);
  set_settings["overlay"] = true;
  logger_.Debug("pointing '" + options_.source_name + "' at " + paths.front() +
                (paths.size() > 1 ? " (+" + std::to_string(paths.size() - 1) + " more)" : ""));

  if (!options_.restart_on_set) {
    dispatcher_.Submit("SetInputSettings", std::move(set_settings),
                       [this, done](const RequestResult& result) { done(MapError(result)); });
    return;
  }

  json restart;
  restart["inputName"] = options_.source_name;
  restart["mediaAction"] = kMediaActionRestart;
  std::vector<BatchEntry> batch = {
      {"SetInputSettings", std::move(set_settings)},
      {"TriggerMediaInputAction", std::move(restart)},
  };
  dispatcher_.SubmitBatch(batch, true, [this, done](const BatchResult& result) {
    if (result.error) {
      done(result.error);
      return;
    }
    for (const auto& entry : result.results) {
      std::optional<Error> error = MapError(entry);
      if (error) {
        done(error);
        return;
      }
    }
    done(std::nullopt);
  });
}

void SourceController::StopMedia(DoneCallback done) {
  json data;
  data["inputName"] = options_.source_name;
  data["mediaAction"] = kMediaActionStop;
  dispatcher_.Submit("TriggerMediaInputAction", std::move(data),
                     [this, done](const RequestResult& result) { done(MapError(result)); });
}

void SourceController::EnsureSource(DoneCallback done) {
  json data;
  data["inputName"] = options_.source_name;
  dispatcher_.Submit("GetInputSettings", std::move(data),
                     [this, done](const RequestResult& result) {
                       if (result.ok()) {
                         auto kind = result.response_data.find("inputKind");
                         if (kind != result.response_data.end() && kind->is_string() &&
                             kind->get<std::string>() != InputKindFor(options_.source_kind)) {
                           logger_.Warn("playback source '" + options_.source_name +
                                        "' has kind " + kind->get<std::string>() +
                                        ", expected " + InputKindFor(options_.source_kind));
                         }
                         done(std::nullopt);
                         return;
                       }
                       if (result.status_code != kRequestStatusResourceNotFound ||
                           !options_.create_if_missing) {
                         done(MapError(result));
                         return;
                       }
                       CreateSource(done);
                     });
}

void SourceController::CreateSource(DoneCallback done) {
  dispatcher_.Submit(
      "GetCurrentProgramScene", json::object(), [this, done](const RequestResult& result) {
        if (!result.ok()) {
          done(result.error);
          return;
        }
        std::string scene;
        for (const char* key : {"currentProgramSceneName", "sceneName"}) {
          auto it = result.response_data.find(key);
          if (it != result.response_data.end() && it->is_string()) {
            scene = it->get<std::string>();
            break;
          }
        }
        if (scene.empty()) {
          done(Error{ErrorKind::kMalformedMessage,
                     "GetCurrentProgramScene response has no scene name", 0});
          return;
        }
        json create;
        create["sceneName"] = scene;
        create["inputName"] = options_.source_name;
        create["inputKind"] = InputKindFor(options_.source_kind);
        create["inputSettings"] = BuildInputSettings(options_.source_kind, {});
        create["sceneItemEnabled"] = true;
        dispatcher_.Submit("CreateInput", std::move(create),
                           [this, done, scene](const RequestResult& created) {
                             if (created.ok()) {
                               logger_.Info("created playback source '" +
                                            options_.source_name + "' in scene '" + scene +
                                            "'");
                               done(std::nullopt);
                               return;
                             }
                             done(created.error);
                           });
      });
}

}  // namespace replaycue
