#pragma once

#include "replaycue/dispatcher.h"
#include "replaycue/log.h"
#include "replaycue/replaycue.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace replaycue {

constexpr const char* kVlcSourceInputKind = "vlc_source";
constexpr const char* kMediaSourceInputKind = "ffmpeg_source";
constexpr const char* kMediaActionRestart = "OBS_WEBSOCKET_MEDIA_INPUT_ACTION_RESTART";
constexpr const char* kMediaActionStop = "OBS_WEBSOCKET_MEDIA_INPUT_ACTION_STOP";

struct SourceOptions {
  std::string source_name = "Replay";
  SourceKind source_kind = SourceKind::kVlcSource;
  bool create_if_missing = false;
  bool restart_on_set = true;
};

/**
 * Points the remote playback source at saved clips.
 *
 * All operations are request sequences submitted through the dispatcher.
 * A ResourceNotFound status maps to kSourceNotFound.
 */
class SourceController {
 public:
  using DoneCallback = std::function<void(const std::optional<Error>&)>;

  SourceController(RequestDispatcher& dispatcher, SourceOptions options,
                   Logger logger = Logger());

  /// Load one clip into the source and (optionally) restart playback.
  void SetMedia(const std::string& path, DoneCallback done);
  /// Load several clips; only a VLC source can hold more than one.
  void SetPlaylist(const std::vector<std::string>& paths, DoneCallback done);
  /// Stop playback on the source.
  void StopMedia(DoneCallback done);
  /// Check the source exists; create it in the program scene when allowed.
  void EnsureSource(DoneCallback done);

  /// inputSettings for the given clips and source kind.
  static nlohmann::json BuildInputSettings(SourceKind kind,
                                           const std::vector<std::string>& paths);
  static const char* InputKindFor(SourceKind kind);

  const SourceOptions& options() const { return options_; }

 private:
  void CreateSource(DoneCallback done);
  std::optional<Error> MapError(const RequestResult& result) const;

  RequestDispatcher& dispatcher_;
  SourceOptions options_;
  Logger logger_;
};

}  // namespace replaycue
