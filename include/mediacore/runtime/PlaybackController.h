// Repository: Mediacore-player
// Component: Playback Controller
// Purpose: Single entry point for transport commands. Owns the playback
//          state machine and sequences the decoder engine and audio sink.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_RUNTIME_PLAYBACK_CONTROLLER_H_
#define MEDIACORE_RUNTIME_PLAYBACK_CONTROLLER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "mediacore/audio/AudioSink.h"
#include "mediacore/audio/IAudioDevice.h"
#include "mediacore/buffer/MediaTypes.h"
#include "mediacore/runtime/DecoderEngine.h"
#include "mediacore/runtime/EngineTypes.h"
#include "mediacore/timing/PlaybackClock.h"
#include "time/ITimeSource.hpp"

namespace mediacore::runtime {

enum class PlaybackState {
  kStopped,
  kPlaying,
  kPaused,
  kEnded,
};

const char* PlaybackStateName(PlaybackState state);

// Immutable status snapshot.
struct PlayerStatus {
  bool is_playing = false;
  double current_time = 0.0;
  double duration = 0.0;
  double volume = 0.0;
  std::string file_path;
  bool has_video = false;
  bool has_audio = false;
  uint32_t video_width = 0;
  uint32_t video_height = 0;
  PlaybackState state = PlaybackState::kStopped;
};

// Result structure for controller operations
struct ControllerResult {
  bool success;
  std::string message;
  PlayerStatus status;

  // For Seek
  double position = 0.0;

  // For SetVolume
  double volume = 0.0;

  // For TogglePlayback
  bool is_playing = false;

  ControllerResult(bool s, const std::string& msg)
      : success(s), message(msg) {}
};

// Events observed by one PumpEvents() call.
struct PumpCounts {
  size_t audio_frames = 0;
  size_t end_of_stream = 0;
  // End-of-stream events produced before the latest Seek; not acted on.
  size_t stale_end_of_stream = 0;
};

struct PlayerConfig {
  EngineConfig engine;
  audio::AudioSinkConfig sink;
  size_t sample_ring_capacity;
  double default_volume;

  // Creates the output device for each load with audio. Defaults to SDL2.
  audio::AudioDeviceFactory device_factory;

  // Drives the reporting clock. Defaults to the system monotonic clock.
  std::shared_ptr<ITimeSource> time_source;

  PlayerConfig();
};

// PlaybackController owns the engine handle, an optional audio sink (only
// while the loaded source has audio), the playback state and the cached
// transport fields.
//
// All calls are serialized by one mutex. Every command first drains the
// engine's event outlet (PumpEvents) so end of stream is observed before the
// command is applied. Status() is a pure read.
//
// Commands fail with "engine unavailable" once the engine has gone away.
class PlaybackController {
 public:
  explicit PlaybackController(const PlayerConfig& config = PlayerConfig());
  ~PlaybackController();

  // Disable copy and move
  PlaybackController(const PlaybackController&) = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  // Stops the current session, loads `path`, and blocks for its media info.
  // Decoded video goes to `video_outlet` when given.
  ControllerResult Load(const std::string& path, VideoOutlet video_outlet = nullptr);

  // Valid from Stopped/Paused/Ended with media loaded; no-op when Playing.
  ControllerResult Play();

  // Only acts when Playing; otherwise a successful no-op.
  ControllerResult Pause();

  // Pause if Playing, else Play. result.is_playing is the new flag.
  ControllerResult TogglePlayback();

  // Full teardown of the session. Always safe, including with nothing loaded.
  ControllerResult Stop();

  // Clamps to [0, duration]; result.position is the stored value.
  ControllerResult Seek(double seconds);

  // Clamps to [0, 1]; result.volume is the stored value.
  ControllerResult SetVolume(double level);

  PlayerStatus Status() const;

  // Drains the engine event outlet. End of stream moves Playing to Ended.
  PumpCounts PumpEvents();

  // Disconnects the decoder engine. Later commands fail as unavailable.
  void ShutdownEngine();

  bool HasAudioSink() const;

 private:
  ControllerResult PlayLocked();
  ControllerResult PauseLocked();
  ControllerResult StopLocked();
  PumpCounts PumpEventsLocked();

  // Waits for the outcome tagged `load_id`, skipping stale ones.
  bool WaitForLoadOutcome(uint64_t load_id, LoadOutcome& outcome, std::string& error);

  // Builds ring + sink and attaches the ring to the engine.
  bool StartAudioOutput(std::string& error);

  double CurrentTimeLocked() const;
  PlayerStatus StatusLocked() const;
  ControllerResult Succeed(const std::string& message = "") const;
  ControllerResult Unavailable() const;

  PlayerConfig config_;
  mutable std::mutex mutex_;

  std::unique_ptr<DecoderEngine> engine_;
  std::unique_ptr<audio::AudioSink> sink_;
  timing::PlaybackClock clock_;

  PlaybackState state_ = PlaybackState::kStopped;
  buffer::MediaInfo info_;
  bool session_loaded_ = false;
  double volume_;
  uint64_t next_load_id_ = 0;

  // Bumped on every Load and Seek; the engine stamps it on its events.
  uint64_t generation_ = 0;
};

}  // namespace mediacore::runtime

#endif  // MEDIACORE_RUNTIME_PLAYBACK_CONTROLLER_H_
