// Repository: Mediacore-player
// Component: Playback Controller Implementation
// Purpose: Single entry point for transport commands. Owns the playback
//          state machine and sequences the decoder engine and audio sink.
// Copyright (c) 2025 Mediacore

#include "mediacore/runtime/PlaybackController.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <utility>

#include "mediacore/audio/SdlAudioDevice.h"
#include "mediacore/buffer/SampleRing.hpp"
#include "mediacore/util/Logger.hpp"

namespace mediacore::runtime {

namespace {

constexpr const char* kEngineUnavailable = "engine unavailable";

double ClampOrZero(double value, double lo, double hi) {
  if (std::isnan(value)) return lo;
  return std::clamp(value, lo, hi);
}

}  // namespace

const char* PlaybackStateName(PlaybackState state) {
  switch (state) {
    case PlaybackState::kStopped:
      return "Stopped";
    case PlaybackState::kPlaying:
      return "Playing";
    case PlaybackState::kPaused:
      return "Paused";
    case PlaybackState::kEnded:
      return "Ended";
  }
  return "Unknown";
}

PlayerConfig::PlayerConfig()
    : sample_ring_capacity(buffer::SampleRing::kDefaultCapacity),
      default_volume(0.8),
      device_factory([] { return std::make_unique<audio::SdlAudioDevice>(); }) {}

PlaybackController::PlaybackController(const PlayerConfig& config)
    : config_(config),
      clock_(config.time_source),
      volume_(ClampOrZero(config.default_volume, 0.0, 1.0)) {
  EngineConfig engine_config = config_.engine;
  engine_config.default_volume = volume_;
  engine_ = std::make_unique<DecoderEngine>(engine_config);
  if (!engine_->Start()) {
    util::Logger::Error("[PlaybackController] Decoder engine failed to start");
  }
}

PlaybackController::~PlaybackController() {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_.reset();
  engine_->Shutdown();
}

// ============================================================================
// Transport commands
// ============================================================================

ControllerResult PlaybackController::Load(const std::string& path, VideoOutlet video_outlet) {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();

  // At most one session: the previous one is fully torn down first.
  ControllerResult stopped = StopLocked();
  if (!stopped.success) {
    return stopped;
  }
  info_ = buffer::MediaInfo();

  const uint64_t load_id = ++next_load_id_;
  util::Logger::Info("[PlaybackController] Load " + path);
  if (!engine_->SendCommand(Command::Load(load_id, path, std::move(video_outlet), ++generation_))) {
    return Unavailable();
  }

  LoadOutcome outcome;
  std::string error;
  if (!WaitForLoadOutcome(load_id, outcome, error)) {
    util::Logger::Error("[PlaybackController] Load failed: " + error);
    return ControllerResult(false, error);
  }
  if (!outcome.success) {
    std::string message = "failed to load " + path + ": " + outcome.error;
    util::Logger::Error("[PlaybackController] " + message);
    return ControllerResult(false, message);
  }

  // Events still queued belong to the previous session.
  EngineEvent stale;
  while (engine_->events().TryReceive(stale) == buffer::ChannelStatus::kOk) {
  }

  info_ = outcome.info;
  session_loaded_ = true;

  if (info_.has_audio && !StartAudioOutput(error)) {
    std::string message = "failed to load " + path + ": " + error;
    util::Logger::Error("[PlaybackController] " + message);
    StopLocked();
    info_ = buffer::MediaInfo();
    return ControllerResult(false, message);
  }

  state_ = PlaybackState::kStopped;
  clock_.Reset();

  std::ostringstream oss;
  oss << "[PlaybackController] Loaded " << path << " duration=" << info_.duration
      << "s audio=" << info_.has_audio << " video=" << info_.has_video;
  util::Logger::Info(oss.str());
  return Succeed("loaded");
}

ControllerResult PlaybackController::Play() {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();
  return PlayLocked();
}

ControllerResult PlaybackController::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();
  return PauseLocked();
}

ControllerResult PlaybackController::TogglePlayback() {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();
  ControllerResult result = state_ == PlaybackState::kPlaying ? PauseLocked() : PlayLocked();
  result.is_playing = state_ == PlaybackState::kPlaying;
  return result;
}

ControllerResult PlaybackController::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();
  return StopLocked();
}

ControllerResult PlaybackController::Seek(double seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();

  const double target = ClampOrZero(seconds, 0.0, info_.duration);
  if (!engine_->SendCommand(Command::Seek(target, ++generation_))) {
    return Unavailable();
  }

  // Cached without waiting for the engine.
  clock_.SetPosition(target);

  ControllerResult result = Succeed();
  result.position = target;
  return result;
}

ControllerResult PlaybackController::SetVolume(double level) {
  std::lock_guard<std::mutex> lock(mutex_);
  PumpEventsLocked();

  volume_ = ClampOrZero(level, 0.0, 1.0);
  if (!engine_->SendCommand(Command::WithValue(Command::Type::kSetVolume, volume_))) {
    return Unavailable();
  }

  ControllerResult result = Succeed();
  result.volume = volume_;
  return result;
}

PlayerStatus PlaybackController::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return StatusLocked();
}

PumpCounts PlaybackController::PumpEvents() {
  std::lock_guard<std::mutex> lock(mutex_);
  return PumpEventsLocked();
}

void PlaybackController::ShutdownEngine() {
  std::lock_guard<std::mutex> lock(mutex_);
  engine_->Shutdown();
}

bool PlaybackController::HasAudioSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sink_ != nullptr;
}

// ============================================================================
// Locked helpers
// ============================================================================

ControllerResult PlaybackController::PlayLocked() {
  if (state_ == PlaybackState::kPlaying) {
    return Succeed("already playing");
  }
  if (!session_loaded_) {
    return ControllerResult(false, "no media loaded");
  }
  if (!engine_->SendCommand(Command::Simple(Command::Type::kPlay))) {
    return Unavailable();
  }
  if (sink_) {
    sink_->Play();
  }
  state_ = PlaybackState::kPlaying;
  clock_.Start();
  return Succeed("playing");
}

ControllerResult PlaybackController::PauseLocked() {
  if (state_ != PlaybackState::kPlaying) {
    return Succeed("not playing");
  }
  if (!engine_->SendCommand(Command::Simple(Command::Type::kPause))) {
    return Unavailable();
  }
  if (sink_) {
    sink_->Pause();
  }
  clock_.Pause();
  clock_.SetPosition(CurrentTimeLocked());
  state_ = PlaybackState::kPaused;
  return Succeed("paused");
}

ControllerResult PlaybackController::StopLocked() {
  const bool sent = engine_->SendCommand(Command::Simple(Command::Type::kStop));

  if (sink_) {
    sink_->Stop();
    sink_.reset();
  }
  session_loaded_ = false;
  state_ = PlaybackState::kStopped;
  clock_.Reset();

  if (!sent) {
    return Unavailable();
  }
  return Succeed("stopped");
}

PumpCounts PlaybackController::PumpEventsLocked() {
  PumpCounts counts;
  EngineEvent event;
  while (engine_->events().TryReceive(event) == buffer::ChannelStatus::kOk) {
    if (event.type == EngineEvent::Type::kAudioFrame) {
      counts.audio_frames++;
      continue;
    }

    if (event.generation < generation_) {
      // Emitted before the engine applied our latest Seek. The engine cleared
      // its playing flag when it emitted this, so restore it if we still play.
      counts.stale_end_of_stream++;
      util::Logger::Debug("[PlaybackController] Ignoring end of stream from before seek");
      if (state_ == PlaybackState::kPlaying &&
          !engine_->SendCommand(Command::Simple(Command::Type::kPlay))) {
        util::Logger::Warn(std::string("[PlaybackController] Resume after seek failed: ") +
                           kEngineUnavailable);
      }
      continue;
    }

    counts.end_of_stream++;
    if (state_ == PlaybackState::kPlaying) {
      if (sink_) {
        sink_->Pause();
      }
      clock_.Pause();
      clock_.SetPosition(info_.duration);
      state_ = PlaybackState::kEnded;
      util::Logger::Info("[PlaybackController] Playback ended");
    }
  }
  return counts;
}

bool PlaybackController::WaitForLoadOutcome(uint64_t load_id, LoadOutcome& outcome,
                                            std::string& error) {
  auto& outcomes = engine_->load_outcomes();
  const auto timeout = config_.engine.load_timeout;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    buffer::ChannelStatus status;
    if (timeout.count() > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);
      status = outcomes.ReceiveFor(outcome, remaining);
    } else {
      status = outcomes.Receive(outcome) ? buffer::ChannelStatus::kOk
                                         : buffer::ChannelStatus::kClosed;
    }

    if (status == buffer::ChannelStatus::kOk) {
      if (outcome.load_id == load_id) {
        return true;
      }
      continue;  // Outcome of an abandoned load
    }

    if (status == buffer::ChannelStatus::kTimeout) {
      error = "timed out waiting for media info";
      // Drop whatever session the engine is still opening.
      if (!engine_->SendCommand(Command::Simple(Command::Type::kStop))) {
        error = kEngineUnavailable;
      }
      return false;
    }

    error = kEngineUnavailable;
    return false;
  }
}

bool PlaybackController::StartAudioOutput(std::string& error) {
  auto ring = std::make_shared<buffer::SampleRing>(config_.sample_ring_capacity);

  std::unique_ptr<audio::IAudioDevice> device;
  if (config_.device_factory) {
    device = config_.device_factory();
  }

  sink_ = audio::AudioSink::Create(config_.sink, ring, std::move(device), &error);
  if (!sink_) {
    return false;
  }

  if (!engine_->SendCommand(Command::AttachSamples(std::move(ring)))) {
    sink_.reset();
    error = kEngineUnavailable;
    return false;
  }
  return true;
}

double PlaybackController::CurrentTimeLocked() const {
  const double position = std::max(0.0, clock_.Position());
  if (info_.duration > 0.0) {
    return std::min(position, info_.duration);
  }
  return position;
}

PlayerStatus PlaybackController::StatusLocked() const {
  PlayerStatus status;
  status.state = state_;
  status.is_playing = state_ == PlaybackState::kPlaying;
  status.current_time = CurrentTimeLocked();
  status.duration = info_.duration;
  status.volume = volume_;
  status.file_path = info_.source_path;
  status.has_video = info_.has_video;
  status.has_audio = info_.has_audio;
  status.video_width = info_.video_width;
  status.video_height = info_.video_height;
  return status;
}

ControllerResult PlaybackController::Succeed(const std::string& message) const {
  ControllerResult result(true, message);
  result.status = StatusLocked();
  result.volume = volume_;
  result.position = result.status.current_time;
  result.is_playing = result.status.is_playing;
  return result;
}

ControllerResult PlaybackController::Unavailable() const {
  util::Logger::Warn(std::string("[PlaybackController] ") + kEngineUnavailable);
  ControllerResult result(false, kEngineUnavailable);
  result.status = StatusLocked();
  return result;
}

}  // namespace mediacore::runtime
