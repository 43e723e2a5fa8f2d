// Repository: Mediacore-player
// Component: Playback Clock
// Purpose: Reporting clock for the current playback position.
// Copyright (c) 2025 Mediacore

#include "mediacore/timing/PlaybackClock.h"

#include <utility>

#include "time/SystemTimeSource.hpp"

namespace mediacore::timing {

PlaybackClock::PlaybackClock(std::shared_ptr<ITimeSource> time_source)
    : time_source_(time_source ? std::move(time_source)
                               : std::make_shared<SystemTimeSource>()) {}

void PlaybackClock::Start() {
  if (running_) return;
  start_us_ = time_source_->NowMonotonicUs();
  running_ = true;
}

void PlaybackClock::Pause() {
  if (!running_) return;
  anchor_seconds_ = Position();
  running_ = false;
}

void PlaybackClock::SetPosition(double seconds) {
  anchor_seconds_ = seconds;
  start_us_ = time_source_->NowMonotonicUs();
}

void PlaybackClock::Reset() {
  running_ = false;
  anchor_seconds_ = 0.0;
}

double PlaybackClock::Position() const {
  if (!running_) {
    return anchor_seconds_;
  }
  const int64_t elapsed_us = time_source_->NowMonotonicUs() - start_us_;
  return anchor_seconds_ + static_cast<double>(elapsed_us) / 1'000'000.0;
}

}  // namespace mediacore::timing
