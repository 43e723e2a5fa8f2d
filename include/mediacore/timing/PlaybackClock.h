// Repository: Mediacore-player
// Component: Playback Clock
// Purpose: Reporting clock for the current playback position.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_TIMING_PLAYBACK_CLOCK_H_
#define MEDIACORE_TIMING_PLAYBACK_CLOCK_H_

#include <cstdint>
#include <memory>

#include "time/ITimeSource.hpp"

namespace mediacore::timing {

// PlaybackClock maps monotonic time to a media position in seconds:
//   position = anchor + (now - start) while running, anchor while paused.
//
// Used for status reporting only; it never paces decoding.
// Not thread-safe: owned by the playback controller.
class PlaybackClock {
 public:
  explicit PlaybackClock(std::shared_ptr<ITimeSource> time_source);

  // Starts advancing from the current position. No-op if running.
  void Start();

  // Freezes at the current position. No-op if paused.
  void Pause();

  // Re-anchors at `seconds`, keeping the running state.
  void SetPosition(double seconds);

  // Pauses and re-anchors at 0.
  void Reset();

  double Position() const;
  bool IsRunning() const { return running_; }

 private:
  std::shared_ptr<ITimeSource> time_source_;
  double anchor_seconds_ = 0.0;
  int64_t start_us_ = 0;
  bool running_ = false;
};

}  // namespace mediacore::timing

#endif  // MEDIACORE_TIMING_PLAYBACK_CLOCK_H_
