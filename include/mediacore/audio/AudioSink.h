// Repository: Mediacore-player
// Component: Audio Sink
// Purpose: Real-time audio output. Drains the per-load sample ring from the
//          device callback and services pause/resume/stop on a control thread.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_AUDIO_AUDIO_SINK_H_
#define MEDIACORE_AUDIO_AUDIO_SINK_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "mediacore/audio/IAudioDevice.h"
#include "mediacore/buffer/Channel.hpp"
#include "mediacore/buffer/MediaTypes.h"
#include "mediacore/buffer/SampleRing.hpp"

namespace mediacore::audio {

struct AudioSinkConfig {
  int sample_rate;
  int channels;
  int period_frames;
  size_t control_capacity;

  AudioSinkConfig()
      : sample_rate(buffer::kOutputSampleRate),
        channels(buffer::kOutputChannels),
        period_frames(1024),
        control_capacity(16) {}
};

// Requests handled by the sink's control thread.
enum class SinkControl {
  kPlay,
  kPause,
  kStop,
};

// AudioSink renders the samples an engine writes into a SampleRing.
//
// Construction opens the device and starts it immediately (autoplay).
// Play/Pause/Stop are fire-and-forget requests to the control thread.
//
// The device callback (FillBuffer) never blocks, allocates, or throws:
// queued samples are copied in order and any shortfall is zero-filled.
//
// Destruction stops the control thread and closes the device; no callback
// runs afterwards.
class AudioSink {
 private:
  // Restricts construction to Create().
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  // Returns nullptr if the device cannot be opened or started.
  // On failure, *error (if non-null) receives the reason.
  static std::unique_ptr<AudioSink> Create(const AudioSinkConfig& config,
                                           std::shared_ptr<buffer::SampleRing> ring,
                                           std::unique_ptr<IAudioDevice> device,
                                           std::string* error = nullptr);

  AudioSink(PrivateTag tag,
            const AudioSinkConfig& config,
            std::shared_ptr<buffer::SampleRing> ring,
            std::unique_ptr<IAudioDevice> device);
  ~AudioSink();

  AudioSink(const AudioSink&) = delete;
  AudioSink& operator=(const AudioSink&) = delete;

  void Play();
  void Pause();

  // Pauses the stream and ends the control thread. Later requests are ignored.
  void Stop();

  // Real-time fill; called by the device. Public for tests.
  void FillBuffer(float* out, size_t sample_count);

  // True while the device is running (not paused or stopped), as last
  // applied by the control thread.
  bool IsPlaying() const { return playing_.load(std::memory_order_acquire); }
  bool IsStopped() const { return stopped_.load(std::memory_order_acquire); }

  uint64_t CallbackCount() const { return callbacks_.load(std::memory_order_relaxed); }
  // Callbacks that had to emit any silence.
  uint64_t UnderrunCount() const { return underruns_.load(std::memory_order_relaxed); }

 private:
  void Request(SinkControl request);
  void ControlLoop();

  AudioSinkConfig config_;
  std::shared_ptr<buffer::SampleRing> ring_;
  std::unique_ptr<IAudioDevice> device_;

  buffer::Channel<SinkControl> control_;
  std::thread control_thread_;

  std::atomic<bool> playing_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> callbacks_{0};
  std::atomic<uint64_t> underruns_{0};
};

}  // namespace mediacore::audio

#endif  // MEDIACORE_AUDIO_AUDIO_SINK_H_
