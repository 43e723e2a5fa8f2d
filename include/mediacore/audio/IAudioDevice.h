// Repository: Mediacore-player
// Component: IAudioDevice Interface
// Purpose: Seam between the audio sink and the platform output device.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_AUDIO_IAUDIO_DEVICE_H_
#define MEDIACORE_AUDIO_IAUDIO_DEVICE_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace mediacore::audio {

// Output format requested from the device. Samples are interleaved f32.
struct AudioDeviceFormat {
  int sample_rate = 0;
  int channels = 0;
  int period_frames = 0;  // Requested callback size in frames (hint)
};

// Invoked on the device's real-time thread with `sample_count` interleaved
// f32 samples to fill. Must not block, allocate, or throw.
using AudioRenderCallback = std::function<void(float* out, size_t sample_count)>;

// IAudioDevice is a callback-driven output stream.
//
// Lifecycle:
// 1. Open() with format and callback (stream is paused)
// 2. Resume() / Pause() any number of times
// 3. Close(); no callback runs after Close() returns
class IAudioDevice {
 public:
  virtual ~IAudioDevice() = default;

  // Opens the default output device. Returns false on failure; see LastError().
  virtual bool Open(const AudioDeviceFormat& format, AudioRenderCallback callback) = 0;

  virtual bool Resume() = 0;
  virtual bool Pause() = 0;

  // Safe to call multiple times.
  virtual void Close() = 0;

  virtual std::string LastError() const = 0;
};

// Produces a fresh device per load.
using AudioDeviceFactory = std::function<std::unique_ptr<IAudioDevice>()>;

}  // namespace mediacore::audio

#endif  // MEDIACORE_AUDIO_IAUDIO_DEVICE_H_
