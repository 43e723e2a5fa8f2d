// Repository: Mediacore-player
// Component: SDL Audio Device
// Purpose: IAudioDevice backed by SDL2's callback-driven audio device API.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_AUDIO_SDL_AUDIO_DEVICE_H_
#define MEDIACORE_AUDIO_SDL_AUDIO_DEVICE_H_

#include <cstdint>
#include <string>

#include "mediacore/audio/IAudioDevice.h"

namespace mediacore::audio {

// SdlAudioDevice opens the default output device as AUDIO_F32SYS. SDL
// converts to the hardware format, so the requested format is always honored.
//
// Each instance holds one reference on SDL's audio subsystem.
class SdlAudioDevice : public IAudioDevice {
 public:
  SdlAudioDevice() = default;
  ~SdlAudioDevice() override;

  SdlAudioDevice(const SdlAudioDevice&) = delete;
  SdlAudioDevice& operator=(const SdlAudioDevice&) = delete;

  bool Open(const AudioDeviceFormat& format, AudioRenderCallback callback) override;
  bool Resume() override;
  bool Pause() override;
  void Close() override;
  std::string LastError() const override { return last_error_; }

 private:
  static void AudioCallback(void* userdata, uint8_t* stream, int len);

  AudioRenderCallback callback_;
  uint32_t device_id_ = 0;
  bool subsystem_initialized_ = false;
  std::string last_error_;
};

}  // namespace mediacore::audio

#endif  // MEDIACORE_AUDIO_SDL_AUDIO_DEVICE_H_
