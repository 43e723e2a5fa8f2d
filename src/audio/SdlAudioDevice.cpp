// Repository: Mediacore-player
// Component: SDL Audio Device
// Purpose: IAudioDevice backed by SDL2's callback-driven audio device API.
// Copyright (c) 2025 Mediacore

#include "mediacore/audio/SdlAudioDevice.h"

#include <sstream>
#include <utility>

#include <SDL2/SDL.h>

#include "mediacore/util/Logger.hpp"

namespace mediacore::audio {

SdlAudioDevice::~SdlAudioDevice() {
  Close();
}

bool SdlAudioDevice::Open(const AudioDeviceFormat& format, AudioRenderCallback callback) {
  if (device_id_ != 0) {
    last_error_ = "device already open";
    return false;
  }

  if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
    last_error_ = std::string("SDL_InitSubSystem(AUDIO) failed: ") + SDL_GetError();
    util::Logger::Error("[SdlAudioDevice] " + last_error_);
    return false;
  }
  subsystem_initialized_ = true;
  callback_ = std::move(callback);

  SDL_AudioSpec want;
  SDL_zero(want);
  want.freq = format.sample_rate;
  want.format = AUDIO_F32SYS;
  want.channels = static_cast<Uint8>(format.channels);
  want.samples = static_cast<Uint16>(format.period_frames);
  want.callback = &SdlAudioDevice::AudioCallback;
  want.userdata = this;

  SDL_AudioSpec have;
  SDL_zero(have);
  // No allowed changes: SDL converts to whatever the hardware wants.
  device_id_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
  if (device_id_ == 0) {
    last_error_ = std::string("SDL_OpenAudioDevice failed: ") + SDL_GetError();
    util::Logger::Error("[SdlAudioDevice] " + last_error_);
    Close();
    return false;
  }

  std::ostringstream oss;
  oss << "[SdlAudioDevice] Opened device " << device_id_
      << " rate=" << have.freq << " channels=" << static_cast<int>(have.channels)
      << " period=" << have.samples;
  util::Logger::Info(oss.str());
  return true;
}

bool SdlAudioDevice::Resume() {
  if (device_id_ == 0) {
    last_error_ = "device not open";
    return false;
  }
  SDL_PauseAudioDevice(device_id_, 0);
  return true;
}

bool SdlAudioDevice::Pause() {
  if (device_id_ == 0) {
    last_error_ = "device not open";
    return false;
  }
  SDL_PauseAudioDevice(device_id_, 1);
  return true;
}

void SdlAudioDevice::Close() {
  if (device_id_ != 0) {
    // Blocks until any in-flight callback has returned.
    SDL_CloseAudioDevice(device_id_);
    util::Logger::Debug("[SdlAudioDevice] Closed device " + std::to_string(device_id_));
    device_id_ = 0;
  }
  if (subsystem_initialized_) {
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
    subsystem_initialized_ = false;
  }
}

void SdlAudioDevice::AudioCallback(void* userdata, uint8_t* stream, int len) {
  auto* self = static_cast<SdlAudioDevice*>(userdata);
  self->callback_(reinterpret_cast<float*>(stream),
                  static_cast<size_t>(len) / sizeof(float));
}

}  // namespace mediacore::audio
