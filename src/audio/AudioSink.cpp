// Repository: Mediacore-player
// Component: Audio Sink
// Purpose: Real-time audio output. Drains the per-load sample ring from the
//          device callback and services pause/resume/stop on a control thread.
// Copyright (c) 2025 Mediacore

#include "mediacore/audio/AudioSink.h"

#include <cstring>
#include <memory>
#include <sstream>
#include <utility>

#include "mediacore/util/Logger.hpp"

namespace mediacore::audio {

std::unique_ptr<AudioSink> AudioSink::Create(const AudioSinkConfig& config,
                                             std::shared_ptr<buffer::SampleRing> ring,
                                             std::unique_ptr<IAudioDevice> device,
                                             std::string* error) {
  auto fail = [error](const std::string& message) -> std::unique_ptr<AudioSink> {
    util::Logger::Error("[AudioSink] " + message);
    if (error) *error = message;
    return nullptr;
  };

  if (!ring) {
    return fail("no sample ring");
  }
  if (!device) {
    return fail("no audio device available");
  }

  auto sink = std::make_unique<AudioSink>(PrivateTag{}, config, std::move(ring), std::move(device));

  AudioDeviceFormat format;
  format.sample_rate = config.sample_rate;
  format.channels = config.channels;
  format.period_frames = config.period_frames;

  AudioSink* raw = sink.get();
  if (!sink->device_->Open(format, [raw](float* out, size_t count) {
        raw->FillBuffer(out, count);
      })) {
    return fail("failed to open audio device: " + sink->device_->LastError());
  }

  // Autoplay: audible output starts on construction.
  if (!sink->device_->Resume()) {
    std::string reason = sink->device_->LastError();
    sink->device_->Close();
    return fail("failed to start audio device: " + reason);
  }
  sink->playing_.store(true, std::memory_order_release);

  sink->control_thread_ = std::thread(&AudioSink::ControlLoop, raw);

  std::ostringstream oss;
  oss << "[AudioSink] Started rate=" << config.sample_rate
      << " channels=" << config.channels;
  util::Logger::Info(oss.str());
  return sink;
}

AudioSink::AudioSink(PrivateTag /*tag*/,
                     const AudioSinkConfig& config,
                     std::shared_ptr<buffer::SampleRing> ring,
                     std::unique_ptr<IAudioDevice> device)
    : config_(config),
      ring_(std::move(ring)),
      device_(std::move(device)),
      control_(config.control_capacity) {}

AudioSink::~AudioSink() {
  Request(SinkControl::kStop);
  control_.Close();
  if (control_thread_.joinable()) {
    control_thread_.join();
  }
  // After Close() returns the device no longer calls FillBuffer.
  device_->Close();
  util::Logger::Debug("[AudioSink] Destroyed");
}

void AudioSink::Play() {
  Request(SinkControl::kPlay);
}

void AudioSink::Pause() {
  Request(SinkControl::kPause);
}

void AudioSink::Stop() {
  Request(SinkControl::kStop);
}

void AudioSink::Request(SinkControl request) {
  switch (control_.TrySend(request)) {
    case buffer::ChannelStatus::kOk:
      break;
    case buffer::ChannelStatus::kFull:
      util::Logger::Warn("[AudioSink] Control queue full; request dropped");
      break;
    default:
      // Control thread already gone (stopped).
      break;
  }
}

void AudioSink::ControlLoop() {
  SinkControl request;
  while (control_.Receive(request)) {
    if (request == SinkControl::kPlay) {
      if (!device_->Resume()) {
        util::Logger::Error("[AudioSink] Resume failed: " + device_->LastError());
        continue;
      }
      playing_.store(true, std::memory_order_release);
    } else if (request == SinkControl::kPause) {
      if (!device_->Pause()) {
        util::Logger::Error("[AudioSink] Pause failed: " + device_->LastError());
        continue;
      }
      playing_.store(false, std::memory_order_release);
    } else {
      if (!device_->Pause()) {
        util::Logger::Warn("[AudioSink] Pause on stop failed: " + device_->LastError());
      }
      playing_.store(false, std::memory_order_release);
      break;
    }
  }
  stopped_.store(true, std::memory_order_release);
  control_.Close();
}

void AudioSink::FillBuffer(float* out, size_t sample_count) {
  callbacks_.fetch_add(1, std::memory_order_relaxed);

  const size_t copied = ring_->Read(out, sample_count);
  if (copied < sample_count) {
    std::memset(out + copied, 0, (sample_count - copied) * sizeof(float));
    underruns_.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace mediacore::audio
