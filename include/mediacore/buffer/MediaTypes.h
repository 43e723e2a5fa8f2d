// Repository: Mediacore-player
// Component: Media Types
// Purpose: Value types exchanged between decoder engine, audio sink and callers.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_BUFFER_MEDIA_TYPES_H_
#define MEDIACORE_BUFFER_MEDIA_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>

namespace mediacore::buffer {

// Fixed output format for all decoded audio, regardless of source format.
constexpr int kOutputSampleRate = 44100;
constexpr int kOutputChannels = 2;

// Fixed output pixel layout for decoded video: tightly packed RGBA.
constexpr int kRgbaBytesPerPixel = 4;

// VideoFrame is a decoded, rescaled picture at the source's native size.
// pixels.size() == width * height * 4. Ownership moves to the consumer on send.
struct VideoFrame {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> pixels;
  double timestamp = 0.0;  // seconds, from the stream time base
};

// AudioFrame holds interleaved stereo f32 samples at kOutputSampleRate.
// samples.size() is a multiple of kOutputChannels.
struct AudioFrame {
  std::vector<float> samples;
  double timestamp = 0.0;  // seconds, from the stream time base

  size_t FrameCount() const { return samples.size() / kOutputChannels; }
};

// MediaInfo describes a successfully loaded source. Produced once per load.
struct MediaInfo {
  bool has_video = false;
  bool has_audio = false;
  uint32_t video_width = 0;
  uint32_t video_height = 0;
  double duration = 0.0;  // seconds; 0 when the container does not say
  std::string source_path;
};

}  // namespace mediacore::buffer

#endif  // MEDIACORE_BUFFER_MEDIA_TYPES_H_
