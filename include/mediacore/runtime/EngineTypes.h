// Repository: Mediacore-player
// Component: Engine Types
// Purpose: Messages exchanged between the playback controller and the
//          decoder engine thread, plus engine configuration.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_RUNTIME_ENGINE_TYPES_H_
#define MEDIACORE_RUNTIME_ENGINE_TYPES_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "mediacore/buffer/Channel.hpp"
#include "mediacore/buffer/MediaTypes.h"
#include "mediacore/buffer/SampleRing.hpp"
#include "mediacore/decode/FFmpegDecoder.h"

namespace mediacore::runtime {

// Per-load destination for decoded video frames.
using VideoOutlet = std::shared_ptr<buffer::Channel<buffer::VideoFrame>>;

// Per-load sample ring shared by the engine (producer) and sink (consumer).
using SampleRingPtr = std::shared_ptr<buffer::SampleRing>;

// Command is the only way the controller mutates engine-thread state.
struct Command {
  enum class Type {
    kLoad,
    kAttachSamples,
    kPlay,
    kPause,
    kStop,
    kSeek,
    kSetVolume,
  };

  Type type = Type::kStop;
  uint64_t load_id = 0;       // kLoad
  std::string path;           // kLoad
  VideoOutlet video_outlet;   // kLoad (optional)
  SampleRingPtr samples;      // kAttachSamples
  double value = 0.0;         // kSeek (seconds), kSetVolume (level)
  uint64_t generation = 0;    // kLoad, kSeek: stamped on later events

  static Command Load(uint64_t id, std::string file_path, VideoOutlet outlet,
                      uint64_t generation = 0) {
    Command cmd;
    cmd.type = Type::kLoad;
    cmd.load_id = id;
    cmd.path = std::move(file_path);
    cmd.video_outlet = std::move(outlet);
    cmd.generation = generation;
    return cmd;
  }

  static Command Seek(double seconds, uint64_t generation) {
    Command cmd;
    cmd.type = Type::kSeek;
    cmd.value = seconds;
    cmd.generation = generation;
    return cmd;
  }

  static Command AttachSamples(SampleRingPtr ring) {
    Command cmd;
    cmd.type = Type::kAttachSamples;
    cmd.samples = std::move(ring);
    return cmd;
  }

  static Command Simple(Type t) {
    Command cmd;
    cmd.type = t;
    return cmd;
  }

  static Command WithValue(Type t, double v) {
    Command cmd;
    cmd.type = t;
    cmd.value = v;
    return cmd;
  }
};

// Emitted on the engine's unbounded event outlet.
struct EngineEvent {
  enum class Type {
    kAudioFrame,   // One sample buffer was handed to the sample ring
    kEndOfStream,  // Source exhausted while playing
  };

  Type type = Type::kAudioFrame;
  double timestamp = 0.0;   // seconds (kAudioFrame)
  size_t sample_count = 0;  // interleaved samples (kAudioFrame)

  // Generation of the last Load or Seek the engine had applied when the event
  // was produced. An event older than the receiver's last Seek is stale.
  uint64_t generation = 0;
};

// Result of one Load command, published on the capacity-1 info outlet.
struct LoadOutcome {
  uint64_t load_id = 0;
  bool success = false;
  std::string error;
  buffer::MediaInfo info;
};

struct EngineConfig {
  size_t command_capacity;
  std::chrono::milliseconds idle_sleep;
  // How long the controller waits for a load outcome; 0 waits forever.
  std::chrono::milliseconds load_timeout;
  decode::DecoderConfig decoder;  // Template; input_uri is set per load
  double default_volume;

  EngineConfig()
      : command_capacity(32),
        idle_sleep(10),
        load_timeout(0),
        default_volume(0.8) {}
};

}  // namespace mediacore::runtime

#endif  // MEDIACORE_RUNTIME_ENGINE_TYPES_H_
