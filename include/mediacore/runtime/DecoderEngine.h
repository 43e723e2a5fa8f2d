// Repository: Mediacore-player
// Component: Decoder Engine
// Purpose: Dedicated thread owning the decode session. Driven by commands,
//          produces audio into the sample ring and video into the per-load
//          outlet, and reports through event and load-outcome outlets.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_RUNTIME_DECODER_ENGINE_H_
#define MEDIACORE_RUNTIME_DECODER_ENGINE_H_

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <thread>

#include "mediacore/buffer/Channel.hpp"
#include "mediacore/decode/FFmpegDecoder.h"
#include "mediacore/runtime/EngineTypes.h"

namespace mediacore::runtime {

// DecoderEngine runs "check commands, bounded work, repeat" on its own thread.
//
// Session states: NoSource -> Loaded -> Playing <-> Paused. Stop returns to
// NoSource. Reaching end of input while playing emits one kEndOfStream event
// and clears the playing flag but keeps the session, so Seek + Play resumes.
//
// Pacing is emergent: audio production stalls while the attached sample ring
// is full; video is not paced.
//
// Thread model:
// - SendCommand / Shutdown: any thread
// - events() / load_outcomes(): receive side for the controller
// - Everything else: engine thread only
class DecoderEngine {
 public:
  explicit DecoderEngine(const EngineConfig& config = EngineConfig());
  ~DecoderEngine();

  DecoderEngine(const DecoderEngine&) = delete;
  DecoderEngine& operator=(const DecoderEngine&) = delete;

  // Starts the engine thread. Returns false if already started.
  bool Start();

  // Disconnects the command inlet and joins the engine thread. The thread
  // tears down its session and closes both outlets on the way out.
  void Shutdown();

  // Enqueues a command (blocks while the inlet is full).
  // Returns false once the engine is gone.
  bool SendCommand(Command command);

  buffer::Channel<EngineEvent>& events() { return events_; }
  buffer::Channel<LoadOutcome>& load_outcomes() { return load_outcomes_; }

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  uint64_t AudioFramesEmitted() const { return audio_frames_emitted_.load(std::memory_order_relaxed); }
  uint64_t VideoFramesEmitted() const { return video_frames_emitted_.load(std::memory_order_relaxed); }
  uint64_t EndOfStreamCount() const { return end_of_stream_count_.load(std::memory_order_relaxed); }

 private:
  void Run();

  void HandleCommand(Command& command);
  void HandleLoad(Command& command);
  void HandleSeek(double seconds);

  // One bounded unit of decode work. Returns false when there was nothing
  // to do (no session, not playing, or sample ring full).
  bool DoWork();

  // Moves pending audio into the ring. Returns false if any remains.
  bool FlushPendingAudio();

  void OnAudioFrame(buffer::AudioFrame&& frame);
  void OnVideoFrame(buffer::VideoFrame&& frame);

  void EmitEvent(EngineEvent event);
  void PublishOutcome(LoadOutcome outcome);

  // Releases decoder, outlets and pending audio. Idempotent.
  void TearDownSession();

  EngineConfig config_;

  buffer::Channel<Command> commands_;
  buffer::Channel<EngineEvent> events_;
  buffer::Channel<LoadOutcome> load_outcomes_;

  std::thread thread_;
  std::atomic<bool> running_{false};

  // Engine-thread state
  std::unique_ptr<decode::FFmpegDecoder> decoder_;
  VideoOutlet video_outlet_;
  SampleRingPtr sample_ring_;
  std::deque<buffer::AudioFrame> pending_audio_;
  bool playing_ = false;
  bool end_of_stream_pending_ = false;
  uint64_t generation_ = 0;
  double volume_;

  std::atomic<uint64_t> audio_frames_emitted_{0};
  std::atomic<uint64_t> video_frames_emitted_{0};
  std::atomic<uint64_t> end_of_stream_count_{0};
};

}  // namespace mediacore::runtime

#endif  // MEDIACORE_RUNTIME_DECODER_ENGINE_H_
