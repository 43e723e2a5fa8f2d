// Repository: Mediacore-player
// Component: Decoder Engine
// Purpose: Dedicated thread owning the decode session. Driven by commands,
//          produces audio into the sample ring and video into the per-load
//          outlet, and reports through event and load-outcome outlets.
// Copyright (c) 2025 Mediacore

#include "mediacore/runtime/DecoderEngine.h"

#include <algorithm>
#include <sstream>
#include <utility>

#include "mediacore/util/Logger.hpp"

namespace mediacore::runtime {

DecoderEngine::DecoderEngine(const EngineConfig& config)
    : config_(config),
      commands_(config.command_capacity),
      events_(buffer::Channel<EngineEvent>::kUnbounded),
      load_outcomes_(1),
      volume_(std::clamp(config.default_volume, 0.0, 1.0)) {}

DecoderEngine::~DecoderEngine() {
  Shutdown();
}

bool DecoderEngine::Start() {
  if (thread_.joinable()) {
    return false;
  }
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&DecoderEngine::Run, this);
  util::Logger::Debug("[DecoderEngine] Thread started");
  return true;
}

void DecoderEngine::Shutdown() {
  commands_.Close();
  if (thread_.joinable()) {
    thread_.join();
    util::Logger::Debug("[DecoderEngine] Thread joined");
  }
}

bool DecoderEngine::SendCommand(Command command) {
  return commands_.Send(std::move(command));
}

void DecoderEngine::Run() {
  Command command;
  while (true) {
    // Drain every command that is already queued.
    buffer::ChannelStatus status;
    while ((status = commands_.TryReceive(command)) == buffer::ChannelStatus::kOk) {
      HandleCommand(command);
    }
    if (status == buffer::ChannelStatus::kClosed) {
      break;
    }

    if (DoWork()) {
      continue;
    }

    // Idle: bounded wait that also wakes on the next command.
    status = commands_.ReceiveFor(command, config_.idle_sleep);
    if (status == buffer::ChannelStatus::kOk) {
      HandleCommand(command);
    } else if (status == buffer::ChannelStatus::kClosed) {
      break;
    }
  }

  TearDownSession();
  events_.Close();
  load_outcomes_.Close();
  running_.store(false, std::memory_order_release);
  util::Logger::Info("[DecoderEngine] Command inlet disconnected; engine stopped");
}

void DecoderEngine::HandleCommand(Command& command) {
  switch (command.type) {
    case Command::Type::kLoad:
      HandleLoad(command);
      break;

    case Command::Type::kAttachSamples:
      if (!decoder_) {
        // Session already gone; the ring has no producer.
        if (command.samples) command.samples->Close();
        break;
      }
      if (sample_ring_) sample_ring_->Close();
      sample_ring_ = std::move(command.samples);
      break;

    case Command::Type::kPlay:
      playing_ = true;
      break;

    case Command::Type::kPause:
      playing_ = false;
      break;

    case Command::Type::kStop:
      TearDownSession();
      break;

    case Command::Type::kSeek:
      generation_ = command.generation;
      HandleSeek(command.value);
      break;

    case Command::Type::kSetVolume:
      volume_ = std::clamp(command.value, 0.0, 1.0);
      break;
  }
}

void DecoderEngine::HandleLoad(Command& command) {
  TearDownSession();
  generation_ = command.generation;

  decode::DecoderConfig decoder_config = config_.decoder;
  decoder_config.input_uri = command.path;

  LoadOutcome outcome;
  outcome.load_id = command.load_id;

  auto decoder = std::make_unique<decode::FFmpegDecoder>(decoder_config);
  if (!decoder->Open()) {
    outcome.success = false;
    outcome.error = decoder->LastError();
    // The outlet belongs to the failed load; its consumer sees it close.
    if (command.video_outlet) command.video_outlet->Close();
    PublishOutcome(std::move(outcome));
    return;
  }

  decoder_ = std::move(decoder);
  video_outlet_ = std::move(command.video_outlet);
  outcome.success = true;
  outcome.info = decoder_->GetMediaInfo();
  PublishOutcome(std::move(outcome));
}

void DecoderEngine::HandleSeek(double seconds) {
  if (!decoder_) {
    return;
  }

  if (!decoder_->SeekTo(seconds)) {
    // Session state is unchanged; playback continues from where it was.
    return;
  }

  pending_audio_.clear();
  end_of_stream_pending_ = false;
  if (sample_ring_) {
    sample_ring_->Invalidate();
  }

  std::ostringstream oss;
  oss << "[DecoderEngine] Seek to " << seconds << "s";
  util::Logger::Debug(oss.str());
}

bool DecoderEngine::DoWork() {
  if (!decoder_ || !playing_) {
    return false;
  }

  // Audio already produced must reach the ring before anything else.
  if (!FlushPendingAudio()) {
    return false;
  }

  if (end_of_stream_pending_) {
    end_of_stream_pending_ = false;
    playing_ = false;
    end_of_stream_count_.fetch_add(1, std::memory_order_relaxed);
    EngineEvent event;
    event.type = EngineEvent::Type::kEndOfStream;
    EmitEvent(event);
    util::Logger::Info("[DecoderEngine] End of stream");
    return true;
  }

  decode::PumpResult result = decoder_->PumpOnce(
      [this](buffer::AudioFrame&& frame) { OnAudioFrame(std::move(frame)); },
      [this](buffer::VideoFrame&& frame) { OnVideoFrame(std::move(frame)); });

  if (result == decode::PumpResult::kEndOfStream) {
    // Emitted once the drained audio has been delivered.
    end_of_stream_pending_ = true;
  }
  return true;
}

bool DecoderEngine::FlushPendingAudio() {
  while (!pending_audio_.empty()) {
    buffer::AudioFrame& frame = pending_audio_.front();

    if (sample_ring_ && !sample_ring_->IsClosed()) {
      if (!sample_ring_->TryPush(frame.samples, frame.timestamp)) {
        return false;
      }
    }

    EngineEvent event;
    event.type = EngineEvent::Type::kAudioFrame;
    event.timestamp = frame.timestamp;
    event.sample_count = frame.samples.size();
    EmitEvent(event);
    audio_frames_emitted_.fetch_add(1, std::memory_order_relaxed);

    pending_audio_.pop_front();
  }
  return true;
}

void DecoderEngine::EmitEvent(EngineEvent event) {
  event.generation = generation_;
  if (events_.TrySend(event) != buffer::ChannelStatus::kOk) {
    util::Logger::Debug("[DecoderEngine] Event outlet closed; event dropped");
  }
}

void DecoderEngine::OnAudioFrame(buffer::AudioFrame&& frame) {
  const float gain = static_cast<float>(volume_);
  for (float& sample : frame.samples) {
    sample *= gain;
  }
  pending_audio_.push_back(std::move(frame));
}

void DecoderEngine::OnVideoFrame(buffer::VideoFrame&& frame) {
  if (!video_outlet_) {
    return;
  }
  if (video_outlet_->TrySend(std::move(frame)) == buffer::ChannelStatus::kOk) {
    video_frames_emitted_.fetch_add(1, std::memory_order_relaxed);
  }
}

void DecoderEngine::PublishOutcome(LoadOutcome outcome) {
  // Capacity 1: an outcome nobody collected (abandoned load) is replaced.
  while (load_outcomes_.TrySend(outcome) == buffer::ChannelStatus::kFull) {
    LoadOutcome stale;
    if (load_outcomes_.TryReceive(stale) == buffer::ChannelStatus::kOk) {
      util::Logger::Debug("[DecoderEngine] Dropped uncollected outcome for load " +
                          std::to_string(stale.load_id));
    }
  }
}

void DecoderEngine::TearDownSession() {
  playing_ = false;
  end_of_stream_pending_ = false;
  pending_audio_.clear();

  if (decoder_) {
    const decode::DecoderStats& stats = decoder_->GetStats();
    std::ostringstream oss;
    oss << "[DecoderEngine] Session closed packets=" << stats.packets_read
        << " audio_frames=" << stats.audio_frames_decoded
        << " video_frames=" << stats.video_frames_decoded
        << " errors=" << (stats.read_errors + stats.decode_errors + stats.convert_errors);
    util::Logger::Debug(oss.str());
    decoder_.reset();
  }

  if (video_outlet_) {
    video_outlet_->Close();
    video_outlet_.reset();
  }
  if (sample_ring_) {
    sample_ring_->Close();
    sample_ring_.reset();
  }
}

}  // namespace mediacore::runtime
