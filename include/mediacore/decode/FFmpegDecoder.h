// Repository: Mediacore-player
// Component: FFmpeg Decoder
// Purpose: One decode session over a media file using libavformat/libavcodec,
//          with audio resampled to 44.1 kHz stereo f32 and video scaled to RGBA.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_DECODE_FFMPEG_DECODER_H_
#define MEDIACORE_DECODE_FFMPEG_DECODER_H_

#include <cstdint>
#include <functional>
#include <string>

#include "mediacore/buffer/MediaTypes.h"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;
struct SwrContext;

namespace mediacore::decode {

// DecoderConfig holds configuration for one decode session.
struct DecoderConfig {
  std::string input_uri;            // File path to decode
  int output_sample_rate;           // Resampler target rate
  int output_channels;              // Resampler target channel count (stereo)
  int max_decode_threads;           // Codec threads (0 = FFmpeg default)
  int max_consecutive_read_errors;  // Demux errors in a row treated as EOF

  DecoderConfig()
      : output_sample_rate(buffer::kOutputSampleRate),
        output_channels(buffer::kOutputChannels),
        max_decode_threads(0),
        max_consecutive_read_errors(64) {}
};

// DecoderStats tracks decoding progress and errors.
struct DecoderStats {
  uint64_t packets_read;
  uint64_t audio_frames_decoded;
  uint64_t video_frames_decoded;
  uint64_t read_errors;
  uint64_t decode_errors;
  uint64_t convert_errors;

  DecoderStats()
      : packets_read(0),
        audio_frames_decoded(0),
        video_frames_decoded(0),
        read_errors(0),
        decode_errors(0),
        convert_errors(0) {}
};

// Result of a single PumpOnce() call.
enum class PumpResult {
  kProgress,     // One packet consumed (may or may not have produced frames)
  kEndOfStream,  // Demuxer exhausted; decoders drained
  kNotOpen,      // No source
};

// FFmpegDecoder owns all demux/decode/convert state for one source.
//
// The first audio stream and the first video stream are selected. Per-track
// setup failures are non-fatal: the track is reported absent. Only a
// container that cannot be opened fails Open().
//
// Thread Safety:
// - Not thread-safe: owned and used by the decoder engine thread only.
//
// Lifecycle:
// 1. Construct with config
// 2. Open(); read GetMediaInfo()
// 3. PumpOnce() repeatedly; SeekTo() at any time
// 4. Close() or destructor
class FFmpegDecoder {
 public:
  using AudioHandler = std::function<void(buffer::AudioFrame&&)>;
  using VideoHandler = std::function<void(buffer::VideoFrame&&)>;

  explicit FFmpegDecoder(const DecoderConfig& config);
  ~FFmpegDecoder();

  // Disable copy and move
  FFmpegDecoder(const FFmpegDecoder&) = delete;
  FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

  // Opens the container and sets up the selected tracks.
  // Returns false if the container cannot be opened; see LastError().
  bool Open();

  // Releases all FFmpeg state. Idempotent.
  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }

  // Valid after a successful Open().
  const buffer::MediaInfo& GetMediaInfo() const { return info_; }

  // Reads one packet, decodes it, and hands every converted frame to the
  // matching handler. At end of input both decoders are drained before
  // kEndOfStream is returned; further calls keep returning kEndOfStream
  // until SeekTo().
  PumpResult PumpOnce(const AudioHandler& on_audio, const VideoHandler& on_video);

  // Container-level seek to `seconds`, then flushes both decoders.
  bool SeekTo(double seconds);

  bool IsEndOfStream() const { return eof_reached_; }

  const DecoderStats& GetStats() const { return stats_; }
  const std::string& LastError() const { return last_error_; }

 private:
  // Finds the first stream of each type.
  int FindFirstStream(int media_type) const;

  bool InitializeAudioCodec();
  bool InitializeResampler();
  bool InitializeVideoCodec();

  // Sends pkt (nullptr flushes) and drains every frame it yields.
  void DecodeAudioPacket(AVPacket* pkt, const AudioHandler& on_audio);
  void DecodeVideoPacket(AVPacket* pkt, const VideoHandler& on_video);

  bool ConvertAudioFrame(AVFrame* av_frame, buffer::AudioFrame& output_frame);
  bool ConvertVideoFrame(AVFrame* av_frame, buffer::VideoFrame& output_frame);

  // Drains both decoders and latches eof_reached_.
  void FinishStream(const AudioHandler& on_audio, const VideoHandler& on_video);

  void ReleaseAudio();
  void ReleaseVideo();

  DecoderConfig config_;
  DecoderStats stats_;
  buffer::MediaInfo info_;
  std::string last_error_;

  // FFmpeg contexts (opaque pointers)
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* audio_codec_ctx_ = nullptr;
  AVCodecContext* video_codec_ctx_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  AVFrame* video_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  ::SwrContext* swr_ctx_ = nullptr;
  ::SwsContext* sws_ctx_ = nullptr;

  int audio_stream_index_ = -1;
  int video_stream_index_ = -1;
  double audio_time_base_ = 0.0;
  double video_time_base_ = 0.0;

  bool eof_reached_ = false;
  int consecutive_read_errors_ = 0;
};

}  // namespace mediacore::decode

#endif  // MEDIACORE_DECODE_FFMPEG_DECODER_H_
