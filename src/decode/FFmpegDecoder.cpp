// Repository: Mediacore-player
// Component: FFmpeg Decoder
// Purpose: One decode session over a media file using libavformat/libavcodec,
//          with audio resampled to 44.1 kHz stereo f32 and video scaled to RGBA.
// Copyright (c) 2025 Mediacore

#include "mediacore/decode/FFmpegDecoder.h"

#include <sstream>
#include <utility>

#include "mediacore/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace mediacore::decode {

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

double FrameTimestamp(const AVFrame* frame, double time_base) {
  if (frame->best_effort_timestamp == AV_NOPTS_VALUE) {
    return 0.0;
  }
  return static_cast<double>(frame->best_effort_timestamp) * time_base;
}

}  // namespace

FFmpegDecoder::FFmpegDecoder(const DecoderConfig& config) : config_(config) {
  info_.source_path = config_.input_uri;
}

FFmpegDecoder::~FFmpegDecoder() {
  Close();
}

bool FFmpegDecoder::Open() {
  util::Logger::Info("[FFmpegDecoder] Opening: " + config_.input_uri);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    last_error_ = "failed to allocate format context";
    util::Logger::Error("[FFmpegDecoder] " + last_error_);
    return false;
  }

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    last_error_ = "cannot open " + config_.input_uri + ": " + AvErrorString(ret);
    util::Logger::Error("[FFmpegDecoder] open_input FAILED: " + last_error_);
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    last_error_ = "cannot read stream info for " + config_.input_uri + ": " +
                  AvErrorString(ret);
    util::Logger::Error("[FFmpegDecoder] find_stream_info FAILED: " + last_error_);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    last_error_ = "failed to allocate packet";
    util::Logger::Error("[FFmpegDecoder] " + last_error_);
    Close();
    return false;
  }

  // Audio track (optional; setup failure means "no audio")
  audio_stream_index_ = FindFirstStream(AVMEDIA_TYPE_AUDIO);
  if (audio_stream_index_ >= 0) {
    if (!InitializeAudioCodec() || !InitializeResampler()) {
      util::Logger::Warn("[FFmpegDecoder] Audio track setup failed; continuing without audio");
      ReleaseAudio();
    }
  }

  // Video track (optional; setup failure means "no video")
  video_stream_index_ = FindFirstStream(AVMEDIA_TYPE_VIDEO);
  if (video_stream_index_ >= 0) {
    if (!InitializeVideoCodec()) {
      util::Logger::Warn("[FFmpegDecoder] Video track setup failed; continuing without video");
      ReleaseVideo();
    }
  }

  info_.has_audio = audio_stream_index_ >= 0;
  info_.has_video = video_stream_index_ >= 0;
  if (info_.has_video) {
    info_.video_width = static_cast<uint32_t>(video_codec_ctx_->width);
    info_.video_height = static_cast<uint32_t>(video_codec_ctx_->height);
  }
  info_.duration = format_ctx_->duration != AV_NOPTS_VALUE
      ? static_cast<double>(format_ctx_->duration) / AV_TIME_BASE
      : 0.0;

  std::ostringstream oss;
  oss << "[FFmpegDecoder] Opened " << config_.input_uri
      << " audio=" << (info_.has_audio ? "yes" : "no")
      << " video=" << (info_.has_video ? "yes" : "no");
  if (info_.has_video) {
    oss << " " << info_.video_width << "x" << info_.video_height;
  }
  oss << " duration=" << info_.duration << "s";
  util::Logger::Info(oss.str());

  eof_reached_ = false;
  consecutive_read_errors_ = 0;
  return true;
}

void FFmpegDecoder::Close() {
  if (!format_ctx_ && !packet_) {
    return;
  }
  util::Logger::Debug("[FFmpegDecoder] Closing decoder");

  ReleaseAudio();
  ReleaseVideo();

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  eof_reached_ = false;
  consecutive_read_errors_ = 0;
}

void FFmpegDecoder::ReleaseAudio() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (audio_frame_) {
    av_frame_free(&audio_frame_);
  }
  if (audio_codec_ctx_) {
    avcodec_free_context(&audio_codec_ctx_);
  }
  audio_stream_index_ = -1;
}

void FFmpegDecoder::ReleaseVideo() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (video_frame_) {
    av_frame_free(&video_frame_);
  }
  if (video_codec_ctx_) {
    avcodec_free_context(&video_codec_ctx_);
  }
  video_stream_index_ = -1;
}

int FFmpegDecoder::FindFirstStream(int media_type) const {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    if (format_ctx_->streams[i]->codecpar->codec_type == media_type) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool FFmpegDecoder::InitializeAudioCodec() {
  AVStream* stream = format_ctx_->streams[audio_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;
  audio_time_base_ = av_q2d(stream->time_base);

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    util::Logger::Warn("[FFmpegDecoder] Audio codec not found: " +
                       std::string(avcodec_get_name(codecpar->codec_id)));
    return false;
  }

  audio_codec_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_codec_ctx_) {
    util::Logger::Warn("[FFmpegDecoder] Failed to allocate audio codec context");
    return false;
  }

  if (avcodec_parameters_to_context(audio_codec_ctx_, codecpar) < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to copy audio codec parameters");
    return false;
  }

  int ret = avcodec_open2(audio_codec_ctx_, codec, nullptr);
  if (ret < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to open audio codec: " + AvErrorString(ret));
    return false;
  }

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) {
    util::Logger::Warn("[FFmpegDecoder] Failed to allocate audio frame");
    return false;
  }

  return true;
}

bool FFmpegDecoder::InitializeResampler() {
  // Source layout; unspecified layouts get the default for the channel count.
  AVChannelLayout src_ch_layout;
  av_channel_layout_uninit(&src_ch_layout);
  if (audio_codec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_default(&src_ch_layout, audio_codec_ctx_->ch_layout.nb_channels);
  } else if (av_channel_layout_copy(&src_ch_layout, &audio_codec_ctx_->ch_layout) < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to copy source channel layout");
    return false;
  }
  if (src_ch_layout.nb_channels <= 0) {
    util::Logger::Warn("[FFmpegDecoder] Invalid source channel count");
    av_channel_layout_uninit(&src_ch_layout);
    return false;
  }

  // Target format: packed f32, stereo, 44.1 kHz
  AVChannelLayout dst_ch_layout;
  av_channel_layout_uninit(&dst_ch_layout);
  av_channel_layout_default(&dst_ch_layout, config_.output_channels);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_ch_layout, AV_SAMPLE_FMT_FLT, config_.output_sample_rate,
                                &src_ch_layout, audio_codec_ctx_->sample_fmt,
                                audio_codec_ctx_->sample_rate,
                                0, nullptr);

  // swr_alloc_set_opts2 copies the layouts
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);

  if (ret < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to set resampler options: " + AvErrorString(ret));
    return false;
  }

  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to initialize resampler: " + AvErrorString(ret));
    return false;
  }

  return true;
}

bool FFmpegDecoder::InitializeVideoCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;
  video_time_base_ = av_q2d(stream->time_base);

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    util::Logger::Warn("[FFmpegDecoder] Video codec not found: " +
                       std::string(avcodec_get_name(codecpar->codec_id)));
    return false;
  }

  video_codec_ctx_ = avcodec_alloc_context3(codec);
  if (!video_codec_ctx_) {
    util::Logger::Warn("[FFmpegDecoder] Failed to allocate video codec context");
    return false;
  }

  if (avcodec_parameters_to_context(video_codec_ctx_, codecpar) < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to copy video codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    video_codec_ctx_->thread_count = config_.max_decode_threads;
  }

  int ret = avcodec_open2(video_codec_ctx_, codec, nullptr);
  if (ret < 0) {
    util::Logger::Warn("[FFmpegDecoder] Failed to open video codec: " + AvErrorString(ret));
    return false;
  }

  if (video_codec_ctx_->width <= 0 || video_codec_ctx_->height <= 0) {
    util::Logger::Warn("[FFmpegDecoder] Video stream has no usable dimensions");
    return false;
  }

  video_frame_ = av_frame_alloc();
  if (!video_frame_) {
    util::Logger::Warn("[FFmpegDecoder] Failed to allocate video frame");
    return false;
  }

  return true;
}

PumpResult FFmpegDecoder::PumpOnce(const AudioHandler& on_audio,
                                   const VideoHandler& on_video) {
  if (!IsOpen()) {
    return PumpResult::kNotOpen;
  }
  if (eof_reached_) {
    return PumpResult::kEndOfStream;
  }

  int ret = av_read_frame(format_ctx_, packet_);
  if (ret == AVERROR_EOF) {
    FinishStream(on_audio, on_video);
    return PumpResult::kEndOfStream;
  }

  if (ret < 0) {
    stats_.read_errors++;
    consecutive_read_errors_++;
    av_packet_unref(packet_);
    if (consecutive_read_errors_ >= config_.max_consecutive_read_errors) {
      std::ostringstream oss;
      oss << "[FFmpegDecoder] " << consecutive_read_errors_
          << " consecutive read errors (last: " << AvErrorString(ret)
          << "); treating as end of stream";
      util::Logger::Warn(oss.str());
      FinishStream(on_audio, on_video);
      return PumpResult::kEndOfStream;
    }
    return PumpResult::kProgress;
  }

  consecutive_read_errors_ = 0;
  stats_.packets_read++;

  // Route by stream index; packets of unselected streams are dropped.
  if (packet_->stream_index == audio_stream_index_) {
    DecodeAudioPacket(packet_, on_audio);
  } else if (packet_->stream_index == video_stream_index_) {
    DecodeVideoPacket(packet_, on_video);
  }
  av_packet_unref(packet_);

  return PumpResult::kProgress;
}

void FFmpegDecoder::FinishStream(const AudioHandler& on_audio,
                                 const VideoHandler& on_video) {
  if (audio_codec_ctx_) {
    DecodeAudioPacket(nullptr, on_audio);
  }
  if (video_codec_ctx_) {
    DecodeVideoPacket(nullptr, on_video);
  }
  eof_reached_ = true;
  util::Logger::Debug("[FFmpegDecoder] End of stream: " + config_.input_uri);
}

void FFmpegDecoder::DecodeAudioPacket(AVPacket* pkt, const AudioHandler& on_audio) {
  int ret = avcodec_send_packet(audio_codec_ctx_, pkt);
  if (ret < 0 && ret != AVERROR_EOF) {
    stats_.decode_errors++;
    util::Logger::Debug("[FFmpegDecoder] Audio send_packet failed: " + AvErrorString(ret));
    return;
  }

  while (true) {
    ret = avcodec_receive_frame(audio_codec_ctx_, audio_frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      break;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      break;
    }

    stats_.audio_frames_decoded++;
    buffer::AudioFrame converted;
    if (ConvertAudioFrame(audio_frame_, converted)) {
      if (!converted.samples.empty()) {
        on_audio(std::move(converted));
      }
    } else {
      stats_.convert_errors++;
    }
    av_frame_unref(audio_frame_);
  }
}

void FFmpegDecoder::DecodeVideoPacket(AVPacket* pkt, const VideoHandler& on_video) {
  int ret = avcodec_send_packet(video_codec_ctx_, pkt);
  if (ret < 0 && ret != AVERROR_EOF) {
    stats_.decode_errors++;
    util::Logger::Debug("[FFmpegDecoder] Video send_packet failed: " + AvErrorString(ret));
    return;
  }

  while (true) {
    ret = avcodec_receive_frame(video_codec_ctx_, video_frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      break;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      break;
    }

    stats_.video_frames_decoded++;
    buffer::VideoFrame converted;
    if (ConvertVideoFrame(video_frame_, converted)) {
      on_video(std::move(converted));
    } else {
      stats_.convert_errors++;
    }
    av_frame_unref(video_frame_);
  }
}

bool FFmpegDecoder::ConvertAudioFrame(AVFrame* av_frame, buffer::AudioFrame& output_frame) {
  if (!swr_ctx_ || av_frame->sample_rate <= 0) {
    return false;
  }

  int64_t delay = swr_get_delay(swr_ctx_, av_frame->sample_rate);
  int64_t out_samples = av_rescale_rnd(delay + av_frame->nb_samples,
                                       config_.output_sample_rate, av_frame->sample_rate,
                                       AV_ROUND_UP);

  output_frame.samples.resize(static_cast<size_t>(out_samples) * config_.output_channels);
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(output_frame.samples.data())};

  int samples_converted = swr_convert(swr_ctx_,
                                      out_data, static_cast<int>(out_samples),
                                      const_cast<const uint8_t**>(av_frame->extended_data),
                                      av_frame->nb_samples);
  if (samples_converted < 0) {
    util::Logger::Debug("[FFmpegDecoder] Audio resampling failed: " +
                        AvErrorString(samples_converted));
    return false;
  }

  output_frame.samples.resize(static_cast<size_t>(samples_converted) * config_.output_channels);
  output_frame.timestamp = FrameTimestamp(av_frame, audio_time_base_);
  return true;
}

bool FFmpegDecoder::ConvertVideoFrame(AVFrame* av_frame, buffer::VideoFrame& output_frame) {
  const int width = av_frame->width;
  const int height = av_frame->height;
  if (width <= 0 || height <= 0) {
    return false;
  }

  // Native size, RGBA. Cached so a mid-stream size change rebuilds the scaler.
  sws_ctx_ = sws_getCachedContext(sws_ctx_,
                                  width, height, static_cast<AVPixelFormat>(av_frame->format),
                                  width, height, AV_PIX_FMT_RGBA,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    util::Logger::Debug("[FFmpegDecoder] Failed to create scaler context");
    return false;
  }

  const int stride = width * buffer::kRgbaBytesPerPixel;
  output_frame.pixels.resize(static_cast<size_t>(stride) * height);
  uint8_t* dst_data[4] = {output_frame.pixels.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {stride, 0, 0, 0};

  int rows = sws_scale(sws_ctx_, av_frame->data, av_frame->linesize, 0, height,
                       dst_data, dst_linesize);
  if (rows != height) {
    return false;
  }

  output_frame.width = static_cast<uint32_t>(width);
  output_frame.height = static_cast<uint32_t>(height);
  output_frame.timestamp = FrameTimestamp(av_frame, video_time_base_);
  return true;
}

bool FFmpegDecoder::SeekTo(double seconds) {
  if (!IsOpen()) {
    return false;
  }

  const int64_t target = static_cast<int64_t>(seconds * AV_TIME_BASE);
  int ret = avformat_seek_file(format_ctx_, -1, INT64_MIN, target, INT64_MAX, 0);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegDecoder] Seek to " << seconds << "s FAILED: " << AvErrorString(ret);
    util::Logger::Warn(oss.str());
    return false;
  }

  // Flush decoder buffers so no pre-seek frame is emitted
  if (audio_codec_ctx_) {
    avcodec_flush_buffers(audio_codec_ctx_);
  }
  if (video_codec_ctx_) {
    avcodec_flush_buffers(video_codec_ctx_);
  }
  if (swr_ctx_) {
    // Drop resampler history along with the decoder's.
    ret = swr_init(swr_ctx_);
    if (ret < 0) {
      util::Logger::Warn("[FFmpegDecoder] Resampler reset after seek failed: " +
                         AvErrorString(ret));
    }
  }

  eof_reached_ = false;
  consecutive_read_errors_ = 0;
  return true;
}

}  // namespace mediacore::decode
