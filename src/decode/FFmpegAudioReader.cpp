// Repository: Reelsmith
// Component: FFmpeg Audio Reader Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/decode/FFmpegAudioReader.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace reelsmith::decode {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FFmpegAudioReader::FFmpegAudioReader(const AudioReaderConfig& config,
                                     const util::Logger& logger)
    : config_(config), logger_(logger) {}

FFmpegAudioReader::~FFmpegAudioReader() {
  Close();
}

bool FFmpegAudioReader::Open() {
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    logger_.Error("[FFmpegAudioReader] open_input FAILED uri=" + config_.input_uri +
                  " err=" + AvErrorString(ret));
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    logger_.Error("[FFmpegAudioReader] find_stream_info FAILED uri=" + config_.input_uri +
                  " err=" + AvErrorString(ret));
    Close();
    return false;
  }

  if (!FindAudioStream()) {
    logger_.Error("[FFmpegAudioReader] No audio stream in " + config_.input_uri);
    Close();
    return false;
  }

  if (!InitializeCodec() || !InitializeResampler()) {
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    logger_.Error("[FFmpegAudioReader] Failed to allocate packet");
    Close();
    return false;
  }

  logger_.Debug("[FFmpegAudioReader] Opened " + config_.input_uri + " " +
                std::to_string(codec_ctx_->sample_rate) + " Hz -> " +
                std::to_string(config_.target_sample_rate) + " Hz x" +
                std::to_string(config_.target_channels));
  return true;
}

void FFmpegAudioReader::Close() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  audio_stream_index_ = -1;
  demux_eof_ = false;
  codec_drained_ = false;
  eof_reached_ = false;
}

bool FFmpegAudioReader::ReadFrame(buffer::AudioFrame& output_frame) {
  if (!IsOpen() || eof_reached_) {
    return false;
  }

  while (!codec_drained_) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret >= 0) {
      bool ok = Resample(frame_, output_frame);
      av_frame_unref(frame_);
      if (!ok) {
        eof_reached_ = true;
        return false;
      }
      if (output_frame.nb_samples > 0) return true;
      continue;
    }
    if (ret == AVERROR_EOF || demux_eof_) {
      codec_drained_ = true;
      break;
    }
    if (ret != AVERROR(EAGAIN)) {
      logger_.Warn("[FFmpegAudioReader] receive_frame failed: " + AvErrorString(ret));
      codec_drained_ = true;
      break;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret < 0) {
      if (ret != AVERROR_EOF) {
        logger_.Warn("[FFmpegAudioReader] read_frame failed: " + AvErrorString(ret));
      }
      demux_eof_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }
    if (packet_->stream_index == audio_stream_index_) {
      ret = avcodec_send_packet(codec_ctx_, packet_);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        logger_.Debug("[FFmpegAudioReader] Dropping undecodable packet: " + AvErrorString(ret));
      }
    }
    av_packet_unref(packet_);
  }

  // Codec drained; flush what the resampler still buffers.
  if (!Resample(nullptr, output_frame) || output_frame.nb_samples == 0) {
    eof_reached_ = true;
    return false;
  }
  return true;
}

bool FFmpegAudioReader::FindAudioStream() {
  int index = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (index < 0) return false;
  audio_stream_index_ = index;
  return true;
}

bool FFmpegAudioReader::InitializeCodec() {
  AVCodecParameters* codecpar = format_ctx_->streams[audio_stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    logger_.Error("[FFmpegAudioReader] Audio codec not found: " +
                  std::to_string(codecpar->codec_id));
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    logger_.Error("[FFmpegAudioReader] Failed to allocate audio codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    logger_.Error("[FFmpegAudioReader] Failed to copy audio codec parameters");
    return false;
  }

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    logger_.Error("[FFmpegAudioReader] Failed to open audio codec: " + AvErrorString(ret));
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    logger_.Error("[FFmpegAudioReader] Failed to allocate audio frame");
    return false;
  }
  return true;
}

bool FFmpegAudioReader::InitializeResampler() {
  AVChannelLayout src_ch_layout = {};
  if (codec_ctx_->ch_layout.nb_channels > 0 &&
      codec_ctx_->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
    if (av_channel_layout_copy(&src_ch_layout, &codec_ctx_->ch_layout) < 0) {
      logger_.Error("[FFmpegAudioReader] Failed to copy source channel layout");
      return false;
    }
  } else {
    const int n = codec_ctx_->ch_layout.nb_channels > 0 ? codec_ctx_->ch_layout.nb_channels : 1;
    av_channel_layout_default(&src_ch_layout, n);
  }

  AVChannelLayout dst_ch_layout = {};
  av_channel_layout_default(&dst_ch_layout, config_.target_channels);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_ch_layout, AV_SAMPLE_FMT_S16, config_.target_sample_rate,
                                &src_ch_layout, codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                                0, nullptr);
  // swr_alloc_set_opts2 copies the layouts.
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);
  if (ret < 0) {
    logger_.Error("[FFmpegAudioReader] Failed to set resampler options: " + AvErrorString(ret));
    return false;
  }

  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    logger_.Error("[FFmpegAudioReader] Failed to initialize resampler: " + AvErrorString(ret));
    return false;
  }
  return true;
}

bool FFmpegAudioReader::Resample(AVFrame* av_frame, buffer::AudioFrame& output_frame) {
  const int in_samples = av_frame ? av_frame->nb_samples : 0;
  const int in_rate = codec_ctx_->sample_rate;
  const int64_t delay = swr_get_delay(swr_ctx_, in_rate);
  const int out_capacity = static_cast<int>(
      av_rescale_rnd(delay + in_samples, config_.target_sample_rate, in_rate, AV_ROUND_UP));

  const int bytes_per_sample = av_get_bytes_per_sample(AV_SAMPLE_FMT_S16);
  output_frame.data.resize(static_cast<size_t>(out_capacity > 0 ? out_capacity : 0) *
                           config_.target_channels * bytes_per_sample);
  output_frame.sample_rate = config_.target_sample_rate;
  output_frame.channels = config_.target_channels;
  output_frame.nb_samples = 0;
  if (out_capacity <= 0) return true;

  uint8_t* out_data[1] = {output_frame.data.data()};
  const int converted = swr_convert(
      swr_ctx_, out_data, out_capacity,
      av_frame ? const_cast<const uint8_t**>(av_frame->extended_data) : nullptr, in_samples);
  if (converted < 0) {
    logger_.Error("[FFmpegAudioReader] Audio resampling failed: " + AvErrorString(converted));
    return false;
  }

  output_frame.nb_samples = converted;
  output_frame.pts_us = av_rescale(samples_delivered_, 1000000, config_.target_sample_rate);
  output_frame.data.resize(static_cast<size_t>(converted) * config_.target_channels *
                           bytes_per_sample);
  samples_delivered_ += converted;
  return true;
}

}  // namespace reelsmith::decode
