// Repository: Reelsmith
// Component: FFmpeg Decoder
// Purpose: Decode one clip's video stream to output-sized YUV420P frames.
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/decode/FFmpegDecoder.hpp"

#include <cstring>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/mem.h>  // av_freep (for av_image_alloc buffer)
#include <libswscale/swscale.h>
}

namespace reelsmith::decode {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FFmpegDecoder::FFmpegDecoder(const DecoderConfig& config, const util::Logger& logger)
    : config_(config), logger_(logger) {}

FFmpegDecoder::~FFmpegDecoder() {
  Close();
}

bool FFmpegDecoder::Open() {
  logger_.Debug("[FFmpegDecoder] Opening: " + config_.input_uri);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    logger_.Error("[FFmpegDecoder] Failed to allocate format context");
    return false;
  }

  // DECODER_STEP: open_input
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    logger_.Warn("[FFmpegDecoder] DECODER_STEP open_input FAILED uri=" + config_.input_uri +
                 " err=" + AvErrorString(ret));
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    return false;
  }

  // DECODER_STEP: avformat_find_stream_info
  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    logger_.Warn("[FFmpegDecoder] DECODER_STEP avformat_find_stream_info FAILED uri=" +
                 config_.input_uri + " err=" + AvErrorString(ret));
    Close();
    return false;
  }

  // DECODER_STEP: find_video_stream
  if (!FindVideoStream()) {
    logger_.Warn("[FFmpegDecoder] DECODER_STEP find_video_stream FAILED uri=" +
                 config_.input_uri + " (no video stream)");
    Close();
    return false;
  }

  // DECODER_STEP: initialize_codec
  if (!InitializeCodec()) {
    logger_.Warn("[FFmpegDecoder] DECODER_STEP initialize_codec FAILED uri=" + config_.input_uri);
    Close();
    return false;
  }

  // DECODER_STEP: initialize_scaler
  if (!InitializeScaler()) {
    logger_.Warn("[FFmpegDecoder] DECODER_STEP initialize_scaler FAILED uri=" + config_.input_uri);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    logger_.Error("[FFmpegDecoder] DECODER_STEP packet_alloc FAILED uri=" + config_.input_uri);
    Close();
    return false;
  }

  const util::RationalFps fps = GetVideoRationalFps();
  std::ostringstream oss;
  oss << "[FFmpegDecoder] DECODER_STEP open_input OK uri=" << config_.input_uri << " "
      << GetVideoWidth() << "x" << GetVideoHeight() << " @ " << fps.num << "/" << fps.den
      << " fps -> " << config_.target_width << "x" << config_.target_height;
  logger_.Debug(oss.str());
  return true;
}

void FFmpegDecoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  if (scaled_frame_) {
    // scaled_frame_ buffer was allocated with av_image_alloc(); AVFrame does not own it.
    if (scaled_frame_->data[0]) {
      av_freep(&scaled_frame_->data[0]);
    }
    av_frame_free(&scaled_frame_);
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

  video_stream_index_ = -1;
  demux_eof_ = false;
  eof_reached_ = false;
}

bool FFmpegDecoder::SeekToUs(int64_t position_us) {
  if (!format_ctx_ || video_stream_index_ < 0) {
    return false;
  }
  if (position_us <= 0) {
    return true;
  }

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  int64_t timestamp = av_rescale_q(position_us, AVRational{1, AV_TIME_BASE}, stream->time_base);
  if (stream->start_time != AV_NOPTS_VALUE) timestamp += stream->start_time;

  // DECODER_STEP: seek
  int ret = av_seek_frame(format_ctx_, video_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    logger_.Warn("[FFmpegDecoder] DECODER_STEP seek FAILED position_us=" +
                 std::to_string(position_us) + " err=" + AvErrorString(ret));
    return false;
  }

  avcodec_flush_buffers(codec_ctx_);
  demux_eof_ = false;
  eof_reached_ = false;
  return true;
}

bool FFmpegDecoder::DecodeFrame(buffer::Frame& output_frame) {
  if (!IsOpen() || eof_reached_) {
    return false;
  }
  if (!ReadAndDecodeFrame(output_frame)) {
    return false;
  }
  ++frames_decoded_;
  return true;
}

int FFmpegDecoder::GetVideoWidth() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->width;
}

int FFmpegDecoder::GetVideoHeight() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->height;
}

util::RationalFps FFmpegDecoder::GetVideoRationalFps() const {
  if (!format_ctx_ || video_stream_index_ < 0) return util::RationalFps{0, 1};

  // r_frame_rate is the nominal cadence; avg_frame_rate is diagnostics only.
  AVRational fps = format_ctx_->streams[video_stream_index_]->r_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) return util::RationalFps{0, 1};
  return util::RationalFps(fps.num, fps.den);
}

int64_t FFmpegDecoder::GetVideoDurationUs() const {
  if (!format_ctx_ || format_ctx_->duration == AV_NOPTS_VALUE) return 0;
  return format_ctx_->duration;  // AV_TIME_BASE is microseconds
}

bool FFmpegDecoder::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    AVStream* stream = format_ctx_->streams[i];
    if (stream->codecpar->codec_type != AVMEDIA_TYPE_VIDEO) continue;
    if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) continue;

    video_stream_index_ = static_cast<int>(i);
    time_base_ = av_q2d(stream->time_base);
    start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    return true;
  }
  return false;
}

bool FFmpegDecoder::InitializeCodec() {
  AVCodecParameters* codecpar = format_ctx_->streams[video_stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    logger_.Warn("[FFmpegDecoder] Codec not found: " + std::to_string(codecpar->codec_id));
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    logger_.Error("[FFmpegDecoder] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    logger_.Warn("[FFmpegDecoder] Failed to copy codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    logger_.Warn("[FFmpegDecoder] Failed to open codec: " + AvErrorString(ret));
    return false;
  }

  frame_ = av_frame_alloc();
  scaled_frame_ = av_frame_alloc();
  if (!frame_ || !scaled_frame_) {
    logger_.Error("[FFmpegDecoder] Failed to allocate frames");
    return false;
  }
  return true;
}

bool FFmpegDecoder::InitializeScaler() {
  const int dst_width = config_.target_width;
  const int dst_height = config_.target_height;
  const AVPixelFormat dst_format = AV_PIX_FMT_YUV420P;

  sws_ctx_ = sws_getContext(codec_ctx_->width, codec_ctx_->height, codec_ctx_->pix_fmt,
                            dst_width, dst_height, dst_format,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    logger_.Warn("[FFmpegDecoder] Failed to create scaler context");
    return false;
  }

  if (av_image_alloc(scaled_frame_->data, scaled_frame_->linesize,
                     dst_width, dst_height, dst_format, 32) < 0) {
    logger_.Error("[FFmpegDecoder] Failed to allocate scaled frame buffer");
    return false;
  }

  scaled_frame_->width = dst_width;
  scaled_frame_->height = dst_height;
  scaled_frame_->format = dst_format;
  return true;
}

bool FFmpegDecoder::ReadAndDecodeFrame(buffer::Frame& output_frame) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret >= 0) {
      bool ok = ConvertFrame(frame_, output_frame);
      av_frame_unref(frame_);
      return ok;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      decode_errors_++;
      logger_.Warn("[FFmpegDecoder] receive_frame failed: " + AvErrorString(ret));
      eof_reached_ = true;
      return false;
    }

    // Codec wants input.
    if (demux_eof_) {
      // Flush already sent yet codec still asks for input: treat as drained.
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      demux_eof_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);  // Enter draining mode
      continue;
    }
    if (ret < 0) {
      decode_errors_++;
      logger_.Warn("[FFmpegDecoder] read_frame failed: " + AvErrorString(ret));
      demux_eof_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      // Corrupt packet: count it and keep reading.
      decode_errors_++;
    }
  }
}

bool FFmpegDecoder::ConvertFrame(AVFrame* av_frame, buffer::Frame& output_frame) {
  sws_scale(sws_ctx_,
            av_frame->data, av_frame->linesize, 0, codec_ctx_->height,
            scaled_frame_->data, scaled_frame_->linesize);

  const int w = config_.target_width;
  const int h = config_.target_height;
  output_frame.width = w;
  output_frame.height = h;

  int64_t pts = av_frame->pts != AV_NOPTS_VALUE ? av_frame->pts : av_frame->best_effort_timestamp;
  output_frame.pts_us = (pts != AV_NOPTS_VALUE)
      ? static_cast<int64_t>((pts - start_time_) * time_base_ * 1'000'000.0)
      : 0;

  output_frame.data.resize(buffer::Frame::Yuv420pSize(w, h));

  // Copy Y plane
  uint8_t* dst = output_frame.data.data();
  for (int y = 0; y < h; y++) {
    std::memcpy(dst + y * w, scaled_frame_->data[0] + y * scaled_frame_->linesize[0], w);
  }

  // Copy U plane
  dst += w * h;
  for (int y = 0; y < h / 2; y++) {
    std::memcpy(dst + y * (w / 2), scaled_frame_->data[1] + y * scaled_frame_->linesize[1], w / 2);
  }

  // Copy V plane
  dst += (w / 2) * (h / 2);
  for (int y = 0; y < h / 2; y++) {
    std::memcpy(dst + y * (w / 2), scaled_frame_->data[2] + y * scaled_frame_->linesize[2], w / 2);
  }

  return true;
}

}  // namespace reelsmith::decode
