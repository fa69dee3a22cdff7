// Repository: Reelsmith
// Component: Encoder Pipeline
// Purpose: Owns FFmpeg encoder/muxer handles and writes one MP4 file.
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/output/EncoderPipeline.hpp"

#include <cstddef>
#include <cstring>
#include <sstream>

#include "reelsmith/buffer/Frame.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace reelsmith::output {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

// Used when the codec reports a variable frame size.
constexpr int kDefaultAudioFrameSize = 1024;

}  // namespace

EncoderPipeline::EncoderPipeline(const runtime::AssemblyContext& ctx) : ctx_(ctx) {}

EncoderPipeline::~EncoderPipeline() {
  close();
}

bool EncoderPipeline::open(const std::string& output_path) {
  if (initialized_) {
    return true;
  }

  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, runtime::kContainerFormat,
                                           output_path.c_str());
  if (ret < 0 || !format_ctx_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate output context: " +
                      AvErrorString(ret));
    close();
    return false;
  }

  if (!OpenVideoEncoder() || !OpenAudioEncoder()) {
    close();
    return false;
  }

  packet_ = av_packet_alloc();
  pending_video_packet_ = av_packet_alloc();
  if (!packet_ || !pending_video_packet_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate packets");
    close();
    return false;
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, output_path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      ctx_.logger.Error("[EncoderPipeline] Failed to open output " + output_path + ": " +
                        AvErrorString(ret));
      close();
      return false;
    }
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to write header: " + AvErrorString(ret));
    close();
    return false;
  }
  header_written_ = true;

  std::ostringstream oss;
  oss << "[EncoderPipeline] Opened " << output_path << " " << codec_ctx_->width << "x"
      << codec_ctx_->height << " @ " << ctx_.profile.video.frame_rate << " "
      << runtime::kVideoEncoderName << "+" << runtime::kAudioEncoderName << " "
      << audio_codec_ctx_->sample_rate << " Hz";
  ctx_.logger.Info(oss.str());

  initialized_ = true;
  return true;
}

bool EncoderPipeline::OpenVideoEncoder() {
  const AVCodec* codec = avcodec_find_encoder_by_name(runtime::kVideoEncoderName);
  if (!codec) {
    ctx_.logger.Error(std::string("[EncoderPipeline] ") + runtime::kVideoEncoderName +
                      " not found");
    return false;
  }

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!video_stream_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to create video stream");
    return false;
  }
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate codec context");
    return false;
  }

  const util::RationalFps fps = ctx_.profile.GetFrameRate();
  codec_ctx_->width = ctx_.profile.video.width;
  codec_ctx_->height = ctx_.profile.video.height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->bit_rate = ctx_.profile.video.bitrate;
  codec_ctx_->gop_size = ctx_.profile.video.gop_size;
  // No B-frames: packets leave the encoder in presentation order, which
  // lets finish() clamp the last one.
  codec_ctx_->max_b_frames = 0;
  codec_ctx_->time_base = AVRational{static_cast<int>(fps.den), static_cast<int>(fps.num)};
  codec_ctx_->framerate = AVRational{static_cast<int>(fps.num), static_cast<int>(fps.den)};
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "preset", "veryfast", 0);
  av_dict_set(&opts, "x264-params", "bframes=0", 0);
  int ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to open video codec: " + AvErrorString(ret));
    return false;
  }

  // Copy AFTER avcodec_open2 so extradata (SPS/PPS) reaches the container.
  ret = avcodec_parameters_from_context(video_stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to copy codec parameters: " + AvErrorString(ret));
    return false;
  }
  video_stream_->time_base = codec_ctx_->time_base;
  video_stream_->avg_frame_rate = codec_ctx_->framerate;

  frame_ = av_frame_alloc();
  if (!frame_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate frame");
    return false;
  }
  frame_->format = AV_PIX_FMT_YUV420P;
  frame_->width = codec_ctx_->width;
  frame_->height = codec_ctx_->height;
  ret = av_frame_get_buffer(frame_, 32);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate frame buffer: " + AvErrorString(ret));
    return false;
  }
  return true;
}

bool EncoderPipeline::OpenAudioEncoder() {
  const AVCodec* audio_codec = avcodec_find_encoder_by_name(runtime::kAudioEncoderName);
  if (!audio_codec) {
    ctx_.logger.Error(std::string("[EncoderPipeline] ") + runtime::kAudioEncoderName +
                      " not found");
    return false;
  }

  audio_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!audio_stream_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to create audio stream");
    return false;
  }
  audio_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  audio_codec_ctx_ = avcodec_alloc_context3(audio_codec);
  if (!audio_codec_ctx_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate audio codec context");
    return false;
  }

  audio_codec_ctx_->sample_fmt = AV_SAMPLE_FMT_FLTP;  // AAC typically uses float planar
  if (audio_codec->sample_fmts) {
    audio_codec_ctx_->sample_fmt = audio_codec->sample_fmts[0];
  }
  audio_codec_ctx_->sample_rate = ctx_.profile.audio.sample_rate;
  av_channel_layout_default(&audio_codec_ctx_->ch_layout, ctx_.profile.audio.channels);
  audio_codec_ctx_->bit_rate = ctx_.profile.audio.bitrate;
  audio_codec_ctx_->time_base = AVRational{1, audio_codec_ctx_->sample_rate};
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    audio_codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  int ret = avcodec_open2(audio_codec_ctx_, audio_codec, nullptr);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to open audio codec: " + AvErrorString(ret));
    return false;
  }

  ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_codec_ctx_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to copy audio codec parameters: " +
                      AvErrorString(ret));
    return false;
  }
  audio_stream_->time_base = audio_codec_ctx_->time_base;

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate audio frame");
    return false;
  }
  audio_frame_->format = audio_codec_ctx_->sample_fmt;
  audio_frame_->sample_rate = audio_codec_ctx_->sample_rate;
  av_channel_layout_copy(&audio_frame_->ch_layout, &audio_codec_ctx_->ch_layout);
  audio_frame_->nb_samples =
      audio_codec_ctx_->frame_size > 0 ? audio_codec_ctx_->frame_size : kDefaultAudioFrameSize;
  ret = av_frame_get_buffer(audio_frame_, 0);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to allocate audio frame buffer: " +
                      AvErrorString(ret));
    return false;
  }

  // Input is always S16 interleaved at the output rate; only the sample
  // format/layout changes here.
  ret = swr_alloc_set_opts2(&swr_ctx_,
                            &audio_codec_ctx_->ch_layout, audio_codec_ctx_->sample_fmt,
                            audio_codec_ctx_->sample_rate,
                            &audio_codec_ctx_->ch_layout, AV_SAMPLE_FMT_S16,
                            audio_codec_ctx_->sample_rate,
                            0, nullptr);
  if (ret < 0 || swr_init(swr_ctx_) < 0) {
    ctx_.logger.Error("[EncoderPipeline] Failed to initialize audio converter");
    return false;
  }
  return true;
}

bool EncoderPipeline::encodeFrame(const buffer::Frame& frame, int64_t frame_index) {
  if (!initialized_) return false;

  const int w = codec_ctx_->width;
  const int h = codec_ctx_->height;
  if (frame.width != w || frame.height != h ||
      frame.data.size() < buffer::Frame::Yuv420pSize(w, h)) {
    ctx_.logger.Error("[EncoderPipeline] Frame size mismatch: got " +
                      std::to_string(frame.width) + "x" + std::to_string(frame.height));
    return false;
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Frame not writable: " + AvErrorString(ret));
    return false;
  }

  const uint8_t* src = frame.data.data();
  for (int y = 0; y < h; ++y) {
    std::memcpy(frame_->data[0] + y * frame_->linesize[0], src + y * w, w);
  }
  src += w * h;
  for (int plane = 1; plane <= 2; ++plane) {
    for (int y = 0; y < h / 2; ++y) {
      std::memcpy(frame_->data[plane] + y * frame_->linesize[plane], src + y * (w / 2), w / 2);
    }
    src += (w / 2) * (h / 2);
  }

  frame_->pts = frame_index;
  frame_->duration = 1;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] send_frame failed at frame " +
                      std::to_string(frame_index) + ": " + AvErrorString(ret));
    return false;
  }
  return DrainVideo();
}

bool EncoderPipeline::encodeAudioFrame(const buffer::AudioFrame& audio_frame) {
  if (!initialized_) return false;

  const int channels = audio_codec_ctx_->ch_layout.nb_channels;
  if (audio_frame.sample_rate != audio_codec_ctx_->sample_rate ||
      audio_frame.channels != channels) {
    ctx_.logger.Error("[EncoderPipeline] Audio format mismatch: " +
                      std::to_string(audio_frame.sample_rate) + " Hz x" +
                      std::to_string(audio_frame.channels));
    return false;
  }

  const int16_t* samples = audio_frame.Samples();
  audio_fifo_.insert(audio_fifo_.end(), samples,
                     samples + static_cast<size_t>(audio_frame.nb_samples) * channels);

  const int frame_size = audio_frame_->nb_samples;
  while (audio_fifo_.size() >= static_cast<size_t>(frame_size) * channels) {
    if (!EncodeAudioChunk(frame_size)) return false;
  }
  return true;
}

bool EncoderPipeline::EncodeAudioChunk(int nb_samples) {
  const int channels = audio_codec_ctx_->ch_layout.nb_channels;

  int ret = av_frame_make_writable(audio_frame_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Audio frame not writable: " + AvErrorString(ret));
    return false;
  }

  const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(audio_fifo_.data())};
  const int converted = swr_convert(swr_ctx_, audio_frame_->data, nb_samples, in, nb_samples);
  if (converted < 0) {
    ctx_.logger.Error("[EncoderPipeline] Audio conversion failed: " + AvErrorString(converted));
    return false;
  }
  audio_fifo_.erase(audio_fifo_.begin(),
                    audio_fifo_.begin() + static_cast<ptrdiff_t>(nb_samples) * channels);

  audio_frame_->nb_samples = converted;
  audio_frame_->pts = audio_samples_encoded_;
  audio_samples_encoded_ += converted;

  ret = avcodec_send_frame(audio_codec_ctx_, audio_frame_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Audio send_frame failed: " + AvErrorString(ret));
    return false;
  }
  return DrainAudio();
}

bool EncoderPipeline::DrainVideo() {
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      ctx_.logger.Error("[EncoderPipeline] receive_packet failed: " + AvErrorString(ret));
      return false;
    }

    packet_->stream_index = video_stream_->index;
    av_packet_rescale_ts(packet_, codec_ctx_->time_base, video_stream_->time_base);

    if (has_pending_video_ && !WritePendingVideo()) {
      return false;
    }
    av_packet_move_ref(pending_video_packet_, packet_);
    has_pending_video_ = true;
  }
  return true;
}

bool EncoderPipeline::WritePendingVideo() {
  // av_interleaved_write_frame takes ownership and unrefs the packet.
  int ret = av_interleaved_write_frame(format_ctx_, pending_video_packet_);
  has_pending_video_ = false;
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Error writing video packet: " + AvErrorString(ret));
    return false;
  }
  return true;
}

bool EncoderPipeline::DrainAudio() {
  while (true) {
    int ret = avcodec_receive_packet(audio_codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      ctx_.logger.Error("[EncoderPipeline] Audio receive_packet failed: " + AvErrorString(ret));
      return false;
    }

    packet_->stream_index = audio_stream_->index;
    av_packet_rescale_ts(packet_, audio_codec_ctx_->time_base, audio_stream_->time_base);
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      ctx_.logger.Error("[EncoderPipeline] Error writing audio packet: " + AvErrorString(ret));
      return false;
    }
  }
  return true;
}

bool EncoderPipeline::finish(int64_t total_duration_us) {
  if (!initialized_) return false;

  // Video: drain the encoder; the last packet stays held back.
  int ret = avcodec_send_frame(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    ctx_.logger.Error("[EncoderPipeline] Video flush failed: " + AvErrorString(ret));
    return false;
  }
  if (!DrainVideo()) return false;

  // Audio: the remainder goes out as one short final frame.
  const int channels = audio_codec_ctx_->ch_layout.nb_channels;
  const int remaining = static_cast<int>(audio_fifo_.size() / channels);
  if (remaining > 0 && !EncodeAudioChunk(remaining)) return false;
  ret = avcodec_send_frame(audio_codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    ctx_.logger.Error("[EncoderPipeline] Audio flush failed: " + AvErrorString(ret));
    return false;
  }
  if (!DrainAudio()) return false;

  if (has_pending_video_) {
    // End the video track exactly at the target, not at the frame grid.
    const int64_t end_ts =
        av_rescale_q(total_duration_us, AVRational{1, 1000000}, video_stream_->time_base);
    if (end_ts > pending_video_packet_->pts) {
      pending_video_packet_->duration = end_ts - pending_video_packet_->pts;
    }
    if (!WritePendingVideo()) return false;
  }

  ret = av_write_trailer(format_ctx_);
  if (ret < 0) {
    ctx_.logger.Error("[EncoderPipeline] Error writing trailer: " + AvErrorString(ret));
    return false;
  }

  std::ostringstream oss;
  oss << "[EncoderPipeline] Finished duration_us=" << total_duration_us
      << " audio_samples=" << audio_samples_encoded_;
  ctx_.logger.Info(oss.str());
  return true;
}

void EncoderPipeline::close() {
  initialized_ = false;

  if (format_ctx_ && format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    avio_closep(&format_ctx_->pb);
  }
  if (format_ctx_) {
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  video_stream_ = nullptr;  // Owned by format_ctx_
  audio_stream_ = nullptr;

  if (frame_) {
    av_frame_free(&frame_);
  }
  if (audio_frame_) {
    av_frame_free(&audio_frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (pending_video_packet_) {
    av_packet_free(&pending_video_packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (audio_codec_ctx_) {
    avcodec_free_context(&audio_codec_ctx_);
  }
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }

  audio_fifo_.clear();
  audio_samples_encoded_ = 0;
  has_pending_video_ = false;
  header_written_ = false;
}

bool EncoderPipeline::IsInitialized() const {
  return initialized_;
}

}  // namespace reelsmith::output
