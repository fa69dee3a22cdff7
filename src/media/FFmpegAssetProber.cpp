// Repository: Reelsmith
// Component: FFmpeg Asset Prober Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/media/FFmpegAssetProber.hpp"

#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

namespace reelsmith::media {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

struct FormatContextCloser {
  void operator()(AVFormatContext* ctx) const {
    if (ctx) avformat_close_input(&ctx);
  }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

int64_t StreamDurationUs(const AVStream* stream) {
  if (stream->duration == AV_NOPTS_VALUE || stream->duration <= 0) return 0;
  return av_rescale_q(stream->duration, stream->time_base, AVRational{1, 1000000});
}

}  // namespace

ProbeInfo FFmpegAssetProber::Probe(const std::string& path) {
  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    return ProbeInfo::Failed("open_input: " + AvErrorString(ret));
  }
  FormatContextPtr fmt_ctx(raw);

  ret = avformat_find_stream_info(fmt_ctx.get(), nullptr);
  if (ret < 0) {
    return ProbeInfo::Failed("find_stream_info: " + AvErrorString(ret));
  }

  ProbeInfo info;
  info.ok = true;

  // AV_TIME_BASE is microseconds.
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    info.duration_us = fmt_ctx->duration;
  }

  for (unsigned int i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVStream* stream = fmt_ctx->streams[i];
    const AVCodecParameters* par = stream->codecpar;

    if (par->codec_type == AVMEDIA_TYPE_VIDEO && !info.has_video) {
      // Cover art is a single attached picture, not a video track.
      if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) continue;

      info.has_video = true;
      info.width = par->width;
      info.height = par->height;

      // r_frame_rate is the nominal cadence; avg_frame_rate is diagnostics only.
      AVRational fps = stream->r_frame_rate;
      if (fps.num <= 0 || fps.den <= 0) fps = stream->avg_frame_rate;
      if (fps.num > 0 && fps.den > 0) {
        info.frame_rate = util::RationalFps(fps.num, fps.den);
      }

      const auto pix_fmt = static_cast<AVPixelFormat>(par->format);
      info.pixel_format_scalable = pix_fmt != AV_PIX_FMT_NONE && sws_isSupportedInput(pix_fmt) > 0;

      if (info.duration_us == 0) info.duration_us = StreamDurationUs(stream);
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !info.has_audio) {
      info.has_audio = true;
      info.sample_rate = par->sample_rate;
      info.channels = par->ch_layout.nb_channels;

      if (info.duration_us == 0) info.duration_us = StreamDurationUs(stream);
    }
  }

  return info;
}

}  // namespace reelsmith::media
