// Repository: Reelsmith
// Component: Synthetic Frame Source Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/producers/SyntheticFrameSource.hpp"

#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>

#include "reelsmith/producers/SolidFrame.hpp"

extern "C" {
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mem.h>
}

namespace reelsmith::producers {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

// Backslash-escape every char in `special` plus the backslash itself.
std::string Escape(const std::string& text, const char* special) {
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (c == '\\' || std::strchr(special, c) != nullptr) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

struct FilterGraphDeleter {
  void operator()(AVFilterGraph* g) const { avfilter_graph_free(&g); }
};

struct FrameDeleter {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};

struct InOutDeleter {
  void operator()(AVFilterInOut* io) const { avfilter_inout_free(&io); }
};

}  // namespace

std::string BuildCaptionFilterGraph(const assembly::SyntheticLook& look,
                                    int32_t width, int32_t height) {
  char color[16];
  std::snprintf(color, sizeof(color), "0x%06X", static_cast<unsigned>(look.rgb & 0xFFFFFF));

  // Font size is specified against 1080 lines and follows the output height.
  int font_size = height > 0 ? static_cast<int>(look.font_size * static_cast<int64_t>(height) / 1080)
                             : look.font_size;
  if (font_size < 8) font_size = 8;

  // Two parsing passes: drawtext options (':' and quotes), then the graph
  // (',', ';', brackets).
  const std::string text = Escape(Escape(look.caption, ":'"), "',;[]");

  std::ostringstream oss;
  oss << "color=c=" << color << ":s=" << width << "x" << height << ":r=1:d=1";
  if (!look.caption.empty()) {
    oss << ",drawtext=text=" << text << ":expansion=none:fontcolor=white:fontsize=" << font_size
        << ":x=(w-text_w)/2:y=(h-text_h)/2";
  }
  oss << ",format=yuv420p";
  return oss.str();
}

SyntheticFrameSource::SyntheticFrameSource(const assembly::SyntheticLook& look,
                                           int32_t width, int32_t height,
                                           const util::Logger& logger)
    : logger_(logger) {
  caption_rendered_ = RenderCaptioned(look, width, height);
  if (!caption_rendered_) {
    if (!look.caption.empty()) {
      logger_.Warn("[SyntheticFrameSource] Caption rendering unavailable; using plain color");
    }
    frame_ = MakeSolidFrame(width, height, look.rgb);
  }
}

bool SyntheticFrameSource::NextFrame(buffer::Frame& out) {
  if (delivered_) return false;
  out = frame_;
  out.pts_us = 0;
  delivered_ = true;
  return true;
}

bool SyntheticFrameSource::RenderCaptioned(const assembly::SyntheticLook& look,
                                           int32_t width, int32_t height) {
  if (look.caption.empty()) return false;

  std::unique_ptr<AVFilterGraph, FilterGraphDeleter> graph(avfilter_graph_alloc());
  if (!graph) return false;

  const AVFilter* sink_filter = avfilter_get_by_name("buffersink");
  if (!sink_filter || !avfilter_get_by_name("drawtext")) {
    logger_.Debug("[SyntheticFrameSource] drawtext filter not built in");
    return false;
  }

  AVFilterContext* sink_ctx = nullptr;
  int ret = avfilter_graph_create_filter(&sink_ctx, sink_filter, "out", nullptr, nullptr,
                                         graph.get());
  if (ret < 0) {
    logger_.Debug("[SyntheticFrameSource] buffersink: " + AvErrorString(ret));
    return false;
  }

  // The graph's dangling output pad feeds the sink labelled "out".
  std::unique_ptr<AVFilterInOut, InOutDeleter> inputs(avfilter_inout_alloc());
  if (!inputs) return false;
  inputs->name = av_strdup("out");
  inputs->filter_ctx = sink_ctx;
  inputs->pad_idx = 0;
  inputs->next = nullptr;

  const std::string desc = BuildCaptionFilterGraph(look, width, height);
  AVFilterInOut* in_raw = inputs.release();
  AVFilterInOut* out_raw = nullptr;
  ret = avfilter_graph_parse_ptr(graph.get(), desc.c_str(), &in_raw, &out_raw, nullptr);
  avfilter_inout_free(&in_raw);
  avfilter_inout_free(&out_raw);
  if (ret < 0) {
    logger_.Debug("[SyntheticFrameSource] graph parse failed: " + AvErrorString(ret) +
                  " desc=" + desc);
    return false;
  }

  ret = avfilter_graph_config(graph.get(), nullptr);
  if (ret < 0) {
    logger_.Debug("[SyntheticFrameSource] graph config failed: " + AvErrorString(ret));
    return false;
  }

  std::unique_ptr<AVFrame, FrameDeleter> av_frame(av_frame_alloc());
  if (!av_frame) return false;
  ret = av_buffersink_get_frame(sink_ctx, av_frame.get());
  if (ret < 0) {
    logger_.Debug("[SyntheticFrameSource] no frame from graph: " + AvErrorString(ret));
    return false;
  }
  if (av_frame->width != width || av_frame->height != height ||
      av_frame->format != AV_PIX_FMT_YUV420P) {
    return false;
  }

  frame_.width = width;
  frame_.height = height;
  frame_.pts_us = 0;
  frame_.data.resize(buffer::Frame::Yuv420pSize(width, height));

  uint8_t* dst = frame_.data.data();
  for (int y = 0; y < height; ++y) {
    std::memcpy(dst + y * width, av_frame->data[0] + y * av_frame->linesize[0], width);
  }
  dst += width * height;
  for (int plane = 1; plane <= 2; ++plane) {
    for (int y = 0; y < height / 2; ++y) {
      std::memcpy(dst + y * (width / 2), av_frame->data[plane] + y * av_frame->linesize[plane],
                  width / 2);
    }
    dst += (width / 2) * (height / 2);
  }

  logger_.Debug("[SyntheticFrameSource] Rendered caption \"" + look.caption + "\"");
  return true;
}

}  // namespace reelsmith::producers
