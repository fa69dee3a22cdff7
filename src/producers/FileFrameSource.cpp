// Repository: Reelsmith
// Component: File Frame Source Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/producers/FileFrameSource.hpp"

namespace reelsmith::producers {

FileFrameSource::FileFrameSource(std::unique_ptr<decode::FFmpegDecoder> decoder,
                                 int64_t start_offset_us)
    : decoder_(std::move(decoder)), start_offset_us_(start_offset_us) {
  if (start_offset_us_ <= 0) {
    start_offset_us_ = 0;
    preroll_done_ = true;
  }
}

bool FileFrameSource::NextFrame(buffer::Frame& out) {
  if (has_pending_) {
    out = std::move(pending_);
    has_pending_ = false;
    out.pts_us -= start_offset_us_;
    return true;
  }

  if (!decoder_->DecodeFrame(out)) {
    return false;
  }

  if (!preroll_done_) {
    // Seeking lands on the keyframe before the start. Keep the newest frame
    // at or before the start so the segment opens on the right picture.
    preroll_done_ = true;
    buffer::Frame next;
    while (out.pts_us < start_offset_us_ && decoder_->DecodeFrame(next)) {
      if (next.pts_us > start_offset_us_) {
        pending_ = std::move(next);
        has_pending_ = true;
        break;
      }
      out = std::move(next);
    }
    out.pts_us = out.pts_us < start_offset_us_ ? 0 : out.pts_us - start_offset_us_;
    return true;
  }

  out.pts_us -= start_offset_us_;
  return true;
}

}  // namespace reelsmith::producers
