// Repository: Reelsmith
// Component: File Frame Source
// Purpose: IFrameSource backed by an FFmpegDecoder for one clip segment.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_PRODUCERS_FILE_FRAME_SOURCE_HPP_
#define REELSMITH_PRODUCERS_FILE_FRAME_SOURCE_HPP_

#include <memory>

#include "reelsmith/decode/FFmpegDecoder.hpp"
#include "reelsmith/producers/IFrameSource.hpp"

namespace reelsmith::producers {

class FileFrameSource : public IFrameSource {
 public:
  // Takes ownership of an already opened decoder. Frames before
  // start_offset_us (left over from keyframe seeking) are skipped and
  // timestamps are rebased so the first delivered frame is near 0.
  FileFrameSource(std::unique_ptr<decode::FFmpegDecoder> decoder, int64_t start_offset_us);

  bool NextFrame(buffer::Frame& out) override;

 private:
  std::unique_ptr<decode::FFmpegDecoder> decoder_;
  int64_t start_offset_us_;
  bool preroll_done_ = false;

  // Frame read past the preroll boundary, delivered on the next call.
  buffer::Frame pending_;
  bool has_pending_ = false;
};

}  // namespace reelsmith::producers

#endif  // REELSMITH_PRODUCERS_FILE_FRAME_SOURCE_HPP_
