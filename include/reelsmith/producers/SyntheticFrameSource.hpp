// Repository: Reelsmith
// Component: Synthetic Frame Source
// Purpose: Render a solid-color clip with a centered caption.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_PRODUCERS_SYNTHETIC_FRAME_SOURCE_HPP_
#define REELSMITH_PRODUCERS_SYNTHETIC_FRAME_SOURCE_HPP_

#include <string>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/producers/IFrameSource.hpp"
#include "reelsmith/util/Logger.hpp"

namespace reelsmith::producers {

// Builds the libavfilter graph description used to draw `look`.
// Exposed for tests; the caption is escaped for both the graph parser and
// the drawtext option parser.
std::string BuildCaptionFilterGraph(const assembly::SyntheticLook& look,
                                    int32_t width, int32_t height);

// The picture never changes, so exactly one frame is rendered and delivered;
// the compositor holds it for the rest of the segment.
//
// Color is guaranteed, the caption is best effort: if the drawtext graph
// cannot be built (filter missing, no usable font) a plain color frame is
// produced and a warning logged.
class SyntheticFrameSource : public IFrameSource {
 public:
  SyntheticFrameSource(const assembly::SyntheticLook& look, int32_t width, int32_t height,
                       const util::Logger& logger);

  bool NextFrame(buffer::Frame& out) override;

  bool CaptionRendered() const { return caption_rendered_; }

 private:
  bool RenderCaptioned(const assembly::SyntheticLook& look, int32_t width, int32_t height);

  const util::Logger& logger_;
  buffer::Frame frame_;
  bool caption_rendered_ = false;
  bool delivered_ = false;
};

}  // namespace reelsmith::producers

#endif  // REELSMITH_PRODUCERS_SYNTHETIC_FRAME_SOURCE_HPP_
