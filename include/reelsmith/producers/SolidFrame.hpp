// Repository: Reelsmith
// Component: Solid Frame
// Purpose: Single-color YUV420P frames for filler and uncaptioned fallbacks.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_PRODUCERS_SOLID_FRAME_HPP_
#define REELSMITH_PRODUCERS_SOLID_FRAME_HPP_

#include <cstdint>

#include "reelsmith/buffer/Frame.hpp"

namespace reelsmith::producers {

struct YuvColor {
  uint8_t y;
  uint8_t u;
  uint8_t v;
};

// BT.601 limited range. 0x000000 maps to Y=0x10, U=V=0x80.
YuvColor RgbToYuv(uint32_t rgb);

buffer::Frame MakeSolidFrame(int32_t width, int32_t height, uint32_t rgb);

}  // namespace reelsmith::producers

#endif  // REELSMITH_PRODUCERS_SOLID_FRAME_HPP_
