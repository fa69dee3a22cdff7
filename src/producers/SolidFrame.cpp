// Repository: Reelsmith
// Component: Solid Frame Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/producers/SolidFrame.hpp"

#include <cstring>

namespace reelsmith::producers {

namespace {

uint8_t Clamp8(int v) {
  return static_cast<uint8_t>(v < 0 ? 0 : (v > 255 ? 255 : v));
}

}  // namespace

YuvColor RgbToYuv(uint32_t rgb) {
  const int r = static_cast<int>((rgb >> 16) & 0xFF);
  const int g = static_cast<int>((rgb >> 8) & 0xFF);
  const int b = static_cast<int>(rgb & 0xFF);

  // Chroma sums go as low as -28432; the 128 << 8 bias keeps every shift
  // operand non-negative.
  YuvColor c;
  c.y = Clamp8(((66 * r + 129 * g + 25 * b + 128) >> 8) + 16);
  c.u = Clamp8((-38 * r - 74 * g + 112 * b + 128 + (128 << 8)) >> 8);
  c.v = Clamp8((112 * r - 94 * g - 18 * b + 128 + (128 << 8)) >> 8);
  return c;
}

buffer::Frame MakeSolidFrame(int32_t width, int32_t height, uint32_t rgb) {
  const YuvColor c = RgbToYuv(rgb);
  const size_t y_size = static_cast<size_t>(width) * static_cast<size_t>(height);
  const size_t uv_size = static_cast<size_t>(width / 2) * static_cast<size_t>(height / 2);

  buffer::Frame frame;
  frame.width = width;
  frame.height = height;
  frame.pts_us = 0;
  frame.data.resize(y_size + 2 * uv_size);
  std::memset(frame.data.data(), c.y, y_size);
  std::memset(frame.data.data() + y_size, c.u, uv_size);
  std::memset(frame.data.data() + y_size + uv_size, c.v, uv_size);
  return frame;
}

}  // namespace reelsmith::producers
