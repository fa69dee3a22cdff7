// Repository: Reelsmith
// Component: Frame Buffers
// Purpose: Raw decoded video/audio frames passed from sources to the encoder.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_BUFFER_FRAME_HPP_
#define REELSMITH_BUFFER_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace reelsmith::buffer {

// Frame is one decoded picture in planar YUV420P: Y plane (width*height)
// followed by U and V planes ((width/2)*(height/2) each), no padding.
struct Frame {
  int32_t width = 0;
  int32_t height = 0;
  int64_t pts_us = 0;  // Source-relative presentation time
  std::vector<uint8_t> data;

  bool IsEmpty() const { return data.empty(); }

  static size_t Yuv420pSize(int32_t w, int32_t h) {
    return static_cast<size_t>(w) * static_cast<size_t>(h) +
           2 * static_cast<size_t>(w / 2) * static_cast<size_t>(h / 2);
  }
};

// AudioFrame holds interleaved signed 16-bit PCM.
// data.size() == nb_samples * channels * sizeof(int16_t)
struct AudioFrame {
  int32_t sample_rate = 0;
  int32_t channels = 0;
  int32_t nb_samples = 0;
  int64_t pts_us = 0;
  std::vector<uint8_t> data;

  const int16_t* Samples() const { return reinterpret_cast<const int16_t*>(data.data()); }
  int16_t* Samples() { return reinterpret_cast<int16_t*>(data.data()); }
};

}  // namespace reelsmith::buffer

#endif  // REELSMITH_BUFFER_FRAME_HPP_
