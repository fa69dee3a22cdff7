// Repository: Reelsmith
// Component: OutputProfile Domain
// Purpose: The single fixed encode target every assembled video is written to.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_RUNTIME_OUTPUT_PROFILE_HPP_
#define REELSMITH_RUNTIME_OUTPUT_PROFILE_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "reelsmith/util/RationalFps.hpp"

namespace reelsmith::runtime {

// Codecs and container are not configurable: one video codec, one audio
// codec, one container for every request.
inline constexpr const char* kVideoEncoderName = "libx264";
inline constexpr const char* kAudioEncoderName = "aac";
inline constexpr const char* kContainerFormat = "mp4";

// OutputProfile is fixed per deployment and shared read-only by every
// request. Resolution, cadence, bitrates and the fallback look can be
// supplied as JSON; anything omitted keeps the default below.
struct OutputProfile {
  struct Video {
    int32_t width;           // Output width in pixels
    int32_t height;          // Output height in pixels
    std::string frame_rate;  // Rational string (e.g., "24/1", "30000/1001")
    int64_t bitrate;         // Target video bitrate (bits/s)
    int32_t gop_size;        // Keyframe interval in frames

    Video()
        : width(1920), height(1080), frame_rate("24/1"), bitrate(5000000), gop_size(48) {}
  } video;

  struct Audio {
    int32_t sample_rate;  // Sample rate in Hz
    int32_t channels;     // Channel count
    int64_t bitrate;      // Target audio bitrate (bits/s)

    Audio() : sample_rate(44100), channels(2), bitrate(128000) {}
  } audio;

  // Post-write validation floor; smaller outputs are treated as corrupt.
  int64_t min_output_bytes = 10000;

  // 0xRRGGBB colors.
  uint32_t filler_rgb = 0x000000;
  uint32_t fallback_rgb = 0x1E90FF;
  std::string fallback_caption = "AI Generated Video";

  // Parse from JSON. Fields are optional; present fields must be valid.
  // Returns empty optional on parse/validation failure.
  static std::optional<OutputProfile> FromJson(const std::string& json_str);

  std::string ToJson() const;

  bool IsValid() const;

  // Parsed frame_rate; 0/1 when malformed.
  util::RationalFps GetFrameRate() const;
};

}  // namespace reelsmith::runtime

#endif  // REELSMITH_RUNTIME_OUTPUT_PROFILE_HPP_
