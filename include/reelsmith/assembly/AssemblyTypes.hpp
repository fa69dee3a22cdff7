// Repository: Reelsmith
// Component: Assembly Types
// Purpose: Data structures shared by loader, reconciler, fallback and compositor.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_ASSEMBLY_TYPES_HPP_
#define REELSMITH_ASSEMBLY_ASSEMBLY_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelsmith/util/RationalFps.hpp"

namespace reelsmith::assembly {

// All durations and offsets are integer microseconds.
inline constexpr int64_t kMicrosPerSecond = 1000000;

// Timeline totals must equal the target within one millisecond.
inline constexpr int64_t kDurationToleranceUs = 1000;

inline constexpr int64_t SecondsToUs(double seconds) {
  return static_cast<int64_t>(seconds * static_cast<double>(kMicrosPerSecond) +
                              (seconds >= 0 ? 0.5 : -0.5));
}

inline constexpr double UsToSeconds(int64_t us) {
  return static_cast<double>(us) / static_cast<double>(kMicrosPerSecond);
}

// =============================================================================
// Error Codes
// =============================================================================

enum class AssemblyError {
  kNone = 0,

  // Per-asset: path missing, unreadable, or probe failed. Skip and continue.
  kAssetOpen,

  // Per-asset: cannot be scaled to the output frame size. Skip and continue.
  kFormatMismatch,

  // No eligible video: route to the fallback generator. Not a failure.
  kEmptyInput,

  // Narration missing or unplayable; there is no target duration.
  kAudioUnavailable,

  // Encoder/muxer could not be opened or failed mid-write.
  kEncodeFailed,

  // Output missing or below the size floor after writing.
  kEncodeValidation,

  // Malformed request (empty prompt, empty output path, bad profile).
  kInvalidRequest,

  // Script provider failed or produced no script.
  kScriptUnavailable,

  // Caller raised the cancel flag before the output was committed.
  kCancelled,
};

const char* AssemblyErrorToString(AssemblyError error);

// =============================================================================
// Media Handles
// =============================================================================

struct FrameSize {
  int32_t width = 0;
  int32_t height = 0;

  bool IsEmpty() const { return width <= 0 || height <= 0; }
  bool operator==(const FrameSize& o) const { return width == o.width && height == o.height; }
  bool operator!=(const FrameSize& o) const { return !(*this == o); }
};

enum class SourceKind : int32_t {
  kFile = 0,       // Decoded from `path`
  kSynthetic = 1,  // Solid color + caption, rendered in-process
};

inline const char* SourceKindName(SourceKind k) {
  switch (k) {
    case SourceKind::kFile:      return "FILE";
    case SourceKind::kSynthetic: return "SYNTHETIC";
  }
  return "UNKNOWN";
}

// Look of a synthetic clip. Caption may contain '\n'.
struct SyntheticLook {
  uint32_t rgb = 0x000000;
  std::string caption;
  int32_t font_size = 100;  // Caption height in pixels at 1080 lines

  bool operator==(const SyntheticLook& o) const {
    return rgb == o.rgb && caption == o.caption && font_size == o.font_size;
  }
};

struct VideoAsset {
  std::string path;  // File path, or internal:// URI for synthetic assets
  int64_t duration_us = 0;
  FrameSize frame_size;
  util::RationalFps frame_rate;
  bool has_audio = false;     // Embedded audio is always replaced on output
  bool needs_scaling = false;  // Set by normalization
  SourceKind kind = SourceKind::kFile;
  SyntheticLook look;  // kSynthetic only

  double DurationSeconds() const { return UsToSeconds(duration_us); }

  // Opened successfully, positive duration, non-zero frame dimensions.
  bool IsEligible() const { return duration_us > 0 && !frame_size.IsEmpty(); }
};

struct AudioTrack {
  std::string path;
  int64_t duration_us = 0;
  int32_t sample_rate = 0;
  int32_t channels = 0;

  double DurationSeconds() const { return UsToSeconds(duration_us); }
};

// =============================================================================
// Timeline
// =============================================================================

// Trimmed reference into Timeline::assets[asset_index]. Never a copy of media.
// 0 <= start_offset_us < end_offset_us <= asset.duration_us
struct Segment {
  int32_t asset_index = -1;
  int64_t start_offset_us = 0;
  int64_t end_offset_us = 0;

  int64_t DurationUs() const { return end_offset_us - start_offset_us; }

  bool operator==(const Segment& o) const {
    return asset_index == o.asset_index && start_offset_us == o.start_offset_us &&
           end_offset_us == o.end_offset_us;
  }
  bool operator!=(const Segment& o) const { return !(*this == o); }
};

struct Timeline {
  // Immutable ordered asset list the segments index into.
  std::vector<VideoAsset> assets;
  std::vector<Segment> segments;

  // Trailing black/silent filler appended when segments under-run the target.
  int64_t filler_us = 0;

  int64_t target_us = 0;

  int64_t SegmentTotalUs() const;
  int64_t TotalUs() const { return SegmentTotalUs() + filler_us; }
  bool IsEmpty() const { return segments.empty(); }

  // True when TotalUs() is within kDurationToleranceUs of target_us.
  bool MatchesTarget() const;

  const VideoAsset& AssetFor(const Segment& seg) const { return assets.at(seg.asset_index); }
};

// =============================================================================
// Assembly Result
// =============================================================================

struct AssemblyResult {
  bool ok = false;
  AssemblyError error = AssemblyError::kNone;
  std::string detail;

  // Success only
  std::string output_path;
  int64_t output_bytes = 0;

  // Conform adjustments applied before encoding (diagnostics).
  int64_t truncated_us = 0;
  int64_t filler_us = 0;

  static AssemblyResult Success(std::string path, int64_t bytes,
                                int64_t truncated_us = 0, int64_t filler_us = 0) {
    return {true, AssemblyError::kNone, "", std::move(path), bytes, truncated_us, filler_us};
  }

  static AssemblyResult Failure(AssemblyError err, const std::string& detail = "") {
    return {false, err, detail, "", 0, 0, 0};
  }
};

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_ASSEMBLY_TYPES_HPP_
