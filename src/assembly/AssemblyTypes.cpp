// Repository: Reelsmith
// Component: Assembly Types Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/assembly/AssemblyTypes.hpp"

namespace reelsmith::assembly {

const char* AssemblyErrorToString(AssemblyError error) {
  switch (error) {
    case AssemblyError::kNone:              return "NONE";
    case AssemblyError::kAssetOpen:         return "ASSET_OPEN_ERROR";
    case AssemblyError::kFormatMismatch:    return "FORMAT_MISMATCH_ERROR";
    case AssemblyError::kEmptyInput:        return "EMPTY_INPUT";
    case AssemblyError::kAudioUnavailable:  return "AUDIO_UNAVAILABLE";
    case AssemblyError::kEncodeFailed:      return "ENCODE_FAILED";
    case AssemblyError::kEncodeValidation:  return "ENCODE_VALIDATION_ERROR";
    case AssemblyError::kInvalidRequest:    return "INVALID_REQUEST";
    case AssemblyError::kScriptUnavailable: return "SCRIPT_UNAVAILABLE";
    case AssemblyError::kCancelled:         return "CANCELLED";
  }
  return "UNKNOWN";
}

int64_t Timeline::SegmentTotalUs() const {
  int64_t sum = 0;
  for (const auto& seg : segments) {
    sum += seg.DurationUs();
  }
  return sum;
}

bool Timeline::MatchesTarget() const {
  int64_t diff = TotalUs() - target_us;
  if (diff < 0) diff = -diff;
  return diff <= kDurationToleranceUs;
}

}  // namespace reelsmith::assembly
