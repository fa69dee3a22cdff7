// Repository: Reelsmith
// Component: Timeline Conformer Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/assembly/TimelineConformer.hpp"

namespace reelsmith::assembly {

ConformReport ConformToTarget(Timeline& timeline, int64_t target_us) {
  ConformReport report;
  timeline.target_us = target_us;
  timeline.filler_us = 0;
  report.realized_us = timeline.SegmentTotalUs();

  if (target_us <= 0) {
    report.truncated_us = report.realized_us;
    timeline.segments.clear();
    return report;
  }

  if (report.realized_us > target_us) {
    int64_t excess = report.realized_us - target_us;
    report.truncated_us = excess;
    while (excess > 0 && !timeline.segments.empty()) {
      Segment& tail = timeline.segments.back();
      const int64_t len = tail.DurationUs();
      if (len <= excess) {
        excess -= len;
        timeline.segments.pop_back();
      } else {
        tail.end_offset_us -= excess;
        excess = 0;
      }
    }
  } else if (report.realized_us < target_us) {
    report.filler_us = target_us - report.realized_us;
    timeline.filler_us = report.filler_us;
  }

  return report;
}

}  // namespace reelsmith::assembly
