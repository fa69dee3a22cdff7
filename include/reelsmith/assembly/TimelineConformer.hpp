// Repository: Reelsmith
// Component: Timeline Conformer
// Purpose: Final duration gate before encoding. Cuts the tail of a timeline
//          that runs long, or schedules trailing filler for one that runs short.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_TIMELINE_CONFORMER_HPP_
#define REELSMITH_ASSEMBLY_TIMELINE_CONFORMER_HPP_

#include <cstdint>

#include "reelsmith/assembly/AssemblyTypes.hpp"

namespace reelsmith::assembly {

struct ConformReport {
  int64_t realized_us = 0;   // Segment total before conforming
  int64_t truncated_us = 0;  // Removed from the tail
  int64_t filler_us = 0;     // Scheduled as trailing filler

  bool Unchanged() const { return truncated_us == 0 && filler_us == 0; }
};

// Mutates `timeline` in place so that TotalUs() == target_us exactly.
// A timeline that already matches leaves segments and filler untouched.
ConformReport ConformToTarget(Timeline& timeline, int64_t target_us);

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_TIMELINE_CONFORMER_HPP_
