// Repository: Reelsmith
// Component: Duration Reconciler
// Purpose: Turn an ordered clip list into a Timeline whose length equals the
//          narration length, by looping (under-run) or trimming (over-run).
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_DURATION_RECONCILER_HPP_
#define REELSMITH_ASSEMBLY_DURATION_RECONCILER_HPP_

#include <cstdint>
#include <vector>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"

namespace reelsmith::assembly {

enum class ReconcileMode {
  kEmpty,     // No eligible assets; caller must invoke the fallback generator
  kUnderRun,  // Assets looped round-robin, last repetition trimmed
  kOverRun,   // Assets walked in order, crossing asset trimmed, rest dropped
  kExact,     // Assets appended unmodified
};

const char* ReconcileModeToString(ReconcileMode mode);

struct ReconcileResult {
  ReconcileMode mode = ReconcileMode::kEmpty;
  Timeline timeline;

  // Number of input assets not referenced by any segment (over-run drops).
  int32_t dropped_assets = 0;

  bool EmptyInput() const { return mode == ReconcileMode::kEmpty; }
};

// Stateless. The asset list is taken by value and becomes the Timeline's
// immutable asset table; segments index into it.
//
// Under-run and over-run are asymmetric: under-run repeats the
// whole list in order and trims the final repetition, over-run trims the
// first asset that crosses the target and drops everything after it. Every
// trim keeps the head of the asset ([0, remaining]).
class DurationReconciler {
 public:
  explicit DurationReconciler(const runtime::AssemblyContext& ctx);

  ReconcileResult Reconcile(std::vector<VideoAsset> assets, int64_t target_us) const;

 private:
  void LoopToTarget(Timeline& timeline) const;
  int32_t TrimToTarget(Timeline& timeline) const;
  void AppendAll(Timeline& timeline) const;

  const runtime::AssemblyContext& ctx_;
};

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_DURATION_RECONCILER_HPP_
