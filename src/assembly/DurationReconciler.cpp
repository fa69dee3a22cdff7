// Repository: Reelsmith
// Component: Duration Reconciler Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/assembly/DurationReconciler.hpp"

#include <sstream>

namespace reelsmith::assembly {

const char* ReconcileModeToString(ReconcileMode mode) {
  switch (mode) {
    case ReconcileMode::kEmpty:    return "EMPTY";
    case ReconcileMode::kUnderRun: return "UNDER_RUN";
    case ReconcileMode::kOverRun:  return "OVER_RUN";
    case ReconcileMode::kExact:    return "EXACT";
  }
  return "UNKNOWN";
}

DurationReconciler::DurationReconciler(const runtime::AssemblyContext& ctx) : ctx_(ctx) {}

ReconcileResult DurationReconciler::Reconcile(std::vector<VideoAsset> assets,
                                              int64_t target_us) const {
  // Zero-length assets are the loader's job to filter; one slipping through
  // would spin the round-robin loop forever.
  std::vector<VideoAsset> usable;
  usable.reserve(assets.size());
  for (auto& asset : assets) {
    if (asset.duration_us <= 0) {
      ctx_.logger.Warn("[DurationReconciler] Dropping non-positive duration asset: " + asset.path);
      continue;
    }
    usable.push_back(std::move(asset));
  }

  ReconcileResult result;
  result.timeline.target_us = target_us;
  result.timeline.assets = std::move(usable);

  if (result.timeline.assets.empty()) {
    result.mode = ReconcileMode::kEmpty;
    ctx_.logger.Info("[DurationReconciler] No eligible assets; fallback required");
    return result;
  }

  int64_t total_available = 0;
  for (const auto& asset : result.timeline.assets) {
    total_available += asset.duration_us;
  }

  if (target_us <= 0) {
    // Nothing to fill. Callers never pass a non-positive target; treat it
    // as an exact match against an empty timeline.
    result.mode = ReconcileMode::kExact;
    result.dropped_assets = static_cast<int32_t>(result.timeline.assets.size());
    return result;
  }

  if (total_available < target_us) {
    result.mode = ReconcileMode::kUnderRun;
    LoopToTarget(result.timeline);
  } else if (total_available > target_us) {
    result.mode = ReconcileMode::kOverRun;
    result.dropped_assets = TrimToTarget(result.timeline);
  } else {
    result.mode = ReconcileMode::kExact;
    AppendAll(result.timeline);
  }

  std::ostringstream oss;
  oss << "[DurationReconciler] mode=" << ReconcileModeToString(result.mode)
      << " assets=" << result.timeline.assets.size()
      << " available_us=" << total_available
      << " target_us=" << target_us
      << " segments=" << result.timeline.segments.size()
      << " dropped=" << result.dropped_assets;
  ctx_.logger.Info(oss.str());

  return result;
}

void DurationReconciler::LoopToTarget(Timeline& timeline) const {
  const size_t count = timeline.assets.size();
  int64_t accumulated = 0;
  size_t index = 0;
  int32_t pass = 0;

  while (accumulated < timeline.target_us) {
    const VideoAsset& asset = timeline.assets[index];
    const int64_t remaining = timeline.target_us - accumulated;

    Segment seg;
    seg.asset_index = static_cast<int32_t>(index);
    seg.start_offset_us = 0;
    seg.end_offset_us = asset.duration_us <= remaining ? asset.duration_us : remaining;
    timeline.segments.push_back(seg);
    accumulated += seg.DurationUs();

    if (index + 1 == count) {
      index = 0;
      ++pass;
    } else {
      ++index;
    }
  }

  ctx_.logger.Debug("[DurationReconciler] under-run looped " + std::to_string(pass) +
                    " full pass(es), " + std::to_string(timeline.segments.size()) + " segments");
}

int32_t DurationReconciler::TrimToTarget(Timeline& timeline) const {
  int64_t accumulated = 0;
  size_t used = 0;

  for (size_t i = 0; i < timeline.assets.size(); ++i) {
    const int64_t remaining = timeline.target_us - accumulated;
    if (remaining <= 0) break;

    const VideoAsset& asset = timeline.assets[i];
    Segment seg;
    seg.asset_index = static_cast<int32_t>(i);
    seg.start_offset_us = 0;
    seg.end_offset_us = asset.duration_us <= remaining ? asset.duration_us : remaining;
    timeline.segments.push_back(seg);
    accumulated += seg.DurationUs();
    used = i + 1;

    if (seg.end_offset_us < asset.duration_us) break;  // Crossing asset trimmed
  }

  return static_cast<int32_t>(timeline.assets.size() - used);
}

void DurationReconciler::AppendAll(Timeline& timeline) const {
  for (size_t i = 0; i < timeline.assets.size(); ++i) {
    Segment seg;
    seg.asset_index = static_cast<int32_t>(i);
    seg.start_offset_us = 0;
    seg.end_offset_us = timeline.assets[i].duration_us;
    timeline.segments.push_back(seg);
  }
}

}  // namespace reelsmith::assembly
