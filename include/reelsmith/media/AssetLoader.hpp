// Repository: Reelsmith
// Component: MediaAsset Loader
// Purpose: Open clips and narration, extract metadata, and filter the batch
//          down to assets the compositor can use.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_MEDIA_ASSET_LOADER_HPP_
#define REELSMITH_MEDIA_ASSET_LOADER_HPP_

#include <memory>
#include <string>
#include <vector>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/media/IAssetProber.hpp"
#include "reelsmith/producers/FallbackGenerator.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"

namespace reelsmith::media {

// Largest frame edge the scaler is asked to handle.
inline constexpr int32_t kMaxScalableDimension = 16384;

struct VideoOpenResult {
  bool ok;
  assembly::AssemblyError error;
  std::string detail;
  assembly::VideoAsset asset;

  static VideoOpenResult Success(assembly::VideoAsset asset) {
    return {true, assembly::AssemblyError::kNone, "", std::move(asset)};
  }
  static VideoOpenResult Failure(assembly::AssemblyError err, const std::string& detail) {
    return {false, err, detail, {}};
  }
};

struct AudioOpenResult {
  bool ok;
  assembly::AssemblyError error;
  std::string detail;
  assembly::AudioTrack track;

  static AudioOpenResult Success(assembly::AudioTrack track) {
    return {true, assembly::AssemblyError::kNone, "", std::move(track)};
  }
  static AudioOpenResult Failure(const std::string& detail) {
    return {false, assembly::AssemblyError::kAudioUnavailable, detail, {}};
  }
};

struct SkippedAsset {
  std::string path;
  assembly::AssemblyError error;
  std::string detail;
};

// Outcome of a batch load. `eligible` preserves input order.
struct LoadReport {
  std::vector<assembly::VideoAsset> eligible;
  std::vector<SkippedAsset> skipped;
};

// AssetLoader turns paths into VideoAsset / AudioTrack handles. It holds no
// decoder open after a call returns: probing opens and closes the container.
//
// Per-asset failures are values (kAssetOpen, kFormatMismatch), never
// exceptions; LoadVideos() logs and skips them so one bad clip cannot sink
// the request.
class AssetLoader {
 public:
  AssetLoader(const runtime::AssemblyContext& ctx, std::shared_ptr<IAssetProber> prober);

  VideoOpenResult OpenVideo(const std::string& path) const;
  AudioOpenResult OpenAudio(const std::string& path) const;

  // Marks the asset for scaling when its frame size differs from the output,
  // or fails with kFormatMismatch when the scaler cannot accept it.
  VideoOpenResult Normalize(assembly::VideoAsset asset, bool pixel_format_scalable) const;

  // Opens every path (on a worker pool when options.parallel_load is set),
  // then filters. Results are collected by input index.
  LoadReport LoadVideos(const std::vector<std::string>& paths) const;

 private:
  VideoOpenResult OpenSynthetic(const std::string& uri) const;
  std::vector<VideoOpenResult> OpenSerial(const std::vector<std::string>& paths) const;
  std::vector<VideoOpenResult> OpenParallel(const std::vector<std::string>& paths) const;

  const runtime::AssemblyContext& ctx_;
  std::shared_ptr<IAssetProber> prober_;
  producers::FallbackGenerator fallback_;
};

}  // namespace reelsmith::media

#endif  // REELSMITH_MEDIA_ASSET_LOADER_HPP_
