// Repository: Reelsmith
// Component: MediaAsset Loader Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/media/AssetLoader.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <thread>

namespace reelsmith::media {

using assembly::AssemblyError;
using assembly::AssemblyErrorToString;
using assembly::VideoAsset;

namespace {

// Reports why `path` cannot be probed, or empty if it looks openable.
std::string CheckRegularFile(const std::string& path) {
  if (path.empty()) return "empty path";

  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) return "does not exist";
  if (!std::filesystem::is_regular_file(status)) return "not a regular file";
  return "";
}

}  // namespace

AssetLoader::AssetLoader(const runtime::AssemblyContext& ctx,
                         std::shared_ptr<IAssetProber> prober)
    : ctx_(ctx), prober_(std::move(prober)), fallback_(ctx) {}

VideoOpenResult AssetLoader::OpenVideo(const std::string& path) const {
  if (producers::FallbackGenerator::IsSyntheticUri(path)) {
    return OpenSynthetic(path);
  }

  const std::string missing = CheckRegularFile(path);
  if (!missing.empty()) {
    return VideoOpenResult::Failure(AssemblyError::kAssetOpen, missing);
  }

  ProbeInfo info = prober_->Probe(path);
  if (!info.ok) {
    return VideoOpenResult::Failure(AssemblyError::kAssetOpen, info.detail);
  }
  if (!info.has_video) {
    return VideoOpenResult::Failure(AssemblyError::kAssetOpen, "no video stream");
  }
  if (info.duration_us <= 0) {
    return VideoOpenResult::Failure(AssemblyError::kAssetOpen, "non-positive duration");
  }
  if (info.width <= 0 || info.height <= 0) {
    return VideoOpenResult::Failure(AssemblyError::kAssetOpen, "zero frame dimensions");
  }

  VideoAsset asset;
  asset.path = path;
  asset.duration_us = info.duration_us;
  asset.frame_size = {info.width, info.height};
  asset.frame_rate = info.frame_rate.IsValid() ? info.frame_rate : ctx_.profile.GetFrameRate();
  asset.has_audio = info.has_audio;
  asset.kind = assembly::SourceKind::kFile;

  return Normalize(std::move(asset), info.pixel_format_scalable);
}

AudioOpenResult AssetLoader::OpenAudio(const std::string& path) const {
  const std::string missing = CheckRegularFile(path);
  if (!missing.empty()) {
    return AudioOpenResult::Failure(missing);
  }

  ProbeInfo info = prober_->Probe(path);
  if (!info.ok) {
    return AudioOpenResult::Failure(info.detail);
  }
  if (!info.has_audio) {
    return AudioOpenResult::Failure("no audio stream");
  }
  if (info.duration_us <= 0) {
    return AudioOpenResult::Failure("non-positive duration");
  }

  assembly::AudioTrack track;
  track.path = path;
  track.duration_us = info.duration_us;
  track.sample_rate = info.sample_rate;
  track.channels = info.channels;

  std::ostringstream oss;
  oss << "[AssetLoader] Audio " << path << " duration_us=" << track.duration_us
      << " rate=" << track.sample_rate << " channels=" << track.channels;
  ctx_.logger.Info(oss.str());
  return AudioOpenResult::Success(std::move(track));
}

VideoOpenResult AssetLoader::Normalize(VideoAsset asset, bool pixel_format_scalable) const {
  const assembly::FrameSize out{ctx_.profile.video.width, ctx_.profile.video.height};

  if (asset.frame_size.width > kMaxScalableDimension ||
      asset.frame_size.height > kMaxScalableDimension || asset.frame_size.IsEmpty()) {
    return VideoOpenResult::Failure(
        AssemblyError::kFormatMismatch,
        "frame size " + std::to_string(asset.frame_size.width) + "x" +
            std::to_string(asset.frame_size.height) + " outside scaler range");
  }
  if (asset.kind == assembly::SourceKind::kFile && !pixel_format_scalable) {
    return VideoOpenResult::Failure(AssemblyError::kFormatMismatch,
                                    "pixel format not accepted by scaler");
  }

  asset.needs_scaling = asset.frame_size != out;
  return VideoOpenResult::Success(std::move(asset));
}

LoadReport AssetLoader::LoadVideos(const std::vector<std::string>& paths) const {
  const bool parallel = ctx_.options.parallel_load && paths.size() > 1 &&
                        ctx_.options.max_load_workers > 1;
  std::vector<VideoOpenResult> results = parallel ? OpenParallel(paths) : OpenSerial(paths);

  LoadReport report;
  for (size_t i = 0; i < results.size(); ++i) {
    VideoOpenResult& r = results[i];
    if (r.ok && r.asset.IsEligible()) {
      report.eligible.push_back(std::move(r.asset));
      continue;
    }
    if (r.ok) {
      r.error = AssemblyError::kAssetOpen;
      r.detail = "not eligible";
    }
    ctx_.logger.Warn("[AssetLoader] Skipping " + paths[i] + ": " +
                     AssemblyErrorToString(r.error) + " (" + r.detail + ")");
    report.skipped.push_back({paths[i], r.error, r.detail});
  }

  ctx_.logger.Info("[AssetLoader] Loaded " + std::to_string(report.eligible.size()) + "/" +
                   std::to_string(paths.size()) + " clips" + (parallel ? " (parallel)" : ""));
  return report;
}

VideoOpenResult AssetLoader::OpenSynthetic(const std::string& uri) const {
  auto ref = producers::FallbackGenerator::ParsePlaceholderUri(uri);
  if (!ref) {
    return VideoOpenResult::Failure(AssemblyError::kAssetOpen, "unrecognized internal URI");
  }
  return VideoOpenResult::Success(fallback_.ForKeyword(ref->label, ref->index));
}

std::vector<VideoOpenResult> AssetLoader::OpenSerial(const std::vector<std::string>& paths) const {
  std::vector<VideoOpenResult> results;
  results.reserve(paths.size());
  for (const auto& path : paths) {
    results.push_back(OpenVideo(path));
  }
  return results;
}

std::vector<VideoOpenResult> AssetLoader::OpenParallel(
    const std::vector<std::string>& paths) const {
  std::vector<VideoOpenResult> results(
      paths.size(), VideoOpenResult::Failure(AssemblyError::kAssetOpen, "not loaded"));
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < paths.size(); i = next.fetch_add(1)) {
      results[i] = OpenVideo(paths[i]);
    }
  };

  const size_t workers = std::min(paths.size(),
                                  static_cast<size_t>(ctx_.options.max_load_workers));
  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    pool.emplace_back(worker);
  }
  for (auto& t : pool) {
    t.join();
  }
  return results;
}

}  // namespace reelsmith::media
