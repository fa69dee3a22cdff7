// Repository: Reelsmith
// Component: Assembly Engine Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/assembly/AssemblyEngine.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#include <unistd.h>

#include "reelsmith/assembly/DurationReconciler.hpp"
#include "reelsmith/media/AssetLoader.hpp"
#include "reelsmith/media/FFmpegAssetProber.hpp"
#include "reelsmith/output/EncoderPipeline.hpp"
#include "reelsmith/producers/FFmpegSourceFactory.hpp"
#include "reelsmith/producers/FallbackGenerator.hpp"

extern "C" {
#include <libavutil/log.h>
}

namespace reelsmith::assembly {

EngineDependencies EngineDependencies::Default() {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  EngineDependencies deps;
  deps.prober = std::make_shared<media::FFmpegAssetProber>();
  deps.source_factory = [](const runtime::AssemblyContext& ctx) {
    return std::unique_ptr<producers::ISourceFactory>(
        std::make_unique<producers::FFmpegSourceFactory>(ctx));
  };
  deps.encoder_factory = [](const runtime::AssemblyContext& ctx) {
    return std::make_unique<output::EncoderPipeline>(ctx);
  };
  return deps;
}

std::string OutputPathForRequest(const std::string& output_dir, const std::string& request_id) {
  return (std::filesystem::path(output_dir) / ("final_video_" + request_id + ".mp4")).string();
}

// <ms>-<pid>-<salt>-<counter>, all hex. The pid and random salt keep ids
// from processes started in the same millisecond apart.
std::string GenerateRequestId() {
  static std::atomic<uint32_t> counter{0};
  static const uint32_t salt = [] {
    std::random_device rd;
    return static_cast<uint32_t>(rd());
  }();
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();

  std::ostringstream oss;
  oss << std::hex << ms << "-" << static_cast<unsigned long>(getpid()) << "-" << std::setw(8)
      << std::setfill('0') << salt << "-" << std::setw(4) << (counter.fetch_add(1) & 0xFFFF);
  return oss.str();
}

AssemblyEngine::AssemblyEngine(runtime::OutputProfile profile, EngineDependencies deps)
    : profile_(std::move(profile)), deps_(std::move(deps)) {}

AssemblyResult AssemblyEngine::Assemble(const std::vector<std::string>& video_paths,
                                        const std::string& audio_path,
                                        const std::string& output_path,
                                        runtime::AssemblyOptions options) const {
  if (options.request_id.empty()) {
    options.request_id = GenerateRequestId();
  }
  const std::string request_id = options.request_id;
  runtime::AssemblyContext ctx(request_id, profile_, std::move(options));
  if (deps_.configure_logger) {
    deps_.configure_logger(ctx.logger);
  }

  if (!profile_.IsValid()) {
    ctx.logger.Error("[AssemblyEngine] Output profile is invalid");
    return AssemblyResult::Failure(AssemblyError::kInvalidRequest, "invalid output profile");
  }
  if (output_path.empty()) {
    ctx.logger.Error("[AssemblyEngine] Output path is empty");
    return AssemblyResult::Failure(AssemblyError::kInvalidRequest, "empty output path");
  }

  ctx.logger.Info("[AssemblyEngine] Assemble clips=" + std::to_string(video_paths.size()) +
                  " audio=" + audio_path + " output=" + output_path);

  media::AssetLoader loader(ctx, deps_.prober);

  // No narration means no target duration: nothing else can proceed.
  media::AudioOpenResult audio = loader.OpenAudio(audio_path);
  if (!audio.ok) {
    ctx.logger.Error("[AssemblyEngine] " +
                     std::string(AssemblyErrorToString(AssemblyError::kAudioUnavailable)) +
                     ": " + audio_path + " (" + audio.detail + ")");
    return AssemblyResult::Failure(AssemblyError::kAudioUnavailable, audio.detail);
  }

  media::LoadReport loaded = loader.LoadVideos(video_paths);

  DurationReconciler reconciler(ctx);
  ReconcileResult reconciled =
      reconciler.Reconcile(std::move(loaded.eligible), audio.track.duration_us);

  if (reconciled.EmptyInput()) {
    ctx.logger.Warn("[AssemblyEngine] " +
                    std::string(AssemblyErrorToString(AssemblyError::kEmptyInput)) +
                    ": no usable clips, using fallback clip");
    producers::FallbackGenerator fallback(ctx);
    std::vector<VideoAsset> fallback_assets;
    fallback_assets.push_back(
        fallback.Generate(audio.track.duration_us, ctx.options.fallback_label));
    reconciled = reconciler.Reconcile(std::move(fallback_assets), audio.track.duration_us);
  }

  if (ctx.CancelRequested()) {
    ctx.logger.Warn("[AssemblyEngine] Cancelled before encode");
    return AssemblyResult::Failure(AssemblyError::kCancelled, "cancelled");
  }

  std::unique_ptr<producers::ISourceFactory> sources = deps_.source_factory(ctx);
  Compositor compositor(ctx, *sources, deps_.encoder_factory);
  AssemblyResult result =
      compositor.Assemble(std::move(reconciled.timeline), audio.track, output_path);

  if (result.ok) {
    ctx.logger.Info("[AssemblyEngine] Done " + result.output_path + " bytes=" +
                    std::to_string(result.output_bytes));
  } else {
    ctx.logger.Error("[AssemblyEngine] Failed: " +
                     std::string(AssemblyErrorToString(result.error)) + " " + result.detail);
  }
  return result;
}

std::future<AssemblyResult> AssemblyEngine::AssembleAsync(std::vector<std::string> video_paths,
                                                          std::string audio_path,
                                                          std::string output_path,
                                                          runtime::AssemblyOptions options) const {
  return std::async(std::launch::async,
                    [this, video_paths = std::move(video_paths),
                     audio_path = std::move(audio_path), output_path = std::move(output_path),
                     options = std::move(options)]() {
                      return Assemble(video_paths, audio_path, output_path, options);
                    });
}

}  // namespace reelsmith::assembly
