// Repository: Reelsmith
// Component: Assembly Engine
// Purpose: Single entry point: clips + narration in, one output file out.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_ASSEMBLY_ENGINE_HPP_
#define REELSMITH_ASSEMBLY_ASSEMBLY_ENGINE_HPP_

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/assembly/Compositor.hpp"
#include "reelsmith/media/IAssetProber.hpp"
#include "reelsmith/producers/IFrameSource.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"
#include "reelsmith/runtime/OutputProfile.hpp"

namespace reelsmith::assembly {

using SourceFactoryFactory =
    std::function<std::unique_ptr<producers::ISourceFactory>(const runtime::AssemblyContext&)>;

// Everything the engine touches outside of pure timeline math.
struct EngineDependencies {
  std::shared_ptr<media::IAssetProber> prober;
  SourceFactoryFactory source_factory;
  EncoderFactory encoder_factory;

  // Optional: called on each request's logger before any stage runs.
  std::function<void(util::Logger&)> configure_logger;

  // FFmpeg-backed prober, sources and encoder.
  static EngineDependencies Default();
};

// <output_dir>/final_video_<request_id>.mp4
std::string OutputPathForRequest(const std::string& output_dir, const std::string& request_id);

// Unique enough to key one request's output and log lines.
std::string GenerateRequestId();

// AssemblyEngine is stateless between calls and safe to share across
// threads: every call builds its own AssemblyContext and owns every handle
// it opens until it returns.
//
// Flow: narration (terminal on failure) -> clip loading -> reconciliation ->
// fallback clip on empty input -> compositor.
class AssemblyEngine {
 public:
  explicit AssemblyEngine(runtime::OutputProfile profile,
                          EngineDependencies deps = EngineDependencies::Default());

  AssemblyResult Assemble(const std::vector<std::string>& video_paths,
                          const std::string& audio_path, const std::string& output_path,
                          runtime::AssemblyOptions options = {}) const;

  // Runs Assemble() on a dedicated thread. The engine must outlive the
  // returned future.
  std::future<AssemblyResult> AssembleAsync(std::vector<std::string> video_paths,
                                            std::string audio_path, std::string output_path,
                                            runtime::AssemblyOptions options = {}) const;

  const runtime::OutputProfile& Profile() const { return profile_; }

 private:
  runtime::OutputProfile profile_;
  EngineDependencies deps_;
};

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_ASSEMBLY_ENGINE_HPP_
