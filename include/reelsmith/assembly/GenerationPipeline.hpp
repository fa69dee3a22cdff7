// Repository: Reelsmith
// Component: Generation Pipeline
// Purpose: Prompt -> script -> footage -> narration -> assembled video.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_GENERATION_PIPELINE_HPP_
#define REELSMITH_ASSEMBLY_GENERATION_PIPELINE_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "reelsmith/assembly/AssemblyEngine.hpp"
#include "reelsmith/assembly/Providers.hpp"
#include "reelsmith/util/Logger.hpp"

namespace reelsmith::assembly {

// Each provider call is attempted 1 + max_retries times. The wait before
// retry n (1-based) is initial_delay_ms * 2^(n-1).
struct RetryPolicy {
  int max_retries = 2;
  int64_t initial_delay_ms = 1000;
};

struct GenerationRequest {
  std::string request_id;  // Empty = generated
  std::string prompt;
  std::string output_dir;
  runtime::AssemblyOptions options;
};

struct GenerationResult {
  AssemblyResult assembly;
  std::string request_id;
  std::string script;
  std::vector<std::string> keywords;
  bool used_placeholders = false;
};

class GenerationPipeline {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  GenerationPipeline(const AssemblyEngine& engine, IScriptProvider& script,
                     IFootageProvider& footage, INarrationProvider& narration,
                     RetryPolicy retry = {});

  // Replaces std::this_thread::sleep_for between retries.
  void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

  // Optional hook applied to the pipeline's own per-request logger.
  void SetLoggerHook(std::function<void(util::Logger&)> hook) { logger_hook_ = std::move(hook); }

  GenerationResult Run(const GenerationRequest& request) const;

 private:
  template <typename Result, typename Call>
  Result WithRetries(const util::Logger& logger, const char* what, Call call) const;

  const AssemblyEngine& engine_;
  IScriptProvider& script_;
  IFootageProvider& footage_;
  INarrationProvider& narration_;
  RetryPolicy retry_;
  Sleeper sleeper_;
  std::function<void(util::Logger&)> logger_hook_;
};

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_GENERATION_PIPELINE_HPP_
