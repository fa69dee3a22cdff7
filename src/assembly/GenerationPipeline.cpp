// Repository: Reelsmith
// Component: Generation Pipeline Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/assembly/GenerationPipeline.hpp"

#include <thread>

#include "reelsmith/producers/FallbackGenerator.hpp"

namespace reelsmith::assembly {

namespace {

bool IsBlank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

GenerationPipeline::GenerationPipeline(const AssemblyEngine& engine, IScriptProvider& script,
                                       IFootageProvider& footage,
                                       INarrationProvider& narration, RetryPolicy retry)
    : engine_(engine),
      script_(script),
      footage_(footage),
      narration_(narration),
      retry_(retry),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

template <typename Result, typename Call>
Result GenerationPipeline::WithRetries(const util::Logger& logger, const char* what,
                                       Call call) const {
  int64_t delay_ms = retry_.initial_delay_ms;
  Result result = call();
  for (int attempt = 1; !result.ok && attempt <= retry_.max_retries; ++attempt) {
    logger.Warn(std::string("[GenerationPipeline] ") + what + " failed (" + result.detail +
                "); retry " + std::to_string(attempt) + "/" +
                std::to_string(retry_.max_retries) + " in " + std::to_string(delay_ms) + " ms");
    sleeper_(std::chrono::milliseconds(delay_ms));
    delay_ms *= 2;
    result = call();
  }
  return result;
}

GenerationResult GenerationPipeline::Run(const GenerationRequest& request) const {
  GenerationResult out;
  out.request_id = request.request_id.empty() ? GenerateRequestId() : request.request_id;

  util::Logger logger(out.request_id, request.options.debug_logging);
  if (logger_hook_) logger_hook_(logger);

  if (IsBlank(request.prompt)) {
    logger.Error("[GenerationPipeline] Empty prompt");
    out.assembly = AssemblyResult::Failure(AssemblyError::kInvalidRequest, "empty prompt");
    return out;
  }

  ScriptResult script = WithRetries<ScriptResult>(
      logger, "script", [&]() { return script_.GenerateScript(request.prompt); });
  if (!script.ok || IsBlank(script.script)) {
    logger.Error("[GenerationPipeline] No script: " + script.detail);
    out.assembly = AssemblyResult::Failure(AssemblyError::kScriptUnavailable,
                                           script.ok ? "empty script" : script.detail);
    return out;
  }
  out.script = script.script;
  out.keywords = script.keywords;
  logger.Info("[GenerationPipeline] Script ready, keywords=" +
              std::to_string(script.keywords.size()));

  FootageResult footage = WithRetries<FootageResult>(
      logger, "footage", [&]() { return footage_.FetchClips(script.keywords); });
  std::vector<std::string> clips;
  if (footage.ok) {
    clips = footage.paths;
  } else {
    logger.Warn("[GenerationPipeline] Footage unavailable: " + footage.detail);
  }
  if (clips.empty()) {
    clips = producers::FallbackGenerator::PlaceholderUris(script.keywords);
    out.used_placeholders = !clips.empty();
    logger.Info("[GenerationPipeline] No footage; " + std::to_string(clips.size()) +
                " keyword placeholder(s)");
  }

  NarrationResult narration = WithRetries<NarrationResult>(
      logger, "narration", [&]() { return narration_.SynthesizeAudio(script.script); });
  if (!narration.ok || narration.audio_path.empty()) {
    logger.Error("[GenerationPipeline] No narration: " + narration.detail);
    out.assembly = AssemblyResult::Failure(AssemblyError::kAudioUnavailable,
                                           narration.ok ? "empty audio path" : narration.detail);
    return out;
  }

  runtime::AssemblyOptions options = request.options;
  options.request_id = out.request_id;
  out.assembly = engine_.Assemble(clips, narration.audio_path,
                                  OutputPathForRequest(request.output_dir, out.request_id),
                                  options);
  return out;
}

}  // namespace reelsmith::assembly
