// Repository: Reelsmith
// Component: Generation Pipeline Contract Tests
// Purpose: Provider retries with exponential backoff, keyword placeholders
//          when no footage arrives, and terminal failures.
// Copyright (c) 2025 The Reelsmith Authors

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "reelsmith/assembly/GenerationPipeline.hpp"
#include "reelsmith/producers/FallbackGenerator.hpp"
#include "fixtures/FakeAssetProber.hpp"
#include "fixtures/FakeEncoderPipeline.hpp"
#include "fixtures/FakeSourceFactory.hpp"
#include "fixtures/TempDir.hpp"
#include "fixtures/TestProfiles.hpp"

namespace reelsmith::assembly::testing {
namespace {

using tests::fixtures::EncoderRecording;
using tests::fixtures::FakeAssetProber;
using tests::fixtures::FakeSourceFactory;
using tests::fixtures::MakeFakeEncoderFactory;
using tests::fixtures::TempDir;

// Each provider fails `failures` times, then returns its canned result.
class ScriptedScript : public IScriptProvider {
 public:
  ScriptResult GenerateScript(const std::string& prompt) override {
    ++calls;
    last_prompt = prompt;
    if (calls <= failures) return {false, "", {}, "rate limited"};
    return result;
  }
  int failures = 0;
  int calls = 0;
  std::string last_prompt;
  ScriptResult result{true, "Waves roll in.", {"ocean", "beach", "sunset", "gulls"}, ""};
};

class ScriptedFootage : public IFootageProvider {
 public:
  FootageResult FetchClips(const std::vector<std::string>& keywords) override {
    ++calls;
    last_keywords = keywords;
    if (calls <= failures) return {false, {}, "timeout"};
    return result;
  }
  int failures = 0;
  int calls = 0;
  std::vector<std::string> last_keywords;
  FootageResult result{true, {}, ""};
};

class ScriptedNarration : public INarrationProvider {
 public:
  NarrationResult SynthesizeAudio(const std::string& script) override {
    ++calls;
    last_script = script;
    if (calls <= failures) return {false, "", "tts down"};
    return result;
  }
  int failures = 0;
  int calls = 0;
  std::string last_script;
  NarrationResult result;
};

class GenerationPipelineTest : public ::testing::Test {
 protected:
  GenerationPipelineTest()
      : prober_(std::make_shared<FakeAssetProber>()),
        open_log_(std::make_shared<std::vector<std::string>>()),
        rec_(std::make_shared<EncoderRecording>()),
        engine_(tests::fixtures::SmallProfile(), Deps()),
        pipeline_(engine_, script_, footage_, narration_, RetryPolicy{2, 1000}) {
    pipeline_.SetSleeper([this](std::chrono::milliseconds d) { sleeps_.push_back(d.count()); });

    const std::string audio = dir_.Touch("narration.mp3");
    prober_->AddAudio(audio, 12000000);
    narration_.result = {true, audio, ""};

    request_.request_id = "req42";
    request_.prompt = "the sea at dusk";
    request_.output_dir = dir_.Root().string();
  }

  EngineDependencies Deps() {
    EngineDependencies deps;
    deps.prober = prober_;
    auto log = open_log_;
    deps.source_factory = [log](const runtime::AssemblyContext& ctx) {
      auto factory = std::make_unique<FakeSourceFactory>(ctx);
      factory->open_log = log;
      return std::unique_ptr<producers::ISourceFactory>(std::move(factory));
    };
    deps.encoder_factory = MakeFakeEncoderFactory(rec_);
    return deps;
  }

  TempDir dir_;
  std::shared_ptr<FakeAssetProber> prober_;
  std::shared_ptr<std::vector<std::string>> open_log_;
  std::shared_ptr<EncoderRecording> rec_;
  ScriptedScript script_;
  ScriptedFootage footage_;
  ScriptedNarration narration_;
  AssemblyEngine engine_;
  GenerationPipeline pipeline_;
  std::vector<int64_t> sleeps_;
  GenerationRequest request_;
};

TEST_F(GenerationPipelineTest, FootageIsAssembledIntoRequestKeyedOutput) {
  const std::string clip = dir_.Touch("ocean.mp4");
  prober_->AddVideo(clip, 6000000);
  footage_.result = {true, {clip}, ""};

  GenerationResult r = pipeline_.Run(request_);

  ASSERT_TRUE(r.assembly.ok) << r.assembly.detail;
  EXPECT_EQ(r.request_id, "req42");
  EXPECT_EQ(r.assembly.output_path, OutputPathForRequest(request_.output_dir, "req42"));
  EXPECT_TRUE(std::filesystem::exists(r.assembly.output_path));
  EXPECT_FALSE(r.used_placeholders);
  EXPECT_EQ(script_.last_prompt, "the sea at dusk");
  EXPECT_EQ(footage_.last_keywords, script_.result.keywords);
  EXPECT_EQ(narration_.last_script, "Waves roll in.");
  EXPECT_EQ(*open_log_, (std::vector<std::string>{clip, clip}));
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(GenerationPipelineTest, NoFootageUsesFirstThreeKeywordPlaceholders) {
  GenerationResult r = pipeline_.Run(request_);

  ASSERT_TRUE(r.assembly.ok) << r.assembly.detail;
  EXPECT_TRUE(r.used_placeholders);
  const auto uris = producers::FallbackGenerator::PlaceholderUris({"ocean", "beach", "sunset"});
  // 3 x 5 s against 12 s: over-run, third placeholder trimmed to 2 s.
  EXPECT_EQ(*open_log_, uris);
}

TEST_F(GenerationPipelineTest, FootageProviderFailureAlsoFallsBackToPlaceholders) {
  footage_.failures = 10;

  GenerationResult r = pipeline_.Run(request_);

  ASSERT_TRUE(r.assembly.ok);
  EXPECT_TRUE(r.used_placeholders);
  EXPECT_EQ(footage_.calls, 3);
}

TEST_F(GenerationPipelineTest, TransientFailuresAreRetriedWithDoublingDelay) {
  script_.failures = 2;

  GenerationResult r = pipeline_.Run(request_);

  ASSERT_TRUE(r.assembly.ok);
  EXPECT_EQ(script_.calls, 3);
  EXPECT_EQ(sleeps_, (std::vector<int64_t>{1000, 2000}));
}

TEST_F(GenerationPipelineTest, ScriptFailureAfterRetriesIsTerminal) {
  script_.failures = 10;

  GenerationResult r = pipeline_.Run(request_);

  EXPECT_FALSE(r.assembly.ok);
  EXPECT_EQ(r.assembly.error, AssemblyError::kScriptUnavailable);
  EXPECT_EQ(script_.calls, 3);
  EXPECT_EQ(footage_.calls, 0);
  EXPECT_EQ(narration_.calls, 0);
  EXPECT_EQ(rec_->open_calls, 0);
}

TEST_F(GenerationPipelineTest, BlankScriptIsTerminal) {
  script_.result.script = "  \n";

  GenerationResult r = pipeline_.Run(request_);

  EXPECT_EQ(r.assembly.error, AssemblyError::kScriptUnavailable);
  EXPECT_EQ(script_.calls, 1);
}

TEST_F(GenerationPipelineTest, NarrationFailureIsTerminal) {
  narration_.failures = 10;

  GenerationResult r = pipeline_.Run(request_);

  EXPECT_FALSE(r.assembly.ok);
  EXPECT_EQ(r.assembly.error, AssemblyError::kAudioUnavailable);
  EXPECT_EQ(narration_.calls, 3);
  EXPECT_EQ(rec_->open_calls, 0);
}

TEST_F(GenerationPipelineTest, EmptyPromptIsRejectedWithoutCallingProviders) {
  request_.prompt = "   ";

  GenerationResult r = pipeline_.Run(request_);

  EXPECT_EQ(r.assembly.error, AssemblyError::kInvalidRequest);
  EXPECT_EQ(script_.calls, 0);
}

TEST_F(GenerationPipelineTest, MissingRequestIdIsGenerated) {
  request_.request_id.clear();

  GenerationResult r = pipeline_.Run(request_);

  ASSERT_TRUE(r.assembly.ok);
  EXPECT_FALSE(r.request_id.empty());
  EXPECT_EQ(r.assembly.output_path, OutputPathForRequest(request_.output_dir, r.request_id));
}

}  // namespace
}  // namespace reelsmith::assembly::testing
