// Repository: Reelsmith
// Component: Fake Encoder Pipeline
// Purpose: Records what the compositor hands the encoder and writes a
//          placeholder file of a chosen size instead of encoding.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_TESTS_FIXTURES_FAKE_ENCODER_PIPELINE_HPP_
#define REELSMITH_TESTS_FIXTURES_FAKE_ENCODER_PIPELINE_HPP_

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "reelsmith/assembly/Compositor.hpp"
#include "reelsmith/buffer/Frame.hpp"
#include "reelsmith/output/EncoderPipeline.hpp"

namespace reelsmith::tests::fixtures {

// Outlives the encoder (the compositor destroys it before returning).
struct EncoderRecording {
  int open_calls = 0;
  int finish_calls = 0;
  int close_calls = 0;
  std::string output_path;
  std::vector<int64_t> frame_indices;
  std::vector<uint8_t> frame_luma;  // First Y byte of every frame
  int64_t audio_samples = 0;
  int64_t silent_samples = 0;
  int64_t finish_total_us = -1;

  // Audio samples received before each video frame after the first.
  std::vector<int64_t> audio_before_frame;
};

struct EncoderBehavior {
  bool fail_open = false;
  int64_t fail_at_frame = -1;  // encodeFrame returns false at this index
  bool fail_finish = false;
  int64_t bytes_to_write = 20000;
};

class FakeEncoderPipeline : public output::EncoderPipeline {
 public:
  FakeEncoderPipeline(const runtime::AssemblyContext& ctx,
                      std::shared_ptr<EncoderRecording> recording, EncoderBehavior behavior)
      : output::EncoderPipeline(ctx), rec_(std::move(recording)), behavior_(behavior) {}

  bool open(const std::string& output_path) override {
    ++rec_->open_calls;
    rec_->output_path = output_path;
    if (behavior_.fail_open) return false;
    // Write a stub immediately so a mid-stream failure leaves a partial file.
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    out << "partial";
    opened_ = true;
    return static_cast<bool>(out);
  }

  bool encodeFrame(const buffer::Frame& frame, int64_t frame_index) override {
    if (frame_index == behavior_.fail_at_frame) return false;
    rec_->frame_indices.push_back(frame_index);
    rec_->frame_luma.push_back(frame.data.empty() ? 0 : frame.data[0]);
    rec_->audio_before_frame.push_back(rec_->audio_samples);
    return true;
  }

  bool encodeAudioFrame(const buffer::AudioFrame& audio_frame) override {
    const int16_t* s = audio_frame.Samples();
    for (int32_t i = 0; i < audio_frame.nb_samples; ++i) {
      if (s[static_cast<size_t>(i) * audio_frame.channels] == 0) ++rec_->silent_samples;
    }
    rec_->audio_samples += audio_frame.nb_samples;
    return true;
  }

  bool finish(int64_t total_duration_us) override {
    ++rec_->finish_calls;
    rec_->finish_total_us = total_duration_us;
    if (behavior_.fail_finish) return false;
    std::ofstream out(rec_->output_path, std::ios::binary | std::ios::trunc);
    out << std::string(static_cast<size_t>(behavior_.bytes_to_write), 'x');
    return static_cast<bool>(out);
  }

  void close() override {
    if (opened_) ++rec_->close_calls;
    opened_ = false;
  }

  bool IsInitialized() const override { return opened_; }

 private:
  std::shared_ptr<EncoderRecording> rec_;
  EncoderBehavior behavior_;
  bool opened_ = false;
};

inline assembly::EncoderFactory MakeFakeEncoderFactory(
    std::shared_ptr<EncoderRecording> recording, EncoderBehavior behavior = {}) {
  return [recording, behavior](const runtime::AssemblyContext& ctx) {
    return std::unique_ptr<output::EncoderPipeline>(
        std::make_unique<FakeEncoderPipeline>(ctx, recording, behavior));
  };
}

}  // namespace reelsmith::tests::fixtures

#endif  // REELSMITH_TESTS_FIXTURES_FAKE_ENCODER_PIPELINE_HPP_
