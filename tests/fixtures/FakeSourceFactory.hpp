// Repository: Reelsmith
// Component: Fake Source Factory
// Purpose: In-memory frame and PCM sources; no decoding.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_TESTS_FIXTURES_FAKE_SOURCE_FACTORY_HPP_
#define REELSMITH_TESTS_FIXTURES_FAKE_SOURCE_FACTORY_HPP_

#include <algorithm>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "reelsmith/producers/IFrameSource.hpp"
#include "reelsmith/producers/SolidFrame.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"

namespace reelsmith::tests::fixtures {

// Each asset is a solid frame whose luma encodes the asset's position in
// the order it was first opened, so the encoder recording shows which
// segment every output frame came from. Frames advance at the profile rate
// and stop at the asset's duration.
class FakeFrameSource : public producers::IFrameSource {
 public:
  FakeFrameSource(buffer::Frame frame, util::RationalFps fps, int64_t start_us, int64_t end_us)
      : frame_(std::move(frame)), fps_(fps), start_us_(start_us), end_us_(end_us) {}

  bool NextFrame(buffer::Frame& out) override {
    const int64_t pts = fps_.DurationFromFramesUs(index_);
    if (start_us_ + pts >= end_us_) return false;
    out = frame_;
    out.pts_us = pts;
    ++index_;
    return true;
  }

 private:
  buffer::Frame frame_;
  util::RationalFps fps_;
  int64_t start_us_;
  int64_t end_us_;
  int64_t index_ = 0;
};

// Constant-value PCM in fixed-size chunks, `total_samples` long.
class FakeAudioSource : public producers::IAudioSource {
 public:
  FakeAudioSource(int32_t sample_rate, int32_t channels, int64_t total_samples, int16_t value)
      : sample_rate_(sample_rate), channels_(channels), remaining_(total_samples), value_(value) {}

  bool NextAudio(buffer::AudioFrame& out) override {
    if (remaining_ <= 0) return false;
    const int64_t n = std::min<int64_t>(remaining_, kChunkSamples);
    out.sample_rate = sample_rate_;
    out.channels = channels_;
    out.nb_samples = static_cast<int32_t>(n);
    out.pts_us = 0;
    out.data.resize(static_cast<size_t>(n) * channels_ * sizeof(int16_t));
    int16_t* s = out.Samples();
    for (int64_t i = 0; i < n * channels_; ++i) s[i] = value_;
    remaining_ -= n;
    return true;
  }

 private:
  static constexpr int64_t kChunkSamples = 1024;
  int32_t sample_rate_;
  int32_t channels_;
  int64_t remaining_;
  int16_t value_;
};

class FakeSourceFactory : public producers::ISourceFactory {
 public:
  explicit FakeSourceFactory(const runtime::AssemblyContext& ctx) : ctx_(ctx) {}

  std::unique_ptr<producers::IFrameSource> OpenVideo(const assembly::VideoAsset& asset,
                                                     int64_t start_offset_us) override {
    opened_video.push_back(asset.path);
    if (open_log) open_log->push_back(asset.path);
    if (fail_video.count(asset.path)) return nullptr;
    const uint32_t gray = LumaTagFor(asset.path);
    buffer::Frame frame = producers::MakeSolidFrame(ctx_.profile.video.width,
                                                    ctx_.profile.video.height, gray);
    return std::make_unique<FakeFrameSource>(std::move(frame), ctx_.profile.GetFrameRate(),
                                             start_offset_us, asset.duration_us);
  }

  std::unique_ptr<producers::IAudioSource> OpenAudio(const assembly::AudioTrack& track) override {
    if (fail_audio) return nullptr;
    const int64_t samples = audio_samples_override >= 0
                                ? audio_samples_override
                                : (track.duration_us * ctx_.profile.audio.sample_rate +
                                   500000) / 1000000;
    return std::make_unique<FakeAudioSource>(ctx_.profile.audio.sample_rate,
                                             ctx_.profile.audio.channels, samples, kAudioValue);
  }

  // Y value of the first frame MakeSolidFrame produces for `path`.
  uint8_t LumaFor(const std::string& path) {
    return producers::RgbToYuv(LumaTagFor(path)).y;
  }

  static constexpr int16_t kAudioValue = 1000;

  std::set<std::string> fail_video;
  bool fail_audio = false;
  int64_t audio_samples_override = -1;  // -1 = exactly the track length
  std::vector<std::string> opened_video;

  // Shared with the test when the engine owns the factory.
  std::shared_ptr<std::vector<std::string>> open_log;

 private:
  uint32_t LumaTagFor(const std::string& path) {
    auto it = std::find(tags_.begin(), tags_.end(), path);
    size_t index = static_cast<size_t>(it - tags_.begin());
    if (it == tags_.end()) tags_.push_back(path);
    const uint32_t level = static_cast<uint32_t>(0x20 + 0x20 * index) & 0xFF;
    return (level << 16) | (level << 8) | level;
  }

  const runtime::AssemblyContext& ctx_;
  std::vector<std::string> tags_;
};

}  // namespace reelsmith::tests::fixtures

#endif  // REELSMITH_TESTS_FIXTURES_FAKE_SOURCE_FACTORY_HPP_
