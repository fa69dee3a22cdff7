// Repository: Reelsmith
// Component: Fake Asset Prober
// Purpose: Table-driven IAssetProber for loader and engine contract tests.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_TESTS_FIXTURES_FAKE_ASSET_PROBER_HPP_
#define REELSMITH_TESTS_FIXTURES_FAKE_ASSET_PROBER_HPP_

#include <atomic>
#include <map>
#include <mutex>
#include <string>

#include "reelsmith/media/IAssetProber.hpp"

namespace reelsmith::tests::fixtures {

// Paths not registered probe as failed ("unreadable container").
class FakeAssetProber : public media::IAssetProber {
 public:
  media::ProbeInfo Probe(const std::string& path) override {
    probe_count_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(path);
    if (it == table_.end()) {
      return media::ProbeInfo::Failed("unreadable container");
    }
    return it->second;
  }

  void Set(const std::string& path, media::ProbeInfo info) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_[path] = std::move(info);
  }

  void AddVideo(const std::string& path, int64_t duration_us, int32_t width = 1920,
                int32_t height = 1080) {
    media::ProbeInfo info;
    info.ok = true;
    info.duration_us = duration_us;
    info.has_video = true;
    info.width = width;
    info.height = height;
    info.frame_rate = util::FPS_24;
    info.pixel_format_scalable = true;
    Set(path, info);
  }

  void AddAudio(const std::string& path, int64_t duration_us) {
    media::ProbeInfo info;
    info.ok = true;
    info.duration_us = duration_us;
    info.has_audio = true;
    info.sample_rate = 44100;
    info.channels = 2;
    Set(path, info);
  }

  int ProbeCount() const { return probe_count_.load(); }

 private:
  std::mutex mutex_;
  std::map<std::string, media::ProbeInfo> table_;
  std::atomic<int> probe_count_{0};
};

}  // namespace reelsmith::tests::fixtures

#endif  // REELSMITH_TESTS_FIXTURES_FAKE_ASSET_PROBER_HPP_
