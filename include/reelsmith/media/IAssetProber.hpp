// Repository: Reelsmith
// Component: Asset Prober Interface
// Purpose: Metadata probe seam between the loader and libavformat.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_MEDIA_I_ASSET_PROBER_HPP_
#define REELSMITH_MEDIA_I_ASSET_PROBER_HPP_

#include <cstdint>
#include <string>

#include "reelsmith/util/RationalFps.hpp"

namespace reelsmith::media {

// Everything the loader needs to know about a media file. `ok` is false when
// the container could not be opened or its streams could not be read; the
// stream fields are meaningless in that case.
struct ProbeInfo {
  bool ok = false;
  std::string detail;

  int64_t duration_us = 0;

  // First video stream
  bool has_video = false;
  int32_t width = 0;
  int32_t height = 0;
  util::RationalFps frame_rate{0, 1};
  bool pixel_format_scalable = false;  // Accepted as input by libswscale

  // First audio stream
  bool has_audio = false;
  int32_t sample_rate = 0;
  int32_t channels = 0;

  static ProbeInfo Failed(std::string why) {
    ProbeInfo info;
    info.detail = std::move(why);
    return info;
  }
};

// Implementations must be safe to call from several loader workers at once.
class IAssetProber {
 public:
  virtual ~IAssetProber() = default;

  virtual ProbeInfo Probe(const std::string& path) = 0;
};

}  // namespace reelsmith::media

#endif  // REELSMITH_MEDIA_I_ASSET_PROBER_HPP_
