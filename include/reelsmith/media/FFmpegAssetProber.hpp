// Repository: Reelsmith
// Component: FFmpeg Asset Prober
// Purpose: Probe container/stream metadata with libavformat and libavcodec.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_MEDIA_FFMPEG_ASSET_PROBER_HPP_
#define REELSMITH_MEDIA_FFMPEG_ASSET_PROBER_HPP_

#include "reelsmith/media/IAssetProber.hpp"

namespace reelsmith::media {

// Stateless; every Probe() opens and closes its own AVFormatContext.
class FFmpegAssetProber : public IAssetProber {
 public:
  ProbeInfo Probe(const std::string& path) override;
};

}  // namespace reelsmith::media

#endif  // REELSMITH_MEDIA_FFMPEG_ASSET_PROBER_HPP_
