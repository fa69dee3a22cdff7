// Repository: Reelsmith
// Component: FFmpeg Source Factory
// Purpose: Production ISourceFactory: files via FFmpegDecoder/FFmpegAudioReader,
//          synthetic clips via libavfilter.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_PRODUCERS_FFMPEG_SOURCE_FACTORY_HPP_
#define REELSMITH_PRODUCERS_FFMPEG_SOURCE_FACTORY_HPP_

#include "reelsmith/producers/IFrameSource.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"

namespace reelsmith::producers {

class FFmpegSourceFactory : public ISourceFactory {
 public:
  explicit FFmpegSourceFactory(const runtime::AssemblyContext& ctx);

  std::unique_ptr<IFrameSource> OpenVideo(const assembly::VideoAsset& asset,
                                          int64_t start_offset_us) override;

  std::unique_ptr<IAudioSource> OpenAudio(const assembly::AudioTrack& track) override;

 private:
  const runtime::AssemblyContext& ctx_;
};

}  // namespace reelsmith::producers

#endif  // REELSMITH_PRODUCERS_FFMPEG_SOURCE_FACTORY_HPP_
