// Repository: Reelsmith
// Component: Frame Source Interfaces
// Purpose: Seams between the compositor and whatever produces pictures/PCM.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_PRODUCERS_I_FRAME_SOURCE_HPP_
#define REELSMITH_PRODUCERS_I_FRAME_SOURCE_HPP_

#include <cstdint>
#include <memory>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/buffer/Frame.hpp"

namespace reelsmith::producers {

// Delivers output-sized YUV420P frames in presentation order. pts_us is
// relative to the position the source was opened at. Returning false means
// the source is exhausted; the compositor then holds the last frame.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  virtual bool NextFrame(buffer::Frame& out) = 0;
};

// Delivers interleaved S16 PCM at the output rate and channel count.
class IAudioSource {
 public:
  virtual ~IAudioSource() = default;

  virtual bool NextAudio(buffer::AudioFrame& out) = 0;
};

// Opens sources for one assembly. Returning nullptr means the source could
// not be opened; the caller decides whether that is fatal.
class ISourceFactory {
 public:
  virtual ~ISourceFactory() = default;

  virtual std::unique_ptr<IFrameSource> OpenVideo(const assembly::VideoAsset& asset,
                                                  int64_t start_offset_us) = 0;

  virtual std::unique_ptr<IAudioSource> OpenAudio(const assembly::AudioTrack& track) = 0;
};

}  // namespace reelsmith::producers

#endif  // REELSMITH_PRODUCERS_I_FRAME_SOURCE_HPP_
