// Repository: Reelsmith
// Component: FFmpeg Source Factory Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/producers/FFmpegSourceFactory.hpp"

#include "reelsmith/decode/FFmpegAudioReader.hpp"
#include "reelsmith/decode/FFmpegDecoder.hpp"
#include "reelsmith/producers/FileFrameSource.hpp"
#include "reelsmith/producers/SyntheticFrameSource.hpp"

namespace reelsmith::producers {

namespace {

class ReaderAudioSource : public IAudioSource {
 public:
  explicit ReaderAudioSource(std::unique_ptr<decode::FFmpegAudioReader> reader)
      : reader_(std::move(reader)) {}

  bool NextAudio(buffer::AudioFrame& out) override { return reader_->ReadFrame(out); }

 private:
  std::unique_ptr<decode::FFmpegAudioReader> reader_;
};

}  // namespace

FFmpegSourceFactory::FFmpegSourceFactory(const runtime::AssemblyContext& ctx) : ctx_(ctx) {}

std::unique_ptr<IFrameSource> FFmpegSourceFactory::OpenVideo(const assembly::VideoAsset& asset,
                                                             int64_t start_offset_us) {
  const int32_t width = ctx_.profile.video.width;
  const int32_t height = ctx_.profile.video.height;

  if (asset.kind == assembly::SourceKind::kSynthetic) {
    return std::make_unique<SyntheticFrameSource>(asset.look, width, height, ctx_.logger);
  }

  decode::DecoderConfig config;
  config.input_uri = asset.path;
  config.target_width = width;
  config.target_height = height;

  auto decoder = std::make_unique<decode::FFmpegDecoder>(config, ctx_.logger);
  if (!decoder->Open()) {
    return nullptr;
  }
  if (start_offset_us > 0 && !decoder->SeekToUs(start_offset_us)) {
    return nullptr;
  }
  return std::make_unique<FileFrameSource>(std::move(decoder), start_offset_us);
}

std::unique_ptr<IAudioSource> FFmpegSourceFactory::OpenAudio(const assembly::AudioTrack& track) {
  decode::AudioReaderConfig config;
  config.input_uri = track.path;
  config.target_sample_rate = ctx_.profile.audio.sample_rate;
  config.target_channels = ctx_.profile.audio.channels;

  auto reader = std::make_unique<decode::FFmpegAudioReader>(config, ctx_.logger);
  if (!reader->Open()) {
    return nullptr;
  }
  return std::make_unique<ReaderAudioSource>(std::move(reader));
}

}  // namespace reelsmith::producers
