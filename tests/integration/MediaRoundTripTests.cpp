// Repository: Reelsmith
// Component: Media Round Trip Tests
// Purpose: Real libx264/aac encode, probe, decode and full assembly.
//          Skipped when the FFmpeg build lacks either encoder.
// Copyright (c) 2025 The Reelsmith Authors

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "reelsmith/assembly/AssemblyEngine.hpp"
#include "reelsmith/decode/FFmpegAudioReader.hpp"
#include "reelsmith/decode/FFmpegDecoder.hpp"
#include "reelsmith/media/FFmpegAssetProber.hpp"
#include "reelsmith/output/EncoderPipeline.hpp"
#include "reelsmith/producers/FFmpegSourceFactory.hpp"
#include "reelsmith/producers/SolidFrame.hpp"
#include "reelsmith/producers/SyntheticFrameSource.hpp"
#include "fixtures/TempDir.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace reelsmith::testing {
namespace {

using tests::fixtures::TempDir;

constexpr int64_t kContainerSlackUs = 100000;  // AAC priming and muxer rounding

runtime::OutputProfile MediaProfile() {
  runtime::OutputProfile p;
  p.video.width = 320;
  p.video.height = 180;
  p.video.frame_rate = "24/1";
  p.video.bitrate = 400000;
  p.video.gop_size = 24;
  p.min_output_bytes = 1000;
  return p;
}

bool EncodersAvailable() {
  return avcodec_find_encoder_by_name(runtime::kVideoEncoderName) != nullptr &&
         avcodec_find_encoder_by_name(runtime::kAudioEncoderName) != nullptr;
}

struct ColorBand {
  int64_t duration_us;
  uint32_t rgb;
};

// Writes consecutive solid-color bands with square-wave PCM (never silent).
bool WriteBandedClip(const runtime::OutputProfile& profile, const std::string& path,
                     const std::vector<ColorBand>& bands) {
  runtime::AssemblyContext ctx("fixture", profile);
  output::EncoderPipeline encoder(ctx);
  if (!encoder.open(path)) return false;

  const util::RationalFps fps = profile.GetFrameRate();
  int64_t duration_us = 0;
  int64_t f = 0;
  for (const auto& band : bands) {
    duration_us += band.duration_us;
    const int64_t band_end = fps.FramesFromDurationCeilUs(duration_us);
    buffer::Frame frame =
        producers::MakeSolidFrame(profile.video.width, profile.video.height, band.rgb);
    for (; f < band_end; ++f) {
      if (!encoder.encodeFrame(frame, f)) return false;
    }
  }

  const int64_t samples = duration_us * profile.audio.sample_rate / 1000000;
  buffer::AudioFrame audio;
  audio.sample_rate = profile.audio.sample_rate;
  audio.channels = profile.audio.channels;
  audio.nb_samples = static_cast<int32_t>(samples);
  audio.data.resize(static_cast<size_t>(samples) * audio.channels * sizeof(int16_t));
  int16_t* s = audio.Samples();
  for (int64_t i = 0; i < samples * audio.channels; ++i) s[i] = (i % 64 < 32) ? 800 : -800;
  if (!encoder.encodeAudioFrame(audio)) return false;

  const bool ok = encoder.finish(duration_us);
  encoder.close();
  return ok;
}

bool WriteClip(const runtime::OutputProfile& profile, const std::string& path,
               int64_t duration_us, uint32_t rgb) {
  return WriteBandedClip(profile, path, {{duration_us, rgb}});
}

uint8_t CenterLuma(const buffer::Frame& frame) {
  return frame.data[static_cast<size_t>(frame.height / 2) * frame.width + frame.width / 2];
}

class MediaRoundTripTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!EncodersAvailable()) {
      GTEST_SKIP() << "libx264 or aac encoder not available";
    }
  }

  runtime::OutputProfile profile_ = MediaProfile();
  TempDir dir_;
};

TEST_F(MediaRoundTripTest, EncodedClipProbesWithExpectedMetadata) {
  const std::string clip = dir_.Path("clip.mp4");
  ASSERT_TRUE(WriteClip(profile_, clip, 2000000, 0x0000FF));

  media::FFmpegAssetProber prober;
  media::ProbeInfo info = prober.Probe(clip);

  ASSERT_TRUE(info.ok) << info.detail;
  EXPECT_TRUE(info.has_video);
  EXPECT_TRUE(info.has_audio);
  EXPECT_EQ(info.width, 320);
  EXPECT_EQ(info.height, 180);
  EXPECT_TRUE(info.pixel_format_scalable);
  EXPECT_EQ(info.sample_rate, 44100);
  EXPECT_NEAR(static_cast<double>(info.duration_us), 2000000.0, kContainerSlackUs);
}

TEST_F(MediaRoundTripTest, ProbeRejectsNonMediaFile) {
  const std::string junk = dir_.Touch("junk.mp4");
  media::FFmpegAssetProber prober;
  EXPECT_FALSE(prober.Probe(junk).ok);
}

TEST_F(MediaRoundTripTest, DecoderScalesToRequestedSize) {
  const std::string clip = dir_.Path("clip.mp4");
  ASSERT_TRUE(WriteClip(profile_, clip, 1000000, 0x008000));

  util::Logger logger("decode");
  decode::DecoderConfig config;
  config.input_uri = clip;
  config.target_width = 64;
  config.target_height = 36;
  decode::FFmpegDecoder decoder(config, logger);
  ASSERT_TRUE(decoder.Open());

  buffer::Frame frame;
  int decoded = 0;
  while (decoder.DecodeFrame(frame)) {
    EXPECT_EQ(frame.width, 64);
    EXPECT_EQ(frame.height, 36);
    EXPECT_EQ(frame.data.size(), buffer::Frame::Yuv420pSize(64, 36));
    ++decoded;
  }
  EXPECT_TRUE(decoder.IsEOF());
  EXPECT_GE(decoded, 23);
  EXPECT_LE(decoded, 25);
}

TEST_F(MediaRoundTripTest, AudioReaderResamplesToS16) {
  const std::string clip = dir_.Path("clip.mp4");
  ASSERT_TRUE(WriteClip(profile_, clip, 1000000, 0x008000));

  util::Logger logger("audio");
  decode::AudioReaderConfig config;
  config.input_uri = clip;
  config.target_sample_rate = 22050;
  config.target_channels = 1;
  decode::FFmpegAudioReader reader(config, logger);
  ASSERT_TRUE(reader.Open());

  buffer::AudioFrame chunk;
  int64_t samples = 0;
  while (reader.ReadFrame(chunk)) {
    EXPECT_EQ(chunk.sample_rate, 22050);
    EXPECT_EQ(chunk.channels, 1);
    samples += chunk.nb_samples;
  }
  EXPECT_NEAR(static_cast<double>(samples), 22050.0, 2048.0);
}

TEST_F(MediaRoundTripTest, SourceOpenedMidClipStartsOnThePictureAtTheOffset) {
  // Keyframes every second: opening at 1.5s seeks to the 1.0s keyframe
  // (black) and must decode forward to the white band.
  const std::string clip = dir_.Path("bands.mp4");
  ASSERT_TRUE(WriteBandedClip(profile_, clip,
                              {{1000000, 0x0000FF}, {500000, 0x000000}, {500000, 0xFFFFFF}}));

  media::FFmpegAssetProber prober;
  media::ProbeInfo info = prober.Probe(clip);
  ASSERT_TRUE(info.ok) << info.detail;
  assembly::VideoAsset asset;
  asset.path = clip;
  asset.duration_us = info.duration_us;
  asset.frame_size = {info.width, info.height};

  runtime::AssemblyContext ctx("seek", profile_);
  producers::FFmpegSourceFactory sources(ctx);
  std::unique_ptr<producers::IFrameSource> source = sources.OpenVideo(asset, 1500000);
  ASSERT_NE(source, nullptr);

  buffer::Frame first;
  ASSERT_TRUE(source->NextFrame(first));
  EXPECT_GE(first.pts_us, 0);
  EXPECT_LT(first.pts_us, 1000);
  EXPECT_GT(CenterLuma(first), 200);

  int delivered = 1;
  buffer::Frame frame;
  int64_t last_pts = first.pts_us;
  while (source->NextFrame(frame)) {
    EXPECT_GT(frame.pts_us, last_pts);
    EXPECT_GT(CenterLuma(frame), 200);
    last_pts = frame.pts_us;
    ++delivered;
  }
  EXPECT_GE(delivered, 11);
  EXPECT_LE(delivered, 13);
}

TEST_F(MediaRoundTripTest, AssembledVideoRunsForTheNarrationLength) {
  const std::string a = dir_.Path("a.mp4");
  const std::string b = dir_.Path("b.mp4");
  const std::string narration = dir_.Path("narration.mp4");
  ASSERT_TRUE(WriteClip(profile_, a, 1500000, 0x0000FF));
  ASSERT_TRUE(WriteClip(profile_, b, 1000000, 0x800080));
  ASSERT_TRUE(WriteClip(profile_, narration, 4000000, 0x000000));

  assembly::AssemblyEngine engine(profile_);
  const std::string out = dir_.Path("final.mp4");
  assembly::AssemblyResult r = engine.Assemble({a, b}, narration, out);

  ASSERT_TRUE(r.ok) << assembly::AssemblyErrorToString(r.error) << " " << r.detail;
  EXPECT_GT(r.output_bytes, profile_.min_output_bytes);

  media::FFmpegAssetProber prober;
  media::ProbeInfo info = prober.Probe(out);
  ASSERT_TRUE(info.ok);
  EXPECT_EQ(info.width, 320);
  EXPECT_EQ(info.height, 180);
  EXPECT_TRUE(info.has_audio);
  EXPECT_NEAR(static_cast<double>(info.duration_us), 4000000.0, kContainerSlackUs);
}

TEST_F(MediaRoundTripTest, FallbackOnlyAssemblyProducesAValidFile) {
  const std::string narration = dir_.Path("narration.mp4");
  ASSERT_TRUE(WriteClip(profile_, narration, 2000000, 0x000000));

  assembly::AssemblyEngine engine(profile_);
  const std::string out = dir_.Path("fallback.mp4");
  assembly::AssemblyResult r = engine.Assemble({dir_.Path("missing.mp4")}, narration, out);

  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_TRUE(std::filesystem::exists(out));
}

TEST_F(MediaRoundTripTest, CaptionedSyntheticFrameHasOutputSize) {
  assembly::SyntheticLook look;
  look.rgb = 0x1E90FF;
  look.caption = "Hello";
  util::Logger logger("caption");
  producers::SyntheticFrameSource source(look, 320, 180, logger);

  buffer::Frame frame;
  ASSERT_TRUE(source.NextFrame(frame));
  EXPECT_EQ(frame.width, 320);
  EXPECT_EQ(frame.height, 180);
  EXPECT_EQ(frame.data.size(), buffer::Frame::Yuv420pSize(320, 180));
}

}  // namespace
}  // namespace reelsmith::testing
