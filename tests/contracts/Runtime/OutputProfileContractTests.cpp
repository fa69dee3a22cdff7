// Repository: Reelsmith
// Component: OutputProfile Contract Tests
// Purpose: Defaults, partial JSON overrides, validation, round trip.
// Copyright (c) 2025 The Reelsmith Authors

#include <gtest/gtest.h>

#include <string>

#include "reelsmith/runtime/OutputProfile.hpp"

namespace reelsmith::runtime::testing {
namespace {

TEST(OutputProfileTest, DefaultsAreTheHouseFormat) {
  OutputProfile p;

  EXPECT_TRUE(p.IsValid());
  EXPECT_EQ(p.video.width, 1920);
  EXPECT_EQ(p.video.height, 1080);
  EXPECT_EQ(p.GetFrameRate(), util::FPS_24);
  EXPECT_EQ(p.audio.sample_rate, 44100);
  EXPECT_EQ(p.audio.channels, 2);
  EXPECT_EQ(p.min_output_bytes, 10000);
  EXPECT_EQ(p.filler_rgb, 0x000000u);
  EXPECT_EQ(std::string(kVideoEncoderName), "libx264");
  EXPECT_EQ(std::string(kAudioEncoderName), "aac");
  EXPECT_EQ(std::string(kContainerFormat), "mp4");
}

TEST(OutputProfileTest, PartialJsonOverridesOnlyNamedFields) {
  auto p = OutputProfile::FromJson(
      R"({"video": {"width": 1280, "height": 720, "frame_rate": "30000/1001"},
          "fallback_caption": "Stand by"})");

  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->video.width, 1280);
  EXPECT_EQ(p->video.height, 720);
  EXPECT_EQ(p->GetFrameRate(), util::FPS_2997);
  EXPECT_EQ(p->video.bitrate, 5000000);
  EXPECT_EQ(p->audio.sample_rate, 44100);
  EXPECT_EQ(p->fallback_caption, "Stand by");
}

TEST(OutputProfileTest, NestedBitrateIsNotMistakenForTopLevelField) {
  auto p = OutputProfile::FromJson(R"({"audio": {"bitrate": 96000}, "min_output_bytes": 2048})");

  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->audio.bitrate, 96000);
  EXPECT_EQ(p->video.bitrate, 5000000);
  EXPECT_EQ(p->min_output_bytes, 2048);
}

TEST(OutputProfileTest, ColorsAcceptHashAndHexPrefixes) {
  auto p = OutputProfile::FromJson(R"({"filler_color": "#102030", "fallback_color": "0xABCDEF"})");

  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->filler_rgb, 0x102030u);
  EXPECT_EQ(p->fallback_rgb, 0xABCDEFu);
}

TEST(OutputProfileTest, InvalidValuesRejectTheWholeProfile) {
  EXPECT_FALSE(OutputProfile::FromJson("").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"video": {"width": 1921}})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"video": {"frame_rate": "fast"}})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"video": {"width": "wide"}})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"audio": {"channels": 0}})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"filler_color": "black"})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"video": 5})").has_value());
}

TEST(OutputProfileTest, ValuesBeyondThirtyTwoBitsAreRejectedNotWrapped) {
  // 4294969216 = 2^32 + 1920
  EXPECT_FALSE(
      OutputProfile::FromJson(R"({"video": {"width": 4294969216, "height": 1080}})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"audio": {"sample_rate": 4294011296}})").has_value());
  EXPECT_FALSE(OutputProfile::FromJson(R"({"video": {"gop_size": -4294967248}})").has_value());

  auto wide = OutputProfile::FromJson(R"({"video": {"bitrate": 8000000000}})");
  ASSERT_TRUE(wide.has_value());
  EXPECT_EQ(wide->video.bitrate, 8000000000LL);
}

TEST(OutputProfileTest, ToJsonRoundTrips) {
  OutputProfile p;
  p.video.width = 640;
  p.video.height = 360;
  p.video.frame_rate = "25/1";
  p.fallback_rgb = 0x123456;
  p.fallback_caption = "Line one\nLine \"two\"";

  auto back = OutputProfile::FromJson(p.ToJson());

  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->video.width, 640);
  EXPECT_EQ(back->video.height, 360);
  EXPECT_EQ(back->GetFrameRate(), util::FPS_25);
  EXPECT_EQ(back->fallback_rgb, 0x123456u);
  EXPECT_EQ(back->fallback_caption, p.fallback_caption);
}

}  // namespace
}  // namespace reelsmith::runtime::testing
