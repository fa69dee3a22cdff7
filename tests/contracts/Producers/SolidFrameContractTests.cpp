// Repository: Reelsmith
// Component: Synthetic Picture Contract Tests
// Purpose: Color conversion, solid frame layout, caption filter graph text.
// Copyright (c) 2025 The Reelsmith Authors

#include <gtest/gtest.h>

#include <string>

#include "reelsmith/producers/SolidFrame.hpp"
#include "reelsmith/producers/SyntheticFrameSource.hpp"

namespace reelsmith::producers::testing {
namespace {

TEST(SolidFrameTest, BlackAndWhiteUseLimitedRange) {
  const YuvColor black = RgbToYuv(0x000000);
  EXPECT_EQ(black.y, 16);
  EXPECT_EQ(black.u, 128);
  EXPECT_EQ(black.v, 128);

  const YuvColor white = RgbToYuv(0xFFFFFF);
  EXPECT_EQ(white.y, 235);
  EXPECT_EQ(white.u, 128);
  EXPECT_EQ(white.v, 128);
}

TEST(SolidFrameTest, BlueHasHighChroma) {
  const YuvColor blue = RgbToYuv(0x0000FF);
  EXPECT_LT(blue.y, 64);
  EXPECT_GT(blue.u, 200);
}

TEST(SolidFrameTest, NegativeChromaSumsRoundDown) {
  const YuvColor yellow = RgbToYuv(0xFFFF00);
  EXPECT_EQ(yellow.y, 210);
  EXPECT_EQ(yellow.u, 16);
  EXPECT_EQ(yellow.v, 146);

  const YuvColor blue = RgbToYuv(0x0000FF);
  EXPECT_EQ(blue.v, 110);
}

TEST(SolidFrameTest, FrameIsPlanarYuv420p) {
  buffer::Frame f = MakeSolidFrame(64, 36, 0x1E90FF);
  const YuvColor c = RgbToYuv(0x1E90FF);

  EXPECT_EQ(f.width, 64);
  EXPECT_EQ(f.height, 36);
  ASSERT_EQ(f.data.size(), buffer::Frame::Yuv420pSize(64, 36));
  EXPECT_EQ(f.data.front(), c.y);
  EXPECT_EQ(f.data[64 * 36], c.u);
  EXPECT_EQ(f.data.back(), c.v);
}

TEST(CaptionFilterGraphTest, DescribesColorSizeAndCenteredText) {
  assembly::SyntheticLook look;
  look.rgb = 0x1E90FF;
  look.caption = "Hello";
  look.font_size = 100;

  const std::string g = BuildCaptionFilterGraph(look, 1920, 1080);

  EXPECT_NE(g.find("color=c=0x1E90FF:s=1920x1080"), std::string::npos);
  EXPECT_NE(g.find("drawtext=text=Hello:"), std::string::npos);
  EXPECT_NE(g.find("fontsize=100"), std::string::npos);
  EXPECT_NE(g.find("x=(w-text_w)/2:y=(h-text_h)/2"), std::string::npos);
  EXPECT_NE(g.find("format=yuv420p"), std::string::npos);
}

TEST(CaptionFilterGraphTest, FontSizeFollowsOutputHeight) {
  assembly::SyntheticLook look;
  look.caption = "x";
  look.font_size = 100;

  EXPECT_NE(BuildCaptionFilterGraph(look, 1280, 720).find("fontsize=66"), std::string::npos);
  EXPECT_NE(BuildCaptionFilterGraph(look, 64, 36).find("fontsize=8"), std::string::npos);
}

TEST(CaptionFilterGraphTest, SpecialCharactersAreEscapedForBothParsers) {
  assembly::SyntheticLook look;
  look.caption = "a:b,c";

  const std::string g = BuildCaptionFilterGraph(look, 64, 36);

  // ':' escaped once for drawtext, the backslash again for the graph.
  EXPECT_NE(g.find("text=a\\\\:b\\,c:"), std::string::npos) << g;
}

TEST(CaptionFilterGraphTest, EmptyCaptionSkipsDrawtext) {
  assembly::SyntheticLook look;
  look.rgb = 0x000000;

  const std::string g = BuildCaptionFilterGraph(look, 64, 36);
  EXPECT_EQ(g.find("drawtext"), std::string::npos);
}

TEST(SyntheticFrameSourceTest, UncaptionedLookDeliversOneSolidFrame) {
  assembly::SyntheticLook look;
  look.rgb = 0x008000;
  util::Logger logger("synthetic");
  SyntheticFrameSource source(look, 64, 36, logger);

  buffer::Frame f;
  ASSERT_TRUE(source.NextFrame(f));
  EXPECT_EQ(f.data.front(), RgbToYuv(0x008000).y);
  EXPECT_EQ(f.pts_us, 0);
  EXPECT_FALSE(source.NextFrame(f));
  EXPECT_FALSE(source.CaptionRendered());
}

}  // namespace
}  // namespace reelsmith::producers::testing
