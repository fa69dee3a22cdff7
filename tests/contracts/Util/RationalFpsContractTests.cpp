// Repository: Reelsmith
// Component: Rational Frame Rate Contract Tests
// Purpose: Integer frame/duration conversions never drift.
// Copyright (c) 2025 The Reelsmith Authors

#include <gtest/gtest.h>

#include "reelsmith/util/RationalFps.hpp"

namespace reelsmith::util::testing {
namespace {

TEST(RationalFpsTest, ReducesAndRejectsNonPositive) {
  EXPECT_EQ(RationalFps(48, 2), FPS_24);
  EXPECT_FALSE(RationalFps(0, 1).IsValid());
  EXPECT_FALSE(RationalFps(24, 0).IsValid());
  EXPECT_EQ(RationalFps(-24, -1), FPS_24);
}

TEST(RationalFpsTest, ParseAcceptsOnlyNumOverDen) {
  EXPECT_EQ(*RationalFps::Parse("30000/1001"), FPS_2997);
  EXPECT_FALSE(RationalFps::Parse("24").has_value());
  EXPECT_FALSE(RationalFps::Parse("24/0").has_value());
  EXPECT_FALSE(RationalFps::Parse("-24/1").has_value());
  EXPECT_FALSE(RationalFps::Parse("").has_value());
  EXPECT_EQ(FPS_2997.ToString(), "30000/1001");
}

TEST(RationalFpsTest, FrameCountsRoundAsDocumented) {
  EXPECT_EQ(FPS_24.FramesFromDurationFloorUs(1010000), 24);
  EXPECT_EQ(FPS_24.FramesFromDurationCeilUs(1010000), 25);
  EXPECT_EQ(FPS_24.FramesFromDurationCeilUs(1000000), 24);
  // 24.5 frames sits between 1020833 us and 1020834 us.
  EXPECT_EQ(FPS_24.FramesFromDurationRoundUs(1020833), 24);
  EXPECT_EQ(FPS_24.FramesFromDurationRoundUs(1020834), 25);
}

TEST(RationalFpsTest, CumulativeBoundariesDoNotDriftAtNtscRate) {
  // One hour of 29.97 is 107892.1 frames.
  const int64_t hour_us = 3600LL * 1000000LL;
  EXPECT_EQ(FPS_2997.FramesFromDurationFloorUs(hour_us), 107892);
  EXPECT_EQ(FPS_2997.DurationFromFramesUs(30000), 1001000000);
}

TEST(RationalFpsTest, FrameDurationIsFlooredMicroseconds) {
  EXPECT_EQ(FPS_24.FrameDurationUs(), 41666);
  EXPECT_EQ(FPS_25.FrameDurationUs(), 40000);
  EXPECT_EQ(RationalFps{}.FrameDurationUs(), 0);
}

}  // namespace
}  // namespace reelsmith::util::testing
