// Repository: Reelsmith
// Component: Rational Frame Rate
// Purpose: Integer frame/duration math for the fixed output cadence.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_UTIL_RATIONAL_FPS_HPP_
#define REELSMITH_UTIL_RATIONAL_FPS_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace reelsmith::util {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// Frame rate as a reduced fraction. Invalid input normalizes to 0/1.
// All frame <-> microsecond conversions stay in integer arithmetic so frame
// boundaries computed from cumulative durations never drift.
struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  constexpr double ToDouble() const { return static_cast<double>(num) / static_cast<double>(den); }

  constexpr int64_t FrameDurationUs() const {
    return IsValid() ? ((1000000LL * den) / num) : 0;
  }

  // Start time of frame `frames` (floor to whole microseconds).
  constexpr int64_t DurationFromFramesUs(int64_t frames) const {
    return IsValid() ? ((frames * 1000000LL * den) / num) : 0;
  }

  constexpr int64_t FramesFromDurationFloorUs(int64_t delta_us) const {
    return IsValid() ? ((delta_us * num) / (den * 1000000LL)) : 0;
  }
  constexpr int64_t FramesFromDurationCeilUs(int64_t delta_us) const {
    if (!IsValid()) return 0;
    const int64_t numer = delta_us * num;
    const int64_t denom = den * 1000000LL;
    return (numer + denom - 1) / denom;
  }
  // Nearest frame boundary; exact halves round up.
  constexpr int64_t FramesFromDurationRoundUs(int64_t delta_us) const {
    if (!IsValid()) return 0;
    const int64_t numer = delta_us * num;
    const int64_t denom = den * 1000000LL;
    return (2 * numer + denom) / (2 * denom);
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }

  // Parses "num/den" (e.g. "24/1", "30000/1001"). Empty on malformed or
  // non-positive input.
  static std::optional<RationalFps> Parse(const std::string& text);

  std::string ToString() const {
    return std::to_string(num) + "/" + std::to_string(den);
  }
};

constexpr RationalFps FPS_23976{24000, 1001};
constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_25{25, 1};
constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_30{30, 1};

}  // namespace reelsmith::util

#endif  // REELSMITH_UTIL_RATIONAL_FPS_HPP_
