// Repository: Reelsmith
// Component: Rational Frame Rate
// Purpose: Parsing of "num/den" frame rate strings.
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/util/RationalFps.hpp"

#include <regex>

namespace reelsmith::util {

std::optional<RationalFps> RationalFps::Parse(const std::string& text) {
  static const std::regex pattern(R"((\d{1,9})/(\d{1,9}))");
  std::smatch match;
  if (!std::regex_match(text, match, pattern)) {
    return std::nullopt;
  }
  const int64_t n = std::stoll(match[1].str());
  const int64_t d = std::stoll(match[2].str());
  RationalFps fps(n, d);
  if (!fps.IsValid()) {
    return std::nullopt;
  }
  return fps;
}

}  // namespace reelsmith::util
