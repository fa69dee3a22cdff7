// Repository: Reelsmith
// Component: Fallback Generator
// Purpose: Synthesize solid-color captioned clips when no usable footage exists.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_PRODUCERS_FALLBACK_GENERATOR_HPP_
#define REELSMITH_PRODUCERS_FALLBACK_GENERATOR_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"

namespace reelsmith::producers {

// Parsed form of an internal://placeholder/<index>?label=<text> URI.
struct PlaceholderRef {
  int32_t index = 0;
  std::string label;

  bool operator==(const PlaceholderRef& o) const { return index == o.index && label == o.label; }
};

// FallbackGenerator never fails and never touches the filesystem: the
// assets it returns are descriptions (color, caption, duration) that a
// SyntheticFrameSource renders at encode time. Output for a given label and
// duration is identical on every call.
class FallbackGenerator {
 public:
  static constexpr const char* kFallbackUri = "internal://fallback";
  static constexpr const char* kPlaceholderPrefix = "internal://placeholder/";

  static constexpr int64_t kKeywordClipUs = 5 * assembly::kMicrosPerSecond;
  static constexpr int32_t kMaxKeywordPlaceholders = 3;
  static constexpr int32_t kFallbackFontSize = 100;
  static constexpr int32_t kKeywordFontSize = 80;

  explicit FallbackGenerator(const runtime::AssemblyContext& ctx);

  // Whole-pipeline fallback. Empty label uses the profile caption.
  assembly::VideoAsset Generate(int64_t target_us, const std::string& label) const;

  // Per-keyword placeholder: 5 s, palette color by index, uppercased caption.
  assembly::VideoAsset ForKeyword(const std::string& keyword, int32_t index) const;

  // URIs for the first kMaxKeywordPlaceholders keywords. Feed them to the
  // loader like any other clip path.
  static std::vector<std::string> PlaceholderUris(const std::vector<std::string>& keywords);

  static std::string PlaceholderUri(int32_t index, const std::string& keyword);
  static std::optional<PlaceholderRef> ParsePlaceholderUri(const std::string& uri);
  static bool IsSyntheticUri(const std::string& uri);

  // blue, green, purple
  static uint32_t KeywordColor(int32_t index);
  static std::string KeywordCaption(const std::string& keyword);

 private:
  assembly::VideoAsset MakeAsset(std::string uri, int64_t duration_us,
                                 assembly::SyntheticLook look) const;

  const runtime::AssemblyContext& ctx_;
};

}  // namespace reelsmith::producers

#endif  // REELSMITH_PRODUCERS_FALLBACK_GENERATOR_HPP_
