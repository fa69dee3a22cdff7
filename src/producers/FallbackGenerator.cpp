// Repository: Reelsmith
// Component: Fallback Generator Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/producers/FallbackGenerator.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace reelsmith::producers {

namespace {

constexpr uint32_t kKeywordPalette[] = {
    0x0000FF,  // blue
    0x008000,  // green
    0x800080,  // purple
};

std::string PercentEncode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::optional<std::string> PercentDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size() || !std::isxdigit(static_cast<unsigned char>(text[i + 1])) ||
        !std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16)));
    i += 2;
  }
  return out;
}

}  // namespace

FallbackGenerator::FallbackGenerator(const runtime::AssemblyContext& ctx) : ctx_(ctx) {}

assembly::VideoAsset FallbackGenerator::Generate(int64_t target_us,
                                                 const std::string& label) const {
  assembly::SyntheticLook look;
  look.rgb = ctx_.profile.fallback_rgb;
  look.caption = label.empty() ? ctx_.profile.fallback_caption : label;
  look.font_size = kFallbackFontSize;

  ctx_.logger.Info("[FallbackGenerator] Generating fallback clip duration_us=" +
                   std::to_string(target_us) + " caption=\"" + look.caption + "\"");
  return MakeAsset(kFallbackUri, target_us, std::move(look));
}

assembly::VideoAsset FallbackGenerator::ForKeyword(const std::string& keyword,
                                                   int32_t index) const {
  assembly::SyntheticLook look;
  look.rgb = KeywordColor(index);
  look.caption = KeywordCaption(keyword);
  look.font_size = kKeywordFontSize;

  ctx_.logger.Debug("[FallbackGenerator] Placeholder index=" + std::to_string(index) +
                    " keyword=" + keyword);
  return MakeAsset(PlaceholderUri(index, keyword), kKeywordClipUs, std::move(look));
}

std::vector<std::string> FallbackGenerator::PlaceholderUris(
    const std::vector<std::string>& keywords) {
  std::vector<std::string> uris;
  for (size_t i = 0; i < keywords.size() && static_cast<int32_t>(i) < kMaxKeywordPlaceholders;
       ++i) {
    uris.push_back(PlaceholderUri(static_cast<int32_t>(i), keywords[i]));
  }
  return uris;
}

std::string FallbackGenerator::PlaceholderUri(int32_t index, const std::string& keyword) {
  return std::string(kPlaceholderPrefix) + std::to_string(index) + "?label=" +
         PercentEncode(keyword);
}

std::optional<PlaceholderRef> FallbackGenerator::ParsePlaceholderUri(const std::string& uri) {
  const std::string prefix(kPlaceholderPrefix);
  if (uri.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

  const std::string rest = uri.substr(prefix.size());
  const size_t q = rest.find("?label=");
  const std::string index_text = rest.substr(0, q);
  if (index_text.empty() || index_text.size() > 6) return std::nullopt;
  for (char c : index_text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }

  PlaceholderRef ref;
  ref.index = std::atoi(index_text.c_str());
  if (q != std::string::npos) {
    auto label = PercentDecode(rest.substr(q + 7));
    if (!label) return std::nullopt;
    ref.label = std::move(*label);
  }
  return ref;
}

bool FallbackGenerator::IsSyntheticUri(const std::string& uri) {
  return uri.compare(0, 11, "internal://") == 0;
}

uint32_t FallbackGenerator::KeywordColor(int32_t index) {
  constexpr int32_t n = static_cast<int32_t>(sizeof(kKeywordPalette) / sizeof(kKeywordPalette[0]));
  const int32_t i = index < 0 ? 0 : index % n;
  return kKeywordPalette[i];
}

std::string FallbackGenerator::KeywordCaption(const std::string& keyword) {
  std::string upper = keyword;
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return upper + "\nStock Video Placeholder";
}

assembly::VideoAsset FallbackGenerator::MakeAsset(std::string uri, int64_t duration_us,
                                                  assembly::SyntheticLook look) const {
  assembly::VideoAsset asset;
  asset.path = std::move(uri);
  asset.duration_us = duration_us;
  asset.frame_size = {ctx_.profile.video.width, ctx_.profile.video.height};
  asset.frame_rate = ctx_.profile.GetFrameRate();
  asset.has_audio = false;
  asset.needs_scaling = false;
  asset.kind = assembly::SourceKind::kSynthetic;
  asset.look = std::move(look);
  return asset;
}

}  // namespace reelsmith::producers
