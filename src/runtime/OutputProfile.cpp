// Repository: Reelsmith
// Component: OutputProfile Domain Implementation
// Purpose: Parse and validate OutputProfile from JSON.
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/runtime/OutputProfile.hpp"

#include <cstdio>
#include <limits>
#include <regex>
#include <sstream>

namespace reelsmith::runtime {

namespace {
  // The profile schema is small and flat, so fields are pulled out with
  // regexes. Every field is optional; a field that is present but does not
  // parse fails the whole profile.
  enum class Field { kAbsent, kOk, kInvalid };

  bool HasKey(const std::string& json, const std::string& field_name) {
    std::regex pattern("\"" + field_name + "\"\\s*:");
    return std::regex_search(json, pattern);
  }

  template <typename Int>
  Field ExtractInt(const std::string& json, const std::string& field_name, Int& out_value) {
    if (!HasKey(json, field_name)) return Field::kAbsent;
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d{1,18})");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) return Field::kInvalid;
    const long long parsed = std::stoll(match[1].str());
    if (parsed < static_cast<long long>(std::numeric_limits<Int>::min()) ||
        parsed > static_cast<long long>(std::numeric_limits<Int>::max())) {
      return Field::kInvalid;
    }
    out_value = static_cast<Int>(parsed);
    return Field::kOk;
  }

  std::string Unescape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
      if (raw[i] == '\\' && i + 1 < raw.size()) {
        char next = raw[++i];
        switch (next) {
          case 'n': out.push_back('\n'); break;
          case 't': out.push_back('\t'); break;
          default: out.push_back(next); break;
        }
      } else {
        out.push_back(raw[i]);
      }
    }
    return out;
  }

  std::string Escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
      switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out.push_back(c); break;
      }
    }
    return out;
  }

  Field ExtractString(const std::string& json, const std::string& field_name, std::string& out_value) {
    if (!HasKey(json, field_name)) return Field::kAbsent;
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) return Field::kInvalid;
    out_value = Unescape(match[1].str());
    return Field::kOk;
  }

  // Colors are written "#RRGGBB" or "0xRRGGBB".
  Field ExtractColor(const std::string& json, const std::string& field_name, uint32_t& out_value) {
    std::string text;
    Field state = ExtractString(json, field_name, text);
    if (state != Field::kOk) return state;
    std::smatch match;
    static const std::regex pattern(R"((?:#|0x|0X)([0-9a-fA-F]{6}))");
    if (!std::regex_match(text, match, pattern)) return Field::kInvalid;
    out_value = static_cast<uint32_t>(std::stoul(match[1].str(), nullptr, 16));
    return Field::kOk;
  }

  // Extract nested object (e.g., "video": { ... })
  Field ExtractNestedObject(const std::string& json, const std::string& field_name, std::string& out_json) {
    if (!HasKey(json, field_name)) return Field::kAbsent;
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\\{");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return Field::kInvalid;
    }

    size_t start_pos = match.position() + match.length() - 1;  // Position of '{'
    int brace_count = 1;
    size_t pos = start_pos + 1;

    while (pos < json.length() && brace_count > 0) {
      if (json[pos] == '{') brace_count++;
      else if (json[pos] == '}') brace_count--;
      pos++;
    }

    if (brace_count == 0) {
      out_json = json.substr(start_pos, pos - start_pos);
      return Field::kOk;
    }
    return Field::kInvalid;
  }

  std::string FormatColor(uint32_t rgb) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%06X", rgb & 0xFFFFFFu);
    return buf;
  }
}  // namespace

std::optional<OutputProfile> OutputProfile::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  OutputProfile profile;

  std::string video_json;
  Field video = ExtractNestedObject(json_str, "video", video_json);
  if (video == Field::kInvalid) return std::nullopt;
  if (video == Field::kOk) {
    if (ExtractInt(video_json, "width", profile.video.width) == Field::kInvalid ||
        ExtractInt(video_json, "height", profile.video.height) == Field::kInvalid ||
        ExtractString(video_json, "frame_rate", profile.video.frame_rate) == Field::kInvalid ||
        ExtractInt(video_json, "bitrate", profile.video.bitrate) == Field::kInvalid ||
        ExtractInt(video_json, "gop_size", profile.video.gop_size) == Field::kInvalid) {
      return std::nullopt;
    }
  }

  std::string audio_json;
  Field audio = ExtractNestedObject(json_str, "audio", audio_json);
  if (audio == Field::kInvalid) return std::nullopt;
  if (audio == Field::kOk) {
    if (ExtractInt(audio_json, "sample_rate", profile.audio.sample_rate) == Field::kInvalid ||
        ExtractInt(audio_json, "channels", profile.audio.channels) == Field::kInvalid ||
        ExtractInt(audio_json, "bitrate", profile.audio.bitrate) == Field::kInvalid) {
      return std::nullopt;
    }
  }

  // Top-level keys are searched outside the nested objects so that, e.g.,
  // a "bitrate" inside "video" is never mistaken for a top-level field.
  std::string top_level = json_str;
  for (const std::string* nested : {&video_json, &audio_json}) {
    if (nested->empty()) continue;
    size_t at = top_level.find(*nested);
    if (at != std::string::npos) top_level.erase(at, nested->size());
  }

  if (ExtractInt(top_level, "min_output_bytes", profile.min_output_bytes) == Field::kInvalid ||
      ExtractColor(top_level, "filler_color", profile.filler_rgb) == Field::kInvalid ||
      ExtractColor(top_level, "fallback_color", profile.fallback_rgb) == Field::kInvalid ||
      ExtractString(top_level, "fallback_caption", profile.fallback_caption) == Field::kInvalid) {
    return std::nullopt;
  }

  if (!profile.IsValid()) {
    return std::nullopt;
  }

  return profile;
}

std::string OutputProfile::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"video\":{"
      << "\"width\":" << video.width << ","
      << "\"height\":" << video.height << ","
      << "\"frame_rate\":\"" << video.frame_rate << "\","
      << "\"bitrate\":" << video.bitrate << ","
      << "\"gop_size\":" << video.gop_size
      << "},"
      << "\"audio\":{"
      << "\"sample_rate\":" << audio.sample_rate << ","
      << "\"channels\":" << audio.channels << ","
      << "\"bitrate\":" << audio.bitrate
      << "},"
      << "\"min_output_bytes\":" << min_output_bytes << ","
      << "\"filler_color\":\"" << FormatColor(filler_rgb) << "\","
      << "\"fallback_color\":\"" << FormatColor(fallback_rgb) << "\","
      << "\"fallback_caption\":\"" << Escape(fallback_caption) << "\""
      << "}";
  return oss.str();
}

bool OutputProfile::IsValid() const {
  // YUV420P needs even dimensions.
  if (video.width <= 0 || video.height <= 0) {
    return false;
  }
  if (video.width % 2 != 0 || video.height % 2 != 0) {
    return false;
  }
  if (!GetFrameRate().IsValid()) {
    return false;
  }
  if (video.bitrate <= 0 || video.gop_size <= 0) {
    return false;
  }

  if (audio.sample_rate <= 0 || audio.channels <= 0 || audio.channels > 8) {
    return false;
  }
  if (audio.bitrate <= 0) {
    return false;
  }

  if (min_output_bytes < 0) {
    return false;
  }

  return true;
}

util::RationalFps OutputProfile::GetFrameRate() const {
  auto fps = util::RationalFps::Parse(video.frame_rate);
  return fps ? *fps : util::RationalFps{};
}

}  // namespace reelsmith::runtime
