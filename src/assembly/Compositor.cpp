// Repository: Reelsmith
// Component: Compositor/Muxer Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/assembly/Compositor.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <vector>

#include "reelsmith/assembly/TimelineConformer.hpp"
#include "reelsmith/output/OutputValidator.hpp"
#include "reelsmith/producers/SolidFrame.hpp"

namespace reelsmith::assembly {

namespace {

// Upper bound on one zero-padding chunk handed to the encoder.
constexpr int64_t kSilenceChunkSamples = 4096;

// Deletes the output file on scope exit unless Commit() was called.
class PartialOutputGuard {
 public:
  explicit PartialOutputGuard(std::string path) : path_(std::move(path)) {}
  ~PartialOutputGuard() {
    if (!committed_) output::RemoveOutputFile(path_);
  }

  PartialOutputGuard(const PartialOutputGuard&) = delete;
  PartialOutputGuard& operator=(const PartialOutputGuard&) = delete;

  void Commit() { committed_ = true; }

 private:
  std::string path_;
  bool committed_ = false;
};

}  // namespace

Compositor::Compositor(const runtime::AssemblyContext& ctx, producers::ISourceFactory& sources,
                       EncoderFactory encoder_factory)
    : ctx_(ctx), sources_(sources), encoder_factory_(std::move(encoder_factory)) {}

int64_t Compositor::SamplesAt(int64_t t_us) const {
  const int64_t sr = ctx_.profile.audio.sample_rate;
  return (t_us * sr + kMicrosPerSecond / 2) / kMicrosPerSecond;
}

AssemblyResult Compositor::Assemble(Timeline timeline, const AudioTrack& audio,
                                    const std::string& output_path) {
  if (output_path.empty()) {
    return AssemblyResult::Failure(AssemblyError::kInvalidRequest, "empty output path");
  }

  const int64_t target_us = audio.duration_us;
  const ConformReport conform = ConformToTarget(timeline, target_us);
  {
    std::ostringstream oss;
    oss << "[Compositor] Conform realized_us=" << conform.realized_us
        << " target_us=" << target_us << " truncated_us=" << conform.truncated_us
        << " filler_us=" << conform.filler_us << " segments=" << timeline.segments.size();
    ctx_.logger.Info(oss.str());
  }

  // Reset per-call state.
  audio_chunk_ = buffer::AudioFrame{};
  audio_chunk_pos_ = 0;
  audio_exhausted_ = false;
  audio_samples_emitted_ = 0;
  audio_samples_padded_ = 0;
  audio_samples_total_ = SamplesAt(target_us);
  frames_emitted_ = 0;
  cancelled_ = false;
  filler_frame_ = producers::MakeSolidFrame(ctx_.profile.video.width, ctx_.profile.video.height,
                                            ctx_.profile.filler_rgb);

  audio_source_ = sources_.OpenAudio(audio);
  if (!audio_source_) {
    ctx_.logger.Error("[Compositor] Cannot decode narration: " + audio.path);
    return AssemblyResult::Failure(AssemblyError::kAudioUnavailable,
                                   "cannot decode " + audio.path);
  }

  PartialOutputGuard guard(output_path);

  encoder_ = encoder_factory_(ctx_);
  if (!encoder_ || !encoder_->open(output_path)) {
    encoder_.reset();
    audio_source_.reset();
    return AssemblyResult::Failure(AssemblyError::kEncodeFailed,
                                   "encoder open failed for " + output_path);
  }

  // Output-timeline pieces in order: every segment, then the filler.
  std::vector<Piece> pieces;
  pieces.reserve(timeline.segments.size() + 1);
  int64_t cursor = 0;
  for (const auto& seg : timeline.segments) {
    pieces.push_back({&seg, cursor, cursor + seg.DurationUs()});
    cursor += seg.DurationUs();
  }
  if (timeline.filler_us > 0) {
    pieces.push_back({nullptr, cursor, cursor + timeline.filler_us});
  }

  const util::RationalFps fps = ctx_.profile.GetFrameRate();
  const int64_t total_frames = fps.FramesFromDurationCeilUs(target_us);

  bool ok = true;
  for (size_t i = 0; ok && i < pieces.size(); ++i) {
    const bool last = i + 1 == pieces.size();
    const int64_t first_frame = fps.FramesFromDurationRoundUs(pieces[i].begin_us);
    const int64_t end_frame = last ? total_frames : fps.FramesFromDurationRoundUs(pieces[i].end_us);
    ok = EmitPiece(timeline, pieces[i], first_frame, end_frame);
  }

  ok = ok && PumpAudio(audio_samples_total_);
  ok = ok && encoder_->finish(target_us);
  encoder_->close();
  encoder_.reset();
  audio_source_.reset();

  if (cancelled_) {
    ctx_.logger.Warn("[Compositor] Cancelled after " + std::to_string(frames_emitted_) +
                     " frames; removing " + output_path);
    return AssemblyResult::Failure(AssemblyError::kCancelled, "cancelled");
  }
  if (!ok) {
    ctx_.logger.Error("[Compositor] Encoding failed after " + std::to_string(frames_emitted_) +
                      " frames; removing " + output_path);
    return AssemblyResult::Failure(AssemblyError::kEncodeFailed, "encoding failed");
  }

  if (audio_samples_padded_ > 0) {
    ctx_.logger.Warn("[Compositor] Narration decoded short; padded " +
                     std::to_string(audio_samples_padded_) + " samples of silence");
  }

  const output::OutputCheck check =
      output::ValidateOutputFile(output_path, ctx_.profile.min_output_bytes);
  if (!check.ok) {
    ctx_.logger.Error("[Compositor] " + std::string(AssemblyErrorToString(
                          AssemblyError::kEncodeValidation)) + ": " + check.detail);
    return AssemblyResult::Failure(AssemblyError::kEncodeValidation, check.detail);
  }

  guard.Commit();

  std::ostringstream oss;
  oss << "[Compositor] Wrote " << output_path << " bytes=" << check.bytes
      << " frames=" << frames_emitted_ << " audio_samples=" << audio_samples_emitted_;
  ctx_.logger.Info(oss.str());

  return AssemblyResult::Success(output_path, check.bytes, conform.truncated_us,
                                 conform.filler_us);
}

bool Compositor::EmitPiece(const Timeline& timeline, const Piece& piece, int64_t first_frame,
                           int64_t end_frame) {
  if (end_frame <= first_frame) return true;

  const util::RationalFps fps = ctx_.profile.GetFrameRate();

  std::unique_ptr<producers::IFrameSource> source;
  if (piece.segment) {
    const VideoAsset& asset = timeline.AssetFor(*piece.segment);
    source = sources_.OpenVideo(asset, piece.segment->start_offset_us);
    if (!source) {
      ctx_.logger.Warn("[Compositor] Cannot open " + asset.path +
                       " at encode time; showing filler for its segment");
    } else {
      ctx_.logger.Debug("[Compositor] Segment " + asset.path + " [" +
                        std::to_string(piece.segment->start_offset_us) + ", " +
                        std::to_string(piece.segment->end_offset_us) + ") frames " +
                        std::to_string(first_frame) + ".." + std::to_string(end_frame));
    }
  }

  buffer::Frame current;
  buffer::Frame next;
  bool have_current = false;
  bool have_next = false;
  bool source_done = source == nullptr;

  for (int64_t f = first_frame; f < end_frame; ++f) {
    if (ctx_.CancelRequested()) {
      cancelled_ = true;
      return false;
    }
    // Position of this output frame inside the piece's source.
    const int64_t source_us = fps.DurationFromFramesUs(f) - piece.begin_us;

    if (!have_current && !source_done) {
      if (source->NextFrame(current)) {
        have_current = true;
      } else {
        source_done = true;
      }
    }
    while (!source_done) {
      if (!have_next) {
        if (!source->NextFrame(next)) {
          source_done = true;
          break;
        }
        have_next = true;
      }
      if (next.pts_us > source_us) break;
      std::swap(current, next);
      have_next = false;
    }

    const buffer::Frame& out = have_current ? current : filler_frame_;
    if (!encoder_->encodeFrame(out, f)) {
      return false;
    }
    ++frames_emitted_;

    const int64_t audio_upto =
        std::min(SamplesAt(fps.DurationFromFramesUs(f + 1)), audio_samples_total_);
    if (!PumpAudio(audio_upto)) {
      return false;
    }
  }
  return true;
}

bool Compositor::PumpAudio(int64_t upto_samples) {
  const int32_t channels = ctx_.profile.audio.channels;
  const int32_t sample_rate = ctx_.profile.audio.sample_rate;

  while (audio_samples_emitted_ < upto_samples) {
    const int64_t wanted = upto_samples - audio_samples_emitted_;

    buffer::AudioFrame chunk;
    chunk.sample_rate = sample_rate;
    chunk.channels = channels;
    chunk.pts_us = audio_samples_emitted_ * kMicrosPerSecond / sample_rate;

    if (audio_chunk_pos_ >= audio_chunk_.nb_samples) {
      if (!audio_exhausted_ && audio_source_->NextAudio(audio_chunk_)) {
        audio_chunk_pos_ = 0;
        continue;
      }
      audio_exhausted_ = true;

      // Narration ran short: zero-pad.
      const int64_t n = std::min(wanted, kSilenceChunkSamples);
      chunk.nb_samples = static_cast<int32_t>(n);
      chunk.data.assign(static_cast<size_t>(n) * channels * sizeof(int16_t), 0);
      audio_samples_padded_ += n;
    } else {
      const int64_t n =
          std::min<int64_t>(wanted, audio_chunk_.nb_samples - audio_chunk_pos_);
      const size_t frame_bytes = static_cast<size_t>(channels) * sizeof(int16_t);
      const uint8_t* src = audio_chunk_.data.data() + audio_chunk_pos_ * frame_bytes;
      chunk.nb_samples = static_cast<int32_t>(n);
      chunk.data.assign(src, src + static_cast<size_t>(n) * frame_bytes);
      audio_chunk_pos_ += static_cast<int32_t>(n);
    }

    if (!encoder_->encodeAudioFrame(chunk)) {
      return false;
    }
    audio_samples_emitted_ += chunk.nb_samples;
  }
  return true;
}

}  // namespace reelsmith::assembly
