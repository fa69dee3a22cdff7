// Repository: Reelsmith
// Component: Compositor/Muxer
// Purpose: Render a reconciled Timeline plus the narration into one file.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_COMPOSITOR_HPP_
#define REELSMITH_ASSEMBLY_COMPOSITOR_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "reelsmith/assembly/AssemblyTypes.hpp"
#include "reelsmith/buffer/Frame.hpp"
#include "reelsmith/output/EncoderPipeline.hpp"
#include "reelsmith/producers/IFrameSource.hpp"
#include "reelsmith/runtime/AssemblyContext.hpp"

namespace reelsmith::assembly {

using EncoderFactory =
    std::function<std::unique_ptr<output::EncoderPipeline>(const runtime::AssemblyContext&)>;

// Compositor walks the timeline once, front to back, and writes exactly one
// output file. Segments are emitted in order with no reordering; the tail
// is cut or padded with filler so the output runs for exactly the narration
// length; the narration is the only audio stream.
//
// Frame budget: output frame boundaries come from cumulative timeline
// positions (round(cum_us * fps)), so per-segment rounding never drifts.
// Each output frame shows the newest source frame at or before its instant;
// a source that runs dry holds its last picture.
//
// On any failure the partially written file is removed before returning.
class Compositor {
 public:
  Compositor(const runtime::AssemblyContext& ctx, producers::ISourceFactory& sources,
             EncoderFactory encoder_factory);

  AssemblyResult Assemble(Timeline timeline, const AudioTrack& audio,
                          const std::string& output_path);

 private:
  // One contiguous stretch of output time: a segment or the trailing filler.
  struct Piece {
    const Segment* segment;  // nullptr = filler
    int64_t begin_us;        // Output-timeline position
    int64_t end_us;
  };

  bool EmitPiece(const Timeline& timeline, const Piece& piece, int64_t first_frame,
                 int64_t end_frame);
  bool PumpAudio(int64_t upto_samples);

  int64_t SamplesAt(int64_t t_us) const;

  const runtime::AssemblyContext& ctx_;
  producers::ISourceFactory& sources_;
  EncoderFactory encoder_factory_;

  // Per-call state
  std::unique_ptr<output::EncoderPipeline> encoder_;
  std::unique_ptr<producers::IAudioSource> audio_source_;
  buffer::Frame filler_frame_;
  buffer::AudioFrame audio_chunk_;
  int32_t audio_chunk_pos_ = 0;
  bool audio_exhausted_ = false;
  int64_t audio_samples_emitted_ = 0;
  int64_t audio_samples_padded_ = 0;
  int64_t audio_samples_total_ = 0;
  int64_t frames_emitted_ = 0;
  bool cancelled_ = false;
};

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_COMPOSITOR_HPP_
