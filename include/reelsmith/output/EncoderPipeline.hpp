// Repository: Reelsmith
// Component: Encoder Pipeline
// Purpose: Owns FFmpeg encoder/muxer handles and writes one MP4 file.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_OUTPUT_ENCODER_PIPELINE_HPP_
#define REELSMITH_OUTPUT_ENCODER_PIPELINE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelsmith/runtime/AssemblyContext.hpp"

struct AVCodecContext;
struct AVFormatContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace reelsmith::buffer {
struct Frame;
struct AudioFrame;
}  // namespace reelsmith::buffer

namespace reelsmith::output {

// EncoderPipeline owns FFmpeg encoder and muxer handles.
// It initializes both encoders in open(), encodes frames via encodeFrame()
// and encodeAudioFrame(), drains and finalizes in finish(), and releases
// everything in close().
//
// Video: libx264, YUV420P at the profile size, CFR at the profile rate.
// Audio: aac, interleaved S16 in at the profile rate, converted internally.
//
// Methods are virtual so tests can substitute an encoder that never touches
// FFmpeg.
class EncoderPipeline {
 public:
  explicit EncoderPipeline(const runtime::AssemblyContext& ctx);
  virtual ~EncoderPipeline();

  EncoderPipeline(const EncoderPipeline&) = delete;
  EncoderPipeline& operator=(const EncoderPipeline&) = delete;
  EncoderPipeline(EncoderPipeline&&) = delete;
  EncoderPipeline& operator=(EncoderPipeline&&) = delete;

  // Create encoders and the output file, write the container header.
  virtual bool open(const std::string& output_path);

  // frame_index is the output frame number; PTS = frame_index / fps.
  virtual bool encodeFrame(const buffer::Frame& frame, int64_t frame_index);

  // Append PCM. Chunks of any size are accepted and regrouped to the codec
  // frame size.
  virtual bool encodeAudioFrame(const buffer::AudioFrame& audio_frame);

  // Drain both encoders, end the video track at total_duration_us, and
  // write the trailer. The file is complete only if this returns true.
  virtual bool finish(int64_t total_duration_us);

  // Release all resources. Safe to call multiple times.
  virtual void close();

  virtual bool IsInitialized() const;

 private:
  bool OpenVideoEncoder();
  bool OpenAudioEncoder();

  // Pull every packet the codec has ready and hand it to the muxer.
  bool DrainVideo();
  bool DrainAudio();

  // Write the held-back video packet.
  bool WritePendingVideo();

  bool EncodeAudioChunk(int nb_samples);

  const runtime::AssemblyContext& ctx_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVCodecContext* audio_codec_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  AVPacket* packet_ = nullptr;

  // One video packet is held back so the last packet's duration can be
  // clamped to the target length in finish().
  AVPacket* pending_video_packet_ = nullptr;
  bool has_pending_video_ = false;

  ::SwrContext* swr_ctx_ = nullptr;

  // AAC requires every frame except the last to be exactly frame_size, so
  // incoming samples are buffered (S16 interleaved) until a full frame exists.
  std::vector<int16_t> audio_fifo_;
  int64_t audio_samples_encoded_ = 0;

  bool header_written_ = false;
  bool initialized_ = false;
};

}  // namespace reelsmith::output

#endif  // REELSMITH_OUTPUT_ENCODER_PIPELINE_HPP_
