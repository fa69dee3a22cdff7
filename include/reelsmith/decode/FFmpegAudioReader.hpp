// Repository: Reelsmith
// Component: FFmpeg Audio Reader
// Purpose: Decode the narration track and resample it to the output format.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_DECODE_FFMPEG_AUDIO_READER_HPP_
#define REELSMITH_DECODE_FFMPEG_AUDIO_READER_HPP_

#include <string>

#include "reelsmith/buffer/Frame.hpp"
#include "reelsmith/util/Logger.hpp"

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace reelsmith::decode {

struct AudioReaderConfig {
  std::string input_uri;
  int target_sample_rate;
  int target_channels;

  AudioReaderConfig() : target_sample_rate(44100), target_channels(2) {}
};

// FFmpegAudioReader yields interleaved S16 chunks at the target rate and
// channel count, in stream order, until the stream and the resampler delay
// are both drained. Chunk sizes follow the source codec and are not fixed.
class FFmpegAudioReader {
 public:
  FFmpegAudioReader(const AudioReaderConfig& config, const util::Logger& logger);
  ~FFmpegAudioReader();

  FFmpegAudioReader(const FFmpegAudioReader&) = delete;
  FFmpegAudioReader& operator=(const FFmpegAudioReader&) = delete;

  bool Open();

  // Returns false once everything has been delivered (or on error).
  bool ReadFrame(buffer::AudioFrame& output_frame);

  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool IsEOF() const { return eof_reached_; }
  int64_t SamplesDelivered() const { return samples_delivered_; }

 private:
  bool FindAudioStream();
  bool InitializeCodec();
  bool InitializeResampler();

  // Converts `av_frame` (nullptr = drain resampler) into output_frame.
  bool Resample(AVFrame* av_frame, buffer::AudioFrame& output_frame);

  AudioReaderConfig config_;
  const util::Logger& logger_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  ::SwrContext* swr_ctx_ = nullptr;

  int audio_stream_index_ = -1;
  bool demux_eof_ = false;
  bool codec_drained_ = false;
  bool eof_reached_ = false;
  int64_t samples_delivered_ = 0;
};

}  // namespace reelsmith::decode

#endif  // REELSMITH_DECODE_FFMPEG_AUDIO_READER_HPP_
