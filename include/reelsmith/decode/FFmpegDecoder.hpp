// Repository: Reelsmith
// Component: FFmpeg Decoder
// Purpose: Decode one clip's video stream to output-sized YUV420P frames.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_DECODE_FFMPEG_DECODER_HPP_
#define REELSMITH_DECODE_FFMPEG_DECODER_HPP_

#include <cstdint>
#include <string>

#include "reelsmith/buffer/Frame.hpp"
#include "reelsmith/util/Logger.hpp"
#include "reelsmith/util/RationalFps.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace reelsmith::decode {

// DecoderConfig holds configuration for FFmpeg-based decoding.
struct DecoderConfig {
  std::string input_uri;   // File path to decode
  int target_width;        // Output width (scaled)
  int target_height;       // Output height (scaled)
  int max_decode_threads;  // Maximum decoder threads (0 = auto)

  DecoderConfig() : target_width(1920), target_height(1080), max_decode_threads(0) {}
};

// FFmpegDecoder decodes the first video stream of a file and scales every
// frame to the target size (stretch, no letterbox). Other streams are read
// and discarded; embedded audio never reaches the output.
//
// Lifecycle:
// 1. Construct with config
// 2. Open()
// 3. SeekToUs() (optional) then DecodeFrame() until it returns false
// 4. Close() or rely on destructor
//
// Not thread-safe. One decoder per segment, owned by a FileFrameSource.
class FFmpegDecoder {
 public:
  FFmpegDecoder(const DecoderConfig& config, const util::Logger& logger);
  ~FFmpegDecoder();

  FFmpegDecoder(const FFmpegDecoder&) = delete;
  FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

  // Opens the input file and initializes decoder and scaler.
  bool Open();

  // Decodes the next frame. Returns false at end of stream or on error;
  // IsEOF() distinguishes the two.
  bool DecodeFrame(buffer::Frame& output_frame);

  // Releases every FFmpeg handle. Safe to call repeatedly.
  void Close();

  // Seeks to the keyframe at or before position_us. A freshly opened decoder
  // is already at the start, so position_us <= 0 does nothing.
  bool SeekToUs(int64_t position_us);

  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool IsEOF() const { return eof_reached_; }
  uint64_t FramesDecoded() const { return frames_decoded_; }
  uint64_t DecodeErrors() const { return decode_errors_; }

  int GetVideoWidth() const;
  int GetVideoHeight() const;
  util::RationalFps GetVideoRationalFps() const;
  int64_t GetVideoDurationUs() const;

 private:
  bool FindVideoStream();
  bool InitializeCodec();
  bool InitializeScaler();

  // Pulls one frame from the codec, feeding packets (and the final flush
  // packet) as needed.
  bool ReadAndDecodeFrame(buffer::Frame& output_frame);

  bool ConvertFrame(AVFrame* av_frame, buffer::Frame& output_frame);

  DecoderConfig config_;
  const util::Logger& logger_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* scaled_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int video_stream_index_ = -1;
  bool demux_eof_ = false;  // Flush packet sent; draining codec
  bool eof_reached_ = false;

  int64_t start_time_ = 0;
  double time_base_ = 0.0;

  uint64_t frames_decoded_ = 0;
  uint64_t decode_errors_ = 0;
};

}  // namespace reelsmith::decode

#endif  // REELSMITH_DECODE_FFMPEG_DECODER_HPP_
