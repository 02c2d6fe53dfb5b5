/**
 * @file frame_sampler.hpp
 * @brief Decoded frame access for content analysis
 *
 * @details Provides:
 *
 *          - VideoDecoder: RAII owner of the libavformat / libavcodec
 *            contexts for the best video stream of a file
 *
 *          - FrameSource: the interface the complexity engine samples
 *            frames through
 *
 *          - FrameSampler: the libav implementation of FrameSource
 *
 * @attention THREAD MODEL:
 *            - One decoder per thread; libav decoder state is not
 *              thread-safe.
 */

#ifndef ADAPTIVE_ENCODER_FRAME_SAMPLER_HPP
#define ADAPTIVE_ENCODER_FRAME_SAMPLER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <functional>
#include <optional>
#include <string>

#include "frame_metrics.hpp"

namespace adaptive_encoder {

/**
 * @class VideoDecoder
 * @brief Opens a file and decodes its best video stream frame by frame.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - All libav resources are freed in reverse allocation order
 */
class VideoDecoder {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;
  bool eof_sent = false;

  std::string path_;

public:
  /// Decoder configuration
  enum class Mode {
    PictureTypes, //< Skip IDCT and loop filter; only pict_type is valid
    Luma          //< Full luma reconstruction, chroma skipped
  };

  explicit VideoDecoder(std::string path);
  ~VideoDecoder();

  VideoDecoder(const VideoDecoder &) = delete;
  VideoDecoder &operator=(const VideoDecoder &) = delete;

  /**
   * @brief Open the container and the video decoder.
   * @return false when the file is unreadable or has no decodable video
   */
  bool initialize(Mode mode);

  AVFormatContext *format_context() const { return fmt_ctx; }
  const AVStream *video_stream() const;

  double get_duration() const;
  double get_fps() const;

  /// Seek to the keyframe at or before seconds and flush the decoder
  bool seek(double seconds);

  /**
   * @brief Decode the next frame of the video stream.
   * @return Decoder-owned frame valid until the next call, nullptr at end
   *         of stream or on a decode error
   */
  const AVFrame *next_frame();

  /// Presentation time of a decoded frame in seconds
  double frame_time(const AVFrame *f) const;
};

/// Copy the luma plane of a decoded frame as 8-bit, decimated to <= max_width
std::optional<LumaFrame> extract_luma(const AVFrame *f, int max_width = 1920);

/**
 * @class FrameSource
 * @brief Random and sequential access to luma frames of one input.
 */
class FrameSource {
public:
  using FrameCallback = std::function<void(double seconds, const LumaFrame &)>;

  virtual ~FrameSource() = default;

  virtual double duration() const = 0;

  /// The first frame at or after seconds; empty when none can be decoded
  virtual std::optional<LumaFrame> frame_at(double seconds) = 0;

  /**
   * @brief Deliver one frame every step seconds over [start, end).
   * @return false when the source could not be positioned at start
   */
  virtual bool scan(double start, double end, double step,
                    const FrameCallback &callback) = 0;
};

/**
 * @class FrameSampler
 * @brief FrameSource backed by a VideoDecoder in Luma mode.
 */
class FrameSampler : public FrameSource {
  VideoDecoder decoder_;
  bool ready_ = false;

public:
  explicit FrameSampler(std::string path);

  /// Open the decoder; must succeed before any other call
  bool initialize();

  double duration() const override;
  std::optional<LumaFrame> frame_at(double seconds) override;
  bool scan(double start, double end, double step,
            const FrameCallback &callback) override;
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_FRAME_SAMPLER_HPP
