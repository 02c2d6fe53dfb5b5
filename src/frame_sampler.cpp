/**
 * @file frame_sampler.cpp
 * @brief Decoded frame access for content analysis
 *
 * @details The decoder is tuned for analysis rather than display:
 *
 *          - PictureTypes mode skips IDCT, loop filtering and chroma, which
 *            is enough to read each frame's picture type
 *
 *          - Luma mode reconstructs pixels but still skips chroma
 *
 *          - Decoding is single-threaded; the analysis samples are small
 */

#include "adaptive_encoder/frame_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

extern "C" {
#include <libavutil/pixdesc.h>
}

#include "adaptive_encoder/logging.hpp"

namespace adaptive_encoder {

// **---- VideoDecoder ----**

VideoDecoder::VideoDecoder(std::string path) : path_(std::move(path)) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
}

VideoDecoder::~VideoDecoder() {
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  av_frame_free(&frame);
  av_packet_free(&pkt);
}

bool VideoDecoder::initialize(Mode mode) {
  if (!frame || !pkt) {
    LOG_ERROR("Failed to allocate decoder frame/packet");
    return false;
  }

  if (avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("Cannot open input: {}", path_);
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_ERROR("Cannot read stream info: {}", path_);
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    LOG_ERROR("No video stream found in {}", path_);
    return false;
  }

  /// Only the video stream is demuxed
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx))
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
  }

  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder for codec {}", avcodec_get_name(param->codec_id));
    return false;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    LOG_ERROR("Failed to allocate decoder context");
    return false;
  }
  if (avcodec_parameters_to_context(dec_ctx, param) < 0) {
    LOG_ERROR("Failed to copy codec parameters");
    return false;
  }

  // **--- DECODER SETTINGS ---**

  dec_ctx->flags |= AV_CODEC_FLAG_GRAY;
  dec_ctx->flags2 |= AV_CODEC_FLAG2_FAST;
  dec_ctx->thread_count = 1;

  if (mode == Mode::PictureTypes) {
    dec_ctx->skip_idct = AVDISCARD_ALL;
    dec_ctx->skip_loop_filter = AVDISCARD_ALL;
  }

  if (avcodec_open2(dec_ctx, codec, nullptr) < 0) {
    LOG_ERROR("avcodec_open2 failed for {}", path_);
    return false;
  }
  return true;
}

const AVStream *VideoDecoder::video_stream() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return nullptr;
  return fmt_ctx->streams[video_stream_idx];
}

double VideoDecoder::get_duration() const {
  if (!fmt_ctx)
    return 0.0;
  if (fmt_ctx->duration != AV_NOPTS_VALUE)
    return fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);

  const AVStream *st = video_stream();
  if (st && st->duration != AV_NOPTS_VALUE)
    return st->duration * av_q2d(st->time_base);
  return 0.0;
}

double VideoDecoder::get_fps() const {
  const AVStream *st = video_stream();
  if (!st)
    return 0.0;
  AVRational r = st->avg_frame_rate;
  if (r.num <= 0 || r.den <= 0)
    r = st->r_frame_rate;
  return (r.num > 0 && r.den > 0) ? av_q2d(r) : 0.0;
}

bool VideoDecoder::seek(double seconds) {
  const AVStream *st = video_stream();
  if (!st || !dec_ctx)
    return false;

  int64_t ts = static_cast<int64_t>(seconds / av_q2d(st->time_base));
  if (st->start_time != AV_NOPTS_VALUE)
    ts += st->start_time;

  if (av_seek_frame(fmt_ctx, video_stream_idx, ts, AVSEEK_FLAG_BACKWARD) < 0) {
    LOG_WARN("Seek to {:.2f}s failed in {}", seconds, path_);
    return false;
  }
  avcodec_flush_buffers(dec_ctx);
  eof_sent = false;
  return true;
}

const AVFrame *VideoDecoder::next_frame() {
  if (!dec_ctx)
    return nullptr;

  while (true) {
    int ret = avcodec_receive_frame(dec_ctx, frame);
    if (ret == 0)
      return frame;
    if (ret == AVERROR_EOF)
      return nullptr;
    if (ret != AVERROR(EAGAIN)) {
      LOG_WARN("Decode error in {}", path_);
      return nullptr;
    }
    if (eof_sent)
      return nullptr;

    /// Feed the next video packet (or the drain signal at end of file)
    while (true) {
      if (av_read_frame(fmt_ctx, pkt) < 0) {
        avcodec_send_packet(dec_ctx, nullptr);
        eof_sent = true;
        break;
      }
      if (pkt->stream_index != video_stream_idx) {
        av_packet_unref(pkt);
        continue;
      }
      int send_ret = avcodec_send_packet(dec_ctx, pkt);
      av_packet_unref(pkt);

      /// Corrupt packets are skipped, the stream continues
      if (send_ret < 0 && send_ret != AVERROR(EAGAIN))
        continue;
      break;
    }
  }
}

double VideoDecoder::frame_time(const AVFrame *f) const {
  const AVStream *st = video_stream();
  if (!st || !f)
    return 0.0;
  int64_t ts = f->best_effort_timestamp;
  if (ts == AV_NOPTS_VALUE)
    ts = f->pts;
  if (ts == AV_NOPTS_VALUE)
    return 0.0;
  if (st->start_time != AV_NOPTS_VALUE)
    ts -= st->start_time;
  return ts * av_q2d(st->time_base);
}

// **---- Luma Extraction ----**

std::optional<LumaFrame> extract_luma(const AVFrame *f, int max_width) {
  if (!f || f->width <= 0 || f->height <= 0 || !f->data[0])
    return std::nullopt;

  const AVPixFmtDescriptor *desc =
      av_pix_fmt_desc_get(static_cast<AVPixelFormat>(f->format));
  if (!desc || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL))
    return std::nullopt;

  const int depth = desc->comp[0].depth;
  const int shift = std::max(0, depth - 8);
  const bool wide = depth > 8;

  /// Integer decimation keeps analysis cost flat for 4K and above
  const int step = std::max(1, (f->width + max_width - 1) / max_width);
  LumaFrame out((f->width + step - 1) / step, (f->height + step - 1) / step);

  for (int y = 0; y < out.height; ++y) {
    const uint8_t *row = f->data[0] + static_cast<ptrdiff_t>(y * step) * f->linesize[0];
    uint8_t *dst = &out.pixels[y * out.width];
    if (wide) {
      const uint16_t *row16 = reinterpret_cast<const uint16_t *>(row);
      for (int x = 0; x < out.width; ++x)
        dst[x] = static_cast<uint8_t>(std::min(255, row16[x * step] >> shift));
    } else {
      for (int x = 0; x < out.width; ++x)
        dst[x] = row[x * step];
    }
  }
  return out;
}

// **---- FrameSampler ----**

FrameSampler::FrameSampler(std::string path) : decoder_(std::move(path)) {}

bool FrameSampler::initialize() {
  ready_ = decoder_.initialize(VideoDecoder::Mode::Luma);
  return ready_;
}

double FrameSampler::duration() const { return decoder_.get_duration(); }

std::optional<LumaFrame> FrameSampler::frame_at(double seconds) {
  if (!ready_)
    return std::nullopt;

  if (!decoder_.seek(std::max(0.0, seconds)))
    return std::nullopt;

  double fps = decoder_.get_fps();
  double tolerance = fps > 0 ? 0.5 / fps : 0.02;

  const AVFrame *f = nullptr;
  while ((f = decoder_.next_frame()) != nullptr) {
    if (decoder_.frame_time(f) + tolerance >= seconds)
      return extract_luma(f);
  }
  return std::nullopt;
}

bool FrameSampler::scan(double start, double end, double step,
                        const FrameCallback &callback) {
  if (!ready_ || step <= 0 || end <= start)
    return false;

  if (!decoder_.seek(std::max(0.0, start)))
    return false;

  double fps = decoder_.get_fps();
  double tolerance = fps > 0 ? 0.5 / fps : 0.02;
  double next_t = start;

  const AVFrame *f = nullptr;
  while ((f = decoder_.next_frame()) != nullptr) {
    double t = decoder_.frame_time(f);
    if (t >= end)
      break;
    if (t + tolerance < next_t)
      continue;

    if (auto luma = extract_luma(f))
      callback(t, *luma);
    while (next_t <= t + tolerance)
      next_t += step;
  }
  return true;
}

} // namespace adaptive_encoder
