/**
 * @file media_probe.cpp
 * @brief Technical probing of input files
 */

#include "adaptive_encoder/media_probe.hpp"

#include <filesystem>

extern "C" {
#include <libavutil/pixdesc.h>
}

#include "adaptive_encoder/frame_sampler.hpp"
#include "adaptive_encoder/logging.hpp"

namespace adaptive_encoder {

namespace {

std::string name_or_empty(const char *name) {
  return name ? std::string(name) : std::string();
}

} // anonymous namespace

std::optional<MediaProbe> probe_media(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    LOG_ERROR("Input is not a readable file: {}", path);
    return std::nullopt;
  }

  VideoDecoder decoder(path);
  if (!decoder.initialize(VideoDecoder::Mode::PictureTypes))
    return std::nullopt;

  const AVFormatContext *fmt_ctx = decoder.format_context();
  const AVStream *st = decoder.video_stream();
  const AVCodecParameters *par = st->codecpar;

  MediaProbe probe;
  probe.path = path;
  probe.width = par->width;
  probe.height = par->height;
  probe.duration_seconds = decoder.get_duration();
  probe.fps = decoder.get_fps();
  probe.codec_name = avcodec_get_name(par->codec_id);
  probe.bitrate_bps = par->bit_rate > 0 ? par->bit_rate : fmt_ctx->bit_rate;
  probe.color_primaries = name_or_empty(av_color_primaries_name(par->color_primaries));
  probe.color_transfer = name_or_empty(av_color_transfer_name(par->color_trc));
  probe.color_space = name_or_empty(av_color_space_name(par->color_space));
  probe.exact_frame_count = st->nb_frames > 0 ? st->nb_frames : 0;

  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    AVMediaType type = fmt_ctx->streams[i]->codecpar->codec_type;
    if (type == AVMEDIA_TYPE_AUDIO)
      ++probe.audio_stream_count;
    else if (type == AVMEDIA_TYPE_SUBTITLE)
      ++probe.subtitle_stream_count;
  }

  if (probe.width <= 0 || probe.height <= 0) {
    LOG_ERROR("Video stream has no dimensions: {}", path);
    return std::nullopt;
  }

  // **--- FRAME TYPE SEQUENCE ---**

  probe.sampled_frame_types.reserve(PROBE_FRAME_TYPE_LIMIT);
  const AVFrame *f = nullptr;
  while (static_cast<int>(probe.sampled_frame_types.size()) <
             PROBE_FRAME_TYPE_LIMIT &&
         (f = decoder.next_frame()) != nullptr) {
    char type = av_get_picture_type_char(f->pict_type);
    if (type == 'I' || type == 'P' || type == 'B')
      probe.sampled_frame_types.push_back(type);
  }

  return probe;
}

// **---- LibavMediaAccess ----**

std::optional<MediaProbe> LibavMediaAccess::probe(const std::string &path) {
  return probe_media(path);
}

std::unique_ptr<FrameSource>
LibavMediaAccess::open_frames(const std::string &path) {
  auto sampler = std::make_unique<FrameSampler>(path);
  if (!sampler->initialize())
    return nullptr;
  return sampler;
}

} // namespace adaptive_encoder
