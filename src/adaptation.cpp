/**
 * @file adaptation.cpp
 * @brief Pure parameter adaptation
 */

#include "adaptive_encoder/adaptation.hpp"

#include <algorithm>
#include <cmath>

namespace adaptive_encoder {

// **---- Modifier Tables ----**

double crf_modifier(ContentType type) {
  switch (type) {
  case ContentType::Anime:
    return 0.2;
  case ContentType::ClassicAnime:
    return 0.5;
  case ContentType::Animation3D:
    return -0.4;
  case ContentType::HeavyGrain:
    return -0.8;
  case ContentType::LightGrain:
    return -0.3;
  case ContentType::Action:
    return -0.2;
  case ContentType::CleanDigital:
    return 0.3;
  case ContentType::Mixed:
    return 0.1;
  case ContentType::Film:
  case ContentType::Unknown:
    break;
  }
  return 0.0;
}

double bitrate_modifier(ContentType type) {
  switch (type) {
  case ContentType::Anime:
    return 0.90;
  case ContentType::ClassicAnime:
    return 0.85;
  case ContentType::Animation3D:
    return 1.05;
  case ContentType::HeavyGrain:
    return 1.25;
  case ContentType::LightGrain:
    return 1.10;
  case ContentType::Action:
    return 1.15;
  case ContentType::CleanDigital:
    return 0.80;
  case ContentType::Film:
  case ContentType::Mixed:
  case ContentType::Unknown:
    break;
  }
  return 1.0;
}

double complexity_factor(double score) { return 0.7 + score / 100.0 * 0.6; }

// **---- Adaptation ----**

double adapt_crf(double base_crf, double score, ContentType type) {
  double crf = base_crf + crf_modifier(type) + (score - 50.0) * -0.05;
  crf = std::clamp(crf, MIN_FINAL_CRF, MAX_FINAL_CRF);
  return std::round(crf * 10.0) / 10.0;
}

int adapt_bitrate(int base_bitrate_kbps, double score, ContentType type) {
  double bitrate =
      base_bitrate_kbps * complexity_factor(score) * bitrate_modifier(type);
  return static_cast<int>(std::lround(bitrate));
}

ParamSet hdr_params() {
  return {{"colorprim", "bt2020"},
          {"transfer", "smpte2084"},
          {"colormatrix", "bt2020nc"},
          {"hdr10_opt", "1"}};
}

namespace {

AdaptedParameters from_profile(const EncodingProfile &profile, bool is_hdr) {
  AdaptedParameters out;
  out.encoder_params = profile.params;
  out.preset = profile.preset;
  out.pixel_format = profile.pixel_format;
  out.codec_profile = profile.codec_profile;
  out.content_type = profile.content_type;
  out.is_hdr = is_hdr;
  if (is_hdr) {
    out.final_crf = profile.base_crf + HDR_CRF_OFFSET;
    out.final_bitrate_kbps = profile.base_bitrate_hdr;
    out.encoder_params.merge(hdr_params());
  } else {
    out.final_crf = profile.base_crf;
    out.final_bitrate_kbps = profile.base_bitrate_sdr;
  }
  return out;
}

} // anonymous namespace

AdaptedParameters adapt(const EncodingProfile &profile, double score,
                        ContentType type, bool is_hdr) {
  /// HDR base values are selected before any modifier
  AdaptedParameters out = from_profile(profile, is_hdr);
  out.final_crf = adapt_crf(out.final_crf, score, type);
  out.final_bitrate_kbps = adapt_bitrate(out.final_bitrate_kbps, score, type);
  out.content_type = type;
  out.complexity_score = score;
  return out;
}

AdaptedParameters base_parameters(const EncodingProfile &profile,
                                  bool is_hdr) {
  AdaptedParameters out = from_profile(profile, is_hdr);
  out.final_crf = std::clamp(out.final_crf, MIN_FINAL_CRF, MAX_FINAL_CRF);
  return out;
}

} // namespace adaptive_encoder
