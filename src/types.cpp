/**
 * @file types.cpp
 * @brief Core data type helpers
 */

#include "adaptive_encoder/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <fmt/core.h>

namespace adaptive_encoder {

// **----- ENUM NAMES -----**

const char *to_string(ContentType type) {
  switch (type) {
  case ContentType::Anime:
    return "anime";
  case ContentType::ClassicAnime:
    return "classic_anime";
  case ContentType::Animation3D:
    return "3d_animation";
  case ContentType::Film:
    return "film";
  case ContentType::HeavyGrain:
    return "heavy_grain";
  case ContentType::LightGrain:
    return "light_grain";
  case ContentType::Action:
    return "action";
  case ContentType::CleanDigital:
    return "clean_digital";
  case ContentType::Mixed:
    return "mixed";
  case ContentType::Unknown:
    break;
  }
  return "unknown";
}

const char *to_string(EncodingMode mode) {
  switch (mode) {
  case EncodingMode::CRF:
    return "crf";
  case EncodingMode::ABR:
    return "abr";
  case EncodingMode::CBR:
    return "cbr";
  }
  return "abr";
}

std::optional<ContentType> parse_content_type(const std::string &name) {
  static const ContentType all[] = {
      ContentType::Anime,      ContentType::ClassicAnime,
      ContentType::Animation3D, ContentType::Film,
      ContentType::HeavyGrain, ContentType::LightGrain,
      ContentType::Action,     ContentType::CleanDigital,
      ContentType::Mixed,      ContentType::Unknown};
  for (ContentType t : all) {
    if (name == to_string(t))
      return t;
  }
  return std::nullopt;
}

std::optional<EncodingMode> parse_encoding_mode(const std::string &name) {
  if (name == "crf")
    return EncodingMode::CRF;
  if (name == "abr")
    return EncodingMode::ABR;
  if (name == "cbr")
    return EncodingMode::CBR;
  return std::nullopt;
}

// **----- ParamSet -----**

ParamSet::ParamSet(std::initializer_list<Entry> entries) {
  for (const auto &e : entries)
    set(e.first, e.second);
}

void ParamSet::set(const std::string &key, const std::string &value) {
  for (auto &e : entries_) {
    if (e.first == key) {
      e.second = value;
      return;
    }
  }
  entries_.emplace_back(key, value);
}

bool ParamSet::erase(const std::string &key) {
  auto it = std::remove_if(entries_.begin(), entries_.end(),
                           [&key](const Entry &e) { return e.first == key; });
  bool removed = it != entries_.end();
  entries_.erase(it, entries_.end());
  return removed;
}

bool ParamSet::contains(const std::string &key) const {
  return get(key).has_value();
}

std::optional<std::string> ParamSet::get(const std::string &key) const {
  for (const auto &e : entries_) {
    if (e.first == key)
      return e.second;
  }
  return std::nullopt;
}

void ParamSet::merge(const ParamSet &other) {
  for (const auto &e : other.entries_)
    set(e.first, e.second);
}

std::string ParamSet::to_string() const {
  std::string out;
  for (const auto &e : entries_) {
    if (!out.empty())
      out += ':';
    out += e.first;
    out += '=';
    out += e.second;
  }
  return out;
}

// **----- MediaProbe -----**

bool MediaProbe::is_hdr() const {
  return color_primaries.find("bt2020") != std::string::npos &&
         color_transfer.find("smpte2084") != std::string::npos;
}

int64_t MediaProbe::total_frame_estimate() const {
  if (exact_frame_count > 0)
    return exact_frame_count;
  if (duration_seconds <= 0 || fps <= 0)
    return 0;
  return static_cast<int64_t>(duration_seconds * fps);
}

// **----- CropRegion -----**

std::string CropRegion::to_string() const {
  return fmt::format("{}:{}:{}:{}", width, height, x, y);
}

std::optional<CropRegion> parse_crop(const std::string &text) {
  std::string body = text;
  if (body.rfind("crop=", 0) == 0)
    body = body.substr(5);

  CropRegion r;
  char trailing = 0;
  int n = std::sscanf(body.c_str(), "%d:%d:%d:%d%c", &r.width, &r.height, &r.x,
                      &r.y, &trailing);
  if (n != 4 || r.width <= 0 || r.height <= 0 || r.x < 0 || r.y < 0)
    return std::nullopt;
  return r;
}

} // namespace adaptive_encoder
