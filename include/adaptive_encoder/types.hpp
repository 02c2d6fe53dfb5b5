/**
 * @file types.hpp
 * @brief Core data types shared by the analysis, adaptation and pass layers
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - ContentType and EncodingMode enumerations
 *
 *          - ParamSet: ordered encoder parameter map (x265-params)
 *
 *          - MediaProbe: immutable technical description of one input
 *
 *          - CropRegion, ComplexitySignals, AdaptedParameters
 */

#ifndef ADAPTIVE_ENCODER_TYPES_HPP
#define ADAPTIVE_ENCODER_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adaptive_encoder {

// **----- CONSTANTS -----**

/// Complexity score bounds and the neutral value used when analysis is off
constexpr double MIN_COMPLEXITY_SCORE = 10.0;
constexpr double MAX_COMPLEXITY_SCORE = 100.0;
constexpr double NEUTRAL_COMPLEXITY_SCORE = 50.0;

/// Final CRF is always clamped into this range
constexpr double MIN_FINAL_CRF = 15.0;
constexpr double MAX_FINAL_CRF = 28.0;

// **----- ENUMERATIONS -----**

/**
 * @brief Content classes the adaptation tables are keyed on.
 * @note Unknown is only produced by an oracle that could not decide; it never
 *       reaches parameter adaptation.
 */
enum class ContentType {
  Anime,
  ClassicAnime,
  Animation3D,
  Film,
  HeavyGrain,
  LightGrain,
  Action,
  CleanDigital,
  Mixed,
  Unknown
};

/// Rate-control mode, each mapping to a fixed pass plan
enum class EncodingMode { CRF, ABR, CBR };

/// Canonical lowercase name ("3d_animation", "heavy_grain", ...)
const char *to_string(ContentType type);
const char *to_string(EncodingMode mode);

/// Parse canonical names; empty optional for anything else
std::optional<ContentType> parse_content_type(const std::string &name);
std::optional<EncodingMode> parse_encoding_mode(const std::string &name);

// **----- ENCODER PARAMETERS -----**

/**
 * @class ParamSet
 * @brief Ordered key/value encoder parameter set.
 *
 * @note Order is preserved because x265 applies parameters left to right.
 *       set() on an existing key replaces its value in place.
 */
class ParamSet {
public:
  using Entry = std::pair<std::string, std::string>;

  ParamSet() = default;
  ParamSet(std::initializer_list<Entry> entries);

  void set(const std::string &key, const std::string &value);
  bool erase(const std::string &key);
  bool contains(const std::string &key) const;
  std::optional<std::string> get(const std::string &key) const;

  /// Append every entry of other (replacing duplicates)
  void merge(const ParamSet &other);

  /// Render as "k1=v1:k2=v2" for -x265-params
  std::string to_string() const;

  const std::vector<Entry> &entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }

  bool operator==(const ParamSet &other) const {
    return entries_ == other.entries_;
  }

private:
  std::vector<Entry> entries_;
};

// **----- PROBE DATA -----**

/**
 * @struct MediaProbe
 * @brief Technical description of an input, created once and never mutated.
 */
struct MediaProbe {
  std::string path;
  int width = 0;
  int height = 0;
  double duration_seconds = 0.0;
  double fps = 0.0;
  std::string codec_name;
  int64_t bitrate_bps = 0;
  std::string color_primaries;
  std::string color_transfer;
  std::string color_space;
  std::vector<char> sampled_frame_types; //< 'I', 'P', 'B' in decode order
  int audio_stream_count = 0;
  int subtitle_stream_count = 0;
  int64_t exact_frame_count = 0; //< 0 when the container does not state it

  /// HDR10: BT.2020 primaries with the PQ (SMPTE 2084) transfer curve
  bool is_hdr() const;

  /// Exact frame count, else duration x fps
  int64_t total_frame_estimate() const;
};

/**
 * @struct CropRegion
 * @brief Crop rectangle in source pixels.
 */
struct CropRegion {
  int width = 0;
  int height = 0;
  int x = 0;
  int y = 0;

  /// Render as "w:h:x:y" (the crop filter argument)
  std::string to_string() const;

  bool operator==(const CropRegion &o) const {
    return width == o.width && height == o.height && x == o.x && y == o.y;
  }
  bool operator!=(const CropRegion &o) const { return !(*this == o); }
};

/// Parse "w:h:x:y" or "crop=w:h:x:y"
std::optional<CropRegion> parse_crop(const std::string &text);

// **----- ANALYSIS DATA -----**

/**
 * @struct ComplexitySignals
 * @brief Sampled complexity measurements of one input.
 */
struct ComplexitySignals {
  double spatial_info = 50.0;
  double temporal_info = 50.0;
  double scene_change_rate = 10.0;
  double frame_type_complexity = 4.0;
  double grain_level = 0.0;
  double texture_score = 0.0;
  bool is_hdr = false;
};

/**
 * @struct Classification
 * @brief A content label with a confidence percentage (0-100).
 */
struct Classification {
  ContentType type = ContentType::Film;
  int confidence = 0;

  bool operator==(const Classification &o) const {
    return type == o.type && confidence == o.confidence;
  }
};

/**
 * @struct AdaptedParameters
 * @brief Final rate-control values for one run.
 * @note Deterministic function of profile, score, content type and HDR flag.
 */
struct AdaptedParameters {
  double final_crf = 0.0;
  int final_bitrate_kbps = 0;
  ParamSet encoder_params;
  std::string preset;
  std::string pixel_format;
  std::string codec_profile;
  ContentType content_type = ContentType::Film;
  double complexity_score = NEUTRAL_COMPLEXITY_SCORE;
  bool is_hdr = false;
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_TYPES_HPP
