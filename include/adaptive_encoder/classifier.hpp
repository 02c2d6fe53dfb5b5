/**
 * @file classifier.hpp
 * @brief Content type resolution
 *
 * @details Resolves the ContentType that drives parameter adaptation:
 *
 *          1. Technical classification from complexity signals and geometry
 *
 *          2. Optional oracle consultation, gated on technical confidence
 *             and title extraction quality
 *
 *          3. Merge of both verdicts
 *
 *          Fallbacks never fail the run: an unavailable oracle keeps the
 *          technical label, missing signals use the file name heuristic.
 */

#ifndef ADAPTIVE_ENCODER_CLASSIFIER_HPP
#define ADAPTIVE_ENCODER_CLASSIFIER_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace adaptive_encoder {

class ContentOracle;
class RunContext;

/// When the oracle may be consulted
enum class OracleMode { Disabled, Enabled, Force };

/// Technical confidence at or above which the oracle is skipped (unless forced)
constexpr int ORACLE_SKIP_CONFIDENCE = 80;

/// Minimum title extraction confidence for an unforced oracle call
constexpr int MIN_TITLE_CONFIDENCE = 30;

/// Confidence assigned to the file name heuristic
constexpr int FILENAME_CONFIDENCE = 40;

/**
 * @struct TechnicalFeatures
 * @brief Inputs of the rule-based classifier.
 */
struct TechnicalFeatures {
  double grain = 0.0;
  int motion_level = 10;
  int width = 0;
  int height = 0;
};

/// Scene cuts per minute to motion level: > 20 is 25, < 4 is 5, else 10
int motion_level_from_scene_rate(double cuts_per_minute);

TechnicalFeatures make_features(const ComplexitySignals &signals,
                                const MediaProbe &probe);

/**
 * @brief Rule-based classification (first matching rule wins).
 *
 * @details
 *   - no grain, >= 1920x1080, motion < 20, aspect in [1.33, 1.90]: 3d_animation/80
 *   - grain <= 3, motion < 15, width <= 1920: anime/70
 *   - grain >= 15: heavy_grain/85
 *   - 5 < grain < 15: light_grain/70
 *   - motion > 20: action/75
 *   - otherwise film/75
 */
Classification classify_technical(const TechnicalFeatures &features);

/**
 * @brief Combine technical and oracle verdicts.
 *
 * @details In order: a known oracle label with higher confidence wins; equal
 *          labels merge to min(95, mean + 10); a known oracle label at >= 70
 *          beats a technical label under 70; otherwise technical.
 */
Classification merge_classification(const Classification &technical,
                                    const std::optional<Classification> &oracle);

/// anime|animation|cartoon, cgi|3d, action|sports, classic|vintage|old, else film
ContentType classify_by_filename(const std::string &path);

/**
 * @brief Refine a profile's declared type with the complexity score.
 * @return classic_anime for anime above 60, heavy_grain for film above 80,
 *         the declared type otherwise
 */
ContentType refine_declared_type(ContentType declared, double score);

/**
 * @brief Profile name for automatic selection.
 * @return `<res>_<type>` where res is `4k` for width >= 3000 else `1080p`;
 *         heavy_grain selects `heavygrain_film`
 */
std::string recommend_profile(ContentType type, int width);

/**
 * @class ContentClassifier
 * @brief Runs technical classification, the gated oracle and the merge.
 */
class ContentClassifier {
  ContentOracle *oracle_; //< Not owned; nullptr = no oracle available
  RunContext *ctx_;       //< Not owned; optional

  void info(const std::string &msg) const;
  void warn(const std::string &msg) const;

  std::optional<Classification> consult_oracle(const std::string &path,
                                               OracleMode mode) const;

public:
  ContentClassifier(ContentOracle *oracle, RunContext *ctx)
      : oracle_(oracle), ctx_(ctx) {}

  /**
   * @brief Resolve the content type of an input.
   * @param path Input path (title source and heuristic fallback)
   * @param signals Complexity signals, empty when analysis failed
   * @param probe Geometry source
   * @param mode Oracle policy
   */
  Classification resolve(const std::string &path,
                         const std::optional<ComplexitySignals> &signals,
                         const MediaProbe &probe, OracleMode mode) const;
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_CLASSIFIER_HPP
