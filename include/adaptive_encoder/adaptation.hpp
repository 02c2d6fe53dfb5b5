/**
 * @file adaptation.hpp
 * @brief Pure parameter adaptation: profile + score + type + HDR -> final values
 *
 * @details Every function here is side-effect free and deterministic, so the
 *          same inputs always give the same AdaptedParameters.
 *
 *          CRF:     clamp(base + type modifier + (score - 50) x -0.05, 15, 28)
 *
 *          Bitrate: base x (0.7 + score / 100 x 0.6) x type modifier
 *
 * @note For HDR inputs the HDR base bitrate and CRF + 2 are selected before
 *       any content or complexity modifier is applied.
 */

#ifndef ADAPTIVE_ENCODER_ADAPTATION_HPP
#define ADAPTIVE_ENCODER_ADAPTATION_HPP

#include "profiles.hpp"
#include "types.hpp"

namespace adaptive_encoder {

/// CRF offset added on top of the base CRF for HDR sources
constexpr double HDR_CRF_OFFSET = 2.0;

/// Per-content CRF offset (negative = higher quality)
double crf_modifier(ContentType type);

/// Per-content bitrate multiplier
double bitrate_modifier(ContentType type);

/// Multiplicative bitrate factor for a complexity score: 0.7 + score/100 x 0.6
double complexity_factor(double score);

/**
 * @brief Final CRF for a base value.
 * @return Value in [15, 28], rounded to one decimal
 */
double adapt_crf(double base_crf, double score, ContentType type);

/**
 * @brief Target bitrate in kbps.
 * @note Unclamped; monotonically non-decreasing in score for a fixed type.
 */
int adapt_bitrate(int base_bitrate_kbps, double score, ContentType type);

/// colorprim/transfer/colormatrix/hdr10_opt for HDR10 output
ParamSet hdr_params();

/**
 * @brief Full adaptation of a profile.
 * @param profile Base profile
 * @param score Complexity score in [10, 100]
 * @param type Resolved content type (drives both modifier tables)
 * @param is_hdr Selects the HDR base values and adds the HDR parameters
 */
AdaptedParameters adapt(const EncodingProfile &profile, double score,
                        ContentType type, bool is_hdr);

/**
 * @brief Profile values without complexity adaptation.
 * @note Used when complexity analysis is off. HDR still selects the HDR
 *       bitrate, CRF + 2 and the HDR parameters; no modifier is applied.
 */
AdaptedParameters base_parameters(const EncodingProfile &profile, bool is_hdr);

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_ADAPTATION_HPP
