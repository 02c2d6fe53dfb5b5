/**
 * @file complexity.hpp
 * @brief Content complexity signals and the complexity score
 *
 * @details The analyzer samples a bounded number of frames; it never scans
 *          a whole input:
 *
 *          - SI: 1 fps over the first 30 seconds
 *
 *          - Scene changes: 4 fps over the first 60 seconds
 *
 *          - Grain and texture: five single frames spread over the duration
 *            (three more for the dark-scene boost)
 *
 *          - TI and frame-type complexity: taken from the probe's picture
 *            type sequence, no decoding needed
 */

#ifndef ADAPTIVE_ENCODER_COMPLEXITY_HPP
#define ADAPTIVE_ENCODER_COMPLEXITY_HPP

#include <vector>

#include "types.hpp"

namespace adaptive_encoder {

class FrameSource;
class RunContext;

// **---- Sampling Windows ----**

constexpr double SI_WINDOW_SEC = 30.0;
constexpr double SI_SAMPLE_STEP_SEC = 1.0;
constexpr double SCENE_WINDOW_SEC = 60.0;
constexpr double SCENE_SAMPLE_STEP_SEC = 0.25;
constexpr double SCENE_CHANGE_THRESHOLD = 0.3;
constexpr int TI_FRAME_LIMIT = 900;
constexpr int FRAME_TYPE_LIMIT = 1800;

/// Grain below this triggers the dark-scene boost
constexpr double DARK_BOOST_TRIGGER = 5.0;

// **---- Pure Functions ----**

/**
 * @brief Weighted complexity score.
 * @return 0.25 SI + 0.35 TI + 1.5 scene + 8 grain + 0.3 texture
 *         + 0.25 frame complexity, clamped to [10, 100]
 */
double compute_complexity_score(const ComplexitySignals &signals);

/// Percentage of P/B among the first 900 picture types (50 when empty)
double temporal_information(const std::vector<char> &frame_types);

/// I-count x 200 / total over the first 1800 picture types (4 when empty)
double frame_type_complexity(const std::vector<char> &frame_types);

/**
 * @brief Grain sample timestamps for an input of the given duration.
 * @details 10/25/50/75/90 % of duration (whole seconds), each clamped to
 *          [2, duration - 5] and de-duplicated. Inputs too short for any
 *          valid point use {2,5,8}, {2, d/2} or {1}.
 */
std::vector<double> grain_sample_points(double duration);

/// 20/40/60 % of duration; candidates for the dark-scene boost
std::vector<double> dark_scene_points(double duration);

// **---- Analyzer ----**

/**
 * @class ComplexityAnalyzer
 * @brief Measures ComplexitySignals from a probe and a frame source.
 *
 * @note Any measurement that yields no frames keeps its neutral default,
 *       so analysis never fails outright. A source that cannot be opened
 *       is handled by the caller.
 */
class ComplexityAnalyzer {
  RunContext *ctx_; //< Optional, for per-sample log lines

  double measure_spatial(FrameSource &source, double duration);
  double measure_scene_changes(FrameSource &source, double duration);
  void measure_grain(FrameSource &source, double duration,
                     ComplexitySignals &signals);

public:
  explicit ComplexityAnalyzer(RunContext *ctx = nullptr) : ctx_(ctx) {}

  ComplexitySignals analyze(const MediaProbe &probe, FrameSource &source);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_COMPLEXITY_HPP
