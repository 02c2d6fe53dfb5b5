/**
 * @file crop_detector.hpp
 * @brief Multi-sample black bar detection with temporal voting
 *
 * @details Three windows of the input (near the start, the middle and near
 *          the end) are analyzed independently. Each window yields at most one
 *          candidate rectangle, its most frequent cropdetect reading. The
 *          final rectangle is the mode across windows, never an average, so a
 *          single dark scene cannot shrink the picture.
 *
 *          A candidate is accepted only when the removed border is large
 *          enough:
 *
 *          - (W - w) + (H - h) >= CROP_MIN_THRESHOLD pixels, or
 *
 *          - that delta exceeds 1% of (W + H)
 *
 * @note HDR sources use a higher black level limit because PQ black bars are
 *       rarely pure black.
 */

#ifndef ADAPTIVE_ENCODER_CROP_DETECTOR_HPP
#define ADAPTIVE_ENCODER_CROP_DETECTOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace adaptive_encoder {

class RunContext;

/**
 * @class CropSampler
 * @brief Source of raw crop readings for one window of the input.
 */
class CropSampler {
public:
  virtual ~CropSampler() = default;

  /**
   * @brief Analyze one window.
   * @param path Input path
   * @param start Window start in seconds
   * @param window Window length in seconds
   * @param limit Black level limit
   * @return Every reading of the window in order (may be empty)
   */
  virtual std::vector<CropRegion> sample(const std::string &path, double start,
                                         double window, int limit) = 0;
};

/**
 * @class FfmpegCropSampler
 * @brief Runs the encoder binary's cropdetect filter and parses its log.
 */
class FfmpegCropSampler : public CropSampler {
  std::vector<int> cpu_set_;

public:
  explicit FfmpegCropSampler(std::vector<int> cpu_set = {})
      : cpu_set_(std::move(cpu_set)) {}

  std::vector<CropRegion> sample(const std::string &path, double start,
                                 double window, int limit) override;
};

/// Extract every "crop=w:h:x:y" token from a block of encoder output
std::vector<CropRegion> parse_crop_readings(const std::string &text);

/**
 * @brief Window start times for an input.
 * @return {skip, duration / 2, duration - skip}, the last one clamped to be
 *         no earlier than the first
 */
std::vector<double> crop_sample_points(double duration);

/// Most frequent rectangle; ties go to the one seen first
std::optional<CropRegion> most_frequent(const std::vector<CropRegion> &regions);

/**
 * @brief Mode across windows.
 * @param candidates One entry per window, empty when the window had no signal
 */
std::optional<CropRegion>
vote_crop(const std::vector<std::optional<CropRegion>> &candidates);

/// Acceptance test against the source geometry
bool crop_is_significant(const CropRegion &crop, int source_width,
                         int source_height, int min_threshold);

/**
 * @class CropDetector
 * @brief Samples, votes and validates a crop for one input.
 */
class CropDetector {
  CropSampler &sampler_;
  RunContext *ctx_; //< Not owned; optional

  void info(const std::string &msg) const;
  void warn(const std::string &msg) const;

public:
  CropDetector(CropSampler &sampler, RunContext *ctx)
      : sampler_(sampler), ctx_(ctx) {}

  /**
   * @brief Detect black bars.
   * @return The accepted rectangle, or empty for an uncropped frame
   */
  std::optional<CropRegion> detect(const MediaProbe &probe) const;

  /**
   * @brief Manual crop if given, detection otherwise.
   * @note A manual crop skips detection entirely.
   */
  std::optional<CropRegion>
  resolve(const MediaProbe &probe,
          const std::optional<CropRegion> &manual) const;
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_CROP_DETECTOR_HPP
