/**
 * @file frame_metrics.hpp
 * @brief Pixel-level measurements on decoded luma planes
 *
 * @details Pure functions over LumaFrame used by the complexity engine:
 *
 *          - Sobel spatial information (SI) and texture count
 *
 *          - Scene-change score between consecutive frames
 *
 *          - Grain indicators: high-pass noise, local deviation, edge density
 *
 *          - Mean luma (dark scene selection)
 *
 * @note All values are computed on 8-bit luma. Sources with higher bit
 *       depth are normalized by the frame sampler before they reach here.
 */

#ifndef ADAPTIVE_ENCODER_FRAME_METRICS_HPP
#define ADAPTIVE_ENCODER_FRAME_METRICS_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

namespace adaptive_encoder {

/**
 * @struct LumaFrame
 * @brief Tightly packed 8-bit luma plane.
 */
struct LumaFrame {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels; //< width * height, row-major

  LumaFrame() = default;
  LumaFrame(int w, int h, uint8_t fill = 0)
      : width(w), height(h), pixels(static_cast<size_t>(w) * h, fill) {}

  uint8_t at(int x, int y) const { return pixels[y * width + x]; }
  uint8_t &at(int x, int y) { return pixels[y * width + x]; }
  bool empty() const { return width <= 0 || height <= 0; }
};

// **---- Geometry ----**

/**
 * @brief Centered crop of at most w x h (smaller frames are returned whole).
 */
LumaFrame center_crop(const LumaFrame &frame, int w, int h);

/// Box-filtered resize to exactly w x h
LumaFrame resize(const LumaFrame &frame, int w, int h);

// **---- Spatial ----**

/// Sobel gradient magnitude, clipped to 255 (border pixels are 0)
LumaFrame sobel(const LumaFrame &frame);

/**
 * @brief Spatial information: standard deviation of the Sobel magnitude
 *        over the interior pixels.
 */
double spatial_information(const LumaFrame &frame);

/**
 * @brief Texture count: pixels whose Sobel magnitude exceeds 50 on a
 *        320x240 downscale, divided by 100.
 */
double texture_score(const LumaFrame &frame);

double mean_luma(const LumaFrame &frame);

// **---- Temporal ----**

/**
 * @class SceneChangeDetector
 * @brief Scene score between consecutive frames.
 *
 * @note Score = min(mafd, |mafd - previous mafd|) / 100, clipped to [0,1],
 *       where mafd is the mean absolute frame difference in luma levels.
 *       A hard cut scores well above 0.3, a pan or fade stays below because
 *       its mafd is similar from frame to frame.
 */
class SceneChangeDetector {
  LumaFrame previous_;
  double previous_mafd_ = 0.0;
  bool has_previous_ = false;

public:
  /**
   * @brief Feed the next frame.
   * @return Score against the previous frame, 0 for the first frame or a
   *         frame whose geometry differs
   */
  double push(const LumaFrame &frame);

  void reset();
};

// **---- Grain ----**

/**
 * @brief High-pass noise on the central 400x400 region: mean absolute
 *        residual against a 3x3 box blur, scaled by 4.
 */
double highpass_noise(const LumaFrame &frame);

/**
 * @brief Mean standard deviation of 10x10 blocks on the central 300x300
 *        region.
 */
double local_variance(const LumaFrame &frame);

/**
 * @brief Percentage of pixels on the central 200x200 region whose Sobel
 *        magnitude exceeds 20, divided by 4.
 */
double edge_density(const LumaFrame &frame);

/// 0.4 noise + 0.1 variance + 0.5 edge
double combined_grain(const LumaFrame &frame);

/**
 * @brief Boosted high-pass used for dark scenes: the noise measurement
 *        after an unsharp pre-pass, scaled by 1.25.
 */
double boosted_highpass_noise(const LumaFrame &frame);

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_FRAME_METRICS_HPP
