/**
 * @file frame_metrics.cpp
 * @brief Pixel-level measurements on decoded luma planes
 *
 * @attention These run once per sampled frame, never per decoded frame, so
 *            clarity wins over SIMD here. Inner loops still cache the row
 *            pointers and dimensions in locals.
 */

#include "adaptive_encoder/frame_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace adaptive_encoder {

namespace {

/// Sobel magnitude at an interior pixel (not clipped)
inline double sobel_at(const LumaFrame &f, int x, int y) {
  const uint8_t *up = &f.pixels[(y - 1) * f.width];
  const uint8_t *mid = &f.pixels[y * f.width];
  const uint8_t *dn = &f.pixels[(y + 1) * f.width];

  int gx = (up[x + 1] + 2 * mid[x + 1] + dn[x + 1]) -
           (up[x - 1] + 2 * mid[x - 1] + dn[x - 1]);
  int gy = (dn[x - 1] + 2 * dn[x] + dn[x + 1]) -
           (up[x - 1] + 2 * up[x] + up[x + 1]);
  return std::sqrt(static_cast<double>(gx * gx + gy * gy));
}

/// 3x3 box blur (borders copied)
LumaFrame box_blur3(const LumaFrame &f) {
  LumaFrame out = f;
  const int w = f.width;
  const int h = f.height;
  for (int y = 1; y < h - 1; ++y) {
    for (int x = 1; x < w - 1; ++x) {
      int sum = 0;
      for (int dy = -1; dy <= 1; ++dy)
        for (int dx = -1; dx <= 1; ++dx)
          sum += f.at(x + dx, y + dy);
      out.at(x, y) = static_cast<uint8_t>((sum + 4) / 9);
    }
  }
  return out;
}

/// Mean absolute residual of f against its 3x3 box blur (interior only)
double mean_highpass_residual(const LumaFrame &f) {
  if (f.width < 3 || f.height < 3)
    return 0.0;
  LumaFrame blurred = box_blur3(f);
  double sum = 0.0;
  long count = 0;
  for (int y = 1; y < f.height - 1; ++y) {
    for (int x = 1; x < f.width - 1; ++x) {
      sum += std::abs(static_cast<int>(f.at(x, y)) - blurred.at(x, y));
      ++count;
    }
  }
  return count > 0 ? sum / count : 0.0;
}

} // anonymous namespace

// **---- Geometry ----**

LumaFrame center_crop(const LumaFrame &frame, int w, int h) {
  int cw = std::min(w, frame.width);
  int ch = std::min(h, frame.height);
  if (cw == frame.width && ch == frame.height)
    return frame;

  int x0 = (frame.width - cw) / 2;
  int y0 = (frame.height - ch) / 2;
  LumaFrame out(cw, ch);
  for (int y = 0; y < ch; ++y) {
    const uint8_t *src = &frame.pixels[(y0 + y) * frame.width + x0];
    std::copy(src, src + cw, &out.pixels[y * cw]);
  }
  return out;
}

LumaFrame resize(const LumaFrame &frame, int w, int h) {
  LumaFrame out(w, h);
  if (frame.empty() || w <= 0 || h <= 0)
    return out;

  const double sx = static_cast<double>(frame.width) / w;
  const double sy = static_cast<double>(frame.height) / h;
  for (int y = 0; y < h; ++y) {
    int y0 = static_cast<int>(y * sy);
    int y1 = std::max(y0 + 1, std::min(frame.height, static_cast<int>((y + 1) * sy)));
    for (int x = 0; x < w; ++x) {
      int x0 = static_cast<int>(x * sx);
      int x1 = std::max(x0 + 1, std::min(frame.width, static_cast<int>((x + 1) * sx)));
      long sum = 0;
      for (int yy = y0; yy < y1; ++yy)
        for (int xx = x0; xx < x1; ++xx)
          sum += frame.at(xx, yy);
      long n = static_cast<long>(y1 - y0) * (x1 - x0);
      out.at(x, y) = static_cast<uint8_t>((sum + n / 2) / n);
    }
  }
  return out;
}

// **---- Spatial ----**

LumaFrame sobel(const LumaFrame &frame) {
  LumaFrame out(frame.width, frame.height);
  for (int y = 1; y < frame.height - 1; ++y) {
    for (int x = 1; x < frame.width - 1; ++x) {
      double m = sobel_at(frame, x, y);
      out.at(x, y) = static_cast<uint8_t>(std::min(255.0, m));
    }
  }
  return out;
}

double spatial_information(const LumaFrame &frame) {
  if (frame.width < 3 || frame.height < 3)
    return 0.0;

  /// Welford's running variance over the interior
  double mean = 0.0;
  double m2 = 0.0;
  long n = 0;
  for (int y = 1; y < frame.height - 1; ++y) {
    for (int x = 1; x < frame.width - 1; ++x) {
      double v = sobel_at(frame, x, y);
      ++n;
      double delta = v - mean;
      mean += delta / n;
      m2 += delta * (v - mean);
    }
  }
  return n > 1 ? std::sqrt(m2 / n) : 0.0;
}

double texture_score(const LumaFrame &frame) {
  if (frame.empty())
    return 0.0;
  LumaFrame edges = sobel(resize(frame, 320, 240));
  long count = std::count_if(edges.pixels.begin(), edges.pixels.end(),
                             [](uint8_t v) { return v > 50; });
  return count / 100.0;
}

double mean_luma(const LumaFrame &frame) {
  if (frame.pixels.empty())
    return 0.0;
  double sum = 0.0;
  for (uint8_t v : frame.pixels)
    sum += v;
  return sum / frame.pixels.size();
}

// **---- Temporal ----**

double SceneChangeDetector::push(const LumaFrame &frame) {
  if (!has_previous_ || previous_.width != frame.width ||
      previous_.height != frame.height || frame.pixels.empty()) {
    previous_ = frame;
    previous_mafd_ = 0.0;
    has_previous_ = !frame.pixels.empty();
    return 0.0;
  }

  double sad = 0.0;
  const uint8_t *a = previous_.pixels.data();
  const uint8_t *b = frame.pixels.data();
  const size_t count = frame.pixels.size();
  for (size_t i = 0; i < count; ++i)
    sad += std::abs(static_cast<int>(a[i]) - b[i]);

  double mafd = sad / count;
  double diff = std::fabs(mafd - previous_mafd_);
  double score = std::clamp(std::min(mafd, diff) / 100.0, 0.0, 1.0);

  previous_mafd_ = mafd;
  previous_ = frame;
  return score;
}

void SceneChangeDetector::reset() {
  previous_ = LumaFrame();
  previous_mafd_ = 0.0;
  has_previous_ = false;
}

// **---- Grain ----**

double highpass_noise(const LumaFrame &frame) {
  return mean_highpass_residual(center_crop(frame, 400, 400)) * 4.0;
}

double local_variance(const LumaFrame &frame) {
  LumaFrame region = center_crop(frame, 300, 300);
  const int block = 10;
  double total = 0.0;
  int blocks = 0;

  for (int by = 0; by + block <= region.height; by += block) {
    for (int bx = 0; bx + block <= region.width; bx += block) {
      double sum = 0.0;
      double sum_sq = 0.0;
      for (int y = by; y < by + block; ++y) {
        for (int x = bx; x < bx + block; ++x) {
          double v = region.at(x, y);
          sum += v;
          sum_sq += v * v;
        }
      }
      const double n = block * block;
      double mean = sum / n;
      double var = std::max(0.0, sum_sq / n - mean * mean);
      total += std::sqrt(var);
      ++blocks;
    }
  }
  return blocks > 0 ? total / blocks : 0.0;
}

double edge_density(const LumaFrame &frame) {
  LumaFrame region = center_crop(frame, 200, 200);
  if (region.width < 3 || region.height < 3)
    return 0.0;

  long edges = 0;
  long total = 0;
  for (int y = 1; y < region.height - 1; ++y) {
    for (int x = 1; x < region.width - 1; ++x) {
      if (sobel_at(region, x, y) > 20.0)
        ++edges;
      ++total;
    }
  }
  double percent = 100.0 * edges / total;
  return percent / 4.0;
}

double combined_grain(const LumaFrame &frame) {
  return 0.4 * highpass_noise(frame) + 0.1 * local_variance(frame) +
         0.5 * edge_density(frame);
}

double boosted_highpass_noise(const LumaFrame &frame) {
  LumaFrame region = center_crop(frame, 400, 400);
  if (region.width < 3 || region.height < 3)
    return 0.0;

  /// Unsharp: f + 2 (f - blur(f))
  LumaFrame blurred = box_blur3(region);
  LumaFrame sharpened = region;
  for (size_t i = 0; i < region.pixels.size(); ++i) {
    int v = region.pixels[i] + 2 * (region.pixels[i] - blurred.pixels[i]);
    sharpened.pixels[i] = static_cast<uint8_t>(std::clamp(v, 0, 255));
  }
  return mean_highpass_residual(sharpened) * 4.0 * 1.25;
}

} // namespace adaptive_encoder
