/**
 * @file complexity.cpp
 * @brief Content complexity signals and the complexity score
 */

#include "adaptive_encoder/complexity.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "adaptive_encoder/frame_sampler.hpp"
#include "adaptive_encoder/run_context.hpp"

namespace adaptive_encoder {

// **---- Pure Functions ----**

double compute_complexity_score(const ComplexitySignals &s) {
  double score = s.spatial_info * 0.25 + s.temporal_info * 0.35 +
                 s.scene_change_rate * 1.5 + s.grain_level * 8.0 +
                 s.texture_score * 0.3 + s.frame_type_complexity * 0.25;
  return std::clamp(score, MIN_COMPLEXITY_SCORE, MAX_COMPLEXITY_SCORE);
}

double temporal_information(const std::vector<char> &frame_types) {
  size_t n = std::min(frame_types.size(), static_cast<size_t>(TI_FRAME_LIMIT));
  if (n == 0)
    return 50.0;
  size_t predicted = std::count_if(frame_types.begin(), frame_types.begin() + n,
                                   [](char t) { return t == 'P' || t == 'B'; });
  return predicted * 100.0 / n;
}

double frame_type_complexity(const std::vector<char> &frame_types) {
  size_t n =
      std::min(frame_types.size(), static_cast<size_t>(FRAME_TYPE_LIMIT));
  if (n == 0)
    return 4.0;
  size_t intra = std::count(frame_types.begin(), frame_types.begin() + n, 'I');
  return intra * 200.0 / n;
}

std::vector<double> grain_sample_points(double duration) {
  static const int percentages[] = {10, 25, 50, 75, 90};
  std::vector<double> points;

  for (int pct : percentages) {
    double t = std::floor(duration * pct / 100.0);
    if (t < 2)
      t = 2;
    else if (t > duration - 5)
      t = std::floor(duration - 5);

    if (t >= 2 && t <= duration &&
        std::find(points.begin(), points.end(), t) == points.end())
      points.push_back(t);
  }

  if (points.empty()) {
    if (duration > 8)
      points = {2, 5, 8};
    else if (duration > 4)
      points = {2, std::floor(duration / 2)};
    else
      points = {1};
  }
  return points;
}

std::vector<double> dark_scene_points(double duration) {
  return {duration * 0.2, duration * 0.4, duration * 0.6};
}

// **---- Analyzer ----**

double ComplexityAnalyzer::measure_spatial(FrameSource &source,
                                           double duration) {
  double window = std::min(SI_WINDOW_SEC, duration);
  double si = -1.0;
  source.scan(0.0, window, SI_SAMPLE_STEP_SEC,
              [&si](double, const LumaFrame &frame) {
                si = std::max(si, spatial_information(frame));
              });
  return si < 0 ? 50.0 : si;
}

double ComplexityAnalyzer::measure_scene_changes(FrameSource &source,
                                                 double duration) {
  double window = std::min(SCENE_WINDOW_SEC, duration);
  SceneChangeDetector detector;
  int frames = 0;
  int changes = 0;
  source.scan(0.0, window, SCENE_SAMPLE_STEP_SEC,
              [&](double, const LumaFrame &frame) {
                ++frames;
                if (detector.push(frame) > SCENE_CHANGE_THRESHOLD)
                  ++changes;
              });
  return frames == 0 ? 10.0 : static_cast<double>(changes);
}

void ComplexityAnalyzer::measure_grain(FrameSource &source, double duration,
                                       ComplexitySignals &signals) {
  double total_grain = 0.0;
  double total_texture = 0.0;
  int valid = 0;

  for (double t : grain_sample_points(duration)) {
    auto frame = source.frame_at(t);
    if (!frame)
      continue;

    double grain = combined_grain(*frame);
    double texture = texture_score(*frame);
    total_grain += grain;
    total_texture += texture;
    ++valid;

    if (ctx_)
      ctx_->log_info(fmt::format("Sample at {:.0f}s: grain={:.2f}, texture={:.1f}",
                                 t, grain, texture));
  }

  if (valid == 0) {
    signals.grain_level = 0.0;
    signals.texture_score = 0.0;
    return;
  }

  signals.grain_level = std::floor(total_grain / valid + 0.5);
  signals.texture_score = total_texture / valid;

  if (signals.grain_level >= DARK_BOOST_TRIGGER)
    return;

  // **--- DARK SCENE BOOST ---**

  std::optional<LumaFrame> darkest;
  double darkest_luma = std::numeric_limits<double>::max();
  for (double t : dark_scene_points(duration)) {
    auto frame = source.frame_at(t);
    if (!frame)
      continue;
    double luma = mean_luma(*frame);
    if (luma < darkest_luma) {
      darkest_luma = luma;
      darkest = std::move(frame);
    }
  }
  if (!darkest)
    return;

  double dark_grain = boosted_highpass_noise(*darkest);
  if (dark_grain > signals.grain_level) {
    signals.grain_level = std::floor(dark_grain);
    if (ctx_)
      ctx_->log_info(fmt::format(
          "Dark scene analysis raised grain level to {:.0f}", signals.grain_level));
  }
}

ComplexitySignals ComplexityAnalyzer::analyze(const MediaProbe &probe,
                                              FrameSource &source) {
  ComplexitySignals signals;
  double duration = source.duration() > 0 ? source.duration()
                                          : probe.duration_seconds;

  signals.spatial_info = measure_spatial(source, duration);
  signals.temporal_info = temporal_information(probe.sampled_frame_types);
  signals.scene_change_rate = measure_scene_changes(source, duration);
  signals.frame_type_complexity =
      frame_type_complexity(probe.sampled_frame_types);
  signals.is_hdr = probe.is_hdr();
  measure_grain(source, duration, signals);

  if (ctx_) {
    ctx_->log_info(fmt::format(
        "SI: {:.1f}, TI: {:.1f}, Scenes/min: {:.0f}, Frame-Complexity: {:.1f}",
        signals.spatial_info, signals.temporal_info, signals.scene_change_rate,
        signals.frame_type_complexity));
    ctx_->log_info(fmt::format("Grain: {:.0f}, Texture: {:.1f}, HDR: {}",
                               signals.grain_level, signals.texture_score,
                               signals.is_hdr));
  }
  return signals;
}

} // namespace adaptive_encoder
