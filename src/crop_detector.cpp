/**
 * @file crop_detector.cpp
 * @brief Multi-sample black bar detection with temporal voting
 */

#include "adaptive_encoder/crop_detector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <regex>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"
#include "adaptive_encoder/logging.hpp"
#include "adaptive_encoder/run_context.hpp"
#include "adaptive_encoder/system.hpp"

namespace adaptive_encoder {

// **---- FfmpegCropSampler ----**

std::vector<CropRegion> FfmpegCropSampler::sample(const std::string &path,
                                                  double start, double window,
                                                  int limit) {
  std::string cmd = fmt::format(
      "{}{} -hide_banner -nostdin -loglevel info -ss {:.0f} -i {} -t {:.0f} "
      "-vsync vfr -vf fps=1/4,cropdetect=limit={}:round=2:reset=1 -f null - "
      "2>&1",
      taskset_prefix(cpu_set_), shell_quote(Config::encoder_bin()), start,
      shell_quote(path), window, limit);

  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    LOG_WARN("Failed to start crop analysis at {:.0f}s", start);
    return {};
  }

  std::string output;
  char buf[512];
  while (std::fgets(buf, sizeof(buf), pipe))
    output += buf;

  int exit_code = decode_exit_status(pclose(pipe));
  if (exit_code != 0)
    LOG_WARN("Crop analysis at {:.0f}s exited with status {}", start,
             exit_code);

  /// Readings printed before a failure are still usable
  return parse_crop_readings(output);
}

// **---- Voting ----**

std::vector<CropRegion> parse_crop_readings(const std::string &text) {
  static const std::regex token(R"(crop=([0-9]+):([0-9]+):([0-9]+):([0-9]+))");

  std::vector<CropRegion> readings;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), token);
       it != std::sregex_iterator(); ++it) {
    const auto &m = *it;
    CropRegion r;
    r.width = std::stoi(m[1].str());
    r.height = std::stoi(m[2].str());
    r.x = std::stoi(m[3].str());
    r.y = std::stoi(m[4].str());
    if (r.width > 0 && r.height > 0)
      readings.push_back(r);
  }
  return readings;
}

std::vector<double> crop_sample_points(double duration) {
  double whole = std::floor(std::max(0.0, duration));
  double start = std::floor(Config::crop_edge_skip_sec());
  double mid = std::floor(whole / 2.0);
  double end = whole - start;
  if (end < start)
    end = start;
  return {start, mid, end};
}

std::optional<CropRegion>
most_frequent(const std::vector<CropRegion> &regions) {
  std::optional<CropRegion> best;
  int best_count = 0;
  for (size_t i = 0; i < regions.size(); ++i) {
    int count = 0;
    for (const auto &r : regions) {
      if (r == regions[i])
        ++count;
    }
    /// Strictly greater keeps the earliest rectangle on ties
    if (count > best_count) {
      best_count = count;
      best = regions[i];
    }
  }
  return best;
}

std::optional<CropRegion>
vote_crop(const std::vector<std::optional<CropRegion>> &candidates) {
  std::vector<CropRegion> present;
  for (const auto &c : candidates) {
    if (c)
      present.push_back(*c);
  }
  return most_frequent(present);
}

bool crop_is_significant(const CropRegion &crop, int source_width,
                         int source_height, int min_threshold) {
  int delta = (source_width - crop.width) + (source_height - crop.height);
  if (delta >= min_threshold)
    return true;
  int perimeter = source_width + source_height;
  return perimeter > 0 && delta * 100.0 / perimeter > 1.0;
}

// **---- CropDetector ----**

void CropDetector::info(const std::string &msg) const {
  if (ctx_)
    ctx_->log_info(msg);
  else
    LOG_INFO("{}", msg);
}

void CropDetector::warn(const std::string &msg) const {
  if (ctx_)
    ctx_->log_warn(msg);
  else
    LOG_WARN("{}", msg);
}

std::optional<CropRegion> CropDetector::detect(const MediaProbe &probe) const {
  const bool hdr = probe.is_hdr();
  const int limit = hdr ? Config::crop_limit_hdr() : Config::crop_limit_sdr();
  info(fmt::format("{} content - crop limit {}", hdr ? "HDR" : "SDR", limit));

  static const char *const labels[] = {"Start", "Middle", "End"};
  std::vector<double> points = crop_sample_points(probe.duration_seconds);

  std::vector<std::optional<CropRegion>> candidates;
  for (size_t i = 0; i < points.size(); ++i) {
    auto readings = sampler_.sample(probe.path, points[i],
                                    Config::crop_window_sec(), limit);
    auto candidate = most_frequent(readings);
    if (candidate)
      info(fmt::format("Crop sample ({}) @ {:.0f}s: {} ({} readings)",
                       labels[i], points[i], candidate->to_string(),
                       readings.size()));
    else
      info(fmt::format("Crop sample ({}) @ {:.0f}s: no signal", labels[i],
                       points[i]));
    candidates.push_back(candidate);
  }

  auto chosen = vote_crop(candidates);
  if (!chosen) {
    warn("Crop detection found no usable signal, keeping the full frame");
    return std::nullopt;
  }

  int delta = (probe.width - chosen->width) + (probe.height - chosen->height);
  int perimeter = probe.width + probe.height;
  double pct = perimeter > 0 ? delta * 100.0 / perimeter : 0.0;

  if (crop_is_significant(*chosen, probe.width, probe.height,
                          Config::crop_min_threshold())) {
    info(fmt::format("Crop detected: {}x{} -> {}x{} ({} pixels, {:.2f}%)",
                     probe.width, probe.height, chosen->width, chosen->height,
                     delta, pct));
    return chosen;
  }

  info(fmt::format("No significant crop required ({} pixels, {:.2f}%)", delta,
                   pct));
  return std::nullopt;
}

std::optional<CropRegion>
CropDetector::resolve(const MediaProbe &probe,
                      const std::optional<CropRegion> &manual) const {
  if (manual) {
    info(fmt::format("Using manual crop: {}", manual->to_string()));
    return manual;
  }
  return detect(probe);
}

} // namespace adaptive_encoder
