/**
 * @file progress.cpp
 * @brief Encoder progress parsing, estimation and live display
 */

#include "adaptive_encoder/progress.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"
#include "adaptive_encoder/logging.hpp"
#include "adaptive_encoder/run_context.hpp"
#include "adaptive_encoder/system.hpp"

namespace adaptive_encoder {

namespace {

constexpr int BAR_WIDTH = 50;
constexpr double ETA_CEILING_SEC = 24.0 * 3600.0;
constexpr double MIN_EXTRAPOLATION_FRACTION = 0.01;

/// Numeric value or 0 for "N/A", empty and garbage
double parse_number(const std::string &text) {
  if (text.empty() || text == "N/A")
    return 0.0;
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str())
    return 0.0;
  return std::isfinite(v) ? v : 0.0;
}

std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

} // anonymous namespace

const char *to_string(ProgressMethod method) {
  switch (method) {
  case ProgressMethod::Time:
    return "time";
  case ProgressMethod::Frame:
    return "frame";
  case ProgressMethod::Unknown:
    break;
  }
  return "unknown";
}

// **---- Parsing ----**

void ProgressParser::apply(const std::string &key, const std::string &value) {
  if (key == "out_time_us") {
    has_time_us_ = true;
    current_.out_time_us = static_cast<int64_t>(parse_number(value));
  } else if (key == "out_time_ms") {
    /// Legacy key; ffmpeg writes microseconds here too
    if (!has_time_us_)
      current_.out_time_us = static_cast<int64_t>(parse_number(value));
  } else if (key == "frame") {
    current_.frame = static_cast<int64_t>(parse_number(value));
  } else if (key == "fps") {
    current_.fps = parse_number(value);
  } else if (key == "speed") {
    /// "1.25x"; strtod stops at the suffix
    current_.speed = parse_number(value);
  } else if (key == "total_size") {
    current_.total_size = static_cast<int64_t>(parse_number(value));
  }
}

std::vector<ProgressSample> ProgressParser::feed(const std::string &chunk,
                                                 double wall_clock_sec) {
  std::vector<ProgressSample> completed;
  partial_ += chunk;

  size_t start = 0;
  size_t nl;
  while ((nl = partial_.find('\n', start)) != std::string::npos) {
    std::string line = trim(partial_.substr(start, nl - start));
    start = nl + 1;

    size_t eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    if (key == "progress") {
      current_.ended = (value == "end");
      current_.wall_clock_sec = wall_clock_sec;
      completed.push_back(current_);
      /// Fields persist across blocks; only the terminator resets
      current_.ended = false;
      continue;
    }
    apply(key, value);
  }
  partial_.erase(0, start);
  return completed;
}

// **---- Estimation ----**

ProgressEstimate estimate_progress(const ProgressSample &sample,
                                   const ProgressTarget &target,
                                   double elapsed_sec) {
  ProgressEstimate est;

  if (target.duration_sec > 0.0 && sample.out_time_us > 0) {
    est.fraction = (sample.out_time_us / 1e6) / target.duration_sec;
    est.method = ProgressMethod::Time;
  }
  if (target.total_frames > 0 && sample.frame > 0) {
    double by_frame =
        static_cast<double>(sample.frame) / static_cast<double>(target.total_frames);
    if (by_frame > 0.0 && by_frame <= 1.0) {
      est.fraction = by_frame;
      est.method = ProgressMethod::Frame;
    }
  }
  est.fraction = std::min(std::max(est.fraction, 0.0), 1.0);

  std::optional<double> eta;
  if (est.fraction > MIN_EXTRAPOLATION_FRACTION && elapsed_sec > 0.0) {
    double by_progress = elapsed_sec / est.fraction - elapsed_sec;
    if (by_progress > 0.0)
      eta = by_progress;
  }
  if (sample.fps > 0.0 && target.total_frames > 0 && est.fraction > 0.0) {
    double remaining = target.total_frames * (1.0 - est.fraction);
    if (remaining > 0.0) {
      double by_fps = remaining / sample.fps;
      if (by_fps > 0.0 && (!eta || by_fps < 2.0 * *eta))
        eta = by_fps;
    }
  }
  if (eta && sample.speed > 0.0)
    eta = *eta / sample.speed;
  if (eta && *eta > ETA_CEILING_SEC)
    eta.reset();
  est.eta_seconds = eta;

  if (sample.total_size > 0 && est.fraction > MIN_EXTRAPOLATION_FRACTION) {
    est.estimated_size_bytes = static_cast<int64_t>(
        std::llround(static_cast<double>(sample.total_size) / est.fraction));
  }
  return est;
}

int update_interval(int width, int height, EncodingMode mode,
                    double complexity_score) {
  int interval = 1;
  if (width >= 3000 || height >= 2000)
    interval += 2;
  else if (width >= 2400 || height >= 1400)
    interval += 1;

  if (mode == EncodingMode::CBR)
    interval += 1;

  if (complexity_score > 70.0)
    interval += 2;
  else if (complexity_score > 50.0)
    interval += 1;

  return std::min(std::max(interval, 1), 5);
}

bool StallTracker::update(double fraction, double now_sec) {
  if (fraction != last_fraction_) {
    last_fraction_ = fraction;
    last_change_ = now_sec;
    return false;
  }
  return (now_sec - last_change_) >= window_;
}

// **---- Display ----**

std::string render_progress_line(const std::string &label,
                                 const ProgressEstimate &estimate) {
  int filled = static_cast<int>(BAR_WIDTH * estimate.fraction);
  filled = std::min(std::max(filled, 0), BAR_WIDTH);
  std::string bar(static_cast<size_t>(filled), '#');
  bar.append(static_cast<size_t>(BAR_WIDTH - filled), ' ');

  std::string eta = estimate.eta_seconds
                        ? format_eta(*estimate.eta_seconds)
                        : std::string("calculating...");
  std::string size = estimate.estimated_size_bytes
                         ? format_size(*estimate.estimated_size_bytes)
                         : std::string("calculating...");

  return fmt::format("\r\033[K{}: [{}] {:5.1f}% | ETA: {:>11} | Estimated size: {:>12}",
                     label, bar, estimate.fraction * 100.0, eta, size);
}

// **---- Monitor ----**

namespace {

void print_line(const std::string &line) {
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("{}", line);
  std::fflush(stdout);
}

} // anonymous namespace

PassOutcome ProgressMonitor::run(RunningPass &pass, const Settings &settings,
                                 RunContext *ctx) {
  using clock = std::chrono::steady_clock;
  auto started = clock::now();
  auto elapsed = [&]() {
    return std::chrono::duration<double>(clock::now() - started).count();
  };

  ProgressParser parser;
  StallTracker stall(Config::stall_window_sec());
  std::optional<ProgressSample> latest;
  int next_log_step = 1; //< Next 10% step to log when not displaying
  int interval_ms = std::max(settings.interval_ms, 1);

  for (;;) {
    bool exited = pass.wait_for(std::chrono::milliseconds(interval_ms));

    double now = elapsed();
    for (auto &sample : parser.feed(pass.read_progress(), now))
      latest = sample;

    if (exited)
      break;

    if (!latest) {
      if (settings.display)
        print_line(fmt::format("\r\033[K{}: Processing... [{}s elapsed]",
                               settings.label, static_cast<long>(now)));
      continue;
    }

    ProgressEstimate est = estimate_progress(*latest, settings.target, now);
    if (stall.update(est.fraction, now))
      est.eta_seconds.reset();

    if (settings.on_update)
      settings.on_update(est);

    if (settings.display) {
      print_line(render_progress_line(settings.label, est));
    } else if (static_cast<int>(est.fraction * 10.0) >= next_log_step) {
      next_log_step = static_cast<int>(est.fraction * 10.0) + 1;
      std::string msg = fmt::format("{}: {:.0f}%", settings.label,
                                    est.fraction * 100.0);
      if (ctx)
        ctx->log_info(msg);
      else
        LOG_INFO("{}", msg);
    }
  }

  PassOutcome outcome = pass.outcome();
  if (settings.display) {
    if (outcome.exit_code == 0) {
      ProgressEstimate done;
      done.fraction = 1.0;
      done.method = latest ? estimate_progress(*latest, settings.target, elapsed()).method
                           : ProgressMethod::Unknown;
      done.eta_seconds = 0.0;
      if (latest && latest->total_size > 0)
        done.estimated_size_bytes = latest->total_size;
      print_line(render_progress_line(settings.label, done));
    }
    print_line("\n");
  }
  return outcome;
}

std::future<PassOutcome> ProgressMonitor::launch(RunningPass &pass,
                                                 Settings settings,
                                                 RunContext *ctx) {
  return std::async(std::launch::async,
                    [&pass, settings = std::move(settings), ctx]() {
                      return run(pass, settings, ctx);
                    });
}

} // namespace adaptive_encoder
