#include <gtest/gtest.h>

#include "adaptive_encoder/progress.hpp"
#include "test_support.hpp"

using namespace adaptive_encoder;
using namespace adaptive_encoder::testing_support;

namespace {

ProgressSample at_time(double seconds) {
  ProgressSample s;
  s.out_time_us = static_cast<int64_t>(seconds * 1e6);
  return s;
}

ProgressTarget duration_only(double seconds) {
  ProgressTarget t;
  t.duration_sec = seconds;
  return t;
}

} // namespace

// **---- Parser ----**

TEST(ProgressParser, LinesSplitAcrossChunks) {
  ProgressParser parser;
  EXPECT_TRUE(parser.feed("frame=1", 0.0).empty());
  EXPECT_TRUE(parser.feed("0\nout_time_us=2000000\nprogress=cont", 1.0).empty());

  auto samples = parser.feed("inue\n", 2.0);
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_EQ(samples[0].frame, 10);
  EXPECT_EQ(samples[0].out_time_us, 2000000);
  EXPECT_DOUBLE_EQ(samples[0].wall_clock_sec, 2.0);
  EXPECT_FALSE(samples[0].ended);
}

TEST(ProgressParser, NotAvailableAndSpeedSuffix) {
  ProgressParser parser;
  auto samples = parser.feed("fps=N/A\nspeed=N/A\ntotal_size=N/A\n"
                             "progress=continue\n"
                             "fps=23.5\nspeed=1.25x\ntotal_size=4096\n"
                             "out_time_ms=3000000\nprogress=end\n",
                             0.0);
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_DOUBLE_EQ(samples[0].fps, 0.0);
  EXPECT_DOUBLE_EQ(samples[0].speed, 0.0);
  EXPECT_DOUBLE_EQ(samples[1].fps, 23.5);
  EXPECT_DOUBLE_EQ(samples[1].speed, 1.25);
  EXPECT_EQ(samples[1].total_size, 4096);
  EXPECT_EQ(samples[1].out_time_us, 3000000);
  EXPECT_TRUE(samples[1].ended);
}

TEST(ProgressParser, MicrosecondKeyWinsOverLegacyKey) {
  ProgressParser parser;
  auto samples = parser.feed("out_time_us=2000000\nout_time_ms=2000\n"
                             "progress=continue\n"
                             "out_time_ms=9999\nout_time_us=4000000\n"
                             "progress=end\n",
                             0.0);
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_EQ(samples[0].out_time_us, 2000000);
  EXPECT_EQ(samples[1].out_time_us, 4000000);
}

TEST(ProgressParser, FieldsPersistBetweenBlocks) {
  ProgressParser parser;
  parser.feed("frame=50\nprogress=continue\n", 0.0);
  auto samples = parser.feed("out_time_us=1000000\nprogress=continue\n", 1.0);
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_EQ(samples[0].frame, 50);
}

// **---- Estimation ----**

TEST(ProgressEstimate, TimeBased) {
  ProgressEstimate est = estimate_progress(at_time(25), duration_only(100), 10);
  EXPECT_DOUBLE_EQ(est.fraction, 0.25);
  EXPECT_EQ(est.method, ProgressMethod::Time);
  ASSERT_TRUE(est.eta_seconds.has_value());
  EXPECT_NEAR(*est.eta_seconds, 30.0, 1e-9);
  EXPECT_FALSE(est.estimated_size_bytes.has_value());
}

TEST(ProgressEstimate, FrameRatioPreferredWhenPlausible) {
  ProgressTarget target{100, 1000};
  ProgressSample s = at_time(25);
  s.frame = 500;
  ProgressEstimate est = estimate_progress(s, target, 10);
  EXPECT_DOUBLE_EQ(est.fraction, 0.5);
  EXPECT_EQ(est.method, ProgressMethod::Frame);

  /// More frames than expected: the time ratio stands
  s.frame = 1200;
  est = estimate_progress(s, target, 10);
  EXPECT_DOUBLE_EQ(est.fraction, 0.25);
  EXPECT_EQ(est.method, ProgressMethod::Time);
}

TEST(ProgressEstimate, FractionClamped) {
  ProgressEstimate est = estimate_progress(at_time(130), duration_only(100), 10);
  EXPECT_DOUBLE_EQ(est.fraction, 1.0);
}

TEST(ProgressEstimate, FpsFigureReplacesExtrapolation) {
  ProgressTarget target{0, 1000};
  ProgressSample s;
  s.frame = 100;
  s.fps = 50;
  ProgressEstimate est = estimate_progress(s, target, 10);
  ASSERT_TRUE(est.eta_seconds.has_value());
  /// 900 frames left at 50 fps
  EXPECT_NEAR(*est.eta_seconds, 18.0, 1e-9);
}

TEST(ProgressEstimate, SpeedScalesEta) {
  ProgressSample s = at_time(25);
  s.speed = 2.0;
  ProgressEstimate est = estimate_progress(s, duration_only(100), 10);
  ASSERT_TRUE(est.eta_seconds.has_value());
  EXPECT_NEAR(*est.eta_seconds, 15.0, 1e-9);
}

TEST(ProgressEstimate, EtaBeyondADayIsDropped) {
  ProgressEstimate est = estimate_progress(at_time(2), duration_only(100), 3600);
  EXPECT_DOUBLE_EQ(est.fraction, 0.02);
  EXPECT_FALSE(est.eta_seconds.has_value());
}

TEST(ProgressEstimate, NoExtrapolationBelowOnePercent) {
  ProgressSample s = at_time(0.5);
  s.total_size = 1000;
  ProgressEstimate est = estimate_progress(s, duration_only(100), 10);
  EXPECT_FALSE(est.eta_seconds.has_value());
  EXPECT_FALSE(est.estimated_size_bytes.has_value());
}

TEST(ProgressEstimate, ProjectedSize) {
  ProgressSample s = at_time(25);
  s.total_size = 1000;
  ProgressEstimate est = estimate_progress(s, duration_only(100), 10);
  ASSERT_TRUE(est.estimated_size_bytes.has_value());
  EXPECT_EQ(*est.estimated_size_bytes, 4000);
}

TEST(ProgressInterval, GrowsWithResolutionModeAndComplexity) {
  EXPECT_EQ(update_interval(1920, 1080, EncodingMode::ABR, 50), 1);
  EXPECT_EQ(update_interval(2560, 1440, EncodingMode::ABR, 60), 3);
  EXPECT_EQ(update_interval(1920, 1080, EncodingMode::CBR, 71), 4);
  EXPECT_EQ(update_interval(3840, 2160, EncodingMode::CBR, 80), 5);
}

TEST(StallTracker, FlagsOnlyAfterWindow) {
  StallTracker tracker(10);
  EXPECT_FALSE(tracker.update(0.1, 0));
  EXPECT_FALSE(tracker.update(0.1, 5));
  EXPECT_TRUE(tracker.update(0.1, 10));
  EXPECT_FALSE(tracker.update(0.2, 11));
}

// **---- Display ----**

TEST(ProgressLine, RendersBarEtaAndSize) {
  ProgressEstimate est;
  est.fraction = 0.5;
  est.eta_seconds = 75;
  est.estimated_size_bytes = 1536;
  std::string line = render_progress_line("Pass", est);

  EXPECT_EQ(line.rfind("\r\033[KPass: [", 0), 0u);
  EXPECT_NE(line.find(std::string(25, '#') + std::string(25, ' ') + "]"),
            std::string::npos);
  EXPECT_NE(line.find(" 50.0%"), std::string::npos);
  EXPECT_NE(line.find("01:15"), std::string::npos);
  EXPECT_NE(line.find("1.5 KB"), std::string::npos);
}

TEST(ProgressLine, MissingFiguresShowCalculating) {
  ProgressEstimate est;
  std::string line = render_progress_line("Pass", est);
  EXPECT_NE(line.find("ETA: calculating..."), std::string::npos);
  EXPECT_NE(line.find("Estimated size: calculating..."), std::string::npos);
}

// **---- Monitor ----**

TEST(ProgressMonitor, ReportsEveryBlockUntilExit) {
  ScriptedPass pass({"frame=10\nout_time_us=5000000\nprogress=continue\n",
                     "frame=20\nout_time_us=10000000\nprogress=end\n"},
                    0);

  std::vector<double> fractions;
  ProgressMonitor::Settings settings;
  settings.target = duration_only(10);
  settings.interval_ms = 1;
  settings.label = "Test";
  settings.display = false;
  settings.on_update = [&](const ProgressEstimate &e) {
    fractions.push_back(e.fraction);
  };

  PassOutcome outcome = ProgressMonitor::launch(pass, settings, nullptr).get();
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(fractions, (std::vector<double>{0.5, 1.0}));
}

TEST(ProgressMonitor, SurfacesFailure) {
  ScriptedPass pass({}, 1, {"Error opening input"});
  ProgressMonitor::Settings settings;
  settings.interval_ms = 1;
  settings.display = false;

  PassOutcome outcome = ProgressMonitor::run(pass, settings, nullptr);
  EXPECT_EQ(outcome.exit_code, 1);
  EXPECT_EQ(outcome.diagnostic_tail,
            (std::vector<std::string>{"Error opening input"}));
}
