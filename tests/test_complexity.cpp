#include <algorithm>
#include <random>

#include <gtest/gtest.h>

#include "adaptive_encoder/complexity.hpp"
#include "adaptive_encoder/frame_metrics.hpp"
#include "test_support.hpp"

using namespace adaptive_encoder;
using namespace adaptive_encoder::testing_support;

TEST(ComplexityScore, StaysInRangeAndIsDeterministic) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> pct(0.0, 100.0);
  std::uniform_real_distribution<double> grain(0.0, 40.0);
  std::uniform_real_distribution<double> scenes(0.0, 120.0);

  for (int i = 0; i < 500; ++i) {
    ComplexitySignals s;
    s.spatial_info = pct(rng);
    s.temporal_info = pct(rng);
    s.scene_change_rate = scenes(rng);
    s.frame_type_complexity = pct(rng) * 2;
    s.grain_level = grain(rng);
    s.texture_score = pct(rng) * 10;

    double a = compute_complexity_score(s);
    EXPECT_GE(a, 10.0);
    EXPECT_LE(a, 100.0);
    EXPECT_EQ(a, compute_complexity_score(s));
  }
}

TEST(ComplexityScore, WeightedSum) {
  ComplexitySignals s;
  s.spatial_info = 40;
  s.temporal_info = 60;
  s.scene_change_rate = 4;
  s.frame_type_complexity = 8;
  s.grain_level = 2;
  s.texture_score = 10;
  /// 10 + 21 + 6 + 16 + 3 + 2
  EXPECT_NEAR(compute_complexity_score(s), 58.0, 1e-9);
}

TEST(ComplexityScore, ZeroSignalsClampToFloor) {
  ComplexitySignals s;
  s.spatial_info = s.temporal_info = s.scene_change_rate = 0;
  s.frame_type_complexity = s.grain_level = s.texture_score = 0;
  EXPECT_DOUBLE_EQ(compute_complexity_score(s), 10.0);
}

TEST(FrameTypes, TemporalInformation) {
  EXPECT_DOUBLE_EQ(temporal_information({}), 50.0);
  EXPECT_DOUBLE_EQ(temporal_information({'I', 'P', 'B', 'B'}), 75.0);
  std::vector<char> long_run(900, 'P');
  long_run.insert(long_run.end(), 900, 'I');
  /// Only the first 900 count
  EXPECT_DOUBLE_EQ(temporal_information(long_run), 100.0);
}

TEST(FrameTypes, FrameTypeComplexity) {
  EXPECT_DOUBLE_EQ(frame_type_complexity({}), 4.0);
  EXPECT_DOUBLE_EQ(frame_type_complexity({'I', 'P', 'P', 'P'}), 50.0);
}

TEST(GrainSampling, LongInputUsesPercentages) {
  std::vector<double> pts = grain_sample_points(1000);
  EXPECT_EQ(pts, (std::vector<double>{100, 250, 500, 750, 900}));
}

TEST(GrainSampling, PointsClampedAndDeduplicated) {
  std::vector<double> pts = grain_sample_points(12);
  /// 1->2, 3, 6, 9->7, 10->7
  EXPECT_EQ(pts, (std::vector<double>{2, 3, 6, 7}));
}

TEST(GrainSampling, DarkScenePointsAreRelative) {
  std::vector<double> pts = dark_scene_points(50);
  ASSERT_EQ(pts.size(), 3u);
  EXPECT_DOUBLE_EQ(pts[0], 10);
  EXPECT_DOUBLE_EQ(pts[1], 20);
  EXPECT_DOUBLE_EQ(pts[2], 30);
}

TEST(FrameMetrics, FlatFrameHasNoDetail) {
  LumaFrame flat(320, 240, 90);
  EXPECT_DOUBLE_EQ(spatial_information(flat), 0.0);
  EXPECT_DOUBLE_EQ(texture_score(flat), 0.0);
  EXPECT_DOUBLE_EQ(highpass_noise(flat), 0.0);
  EXPECT_DOUBLE_EQ(mean_luma(flat), 90.0);
}

TEST(FrameMetrics, EdgesRaiseSpatialInformation) {
  LumaFrame stripes = striped_frame(320, 240, 8);
  EXPECT_GT(spatial_information(stripes), 0.0);
  EXPECT_GT(texture_score(stripes), 0.0);
  EXPECT_GT(edge_density(stripes), 0.0);
}

TEST(FrameMetrics, SceneChangeOnHardCutOnly) {
  SceneChangeDetector detector;
  LumaFrame dark(64, 48, 10);
  LumaFrame bright(64, 48, 240);

  EXPECT_DOUBLE_EQ(detector.push(dark), 0.0);
  EXPECT_DOUBLE_EQ(detector.push(dark), 0.0);
  EXPECT_GT(detector.push(bright), 0.3);
}

TEST(ComplexityAnalyzer, UsesProbeFrameTypesAndSamples) {
  MediaProbe probe;
  probe.width = 320;
  probe.height = 240;
  probe.duration_seconds = 120;
  probe.sampled_frame_types = {'I', 'P', 'B', 'B'};

  SyntheticFrames frames(120, LumaFrame(320, 240, 128));
  ComplexityAnalyzer analyzer;
  ComplexitySignals s = analyzer.analyze(probe, frames);

  EXPECT_DOUBLE_EQ(s.temporal_info, 75.0);
  EXPECT_DOUBLE_EQ(s.frame_type_complexity, 50.0);
  EXPECT_DOUBLE_EQ(s.spatial_info, 0.0);
  EXPECT_DOUBLE_EQ(s.scene_change_rate, 0.0);
  EXPECT_DOUBLE_EQ(s.grain_level, 0.0);
  EXPECT_FALSE(s.is_hdr);
}

TEST(ComplexityAnalyzer, DarkScenesRaiseGrain) {
  MediaProbe probe;
  probe.duration_seconds = 1000;
  TimedFrames frames(1000, LumaFrame(320, 240, 200));
  for (double t : dark_scene_points(1000))
    frames.frames[t] = dark_noisy_frame(320, 240);

  ComplexityAnalyzer analyzer;
  ComplexitySignals s = analyzer.analyze(probe, frames);

  /// Bright flat frames at the grain points alone measure nothing
  EXPECT_DOUBLE_EQ(s.texture_score, 0.0);
  EXPECT_GT(s.grain_level, DARK_BOOST_TRIGGER);
}

TEST(ComplexityAnalyzer, ShortClipNeverSeeksPastEnd) {
  MediaProbe probe;
  probe.duration_seconds = 100;
  TimedFrames frames(100, LumaFrame(320, 240, 200));

  ComplexityAnalyzer analyzer;
  analyzer.analyze(probe, frames);

  ASSERT_FALSE(frames.requested.empty());
  for (double t : frames.requested)
    EXPECT_LE(t, 100.0) << t;
  /// Dark-scene candidates were consulted at 20/40/60 %
  for (double t : dark_scene_points(100))
    EXPECT_NE(std::find(frames.requested.begin(), frames.requested.end(), t),
              frames.requested.end())
        << t;
}
