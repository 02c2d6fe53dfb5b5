#include <filesystem>

#include <gtest/gtest.h>

#include "adaptive_encoder/batch_processor.hpp"
#include "adaptive_encoder/pipeline.hpp"
#include "adaptive_encoder/run_context.hpp"
#include "test_support.hpp"

using namespace adaptive_encoder;
using namespace adaptive_encoder::testing_support;

namespace {

MediaProbe hd_probe() {
  MediaProbe p;
  p.width = 1920;
  p.height = 1080;
  p.duration_seconds = 600;
  p.fps = 24;
  p.codec_name = "h264";
  p.audio_stream_count = 1;
  p.sampled_frame_types = {'I', 'P', 'B', 'B'};
  return p;
}

/// Fakes wired into one pipeline, input file created in a temp dir
struct PipelineFixture : public ::testing::Test {
  TempDir dir{"pipeline"};
  FakeMedia media;
  FakeEncoder encoder;
  FakeCropSampler crop_sampler;
  CountingOracle oracle;
  EncodingPipeline pipeline{media, encoder, crop_sampler, &oracle};
  std::string input;
  EncodeOverrides overrides;

  void SetUp() override {
    media.probe_result = hd_probe();
    input = dir.file("my_anime_show.mkv", "source bytes");
    overrides.output_path = dir.path("out.mkv");
    overrides.oracle_mode = OracleMode::Disabled;
  }

  EncodeResult run(const std::string &profile, EncodingMode mode) {
    RunContext ctx(0);
    return pipeline.decide_and_encode(input, profile, mode, overrides, ctx);
  }
};

} // namespace

// **---- Argument Validation ----**

TEST_F(PipelineFixture, MissingInputIsRejected) {
  input = dir.path("missing.mkv");
  EncodeResult r = run("film", EncodingMode::ABR);
  EXPECT_EQ(r.failure, FailureKind::InvalidArguments);
  EXPECT_TRUE(encoder.started.empty());
}

TEST_F(PipelineFixture, UnknownProfileIsRejected) {
  EncodeResult r = run("no_such_profile", EncodingMode::ABR);
  EXPECT_EQ(r.failure, FailureKind::UnknownProfile);
  EXPECT_TRUE(encoder.started.empty());
}

TEST_F(PipelineFixture, OutputMustDifferFromInput) {
  overrides.output_path = input;
  EncodeResult r = run("film", EncodingMode::CRF);
  EXPECT_EQ(r.failure, FailureKind::InvalidArguments);
  EXPECT_TRUE(encoder.started.empty());
}

TEST_F(PipelineFixture, ProbeFailure) {
  media.probe_result.reset();
  EncodeResult r = run("film", EncodingMode::ABR);
  EXPECT_EQ(r.failure, FailureKind::ProbeFailure);
  EXPECT_TRUE(encoder.started.empty());
}

// **---- Explicit Profiles ----**

TEST_F(PipelineFixture, ExplicitProfileCbrRunsTwoConstrainedPasses) {
  EncodeResult r = run("film", EncodingMode::CBR);

  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.profile_name, "film");
  EXPECT_DOUBLE_EQ(r.params.final_crf, 19.0);
  EXPECT_EQ(r.params.final_bitrate_kbps, 4500);
  EXPECT_EQ(r.output_path, dir.path("out.mkv"));

  ASSERT_EQ(encoder.started.size(), 2u);
  for (const auto &pass : encoder.started) {
    EXPECT_EQ(arg_after(pass.args, "-minrate"), "4500k");
    EXPECT_EQ(arg_after(pass.args, "-bufsize"), "6750k");
  }
  EXPECT_TRUE(contains(encoder.started[1].args, "0:a:0"));
  EXPECT_TRUE(std::filesystem::exists(dir.path("out.log")));
}

TEST_F(PipelineFixture, ExplicitProfileSkipsAnalysisAndOracle) {
  media.frames_available = true;
  overrides.oracle_mode = OracleMode::Force;
  EncodeResult r = run("anime", EncodingMode::CRF);

  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.params.content_type, ContentType::Anime);
  EXPECT_DOUBLE_EQ(r.params.complexity_score, NEUTRAL_COMPLEXITY_SCORE);
  EXPECT_EQ(oracle.calls.load(), 0);
  ASSERT_EQ(encoder.started.size(), 1u);
  EXPECT_EQ(arg_after(encoder.started[0].args, "-crf"), "23");
}

TEST_F(PipelineFixture, ManualCropSkipsDetection) {
  overrides.manual_crop = CropRegion{1920, 800, 0, 140};
  EncodeResult r = run("film", EncodingMode::CRF);

  ASSERT_TRUE(r.success());
  EXPECT_TRUE(crop_sampler.starts.empty());
  EXPECT_EQ(arg_after(encoder.started[0].args, "-filter_complex"),
            "[0:v]crop=1920:800:0:140[v]");
}

TEST_F(PipelineFixture, DetectedCropIsApplied) {
  CropRegion bars{1920, 800, 0, 140};
  crop_sampler.windows = {{bars}, {bars}, {bars}};
  EncodeResult r = run("film", EncodingMode::CRF);

  ASSERT_TRUE(r.success());
  EXPECT_EQ(crop_sampler.starts.size(), 3u);
  EXPECT_EQ(arg_after(encoder.started[0].args, "-filter_complex"),
            "[0:v]crop=1920:800:0:140[v]");
}

// **---- Automatic Selection ----**

TEST_F(PipelineFixture, AutoWithoutFramesUsesFileName) {
  EncodeResult r = run(AUTO_PROFILE, EncodingMode::ABR);

  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.profile_name, "1080p_anime");
  EXPECT_EQ(r.params.content_type, ContentType::Anime);
  EXPECT_EQ(encoder.started.size(), 2u);
}

TEST_F(PipelineFixture, AutoConsultsOracleWhenUnsure) {
  overrides.oracle_mode = OracleMode::Enabled;
  oracle.verdict = Classification{ContentType::Action, 90};
  EncodeResult r = run(AUTO_PROFILE, EncodingMode::ABR);

  ASSERT_TRUE(r.success());
  EXPECT_EQ(oracle.calls.load(), 1);
  EXPECT_EQ(r.profile_name, "1080p_action");
}

TEST_F(PipelineFixture, AutoWithComplexityAdaptsParameters) {
  media.frames_available = true;
  overrides.use_complexity = true;
  EncodeResult r = run(AUTO_PROFILE, EncodingMode::CRF);

  ASSERT_TRUE(r.success());
  EXPECT_NE(r.params.complexity_score, NEUTRAL_COMPLEXITY_SCORE);
  EXPECT_GE(r.params.final_crf, MIN_FINAL_CRF);
  EXPECT_LE(r.params.final_crf, MAX_FINAL_CRF);
}

TEST_F(PipelineFixture, AutoWithoutComplexityMonitorsWithNeutralScore) {
  media.frames_available = true;
  EncodeResult r = run(AUTO_PROFILE, EncodingMode::ABR);

  ASSERT_TRUE(r.success());
  EXPECT_DOUBLE_EQ(r.params.complexity_score, NEUTRAL_COMPLEXITY_SCORE);
  MonitorOptions monitor = monitor_options(hd_probe(), r.params);
  EXPECT_DOUBLE_EQ(monitor.complexity_score, NEUTRAL_COMPLEXITY_SCORE);
}

TEST(MonitorOptions, FollowAdaptedParameters) {
  MediaProbe probe = hd_probe();
  AdaptedParameters params;
  params.complexity_score = 82.0;

  MonitorOptions monitor = monitor_options(probe, params);
  EXPECT_DOUBLE_EQ(monitor.complexity_score, 82.0);
  EXPECT_EQ(monitor.width, 1920);
  EXPECT_EQ(monitor.height, 1080);
  EXPECT_DOUBLE_EQ(monitor.target.duration_sec, 600.0);
  EXPECT_EQ(monitor.target.total_frames, 14400);
}

TEST_F(PipelineFixture, GeneratedOutputPathSitsBesideInput) {
  overrides.output_path.clear();
  EncodeResult r = run("film", EncodingMode::CRF);

  ASSERT_TRUE(r.success());
  std::filesystem::path out(r.output_path);
  EXPECT_EQ(out.parent_path().string(), dir.dir().string());
  EXPECT_EQ(out.extension().string(), ".mkv");
  EXPECT_EQ(out.filename().string().rfind("my_anime_show_", 0), 0u);
  /// stem + "_" + 36-character uuid
  EXPECT_EQ(out.stem().string().size(), std::string("my_anime_show_").size() + 36);
}

// **---- Failures ----**

TEST_F(PipelineFixture, PassFailureIsReported) {
  encoder.exit_codes[1] = 5;
  EncodeResult r = run("film", EncodingMode::ABR);

  EXPECT_EQ(r.failure, FailureKind::PassFailure);
  EXPECT_EQ(r.exit_status, 5);
  EXPECT_EQ(r.diagnostic_tail.size(), 2u);
  EXPECT_EQ(encoder.started.size(), 1u);
}

TEST(SessionLogPath, ReplacesExtension) {
  EXPECT_EQ(session_log_path("/out/movie.mkv"), "/out/movie.log");
  EXPECT_EQ(session_log_path("/out/movie"), "/out/movie.log");
}

TEST(BatchFiles, CollectsVideoFilesSorted) {
  TempDir dir("batch_files");
  dir.file("b.MKV");
  dir.file("a.mp4");
  dir.file("notes.txt");
  dir.file("c.m2ts");
  std::filesystem::create_directories(dir.dir() / "nested.mkv");

  std::vector<std::string> files = collect_video_files(dir.dir().string());
  EXPECT_EQ(files, (std::vector<std::string>{dir.path("a.mp4"), dir.path("b.MKV"),
                                             dir.path("c.m2ts")}));
  EXPECT_TRUE(collect_video_files(dir.path("absent")).empty());
}
