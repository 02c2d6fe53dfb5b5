/**
 * @file pipeline.cpp
 * @brief Decide-and-encode pipeline for one input
 */

#include "adaptive_encoder/pipeline.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

#include <fmt/core.h>

#include "adaptive_encoder/adaptation.hpp"
#include "adaptive_encoder/complexity.hpp"
#include "adaptive_encoder/crop_detector.hpp"
#include "adaptive_encoder/frame_sampler.hpp"
#include "adaptive_encoder/media_probe.hpp"
#include "adaptive_encoder/orchestrator.hpp"
#include "adaptive_encoder/pass_plan.hpp"
#include "adaptive_encoder/profiles.hpp"
#include "adaptive_encoder/run_context.hpp"
#include "adaptive_encoder/system.hpp"

namespace adaptive_encoder {

namespace fs = std::filesystem;

const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::None:
    return "none";
  case FailureKind::InvalidArguments:
    return "invalid arguments";
  case FailureKind::ProbeFailure:
    return "probe failure";
  case FailureKind::UnknownProfile:
    return "unknown profile";
  case FailureKind::PassFailure:
    return "pass failure";
  }
  return "none";
}

std::string generated_output_path(const std::string &input_path) {
  fs::path in(input_path);
  std::string name = fmt::format("{}_{}{}", in.stem().string(),
                                 generate_uuid(), in.extension().string());
  return (in.parent_path() / name).string();
}

MonitorOptions monitor_options(const MediaProbe &probe,
                               const AdaptedParameters &params) {
  MonitorOptions monitor;
  monitor.target.duration_sec = probe.duration_seconds;
  monitor.target.total_frames = probe.total_frame_estimate();
  monitor.width = probe.width;
  monitor.height = probe.height;
  monitor.complexity_score = params.complexity_score;
  return monitor;
}

std::string session_log_path(const std::string &output_path) {
  fs::path out(output_path);
  out.replace_extension(".log");
  return out.string();
}

namespace {

/// Profile parameters and run settings, written once per session
void write_session_details(RunContext &ctx, const std::string &input,
                           const std::string &output,
                           const EncodingProfile &profile, EncodingMode mode,
                           const MediaProbe &probe,
                           const AdaptedParameters &params) {
  ctx.session_note("=== SESSION DETAILS ===");
  ctx.session_note(fmt::format("Input: {}", input));
  ctx.session_note(fmt::format("Output: {}", output));
  ctx.session_note(fmt::format("Source: {}x{} {} {:.3f} fps, {:.1f}s, {} kb/s",
                               probe.width, probe.height, probe.codec_name,
                               probe.fps, probe.duration_seconds,
                               probe.bitrate_bps / 1000));
  ctx.session_note(fmt::format("Audio streams: {}, subtitle streams: {}",
                               probe.audio_stream_count,
                               probe.subtitle_stream_count));

  ctx.session_note("=== PROFILE ===");
  ctx.session_note(fmt::format("Profile: {} ({})", profile.name, profile.title));
  ctx.session_note(fmt::format("Declared content type: {}",
                               to_string(profile.content_type)));
  ctx.session_note(fmt::format(
      "Base CRF: {}, base bitrate: {} kb/s SDR / {} kb/s HDR", profile.base_crf,
      profile.base_bitrate_sdr, profile.base_bitrate_hdr));

  ctx.session_note("=== ENCODING PARAMETERS ===");
  ctx.session_note(fmt::format("Mode: {}", to_string(mode)));
  ctx.session_note(fmt::format("Content type: {}, complexity score: {:.1f}, HDR: {}",
                               to_string(params.content_type),
                               params.complexity_score, params.is_hdr));
  ctx.session_note(fmt::format("CRF: {:.1f}, bitrate: {} kb/s, preset: {}",
                               params.final_crf, params.final_bitrate_kbps,
                               params.preset));
  ctx.session_note(fmt::format("Pixel format: {}, codec profile: {}",
                               params.pixel_format, params.codec_profile));
  ctx.session_note(fmt::format("x265 params: {}",
                               params.encoder_params.to_string()));
}

void write_results(RunContext &ctx, const std::string &input,
                   const std::string &output) {
  std::error_code in_ec, out_ec;
  auto in_size = fs::file_size(input, in_ec);
  auto out_size = fs::file_size(output, out_ec);
  if (in_ec || out_ec || out_size == 0) {
    ctx.log_warn(fmt::format("Cannot compute compression ratio for {}", output));
    return;
  }
  double ratio = static_cast<double>(in_size) / static_cast<double>(out_size);
  ctx.log_info(fmt::format("Compression: {} -> {} (Ratio: {:.1f}:1)",
                           format_size(static_cast<int64_t>(in_size)),
                           format_size(static_cast<int64_t>(out_size)), ratio));
  ctx.session_note("=== ENCODING RESULTS ===");
  ctx.session_note(fmt::format("Input size: {}", format_size(in_size)));
  ctx.session_note(fmt::format("Output size: {}", format_size(out_size)));
  ctx.session_note(fmt::format("Compression ratio: {:.1f}:1", ratio));
}

} // anonymous namespace

EncodeResult EncodingPipeline::decide_and_encode(
    const std::string &input, const std::string &profile_or_auto,
    EncodingMode mode, const EncodeOverrides &overrides, RunContext &ctx) {
  TIMER_START(total_run);
  EncodeResult result;

  // **---- Arguments ----**

  std::error_code ec;
  if (input.empty() || !fs::is_regular_file(input, ec)) {
    ctx.log_error(fmt::format("Invalid input file: {}", input));
    result.failure = FailureKind::InvalidArguments;
    return result;
  }

  bool automatic = (profile_or_auto == AUTO_PROFILE);
  const EncodingProfile *profile = nullptr;
  if (!automatic) {
    profile = find_profile(profile_or_auto);
    if (!profile) {
      ctx.log_error(fmt::format("Unknown profile: {}", profile_or_auto));
      result.failure = FailureKind::UnknownProfile;
      return result;
    }
  }

  result.output_path = overrides.output_path.empty()
                           ? generated_output_path(input)
                           : overrides.output_path;
  if (fs::equivalent(input, result.output_path, ec)) {
    ctx.log_error("Output path must differ from the input");
    result.failure = FailureKind::InvalidArguments;
    return result;
  }

  if (!ctx.open_session_log(session_log_path(result.output_path)))
    ctx.log_warn(fmt::format("Cannot create session log {}",
                             session_log_path(result.output_path)));

  // **---- Probe ----**

  ctx.log_phase(fmt::format("Analyzing {}", fs::path(input).filename().string()));
  TIMER_START(probe);
  std::optional<MediaProbe> probe = media_.probe(input);
  TIMER_END(ctx.timings(), probe);
  if (!probe) {
    ctx.log_error(fmt::format("Failed to probe {}", input));
    result.failure = FailureKind::ProbeFailure;
    return result;
  }
  ctx.log_info(fmt::format("{}x{}, {:.1f}s, {:.3f} fps, {}{}", probe->width,
                           probe->height, probe->duration_seconds, probe->fps,
                           probe->codec_name, probe->is_hdr() ? ", HDR" : ""));

  // **---- Complexity ----**

  std::optional<ComplexitySignals> signals;
  double score = NEUTRAL_COMPLEXITY_SCORE;
  if (automatic || overrides.use_complexity) {
    TIMER_START(complexity);
    std::unique_ptr<FrameSource> frames = media_.open_frames(input);
    if (frames) {
      ComplexityAnalyzer analyzer(&ctx);
      signals = analyzer.analyze(*probe, *frames);
      score = compute_complexity_score(*signals);
      ctx.log_info(fmt::format("Complexity score: {:.1f}", score));
    } else {
      ctx.log_warn("Cannot decode frames for complexity analysis, using "
                   "neutral score");
    }
    TIMER_END(ctx.timings(), complexity);
  }

  // **---- Content Type & Profile ----**

  ContentType type;
  if (automatic) {
    TIMER_START(classify);
    ContentClassifier classifier(oracle_, &ctx);
    Classification verdict =
        classifier.resolve(input, signals, *probe, overrides.oracle_mode);
    type = verdict.type;

    std::string name = recommend_profile(type, probe->width);
    profile = find_profile(name);
    if (!profile) {
      type = classify_by_filename(input);
      name = recommend_profile(type, probe->width);
      ctx.log_warn(fmt::format("No profile for {}, falling back to {}",
                               to_string(verdict.type), name));
      profile = find_profile(name);
    }
    TIMER_END(ctx.timings(), classify);
    if (!profile) {
      ctx.log_error(fmt::format("Unknown profile: {}", name));
      result.failure = FailureKind::UnknownProfile;
      return result;
    }
    ctx.log_info(fmt::format("Selected profile: {}", profile->name));
  } else {
    type = profile->content_type;
    if (overrides.use_complexity) {
      ContentType refined = refine_declared_type(type, score);
      if (refined != type)
        ctx.log_info(fmt::format("Content type refined: {} -> {}",
                                 to_string(type), to_string(refined)));
      type = refined;
    }
  }
  result.profile_name = profile->name;

  // **---- Parameters ----**

  bool hdr = probe->is_hdr();
  result.params = overrides.use_complexity ? adapt(*profile, score, type, hdr)
                                           : base_parameters(*profile, hdr);
  if (!overrides.use_complexity)
    result.params.content_type = type;
  ctx.log_info(fmt::format("Encoding mode: {} - CRF: {:.1f}, bitrate: {} kb/s",
                           to_string(mode), result.params.final_crf,
                           result.params.final_bitrate_kbps));
  write_session_details(ctx, input, result.output_path, *profile, mode, *probe,
                        result.params);

  // **---- Crop ----**

  TIMER_START(crop);
  CropDetector detector(crop_sampler_, &ctx);
  std::optional<CropRegion> crop = detector.resolve(*probe, overrides.manual_crop);
  TIMER_END(ctx.timings(), crop);

  // **---- Encode ----**

  EncodeJob job;
  job.input_path = input;
  job.output_path = result.output_path;
  job.title = overrides.title;
  job.params = result.params;
  job.mode = mode;
  job.filters.denoise = overrides.denoise;
  job.filters.hardware = overrides.hardware;
  job.filters.crop = crop;
  job.filters.scale = overrides.scale;
  job.audio_streams = probe->audio_stream_count;
  job.subtitle_streams = probe->subtitle_stream_count;

  PassPlan plan = PassPlan::build(job, ctx.temp_path("stats.log"));

  PassOrchestrator orchestrator(encoder_, ctx);
  OrchestratorResult run =
      orchestrator.execute(plan, monitor_options(*probe, result.params));
  result.exit_status = run.exit_status;

  if (!run.success) {
    result.failure = FailureKind::PassFailure;
    result.diagnostic_tail = std::move(run.diagnostic_tail);
    ctx.session_note(fmt::format("Encoding status: FAILED (pass {}, exit {})",
                                 run.failed_pass, run.exit_status));
    return result;
  }

  write_results(ctx, input, result.output_path);
  ctx.session_note("Encoding status: SUCCESS");
  ctx.log_success(fmt::format("Encoding completed: {}", result.output_path));

  TIMER_END(ctx.timings(), total_run);
  return result;
}

} // namespace adaptive_encoder
