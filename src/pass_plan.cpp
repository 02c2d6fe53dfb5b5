/**
 * @file pass_plan.cpp
 * @brief Mode-specific pass plans and encoder argument assembly
 */

#include "adaptive_encoder/pass_plan.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"
#include "adaptive_encoder/logging.hpp"
#include "adaptive_encoder/system.hpp"

namespace adaptive_encoder {

namespace fs = std::filesystem;

const char *to_string(PassPurpose purpose) {
  switch (purpose) {
  case PassPurpose::Single:
    return "single";
  case PassPurpose::Analysis:
    return "analysis";
  case PassPurpose::Final:
    return "final";
  }
  return "single";
}

// **---- StatsHandle ----**

StatsHandle::~StatsHandle() {
  if (!released_)
    remove_artifacts();
}

int StatsHandle::remove_artifacts() {
  released_ = true;
  fs::path stats(path_);
  fs::path dir = stats.has_parent_path() ? stats.parent_path() : fs::path(".");
  std::string prefix = stats.filename().string();

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_WARN("Cannot list {} for stats cleanup: {}", dir.string(),
             ec.message());
    return 0;
  }

  int removed = 0;
  for (const auto &entry : it) {
    std::string name = entry.path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0)
      continue;
    std::error_code rm_ec;
    if (fs::remove(entry.path(), rm_ec))
      ++removed;
    else if (rm_ec)
      LOG_WARN("Failed to remove stats file {}: {}", entry.path().string(),
               rm_ec.message());
  }
  return removed;
}

// **---- Argument Assembly ----**

int cbr_buffer_kbps(int bitrate_kbps) {
  return static_cast<int>(std::lround(bitrate_kbps * 1.5));
}

namespace {

const char *mode_tag(EncodingMode mode) {
  switch (mode) {
  case EncodingMode::CRF:
    return "CRF";
  case EncodingMode::ABR:
    return "ABR";
  case EncodingMode::CBR:
    return "CBR";
  }
  return "ABR";
}

/// Input, filter graph and codec selection shared by every pass
std::vector<std::string> base_args(const EncodeJob &job) {
  std::vector<std::string> args = {"-y"};
  /// Frames stay on the GPU only when the graph starts with hwdownload
  if (job.filters.hardware) {
    args.insert(args.end(), {"-hwaccel", "cuda"});
    if (job.filters.denoise)
      args.insert(args.end(), {"-hwaccel_output_format", "cuda"});
  }
  args.insert(args.end(),
              {"-i", job.input_path, "-max_muxing_queue_size", "1024"});
  if (!job.title.empty())
    args.insert(args.end(), {"-metadata", fmt::format("title={}", job.title)});

  auto video = video_args(job.filters);
  args.insert(args.end(), video.begin(), video.end());

  args.insert(args.end(), {"-c:v", "libx265", "-pix_fmt",
                           job.params.pixel_format, "-profile:v",
                           job.params.codec_profile});
  return args;
}

std::vector<std::string> bitrate_args(const EncodeJob &job) {
  int b = job.params.final_bitrate_kbps;
  std::vector<std::string> args = {"-b:v", fmt::format("{}k", b)};
  if (job.mode == EncodingMode::CBR) {
    args.insert(args.end(),
                {"-minrate", fmt::format("{}k", b), "-maxrate",
                 fmt::format("{}k", b), "-bufsize",
                 fmt::format("{}k", cbr_buffer_kbps(b))});
  }
  return args;
}

/// Audio, subtitles, chapters and metadata, then the output file
void append_final_output(std::vector<std::string> &args, const EncodeJob &job) {
  auto streams = stream_map_args(job.audio_streams, job.subtitle_streams);
  args.insert(args.end(), streams.begin(), streams.end());
  args.insert(args.end(), {"-default_mode", "infer_no_subs", "-loglevel",
                           "warning", job.output_path});
}

ParamSet encoder_params(const EncodeJob &job) {
  ParamSet p = job.params.encoder_params;
  p.erase("bitrate");
  /// x265-params override -maxrate/-bufsize; profile VBV caps follow the CBR target
  if (job.mode == EncodingMode::CBR) {
    int b = job.params.final_bitrate_kbps;
    if (p.contains("vbv-maxrate"))
      p.set("vbv-maxrate", std::to_string(b));
    if (p.contains("vbv-bufsize"))
      p.set("vbv-bufsize", std::to_string(cbr_buffer_kbps(b)));
  }
  return p;
}

PassSpec single_pass(const EncodeJob &job) {
  PassSpec pass;
  pass.index = 1;
  pass.purpose = PassPurpose::Single;
  pass.label = "CRF Encoding (Single Pass)";
  pass.preset = job.params.preset;

  pass.args = base_args(job);
  pass.args.insert(pass.args.end(),
                   {"-crf", fmt::format("{}", job.params.final_crf),
                    "-preset:v", pass.preset});
  ParamSet p = encoder_params(job);
  if (!p.empty())
    pass.args.insert(pass.args.end(), {"-x265-params", p.to_string()});
  append_final_output(pass.args, job);
  return pass;
}

PassSpec analysis_pass(const EncodeJob &job, const std::string &stats) {
  PassSpec pass;
  pass.index = 1;
  pass.purpose = PassPurpose::Analysis;
  pass.label = fmt::format("{} First Pass (Analysis)", mode_tag(job.mode));
  pass.preset = Config::first_pass_preset();

  ParamSet p = encoder_params(job);
  p.set("pass", "1");
  p.set("no-slow-firstpass", "1");
  p.set("stats", stats);

  pass.args = base_args(job);
  pass.args.insert(pass.args.end(), {"-x265-params", p.to_string()});
  auto rate = bitrate_args(job);
  pass.args.insert(pass.args.end(), rate.begin(), rate.end());
  /// Statistics only: no audio, subtitles or data, nothing written
  pass.args.insert(pass.args.end(),
                   {"-preset:v", pass.preset, "-an", "-sn", "-dn", "-f", "mp4",
                    "-loglevel", "warning", "/dev/null"});
  return pass;
}

PassSpec final_pass(const EncodeJob &job, const std::string &stats) {
  PassSpec pass;
  pass.index = 2;
  pass.purpose = PassPurpose::Final;
  pass.label = fmt::format("{} Second Pass (Final Encoding)", mode_tag(job.mode));
  pass.preset = job.params.preset;

  ParamSet p = encoder_params(job);
  p.set("pass", "2");
  p.set("stats", stats);

  pass.args = base_args(job);
  pass.args.insert(pass.args.end(), {"-x265-params", p.to_string()});
  auto rate = bitrate_args(job);
  pass.args.insert(pass.args.end(), rate.begin(), rate.end());
  pass.args.insert(pass.args.end(), {"-preset:v", pass.preset});
  append_final_output(pass.args, job);
  return pass;
}

bool needs_quoting(const std::string &arg) {
  if (arg.empty())
    return true;
  for (char c : arg) {
    bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                c == '_' || c == '.' || c == '/' || c == ':' || c == '=' ||
                c == ',' || c == '+';
    if (!safe)
      return true;
  }
  return false;
}

} // anonymous namespace

// **---- PassPlan ----**

PassPlan PassPlan::build(const EncodeJob &job, const std::string &stats_path) {
  PassPlan plan;
  plan.mode_ = job.mode;
  if (job.mode == EncodingMode::CRF) {
    plan.passes_.push_back(single_pass(job));
    return plan;
  }

  plan.stats_ = std::make_unique<StatsHandle>(stats_path);
  plan.passes_.push_back(analysis_pass(job, stats_path));
  plan.passes_.push_back(final_pass(job, stats_path));
  return plan;
}

void PassPlan::release_stats() {
  if (!stats_)
    return;
  stats_->remove_artifacts();
  stats_.reset();
}

std::string render_command(const std::string &binary,
                           const std::vector<std::string> &args) {
  std::string cmd = needs_quoting(binary) ? shell_quote(binary) : binary;
  for (const auto &a : args) {
    cmd += ' ';
    cmd += needs_quoting(a) ? shell_quote(a) : a;
  }
  return cmd;
}

} // namespace adaptive_encoder
