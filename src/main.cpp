/**
 * @file main.cpp
 * @brief Entry point for the adaptive encoder
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: decide and encode one input
 *
 *          - Batch mode (a directory or several -i): parallel encoding with
 *            BatchProcessor
 *
 * @note Environment variables tune tools and parallelism, see config.hpp.
 */

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "adaptive_encoder/batch_processor.hpp"
#include "adaptive_encoder/content_oracle.hpp"
#include "adaptive_encoder/crop_detector.hpp"
#include "adaptive_encoder/encoder_backend.hpp"
#include "adaptive_encoder/logging.hpp"
#include "adaptive_encoder/media_probe.hpp"
#include "adaptive_encoder/pipeline.hpp"
#include "adaptive_encoder/profiles.hpp"
#include "adaptive_encoder/run_context.hpp"

using namespace adaptive_encoder;

namespace {

struct CliOptions {
  std::vector<std::string> inputs;
  std::string output;
  std::string profile = AUTO_PROFILE;
  EncodingMode mode = EncodingMode::ABR;
  EncodeOverrides overrides;
  bool help = false;
};

void print_usage() {
  fmt::print("Usage: adaptive_encoder -i <input> [options]\n\n");
  fmt::print("  -i <path>            Input file or directory (repeatable)\n");
  fmt::print("  -o <path>            Output file (single) or directory (batch)\n");
  fmt::print("  -p <profile>         Profile name or 'auto' (default: auto)\n");
  fmt::print("  -m <crf|abr|cbr>     Rate-control mode (default: abr)\n");
  fmt::print("  -t <title>           Container title metadata\n");
  fmt::print("  -c <w:h:x:y>         Manual crop, skips detection\n");
  fmt::print("  -s <w:h>             Scale after crop\n");
  fmt::print("  --denoise            Light hqdn3d grain reduction\n");
  fmt::print("  --hardware           CUDA hardware decode\n");
  fmt::print("  --use-complexity     Adapt CRF and bitrate to measured complexity\n");
  fmt::print("  --web-search         Consult the content oracle when unsure (default)\n");
  fmt::print("  --web-search-force   Always consult the content oracle\n");
  fmt::print("  --no-web-search      Never consult the content oracle\n");
  fmt::print("  -h, --help           Show this help\n\n");
  fmt::print("Profiles:\n");
  for (const auto &p : all_profiles())
    fmt::print("  {:<24} {}\n", p.name, p.title);
}

/// @return nullopt when the arguments are invalid (already reported)
std::optional<CliOptions> parse_args(int argc, char *argv[]) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> const char * {
      if (i + 1 >= argc) {
        LOG_ERROR("Missing value for {}", arg);
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--denoise") {
      opts.overrides.denoise = true;
    } else if (arg == "--hardware") {
      opts.overrides.hardware = true;
    } else if (arg == "--use-complexity") {
      opts.overrides.use_complexity = true;
    } else if (arg == "--web-search") {
      opts.overrides.oracle_mode = OracleMode::Enabled;
    } else if (arg == "--web-search-force") {
      opts.overrides.oracle_mode = OracleMode::Force;
    } else if (arg == "--no-web-search") {
      opts.overrides.oracle_mode = OracleMode::Disabled;
    } else if (arg == "-i" || arg == "-o" || arg == "-p" || arg == "-m" ||
               arg == "-t" || arg == "-c" || arg == "-s") {
      const char *v = value();
      if (!v)
        return std::nullopt;
      if (arg == "-i") {
        opts.inputs.emplace_back(v);
      } else if (arg == "-o") {
        opts.output = v;
      } else if (arg == "-p") {
        opts.profile = v;
      } else if (arg == "-m") {
        auto mode = parse_encoding_mode(v);
        if (!mode) {
          LOG_ERROR("Invalid mode '{}' (expected crf, abr or cbr)", v);
          return std::nullopt;
        }
        opts.mode = *mode;
      } else if (arg == "-t") {
        opts.overrides.title = v;
      } else if (arg == "-c") {
        auto crop = parse_crop(v);
        if (!crop) {
          LOG_ERROR("Invalid crop '{}' (expected w:h:x:y)", v);
          return std::nullopt;
        }
        opts.overrides.manual_crop = crop;
      } else {
        opts.overrides.scale = v;
      }
    } else {
      LOG_ERROR("Unknown argument: {}", arg);
      return std::nullopt;
    }
  }
  return opts;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  auto opts = parse_args(argc, argv);
  if (!opts) {
    print_usage();
    return 2;
  }
  if (opts->help) {
    print_usage();
    return 0;
  }
  if (opts->inputs.empty()) {
    LOG_ERROR("No input given");
    print_usage();
    return 2;
  }

  namespace fs = std::filesystem;
  KeywordOracle oracle;
  std::error_code ec;

  bool batch = opts->inputs.size() > 1 || fs::is_directory(opts->inputs[0], ec);
  if (batch) {
    // **---- BATCH MODE - Parallel encoding ----**

    std::vector<std::string> files;
    for (const auto &in : opts->inputs) {
      if (fs::is_directory(in, ec)) {
        auto found = collect_video_files(in);
        files.insert(files.end(), found.begin(), found.end());
      } else {
        files.push_back(in);
      }
    }
    if (files.empty()) {
      LOG_WARN("No video files found");
      return 0;
    }
    LOG_INFO("Adaptive Encoder - Batch Mode ({} files)", files.size());

    BatchSettings settings;
    settings.profile = opts->profile;
    settings.mode = opts->mode;
    settings.overrides = opts->overrides;
    settings.output_dir = opts->output;

    BatchProcessor processor(std::move(settings), &oracle);
    return processor.process(files) == 0 ? 0 : 1;
  }

  // **---- SINGLE FILE MODE ----**

  LOG_INFO("Adaptive Encoder - Single File Mode");
  LOG_INFO("Input: {}", opts->inputs[0]);

  opts->overrides.output_path = opts->output;
  LibavMediaAccess media;
  FfmpegEncoder encoder;
  FfmpegCropSampler crop_sampler;
  EncodingPipeline pipeline(media, encoder, crop_sampler, &oracle);

  RunContext ctx;
  EncodeResult result = pipeline.decide_and_encode(
      opts->inputs[0], opts->profile, opts->mode, opts->overrides, ctx);
  ctx.timings().print_summary();

  if (!result.success()) {
    LOG_ERROR("Encoding failed: {}", to_string(result.failure));
    switch (result.failure) {
    case FailureKind::InvalidArguments:
    case FailureKind::UnknownProfile:
      return 2;
    case FailureKind::PassFailure:
      return result.exit_status != 0 ? result.exit_status : 1;
    default:
      return 1;
    }
  }
  LOG_SUCCESS("Output: {}", result.output_path);
  return 0;
}
