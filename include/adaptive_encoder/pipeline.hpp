/**
 * @file pipeline.hpp
 * @brief Decide-and-encode pipeline for one input
 *
 * @details EncodingPipeline runs the complete decision and encode workflow:
 *
 *          1. Validate arguments and probe the input
 *
 *          2. Measure complexity signals (sampled decode)
 *
 *          3. Resolve the content type and profile
 *
 *          4. Adapt rate-control parameters
 *
 *          5. Resolve the crop (manual or detected)
 *
 *          6. Build the pass plan and execute it
 *
 * @note Every collaborator is injected so batch streams and tests can swap
 *       the prober, encoder, crop sampler and oracle independently.
 */

#ifndef ADAPTIVE_ENCODER_PIPELINE_HPP
#define ADAPTIVE_ENCODER_PIPELINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "classifier.hpp"
#include "orchestrator.hpp"
#include "types.hpp"

namespace adaptive_encoder {

class ContentOracle;
class CropSampler;
class EncoderBackend;
class MediaAccess;
class RunContext;

/// Profile name requesting automatic selection
constexpr const char *AUTO_PROFILE = "auto";

enum class FailureKind {
  None,
  InvalidArguments,
  ProbeFailure,
  UnknownProfile,
  PassFailure
};

const char *to_string(FailureKind kind);

/**
 * @struct EncodeOverrides
 * @brief Per-run options on top of the profile.
 */
struct EncodeOverrides {
  std::string output_path; //< Empty = generated_output_path(input)
  std::string title;       //< Container title, empty = none
  std::optional<CropRegion> manual_crop;
  std::string scale; //< "w:h", empty = none
  bool denoise = false;
  bool hardware = false;
  bool use_complexity = false;
  OracleMode oracle_mode = OracleMode::Enabled;
};

/**
 * @struct EncodeResult
 */
struct EncodeResult {
  std::string output_path;
  std::string profile_name;
  AdaptedParameters params;
  int exit_status = 0;
  FailureKind failure = FailureKind::None;
  std::vector<std::string> diagnostic_tail;

  bool success() const { return failure == FailureKind::None; }
};

/**
 * @brief `<dir>/<stem>_<uuid><ext>` next to the input.
 */
std::string generated_output_path(const std::string &input_path);

/// Output path with its extension replaced by ".log"
std::string session_log_path(const std::string &output_path);

/**
 * @brief Progress inputs for the passes of one encode.
 * @note The poll interval follows the score the parameters were adapted
 *       with, so unadapted runs use the neutral score.
 */
MonitorOptions monitor_options(const MediaProbe &probe,
                               const AdaptedParameters &params);

/**
 * @class EncodingPipeline
 * @brief Probe, decide and encode one input.
 */
class EncodingPipeline {
  MediaAccess &media_;
  EncoderBackend &encoder_;
  CropSampler &crop_sampler_;
  ContentOracle *oracle_; //< Not owned; nullptr = no oracle

public:
  EncodingPipeline(MediaAccess &media, EncoderBackend &encoder,
                   CropSampler &crop_sampler, ContentOracle *oracle)
      : media_(media), encoder_(encoder), crop_sampler_(crop_sampler),
        oracle_(oracle) {}

  /**
   * @brief Run the complete decision and encode.
   * @param input Input file path
   * @param profile_or_auto Profile name, or AUTO_PROFILE
   * @param mode Rate-control mode
   * @param overrides Per-run options
   * @param ctx Run context (logging, temporaries, timings, CPU set)
   * @return Result with FailureKind::None on success
   */
  EncodeResult decide_and_encode(const std::string &input,
                                 const std::string &profile_or_auto,
                                 EncodingMode mode,
                                 const EncodeOverrides &overrides,
                                 RunContext &ctx);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_PIPELINE_HPP
