/**
 * @file pass_plan.hpp
 * @brief Mode-specific pass plans and encoder argument assembly
 *
 * @details Each EncodingMode maps to a fixed plan:
 *
 *          - CRF: one pass, quality driven, no bitrate anywhere
 *
 *          - ABR: analysis pass (first-pass preset, stats written, null
 *            output) then the final pass (profile preset, stats read)
 *
 *          - CBR: ABR plus minrate = maxrate = B and bufsize = 1.5 x B on
 *            both passes
 *
 * @attention The two-pass stats handle is owned by the plan. Its files are
 *            deleted when the plan releases it or is destroyed, so they
 *            never outlive the run, whether it succeeded or failed.
 */

#ifndef ADAPTIVE_ENCODER_PASS_PLAN_HPP
#define ADAPTIVE_ENCODER_PASS_PLAN_HPP

#include <memory>
#include <string>
#include <vector>

#include "filter_graph.hpp"
#include "types.hpp"

namespace adaptive_encoder {

/// Role of one pass in its plan
enum class PassPurpose { Single, Analysis, Final };

const char *to_string(PassPurpose purpose);

/**
 * @struct EncodeJob
 * @brief Everything the plan needs to know about one encode.
 */
struct EncodeJob {
  std::string input_path;
  std::string output_path;
  std::string title; //< Container title metadata, empty = none
  AdaptedParameters params;
  EncodingMode mode = EncodingMode::ABR;
  FilterOptions filters;
  int audio_streams = 0;
  int subtitle_streams = 0;
};

/**
 * @struct PassSpec
 * @brief One encoder invocation.
 */
struct PassSpec {
  int index = 1; //< 1-based position in the plan
  PassPurpose purpose = PassPurpose::Single;
  std::string label;             //< Human readable, used for progress output
  std::string preset;
  std::vector<std::string> args; //< Encoder arguments, binary excluded
};

/**
 * @class StatsHandle
 * @brief Inter-pass statistics file of a two-pass plan.
 * @note x265 writes `<path>` and companions such as `<path>.cutree`, so
 *       removal deletes every file starting with the path.
 */
class StatsHandle {
  std::string path_;
  bool released_ = false;

public:
  explicit StatsHandle(std::string path) : path_(std::move(path)) {}
  ~StatsHandle();

  StatsHandle(const StatsHandle &) = delete;
  StatsHandle &operator=(const StatsHandle &) = delete;

  const std::string &path() const { return path_; }

  /**
   * @brief Delete `<path>*` (best effort).
   * @return Number of files removed
   */
  int remove_artifacts();
};

/// x265 VBV buffer for CBR: round(1.5 x bitrate)
int cbr_buffer_kbps(int bitrate_kbps);

/**
 * @class PassPlan
 * @brief Ordered passes of one encode plus the stats handle they share.
 */
class PassPlan {
  EncodingMode mode_ = EncodingMode::CRF;
  std::vector<PassSpec> passes_;
  std::unique_ptr<StatsHandle> stats_;

public:
  /**
   * @brief Build the plan for a job.
   * @param job Encode description
   * @param stats_path Run-scoped stats file path (unused for CRF)
   */
  static PassPlan build(const EncodeJob &job, const std::string &stats_path);

  EncodingMode mode() const { return mode_; }
  const std::vector<PassSpec> &passes() const { return passes_; }

  /// nullptr for single-pass plans
  const StatsHandle *stats() const { return stats_.get(); }

  /// Delete the stats artifacts now (no-op without a handle)
  void release_stats();
};

/**
 * @brief Printable command line for the session log.
 * @note Arguments containing shell metacharacters are single-quoted.
 */
std::string render_command(const std::string &binary,
                           const std::vector<std::string> &args);

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_PASS_PLAN_HPP
