/**
 * @file progress.hpp
 * @brief Encoder progress parsing, estimation and live display
 *
 * @details The encoder writes key=value blocks to its `-progress` file, each
 *          block closed by `progress=continue` or `progress=end`. The monitor
 *          polls the feed on its own thread while a pass runs:
 *
 *          - ProgressParser turns raw chunks into ProgressSample records
 *
 *          - estimate_progress derives completion, ETA and projected size
 *
 *          - StallTracker withholds the ETA while the fraction stands still
 *
 *          - render_progress_line draws the single-line console display
 *
 * @note The poll interval grows with resolution, CBR and content
 *       complexity, since those passes advance more slowly.
 */

#ifndef ADAPTIVE_ENCODER_PROGRESS_HPP
#define ADAPTIVE_ENCODER_PROGRESS_HPP

#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "encoder_backend.hpp"
#include "types.hpp"

namespace adaptive_encoder {

class RunContext;

/**
 * @struct ProgressSample
 * @brief One completed block of the progress feed.
 */
struct ProgressSample {
  double wall_clock_sec = 0.0; //< Monitor clock when the block was parsed
  int64_t out_time_us = 0;     //< Encoded media position
  int64_t frame = 0;
  double fps = 0.0;
  double speed = 0.0;      //< Realtime multiple, 0 when unknown
  int64_t total_size = 0;  //< Bytes written so far
  bool ended = false;      //< progress=end
};

enum class ProgressMethod { Unknown, Time, Frame };

const char *to_string(ProgressMethod method);

/**
 * @struct ProgressEstimate
 */
struct ProgressEstimate {
  double fraction = 0.0; //< [0, 1]
  ProgressMethod method = ProgressMethod::Unknown;
  std::optional<double> eta_seconds;
  std::optional<int64_t> estimated_size_bytes;
};

/**
 * @struct ProgressTarget
 * @brief What a finished pass amounts to.
 */
struct ProgressTarget {
  double duration_sec = 0.0;
  int64_t total_frames = 0; //< 0 = unknown, time-based only
};

/**
 * @class ProgressParser
 * @brief Incremental parser for the key=value progress feed.
 * @note Lines split across chunks are carried over to the next feed().
 */
class ProgressParser {
  std::string partial_;
  ProgressSample current_;
  bool has_time_us_ = false; //< out_time_ms is only used until out_time_us appears

  void apply(const std::string &key, const std::string &value);

public:
  /**
   * @brief Consume a chunk of the feed.
   * @param chunk Raw text, may start or end mid-line
   * @param wall_clock_sec Timestamp given to blocks completed by this chunk
   * @return Blocks completed by this chunk, oldest first
   */
  std::vector<ProgressSample> feed(const std::string &chunk,
                                   double wall_clock_sec);
};

/**
 * @brief Estimate completion of a pass.
 * @details The frame ratio is preferred when it lies in (0, 1]; otherwise
 *          the encoded time ratio is used. The ETA extrapolates elapsed time
 *          once past 1%, is replaced by the fps-based figure when that is
 *          plausible, is divided by speed, and is dropped beyond 24 hours.
 * @param elapsed_sec Wall time since the pass started
 */
ProgressEstimate estimate_progress(const ProgressSample &sample,
                                   const ProgressTarget &target,
                                   double elapsed_sec);

/**
 * @brief Poll interval in seconds, within [1, 5].
 */
int update_interval(int width, int height, EncodingMode mode,
                    double complexity_score);

/**
 * @class StallTracker
 * @brief Flags a pass whose fraction has not moved for `window` seconds.
 */
class StallTracker {
  double window_;
  double last_fraction_ = -1.0;
  double last_change_ = 0.0;

public:
  explicit StallTracker(double window_sec) : window_(window_sec) {}

  /// @return true while stalled
  bool update(double fraction, double now_sec);
};

/// `\r\033[K<label>: [#####     ] 42.0% | ETA: ... | Estimated size: ...`
std::string render_progress_line(const std::string &label,
                                 const ProgressEstimate &estimate);

/**
 * @class ProgressMonitor
 * @brief Drives one RunningPass to completion while reporting progress.
 */
class ProgressMonitor {
public:
  struct Settings {
    ProgressTarget target;
    int interval_ms = 1000;
    std::string label;
    bool display = true; //< Live console line; false = log every 10%
    std::function<void(const ProgressEstimate &)> on_update;
  };

  /**
   * @brief Monitor the pass on a worker thread.
   * @return Future resolving to the pass outcome once the encoder exits
   * @attention `pass` must outlive the returned future.
   */
  static std::future<PassOutcome> launch(RunningPass &pass, Settings settings,
                                         RunContext *ctx);

  /// Same loop on the calling thread
  static PassOutcome run(RunningPass &pass, const Settings &settings,
                         RunContext *ctx);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_PROGRESS_HPP
