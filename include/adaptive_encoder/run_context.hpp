/**
 * @file run_context.hpp
 * @brief Per-run logging, naming and timing state
 *
 * @details One RunContext is created for every input that is encoded. It
 *          carries everything that would otherwise be process-global:
 *
 *          - a unique run id (`<pid>-<counter>`) used to namespace stats
 *            files and temporaries
 *
 *          - the `[Stream N]` console prefix in batch mode
 *
 *          - the session log file written next to the output
 *
 *          - the TimingCollector for the run's phases
 *
 *          - the CPU set the encoder is pinned to
 *
 * @note Log methods are safe to call from the progress monitor thread.
 */

#ifndef ADAPTIVE_ENCODER_RUN_CONTEXT_HPP
#define ADAPTIVE_ENCODER_RUN_CONTEXT_HPP

#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "logging.hpp"

namespace adaptive_encoder {

class RunContext {
  std::string run_id_;
  int stream_id_;           //< Stream ID for log prefixing (-1 = no prefix)
  std::vector<int> cpu_set_; //< CPUs for taskset (empty = no pinning)

  std::mutex session_mutex_;
  std::ofstream session_log_;
  std::string session_log_path_;

  TimingCollector timings_;

  std::string prefix() const;
  void mirror(const char *level, const std::string &msg);

public:
  /**
   * @brief Create a context with a fresh run id.
   * @param stream_id Stream ID for log prefixing (-1 = no prefix, default)
   * @param cpu_set CPU cores the encoder is pinned to (empty = no pinning)
   */
  explicit RunContext(int stream_id = -1, std::vector<int> cpu_set = {});
  ~RunContext();

  RunContext(const RunContext &) = delete;
  RunContext &operator=(const RunContext &) = delete;

  const std::string &run_id() const { return run_id_; }
  int stream_id() const { return stream_id_; }
  const std::vector<int> &cpu_set() const { return cpu_set_; }
  TimingCollector &timings() { return timings_; }

  /**
   * @brief Open (truncate) the session log file.
   * @return false if the file cannot be created; console logging continues
   */
  bool open_session_log(const std::string &path);
  void close_session_log();
  const std::string &session_log_path() const { return session_log_path_; }

  /**
   * @brief Path of a run-scoped temporary in TEMP_DIR.
   * @param suffix Distinguishes temporaries within the run ("stats", ...)
   */
  std::string temp_path(const std::string &suffix) const;

  // **---- Logging ----**

  void log_info(const std::string &msg);
  void log_warn(const std::string &msg);
  void log_error(const std::string &msg);
  void log_phase(const std::string &msg);
  void log_success(const std::string &msg);

  /// Write to the session log only (commands, parameter dumps)
  void session_note(const std::string &msg);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_RUN_CONTEXT_HPP
