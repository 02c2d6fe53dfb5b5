/**
 * @file encoder_backend.hpp
 * @brief Encoder subprocess execution
 *
 * @details The orchestrator treats the encoder as opaque: it starts a pass,
 *          reads a line-oriented progress feed while it runs, and collects
 *          the exit status plus the tail of its diagnostic output.
 *
 *          FfmpegEncoder runs the encoder binary through std::system inside a
 *          std::async task:
 *
 *          - `-progress <file> -nostats` provides the key=value progress feed
 *
 *          - stderr is redirected to a diagnostics file
 *
 *          - `taskset -c` pins the encoder to the run's CPU set
 *
 * @note Both temporaries are namespaced by the run id and removed when the
 *       pass object is destroyed.
 */

#ifndef ADAPTIVE_ENCODER_ENCODER_BACKEND_HPP
#define ADAPTIVE_ENCODER_ENCODER_BACKEND_HPP

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_encoder {

class RunContext;
struct PassSpec;

/**
 * @struct PassOutcome
 * @brief Result of one finished encoder invocation.
 */
struct PassOutcome {
  int exit_code = -1;
  std::vector<std::string> diagnostic_tail; //< Last DIAGNOSTIC_TAIL_LINES lines
};

/**
 * @class RunningPass
 * @brief Handle on an encoder invocation in flight.
 */
class RunningPass {
public:
  virtual ~RunningPass() = default;

  /**
   * @brief Wait up to timeout for the encoder to exit.
   * @return true once the encoder has exited
   */
  virtual bool wait_for(std::chrono::milliseconds timeout) = 0;

  /// Progress text written since the previous call (may end mid-line)
  virtual std::string read_progress() = 0;

  /// Block until exit; valid once per pass
  virtual PassOutcome outcome() = 0;
};

/**
 * @class EncoderBackend
 * @brief Starts encoder passes.
 */
class EncoderBackend {
public:
  virtual ~EncoderBackend() = default;

  /**
   * @brief Launch one pass.
   * @return The running pass, or nullptr if it could not be started
   */
  virtual std::unique_ptr<RunningPass> start(const PassSpec &pass,
                                             RunContext &ctx) = 0;
};

/**
 * @class FfmpegEncoder
 * @brief EncoderBackend running Config::encoder_bin().
 */
class FfmpegEncoder : public EncoderBackend {
public:
  std::unique_ptr<RunningPass> start(const PassSpec &pass,
                                     RunContext &ctx) override;
};

/// Last max_lines lines of a text file (empty if unreadable)
std::vector<std::string> read_tail_lines(const std::string &path,
                                         int max_lines);

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_ENCODER_BACKEND_HPP
