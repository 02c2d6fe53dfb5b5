/**
 * @file batch_processor.hpp
 * @brief Parallel encoding of several inputs
 *
 * @details The BatchProcessor spreads a queue of inputs over worker streams:
 *
 *          - PARALLEL_STREAMS worker threads (one per stream, at most one
 *            per file)
 *
 *          - Each stream owns a contiguous CPU set of THREADS_PER_STREAM
 *            cores; the worker thread and its encoder (via taskset) are
 *            pinned to it
 *
 *          - Each input gets its own RunContext, so session logs, stats
 *            files and timings never mix between streams
 *
 *          - Logging is stream-prefixed for clarity
 *
 * @attention CPU Allocation Example (8 CPUs, 2 streams, 4 threads each):
 *       Stream 0 -> CPUs [0,1,2,3]
 *
 *       Stream 1 -> CPUs [4,5,6,7]
 */

#ifndef ADAPTIVE_ENCODER_BATCH_PROCESSOR_HPP
#define ADAPTIVE_ENCODER_BATCH_PROCESSOR_HPP

#include <atomic>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "pipeline.hpp"

namespace adaptive_encoder {

class ContentOracle;

/**
 * @struct BatchSettings
 * @brief Options applied to every input of the batch.
 */
struct BatchSettings {
  std::string profile = AUTO_PROFILE;
  EncodingMode mode = EncodingMode::ABR;
  EncodeOverrides overrides; //< output_path is ignored, outputs are generated
  std::string output_dir;    //< Empty = next to each input
};

/**
 * @struct StreamResult
 * @brief Result from encoding a single input in a stream.
 */
struct StreamResult {
  std::string filename;    //< Input filename
  std::string output_path;
  std::string profile_name;
  FailureKind failure = FailureKind::None;
  long processing_time_us = 0;

  bool success() const { return failure == FailureKind::None; }
};

/// Video files directly inside a directory, sorted by name
std::vector<std::string> collect_video_files(const std::string &dir);

/**
 * @class BatchProcessor
 * @brief Encodes a list of inputs on parallel, CPU-isolated streams.
 */
class BatchProcessor {
public:
  /**
   * @param settings Options shared by every input
   * @param oracle Shared content oracle (nullptr = none); must tolerate
   *               concurrent calls
   */
  BatchProcessor(BatchSettings settings, ContentOracle *oracle);

  /**
   * @brief Encode every input.
   * @return Number of failures (0 = all succeeded)
   */
  int process(const std::vector<std::string> &input_files);

private:
  BatchSettings settings_;
  ContentOracle *oracle_;
  int num_streams_ = 1;

  std::mutex queue_mutex_;             //< Protects work queue
  std::queue<std::string> work_queue_; //< Files to encode
  std::atomic<int> files_done_{0};
  int total_files_ = 0;

  std::mutex results_mutex_;          //< Protects results vector
  std::vector<StreamResult> results_;

  bool get_next_file(std::string &file);

  void stream_worker(int stream_id, const std::vector<int> &cpu_set);

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_BATCH_PROCESSOR_HPP
