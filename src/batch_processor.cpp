/**
 * @file batch_processor.cpp
 * @brief Parallel encoding of several inputs
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Thread pinning for CPU affinity
 *
 *          - Shared work queue for load balancing
 *
 *          - One RunContext and one set of collaborators per input
 *
 *          - Sequential summary output
 */

#include "adaptive_encoder/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"
#include "adaptive_encoder/crop_detector.hpp"
#include "adaptive_encoder/encoder_backend.hpp"
#include "adaptive_encoder/logging.hpp"
#include "adaptive_encoder/media_probe.hpp"
#include "adaptive_encoder/run_context.hpp"
#include "adaptive_encoder/system.hpp"

namespace adaptive_encoder {

namespace fs = std::filesystem;

namespace {

std::string join_cpus(const std::vector<int> &cpus) {
  std::string list;
  for (size_t i = 0; i < cpus.size(); ++i) {
    if (i > 0)
      list += ",";
    list += std::to_string(cpus[i]);
  }
  return list;
}

bool is_video_extension(std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mkv" || ext == ".ts" || ext == ".mov" ||
         ext == ".avi" || ext == ".m2ts" || ext == ".webm";
}

} // anonymous namespace

std::vector<std::string> collect_video_files(const std::string &dir) {
  std::vector<std::string> files;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_ERROR("Cannot list {}: {}", dir, ec.message());
    return files;
  }
  for (const auto &entry : it) {
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec) &&
        is_video_extension(entry.path().extension().string()))
      files.push_back(entry.path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

BatchProcessor::BatchProcessor(BatchSettings settings, ContentOracle *oracle)
    : settings_(std::move(settings)), oracle_(oracle) {}

int BatchProcessor::process(const std::vector<std::string> &input_files) {
  if (input_files.empty()) {
    LOG_WARN("No input files to encode");
    return 0;
  }

  for (const auto &file : input_files)
    work_queue_.push(file);
  total_files_ = static_cast<int>(work_queue_.size());
  files_done_.store(0);

  if (!settings_.output_dir.empty()) {
    std::error_code ec;
    fs::create_directories(settings_.output_dir, ec);
    if (ec) {
      LOG_ERROR("Cannot create output directory {}: {}", settings_.output_dir,
                ec.message());
      return total_files_;
    }
  }

  auto available_cpus = get_available_cpus();
  num_streams_ = calculate_parallel_streams(total_files_);
  auto stream_cpu_sets =
      partition_cpus(available_cpus, num_streams_, Config::threads_per_stream());

  LOG_PHASE("================== BATCH ENCODING ==================");
  LOG_INFO("Files to encode: {}", total_files_);
  LOG_INFO("Profile: {}, mode: {}", settings_.profile, to_string(settings_.mode));
  LOG_INFO("Parallel streams: {}", num_streams_);
  LOG_INFO("Available CPUs: {}", available_cpus.size());
  for (int s = 0; s < num_streams_; ++s)
    LOG_INFO("Stream {} -> CPUs [{}]", s, join_cpus(stream_cpu_sets[s]));
  LOG_PHASE("====================================================");

  auto batch_start = std::chrono::high_resolution_clock::now();

  std::vector<std::thread> streams;
  for (int i = 0; i < num_streams_; ++i)
    streams.emplace_back(&BatchProcessor::stream_worker, this, i,
                         stream_cpu_sets[i]);
  for (auto &stream : streams)
    stream.join();

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::high_resolution_clock::now() - batch_start)
                           .count();
  print_batch_summary(elapsed_sec);

  return static_cast<int>(
      std::count_if(results_.begin(), results_.end(),
                    [](const StreamResult &r) { return !r.success(); }));
}

bool BatchProcessor::get_next_file(std::string &file) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (work_queue_.empty())
    return false;
  file = work_queue_.front();
  work_queue_.pop();
  return true;
}

void BatchProcessor::stream_worker(int stream_id,
                                   const std::vector<int> &cpu_set) {
  /// Single stream keeps the console progress line and skips the prefix
  int log_stream = num_streams_ > 1 ? stream_id : -1;

  if (pin_thread_to_cpus(cpu_set)) {
    LOG_INFO("[Stream {}] Pinned to CPUs [{}]", stream_id, join_cpus(cpu_set));
  } else {
    LOG_WARN("[Stream {}] Failed to pin to CPUs", stream_id);
  }

  LibavMediaAccess media;
  FfmpegEncoder encoder;
  FfmpegCropSampler crop_sampler(cpu_set);
  EncodingPipeline pipeline(media, encoder, crop_sampler, oracle_);

  std::string file;
  while (get_next_file(file)) {
    fs::path input_path(file);
    RunContext ctx(log_stream, cpu_set);

    ctx.log_phase("----------------------------------------");
    ctx.log_info(fmt::format("Encoding: {}", input_path.filename().string()));
    ctx.log_info(fmt::format("Progress: {}/{}", files_done_.load() + 1,
                             total_files_));

    EncodeOverrides overrides = settings_.overrides;
    overrides.output_path = generated_output_path(file);
    if (!settings_.output_dir.empty())
      overrides.output_path =
          (fs::path(settings_.output_dir) /
           fs::path(overrides.output_path).filename())
              .string();

    auto start_time = std::chrono::high_resolution_clock::now();
    EncodeResult encoded = pipeline.decide_and_encode(
        file, settings_.profile, settings_.mode, overrides, ctx);

    StreamResult result;
    result.filename = input_path.filename().string();
    result.output_path = encoded.output_path;
    result.profile_name = encoded.profile_name;
    result.failure = encoded.failure;
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - start_time)
            .count());

    {
      std::lock_guard<std::mutex> lock(results_mutex_);
      results_.push_back(result);
    }
    ++files_done_;

    if (result.success()) {
      ctx.log_success(fmt::format("Completed: {} ({:.1f}s)", result.filename,
                                  result.processing_time_us / 1000000.0));
    } else {
      ctx.log_error(fmt::format("Failed: {} ({})", result.filename,
                                to_string(result.failure)));
    }
    ctx.timings().print_summary(log_stream >= 0
                                    ? fmt::format("[Stream {}] ", stream_id)
                                    : "");
  }

  LOG_INFO("[Stream {}] Finished (no more files)", stream_id);
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) {
  int total = static_cast<int>(results_.size());
  int success = 0;
  long total_time_us = 0;
  for (const auto &result : results_) {
    if (result.success())
      success++;
    total_time_us += result.processing_time_us;
  }
  int failed = total - success;
  double sum_time_sec = total_time_us / 1000000.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=============== BATCH ENCODING SUMMARY ===============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", total);
  fmt::print("{:<25} {:>25}\n", "Successful:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Parallel streams:", num_streams_);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of file times:", sum_time_sec);
  if (total > 0)
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per file:",
               sum_time_sec / total);
  fmt::print(fg(fmt::color::cyan),
             "------------------------------------------------------\n");
  for (const auto &result : results_) {
    if (result.success()) {
      fmt::print(fg(fmt::color::green), "  OK    {:<30} {}\n", result.filename,
                 result.profile_name);
    } else {
      fmt::print(fg(fmt::color::red), "  FAIL  {:<30} {}\n", result.filename,
                 to_string(result.failure));
    }
  }
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);
}

} // namespace adaptive_encoder
