/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector, one instance per encoding run
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so that progress and pass output interleave correctly.
 *       Per-run prefixes and the session log file live in RunContext.
 */

#ifndef ADAPTIVE_ENCODER_LOGGING_HPP
#define ADAPTIVE_ENCODER_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace adaptive_encoder {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global console mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(adaptive_encoder::log_mutex);             \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(adaptive_encoder::log_mutex);             \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(adaptive_encoder::log_mutex);             \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(adaptive_encoder::log_mutex);             \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(adaptive_encoder::log_mutex);             \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for the timing measurements of one run.
 * @note Each RunContext owns one, so concurrent batch streams never mix
 *       their phase timings.
 */
class TimingCollector {
  mutable std::mutex timing_mutex_;
  std::vector<TimingEntry> entries_;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   * @param prefix Prepended to every line (stream tag in batch mode)
   */
  void print_summary(const std::string &prefix = "") const;

  /// Copy of the entries recorded so far
  std::vector<TimingEntry> entries() const;
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(collector, name)                                             \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    (collector).record(#name, static_cast<long>(timer_duration_##name));       \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(collector, name) ((void)0)
#endif

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_LOGGING_HPP
