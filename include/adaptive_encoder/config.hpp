/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Every accessor reads its variable once; later changes to the
 *          environment are not observed.
 */

#ifndef ADAPTIVE_ENCODER_CONFIG_HPP
#define ADAPTIVE_ENCODER_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace adaptive_encoder {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  double parsed = std::strtod(val, &end);
  return (end && *end == '\0') ? parsed : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/// String value, default when unset or empty
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- EXTERNAL TOOLS ----**

/// Encoder binary (must accept ffmpeg command-line syntax with libx265)
inline const std::string &encoder_bin() {
  static std::string val = get_env_string("ENCODER_BIN", "ffmpeg");
  return val;
}

/// Directory for stats files and progress/diagnostic temporaries
inline const std::string &temp_dir() {
  static std::string val = get_env_string("TEMP_DIR", "/tmp");
  return val;
}

// **---- ENCODING ----**

/**
 * @brief x265 preset used for the analysis pass of two-pass modes
 * @note Pass 2 always uses the profile preset.
 */
inline const std::string &first_pass_preset() {
  static std::string val = get_env_string("FIRST_PASS_PRESET", "fast");
  return val;
}

// **---- CROP DETECTION ----**

/// Minimum (W-w)+(H-h) pixel delta for a crop to be accepted
inline int crop_min_threshold() {
  static int val = get_env_int("CROP_MIN_THRESHOLD", 20);
  return val;
}

/// cropdetect black level limit for SDR sources
inline int crop_limit_sdr() {
  static int val = get_env_int("CROP_LIMIT_SDR", 24);
  return val;
}

/// cropdetect black level limit for HDR (PQ) sources
inline int crop_limit_hdr() {
  static int val = get_env_int("CROP_LIMIT_HDR", 64);
  return val;
}

/// Offset from both ends of the input for the first and last samples
inline double crop_edge_skip_sec() {
  static double val = get_env_double("CROP_EDGE_SKIP_SEC", 60.0);
  return val;
}

/// Length of each cropdetect window
inline double crop_window_sec() {
  static double val = get_env_double("CROP_WINDOW_SEC", 30.0);
  return val;
}

// **---- PROGRESS ----**

/**
 * @brief Seconds without forward progress before a pass counts as stalled
 * @note A stalled pass is never cancelled; only the ETA is withheld.
 */
inline double stall_window_sec() {
  static double val = get_env_double("STALL_WINDOW_SEC", 10.0);
  return val;
}

/// Number of trailing encoder diagnostic lines kept on failure
inline int diagnostic_tail_lines() {
  static int val = get_env_int("DIAGNOSTIC_TAIL_LINES", 20);
  return val;
}

/// Render the live progress line on the console (0 = log lines only)
inline bool progress_display() {
  static bool val = (get_env_int("PROGRESS_DISPLAY", 1) != 0);
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of files encoded simultaneously in batch mode
 * @note x265 already saturates every core it is given, so the default is a
 *       single stream. 0 = one stream per THREADS_PER_STREAM block of CPUs.
 */
inline int parallel_streams() {
  static int val = get_env_int("PARALLEL_STREAMS", 1);
  return val;
}

/**
 * @brief CPUs pinned to each stream's encoder via taskset
 * @note 0 = auto-calculate as (available_cpus / parallel_streams).
 *       Total CPUs used = PARALLEL_STREAMS x THREADS_PER_STREAM.
 */
inline int threads_per_stream() {
  static int val = get_env_int("THREADS_PER_STREAM", 0);
  return val;
}

} // namespace Config
} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_CONFIG_HPP
