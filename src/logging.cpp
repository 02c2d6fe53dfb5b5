/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 */

#include "adaptive_encoder/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace adaptive_encoder {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR -----**

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  entries_.push_back({name, us});
}

void TimingCollector::print_summary(const std::string &prefix) const {
  std::vector<TimingEntry> snapshot = entries();
  if (snapshot.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "{}================== TIMING SUMMARY ==================\n",
             prefix);
  fmt::print("{}{:<30} {:>20}\n", prefix, "Phase", "Time (us) [sec]");
  fmt::print("{}{:-<30} {:-<20}\n", prefix, "", "");

  for (const auto &e : snapshot) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{}{:<30} {:>10} [{:.2f}s]\n", prefix, e.name, e.microseconds,
               seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "{}====================================================\n",
             prefix);
  std::fflush(stdout);
}

std::vector<TimingEntry> TimingCollector::entries() const {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  return entries_;
}

} // namespace adaptive_encoder
