/**
 * @file system.cpp
 * @brief Process, CPU and formatting utilities implementation
 */

#include "adaptive_encoder/system.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <string>
#include <thread>

#include <pthread.h>
#include <sched.h>
#include <sys/wait.h>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"

namespace adaptive_encoder {

// **---- Internal Helpers ----**

namespace {

long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val = -1;
  f >> val;
  return f ? val : -1;
}

std::vector<int> read_cpuset_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return {};
  std::string line;
  std::getline(f, line);
  return parse_cpu_list(line);
}

/// Cpuset of this process (cgroup v2 first, then v1)
std::vector<int> cgroup_cpuset() {
  auto cpus = read_cpuset_file("/sys/fs/cgroup/cpuset.cpus.effective");
  if (cpus.empty())
    cpus = read_cpuset_file("/sys/fs/cgroup/cpuset/cpuset.cpus");
  return cpus;
}

/// CFS quota in whole CPUs (rounded up), or -1 when unlimited
int cgroup_quota_cpus() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (f) {
    std::string quota_str, period_str;
    f >> quota_str >> period_str;
    if (quota_str != "max" && !period_str.empty()) {
      char *end = nullptr;
      long quota = std::strtol(quota_str.c_str(), &end, 10);
      long period = std::strtol(period_str.c_str(), &end, 10);
      if (quota > 0 && period > 0)
        return static_cast<int>((quota + period - 1) / period);
    }
  }

  long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  if (quota > 0 && period > 0)
    return static_cast<int>((quota + period - 1) / period);
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

std::vector<int> parse_cpu_list(const std::string &text) {
  std::vector<int> cpus;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t comma = text.find(',', pos);
    if (comma == std::string::npos)
      comma = text.size();
    std::string item = text.substr(pos, comma - pos);
    pos = comma + 1;

    int first = 0;
    int last = 0;
    if (std::sscanf(item.c_str(), "%d-%d", &first, &last) == 2) {
      for (int cpu = first; cpu <= last; ++cpu)
        cpus.push_back(cpu);
    } else if (std::sscanf(item.c_str(), "%d", &first) == 1) {
      cpus.push_back(first);
    }
  }
  return cpus;
}

int detect_cpu_limit() {
  int limit = cgroup_quota_cpus();
  int cpuset_count = static_cast<int>(cgroup_cpuset().size());

  /// A cpuset wider than the quota still bounds scheduling; use the larger
  if (cpuset_count > limit)
    limit = cpuset_count;
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());
  if (limit <= 0)
    limit = 4;
  return std::min(limit, 256);
}

std::vector<int> get_available_cpus() {
  auto cpus = cgroup_cpuset();
  if (cpus.empty()) {
    int limit = detect_cpu_limit();
    for (int i = 0; i < limit; ++i)
      cpus.push_back(i);
  }
  return cpus;
}

int calculate_parallel_streams(int file_count) {
  int configured = Config::parallel_streams();
  int streams = configured;

  /// 0 = one stream per THREADS_PER_STREAM block
  if (configured <= 0) {
    int per_stream = std::max(1, Config::threads_per_stream());
    streams = detect_cpu_limit() / per_stream;
  }
  streams = std::min(streams, std::max(1, file_count));
  return std::max(1, streams);
}

std::vector<std::vector<int>>
partition_cpus(const std::vector<int> &cpus, int streams, int per_stream) {
  std::vector<std::vector<int>> sets(static_cast<size_t>(std::max(1, streams)));
  if (cpus.empty())
    return sets;

  int count = static_cast<int>(cpus.size());
  int n = static_cast<int>(sets.size());
  int width = per_stream > 0 ? per_stream : std::max(1, count / n);

  for (int s = 0; s < n; ++s) {
    for (int i = 0; i < width; ++i) {
      /// Wrap around when the request exceeds the available CPUs
      sets[s].push_back(cpus[(s * width + i) % count]);
    }
    std::sort(sets[s].begin(), sets[s].end());
    sets[s].erase(std::unique(sets[s].begin(), sets[s].end()), sets[s].end());
  }
  return sets;
}

// **---- Thread & Process Pinning ----**

bool pin_thread_to_cpus(const std::vector<int> &cpu_ids) {
  if (cpu_ids.empty())
    return false;

  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  for (int cpu_id : cpu_ids)
    CPU_SET(cpu_id, &cpuset);

  return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) ==
         0;
}

std::string taskset_prefix(const std::vector<int> &cpu_ids) {
  if (cpu_ids.empty())
    return "";
  std::string cpu_list;
  for (size_t i = 0; i < cpu_ids.size(); ++i) {
    if (i > 0)
      cpu_list += ",";
    cpu_list += std::to_string(cpu_ids[i]);
  }
  return fmt::format("taskset -c {} ", cpu_list);
}

// **---- Shell ----**

std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

int decode_exit_status(int status) {
  if (status == -1)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return (status >> 8) & 0xFF;
}

// **---- Identifiers ----**

std::string generate_uuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();

  /// Version 4, variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32,
                     (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                     lo & 0xFFFFFFFFFFFFULL);
}

// **---- Formatting ----**

std::string format_time(double seconds) {
  long total = static_cast<long>(std::max(0.0, seconds));
  return fmt::format("{:02d}:{:02d}:{:02d}", total / 3600, (total % 3600) / 60,
                     total % 60);
}

std::string format_eta(double seconds) {
  long total = static_cast<long>(std::max(0.0, seconds));
  if (total >= 3600)
    return format_time(seconds);
  return fmt::format("{:02d}:{:02d}", total / 60, total % 60);
}

std::string format_size(int64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  if (bytes < 1024)
    return fmt::format("{} B", bytes);

  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  return unit >= 3 ? fmt::format("{:.2f} {}", value, units[unit])
                   : fmt::format("{:.1f} {}", value, units[unit]);
}

} // namespace adaptive_encoder
