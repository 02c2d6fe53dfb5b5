/**
 * @file system.hpp
 * @brief Process, CPU and formatting utilities
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU discovery and per-stream CPU partitioning
 *
 *          - Thread pinning and the `taskset` prefix for encoder commands
 *
 *          - Shell quoting and exit status decoding for std::system
 *
 *          - Human readable time and size formatting
 *
 * @note Thread pinning uses pthread_setaffinity_np which is Linux-specific.
 */

#ifndef ADAPTIVE_ENCODER_SYSTEM_HPP
#define ADAPTIVE_ENCODER_SYSTEM_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace adaptive_encoder {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note Reads the cgroup v2 `cpu.max` quota, then the cgroup v1 CFS quota,
 *       then the cpuset, before falling back to hardware_concurrency().
 *       Inside containers hardware_concurrency() reports the host.
 */
int detect_cpu_limit();

/**
 * @brief List the CPU ids this process may run on (cgroup cpuset aware).
 * @return CPU ids, or 0..detect_cpu_limit()-1 when no cpuset is set
 */
std::vector<int> get_available_cpus();

/// Parse a cpuset list such as "0-3,8,10-11"
std::vector<int> parse_cpu_list(const std::string &text);

/**
 * @brief Number of parallel batch streams (PARALLEL_STREAMS, at most one per
 *        file and at least 1).
 * @param file_count Number of queued inputs
 */
int calculate_parallel_streams(int file_count);

/**
 * @brief Split the available CPUs into contiguous per-stream sets.
 * @param cpus Available CPU ids
 * @param streams Number of streams
 * @param per_stream CPUs per stream (0 = cpus / streams)
 */
std::vector<std::vector<int>>
partition_cpus(const std::vector<int> &cpus, int streams, int per_stream);

// **---- Thread & Process Pinning ----**

/**
 * @brief Pin the calling thread to a set of CPU cores.
 * @return true if pinning succeeded, false otherwise
 */
bool pin_thread_to_cpus(const std::vector<int> &cpu_ids);

/// "taskset -c 0,1,2 " for a non-empty set, "" otherwise
std::string taskset_prefix(const std::vector<int> &cpu_ids);

// **---- Shell ----**

/// Single-quote an argument for /bin/sh
std::string shell_quote(const std::string &arg);

/**
 * @brief Decode a std::system() status into a process exit code.
 * @return Exit code, or 128 + signal when the child was killed
 */
int decode_exit_status(int status);

// **---- Identifiers ----**

/// Random RFC 4122 version 4 UUID string
std::string generate_uuid();

// **---- Formatting ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

/// MM:SS below one hour, HH:MM:SS otherwise
std::string format_eta(double seconds);

/// Bytes as "512 B", "1.5 KB", "12.3 MB", "4.20 GB", "1.00 TB"
std::string format_size(int64_t bytes);

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_SYSTEM_HPP
