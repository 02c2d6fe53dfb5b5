/**
 * @file run_context.cpp
 * @brief Per-run logging, naming and timing state
 */

#include "adaptive_encoder/run_context.hpp"

#include <atomic>
#include <ctime>
#include <filesystem>

#include <unistd.h>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"

namespace adaptive_encoder {

namespace {

std::atomic<int> run_counter{0};

std::string timestamp_now() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

} // anonymous namespace

RunContext::RunContext(int stream_id, std::vector<int> cpu_set)
    : run_id_(fmt::format("{}-{}", static_cast<long>(getpid()),
                          run_counter.fetch_add(1) + 1)),
      stream_id_(stream_id), cpu_set_(std::move(cpu_set)) {}

RunContext::~RunContext() { close_session_log(); }

// **---- Session Log ----**

bool RunContext::open_session_log(const std::string &path) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (session_log_.is_open())
    session_log_.close();

  session_log_.open(path, std::ios::out | std::ios::trunc);
  if (!session_log_) {
    session_log_path_.clear();
    return false;
  }
  session_log_path_ = path;
  session_log_ << fmt::format("=== Session {} started {} ===\n", run_id_,
                              timestamp_now());
  session_log_.flush();
  return true;
}

void RunContext::close_session_log() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (!session_log_.is_open())
    return;
  session_log_ << fmt::format("=== Session {} closed {} ===\n", run_id_,
                              timestamp_now());
  session_log_.close();
}

void RunContext::mirror(const char *level, const std::string &msg) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (!session_log_.is_open())
    return;
  session_log_ << fmt::format("[{}] [{}] {}\n", timestamp_now(), level, msg);
  session_log_.flush();
}

void RunContext::session_note(const std::string &msg) { mirror("NOTE", msg); }

std::string RunContext::temp_path(const std::string &suffix) const {
  std::filesystem::path dir(Config::temp_dir());
  return (dir / fmt::format("adaptive_encoder_{}_{}", run_id_, suffix))
      .string();
}

// **---- Logging Helpers ----**

std::string RunContext::prefix() const {
  return (stream_id_ >= 0) ? fmt::format("[Stream {}] ", stream_id_) : "";
}

void RunContext::log_info(const std::string &msg) {
  LOG_INFO("{}{}", prefix(), msg);
  mirror("INFO", msg);
}

void RunContext::log_warn(const std::string &msg) {
  LOG_WARN("{}{}", prefix(), msg);
  mirror("WARN", msg);
}

void RunContext::log_error(const std::string &msg) {
  LOG_ERROR("{}{}", prefix(), msg);
  mirror("ERROR", msg);
}

void RunContext::log_phase(const std::string &msg) {
  LOG_PHASE("{}{}", prefix(), msg);
  mirror("PHASE", msg);
}

void RunContext::log_success(const std::string &msg) {
  LOG_SUCCESS("{}{}", prefix(), msg);
  mirror("OK", msg);
}

} // namespace adaptive_encoder
