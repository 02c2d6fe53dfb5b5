/**
 * @file encoder_backend.cpp
 * @brief Encoder subprocess execution
 */

#include "adaptive_encoder/encoder_backend.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"
#include "adaptive_encoder/pass_plan.hpp"
#include "adaptive_encoder/run_context.hpp"
#include "adaptive_encoder/system.hpp"

namespace adaptive_encoder {

std::vector<std::string> read_tail_lines(const std::string &path,
                                         int max_lines) {
  std::ifstream in(path);
  if (!in || max_lines <= 0)
    return {};

  std::deque<std::string> tail;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    tail.push_back(line);
    if (static_cast<int>(tail.size()) > max_lines)
      tail.pop_front();
  }
  return {tail.begin(), tail.end()};
}

namespace {

/**
 * @class FfmpegPass
 * @brief One encoder process started with std::system on a worker thread.
 */
class FfmpegPass : public RunningPass {
  std::future<int> status_;
  std::string progress_path_;
  std::string diag_path_;
  std::streamoff progress_offset_ = 0;

public:
  FfmpegPass(std::string command, std::string progress_path,
             std::string diag_path)
      : progress_path_(std::move(progress_path)),
        diag_path_(std::move(diag_path)) {
    status_ = std::async(std::launch::async, [cmd = std::move(command)]() {
      return std::system(cmd.c_str());
    });
  }

  ~FfmpegPass() override {
    /// A std::async future blocks in its destructor; wait explicitly first
    if (status_.valid())
      status_.wait();
    std::error_code ec;
    std::filesystem::remove(progress_path_, ec);
    std::filesystem::remove(diag_path_, ec);
  }

  bool wait_for(std::chrono::milliseconds timeout) override {
    return status_.wait_for(timeout) == std::future_status::ready;
  }

  std::string read_progress() override {
    std::ifstream in(progress_path_, std::ios::binary);
    if (!in)
      return "";
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size <= progress_offset_)
      return "";

    std::string chunk(static_cast<size_t>(size - progress_offset_), '\0');
    in.seekg(progress_offset_);
    in.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<size_t>(in.gcount()));
    progress_offset_ += static_cast<std::streamoff>(chunk.size());
    return chunk;
  }

  PassOutcome outcome() override {
    PassOutcome out;
    out.exit_code = decode_exit_status(status_.get());
    out.diagnostic_tail =
        read_tail_lines(diag_path_, Config::diagnostic_tail_lines());
    return out;
  }
};

} // anonymous namespace

std::unique_ptr<RunningPass> FfmpegEncoder::start(const PassSpec &pass,
                                                  RunContext &ctx) {
  std::string progress_path =
      ctx.temp_path(fmt::format("pass{}_progress.txt", pass.index));
  std::string diag_path =
      ctx.temp_path(fmt::format("pass{}_stderr.txt", pass.index));

  /// Progress file must exist (empty) before the first read
  {
    std::ofstream touch(progress_path, std::ios::trunc);
    if (!touch) {
      ctx.log_error(fmt::format("Cannot create progress file {}",
                                progress_path));
      return nullptr;
    }
  }

  std::string cmd = taskset_prefix(ctx.cpu_set());
  cmd += shell_quote(Config::encoder_bin());
  cmd += " -nostdin -progress ";
  cmd += shell_quote(progress_path);
  cmd += " -nostats";
  for (const auto &arg : pass.args) {
    cmd += ' ';
    cmd += shell_quote(arg);
  }
  cmd += " 2> ";
  cmd += shell_quote(diag_path);

  return std::make_unique<FfmpegPass>(std::move(cmd), std::move(progress_path),
                                      std::move(diag_path));
}

} // namespace adaptive_encoder
