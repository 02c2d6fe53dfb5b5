/**
 * @file test_support.hpp
 * @brief In-memory doubles for the encoder, media access, crop sampler and
 *        content oracle
 */

#ifndef ADAPTIVE_ENCODER_TEST_SUPPORT_HPP
#define ADAPTIVE_ENCODER_TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "adaptive_encoder/content_oracle.hpp"
#include "adaptive_encoder/crop_detector.hpp"
#include "adaptive_encoder/encoder_backend.hpp"
#include "adaptive_encoder/frame_sampler.hpp"
#include "adaptive_encoder/media_probe.hpp"
#include "adaptive_encoder/pass_plan.hpp"

namespace adaptive_encoder {
namespace testing_support {

/**
 * @class ScriptedPass
 * @brief RunningPass that hands out progress chunks, one per poll, then
 *        exits with a fixed code.
 */
class ScriptedPass : public RunningPass {
  std::vector<std::string> chunks_;
  size_t next_ = 0;
  int exit_code_;
  std::vector<std::string> tail_;

public:
  ScriptedPass(std::vector<std::string> chunks, int exit_code,
               std::vector<std::string> tail = {})
      : chunks_(std::move(chunks)), exit_code_(exit_code),
        tail_(std::move(tail)) {}

  bool wait_for(std::chrono::milliseconds) override {
    return next_ >= chunks_.size();
  }

  std::string read_progress() override {
    if (next_ >= chunks_.size())
      return "";
    return chunks_[next_++];
  }

  PassOutcome outcome() override { return {exit_code_, tail_}; }
};

/**
 * @class FakeEncoder
 * @brief Records every started pass; exit code chosen per pass index.
 */
class FakeEncoder : public EncoderBackend {
public:
  std::map<int, int> exit_codes; //< pass index -> exit code (default 0)
  std::vector<PassSpec> started;
  std::vector<std::string> progress = {
      "frame=10\nout_time_us=5000000\nprogress=continue\n",
      "frame=20\nout_time_us=10000000\nprogress=end\n"};

  std::unique_ptr<RunningPass> start(const PassSpec &pass,
                                     RunContext &) override {
    started.push_back(pass);
    auto it = exit_codes.find(pass.index);
    int code = it == exit_codes.end() ? 0 : it->second;
    std::vector<std::string> tail;
    if (code != 0)
      tail = {"x265 [error]: stats file could not be written",
              "Conversion failed!"};
    return std::make_unique<ScriptedPass>(progress, code, tail);
  }
};

/**
 * @class SyntheticFrames
 * @brief FrameSource returning the same generated frame everywhere.
 */
class SyntheticFrames : public FrameSource {
  double duration_;
  LumaFrame frame_;

public:
  SyntheticFrames(double duration, LumaFrame frame)
      : duration_(duration), frame_(std::move(frame)) {}

  double duration() const override { return duration_; }

  std::optional<LumaFrame> frame_at(double seconds) override {
    if (seconds > duration_)
      return std::nullopt;
    return frame_;
  }

  bool scan(double start, double end, double step,
            const FrameCallback &callback) override {
    for (double t = start; t < end; t += step)
      callback(t, frame_);
    return true;
  }
};

/**
 * @class TimedFrames
 * @brief FrameSource with per-timestamp frames; records every seek.
 */
class TimedFrames : public FrameSource {
  double duration_;
  LumaFrame fallback_;

public:
  std::map<double, LumaFrame> frames; //< exact timestamp -> frame
  std::vector<double> requested;

  TimedFrames(double duration, LumaFrame fallback)
      : duration_(duration), fallback_(std::move(fallback)) {}

  double duration() const override { return duration_; }

  std::optional<LumaFrame> frame_at(double seconds) override {
    requested.push_back(seconds);
    if (seconds > duration_)
      return std::nullopt;
    auto it = frames.find(seconds);
    return it == frames.end() ? fallback_ : it->second;
  }

  bool scan(double start, double end, double step,
            const FrameCallback &callback) override {
    for (double t = start; t < end; t += step)
      callback(t, fallback_);
    return true;
  }
};

/// Alternating dark pixels: low mean luma, strong pixel-level noise
inline LumaFrame dark_noisy_frame(int w, int h) {
  LumaFrame f(w, h);
  for (int y = 0; y < h; ++y)
    for (int x = 0; x < w; ++x)
      f.at(x, y) = ((x + y) % 2) ? 50 : 10;
  return f;
}

/// Vertical bars of alternating brightness: strong edges, no noise
inline LumaFrame striped_frame(int w, int h, int period) {
  LumaFrame f(w, h);
  for (int y = 0; y < h; ++y)
    for (int x = 0; x < w; ++x)
      f.at(x, y) = ((x / period) % 2) ? 200 : 40;
  return f;
}

/**
 * @class FakeMedia
 * @brief MediaAccess returning a fixed probe and optional frames.
 */
class FakeMedia : public MediaAccess {
public:
  std::optional<MediaProbe> probe_result;
  bool frames_available = false;
  LumaFrame frame = LumaFrame(64, 48, 128);

  std::optional<MediaProbe> probe(const std::string &path) override {
    if (!probe_result)
      return std::nullopt;
    MediaProbe p = *probe_result;
    p.path = path;
    return p;
  }

  std::unique_ptr<FrameSource> open_frames(const std::string &) override {
    if (!frames_available || !probe_result)
      return nullptr;
    return std::make_unique<SyntheticFrames>(probe_result->duration_seconds,
                                             frame);
  }
};

/**
 * @class FakeCropSampler
 * @brief Returns scripted readings for successive windows.
 */
class FakeCropSampler : public CropSampler {
public:
  std::vector<std::vector<CropRegion>> windows;
  std::vector<double> starts;
  std::vector<int> limits;

  std::vector<CropRegion> sample(const std::string &, double start, double,
                                 int limit) override {
    size_t i = starts.size();
    starts.push_back(start);
    limits.push_back(limit);
    return i < windows.size() ? windows[i] : std::vector<CropRegion>{};
  }
};

/**
 * @class CountingOracle
 * @brief Fixed verdict; counts how often it was asked.
 */
class CountingOracle : public ContentOracle {
public:
  std::optional<Classification> verdict;
  std::atomic<int> calls{0};

  std::optional<Classification> classify(const TitleQuery &) override {
    ++calls;
    return verdict;
  }
};

/**
 * @class TempDir
 * @brief Unique directory under the system temp dir, removed on destruction.
 */
class TempDir {
  std::filesystem::path path_;

public:
  explicit TempDir(const std::string &tag) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("adaptive_encoder_test_" + tag + "_" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string file(const std::string &name, const std::string &content = "x") {
    std::string p = (path_ / name).string();
    std::ofstream(p) << content;
    return p;
  }
  std::string path(const std::string &name) const {
    return (path_ / name).string();
  }
  const std::filesystem::path &dir() const { return path_; }
};

inline bool contains(const std::vector<std::string> &args,
                     const std::string &value) {
  for (const auto &a : args)
    if (a == value)
      return true;
  return false;
}

/// Argument following the first occurrence of flag, "" when absent
inline std::string arg_after(const std::vector<std::string> &args,
                             const std::string &flag) {
  for (size_t i = 0; i + 1 < args.size(); ++i)
    if (args[i] == flag)
      return args[i + 1];
  return "";
}

} // namespace testing_support
} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_TEST_SUPPORT_HPP
