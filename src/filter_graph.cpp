/**
 * @file filter_graph.cpp
 * @brief Video filter graph and stream map assembly
 */

#include "adaptive_encoder/filter_graph.hpp"

#include <fmt/core.h>

namespace adaptive_encoder {

std::string build_filter_graph(const FilterOptions &opts) {
  std::vector<std::string> stages;
  if (opts.denoise)
    stages.push_back(opts.hardware ? fmt::format("hwdownload,{}", DENOISE_FILTER)
                                   : std::string(DENOISE_FILTER));
  if (opts.crop)
    stages.push_back(fmt::format("crop={}", opts.crop->to_string()));
  if (!opts.scale.empty())
    stages.push_back(fmt::format("scale={}", opts.scale));

  if (stages.empty())
    return "";

  /// Chain labels: [0:v]a[f0];[f0]b[f1];...;[fN]z[v]
  std::string graph;
  std::string input = "0:v";
  for (size_t i = 0; i < stages.size(); ++i) {
    bool last = (i + 1 == stages.size());
    std::string output = last ? "v" : fmt::format("f{}", i);
    if (!graph.empty())
      graph += ";";
    graph += fmt::format("[{}]{}[{}]", input, stages[i], output);
    input = output;
  }
  return graph;
}

std::vector<std::string> video_args(const FilterOptions &opts) {
  std::string graph = build_filter_graph(opts);
  if (graph.empty())
    return {"-map", "0:v:0"};
  return {"-filter_complex", graph, "-map", "[v]"};
}

std::vector<std::string> stream_map_args(int audio_streams,
                                         int subtitle_streams) {
  std::vector<std::string> args;
  for (int i = 0; i < audio_streams; ++i) {
    args.insert(args.end(), {"-map", fmt::format("0:a:{}", i),
                             fmt::format("-c:a:{}", i), "copy"});
  }
  for (int i = 0; i < subtitle_streams; ++i) {
    args.insert(args.end(), {"-map", fmt::format("0:s:{}", i),
                             fmt::format("-c:s:{}", i), "copy"});
  }
  args.insert(args.end(), {"-map_chapters", "0", "-map_metadata", "0"});
  return args;
}

} // namespace adaptive_encoder
