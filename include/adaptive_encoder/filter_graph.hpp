/**
 * @file filter_graph.hpp
 * @brief Video filter graph and stream map assembly
 *
 * @details The graph is fixed-order and additive:
 *
 *          [0:v] -> denoise -> crop -> scale -> [v]
 *
 *          Each stage is inserted only when requested. With no stage at all
 *          the video stream is mapped directly.
 */

#ifndef ADAPTIVE_ENCODER_FILTER_GRAPH_HPP
#define ADAPTIVE_ENCODER_FILTER_GRAPH_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace adaptive_encoder {

/// Light uniform grain reduction applied before encoding
constexpr const char *DENOISE_FILTER = "hqdn3d=1:1:2:2";

/**
 * @struct FilterOptions
 * @brief Requested stages.
 */
struct FilterOptions {
  bool denoise = false;
  bool hardware = false;           //< CUDA decode: frames need hwdownload
  std::optional<CropRegion> crop;  //< Manual or detected, already resolved
  std::string scale;               //< "w:h" for the scale filter, empty = none
};

/**
 * @brief Build the filter_complex graph.
 * @return Graph whose output label is [v], or empty when no stage applies
 */
std::string build_filter_graph(const FilterOptions &opts);

/**
 * @brief Arguments selecting and filtering the video stream.
 * @return {"-filter_complex", graph, "-map", "[v]"} or {"-map", "0:v:0"}
 */
std::vector<std::string> video_args(const FilterOptions &opts);

/**
 * @brief Pass-through arguments for every non-video stream.
 * @details Audio and subtitle streams are copied by index, then chapters and
 *          container metadata are carried over.
 */
std::vector<std::string> stream_map_args(int audio_streams,
                                         int subtitle_streams);

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_FILTER_GRAPH_HPP
