/**
 * @file media_probe.hpp
 * @brief Technical probing of input files
 */

#ifndef ADAPTIVE_ENCODER_MEDIA_PROBE_HPP
#define ADAPTIVE_ENCODER_MEDIA_PROBE_HPP

#include <memory>
#include <optional>
#include <string>

#include "types.hpp"

namespace adaptive_encoder {

/// Number of leading frames whose picture type is recorded
constexpr int PROBE_FRAME_TYPE_LIMIT = 1800;

/**
 * @brief Probe an input file.
 *
 * @details Reads container and stream metadata, counts audio and subtitle
 *          streams, and decodes the picture type of up to
 *          PROBE_FRAME_TYPE_LIMIT leading frames with IDCT and loop
 *          filtering disabled.
 *
 * @return The probe, or empty when the file is unreadable or has no video
 *         stream (logged as an error)
 */
std::optional<MediaProbe> probe_media(const std::string &path);

class FrameSource;

/**
 * @class MediaAccess
 * @brief Everything the decision layer reads from an input.
 * @note The pipeline depends on this seam only, so analysis can run against
 *       synthetic inputs.
 */
class MediaAccess {
public:
  virtual ~MediaAccess() = default;

  virtual std::optional<MediaProbe> probe(const std::string &path) = 0;

  /// Open a luma frame source; nullptr when the input cannot be decoded
  virtual std::unique_ptr<FrameSource> open_frames(const std::string &path) = 0;
};

/// MediaAccess over probe_media() and FrameSampler
class LibavMediaAccess : public MediaAccess {
public:
  std::optional<MediaProbe> probe(const std::string &path) override;
  std::unique_ptr<FrameSource> open_frames(const std::string &path) override;
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_MEDIA_PROBE_HPP
