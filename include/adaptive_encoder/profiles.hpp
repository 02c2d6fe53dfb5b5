/**
 * @file profiles.hpp
 * @brief Static table of hand-tuned x265 encoding profiles
 *
 * @details Two groups of profiles share one table:
 *
 *          - Named profiles chosen explicitly (`4k`, `anime`, `3d_cgi`, ...)
 *
 *          - The `1080p_<type>` / `4k_<type>` families that automatic
 *            selection resolves to
 *
 * @note Profiles are immutable. Adaptation copies what it needs.
 */

#ifndef ADAPTIVE_ENCODER_PROFILES_HPP
#define ADAPTIVE_ENCODER_PROFILES_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace adaptive_encoder {

/**
 * @struct EncodingProfile
 * @brief Base values and x265 parameters of one profile.
 */
struct EncodingProfile {
  std::string name;
  std::string title;
  std::string preset;
  double base_crf;
  int base_bitrate_sdr; //< kbps
  int base_bitrate_hdr; //< kbps
  std::string pixel_format;
  std::string codec_profile;
  ParamSet params; //< x265-params in application order
  ContentType content_type;
};

/// Every profile, in help-output order
const std::vector<EncodingProfile> &all_profiles();

/// Lookup by exact name; nullptr when unknown
const EncodingProfile *find_profile(const std::string &name);

std::vector<std::string> profile_names();

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_PROFILES_HPP
