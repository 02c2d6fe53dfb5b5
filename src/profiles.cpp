/**
 * @file profiles.cpp
 * @brief Static table of hand-tuned x265 encoding profiles
 */

#include "adaptive_encoder/profiles.hpp"

namespace adaptive_encoder {

namespace {

constexpr const char *PIX_FMT = "yuv420p10le";
constexpr const char *CODEC_PROFILE = "main10";

// **---- Parameter Sets ----**

ParamSet general_4k_params() {
  return {{"sao", "0"},          {"bframes", "8"},       {"b-adapt", "2"},
          {"ref", "4"},          {"psy-rd", "1.5"},      {"psy-rdoq", "1.0"},
          {"aq-mode", "2"},      {"aq-strength", "0.9"}, {"deblock", "-1,-1"},
          {"rc-lookahead", "40"}, {"ctu", "32"},         {"rd", "4"},
          {"rdoq-level", "2"},   {"qcomp", "0.70"},      {"weightb", "1"},
          {"weightp", "1"},      {"cutree", "1"},        {"me", "umh"},
          {"subme", "3"}};
}

ParamSet heavy_grain_params() {
  return {{"selective-sao", "2"}, {"deblock", "-1,-1"},
          {"aq-mode", "3"},       {"psy-rd", "0.8"},
          {"psy-rdoq", "1.0"},    {"rskip", "2"},
          {"rskip-edge-threshold", "2"}, {"bframes", "5"},
          {"b-adapt", "2"},       {"ref", "6"},
          {"rc-lookahead", "60"}, {"ctu", "32"},
          {"rd", "4"},            {"rdoq-level", "2"},
          {"qcomp", "0.75"},      {"vbv-maxrate", "12000"},
          {"vbv-bufsize", "20000"}, {"keyint", "240"},
          {"min-keyint", "24"},   {"me", "umh"},
          {"subme", "7"},         {"merange", "57"}};
}

ParamSet cgi_params() {
  return {{"limit-sao", "1"},     {"deblock", "1,1"},
          {"aq-mode", "3"},       {"aq-strength", "0.9"},
          {"psy-rd", "1.6"},      {"psy-rdoq", "1.5"},
          {"rskip", "2"},         {"rskip-edge-threshold", "2"},
          {"bframes", "8"},       {"b-adapt", "2"},
          {"ref", "5"},           {"rc-lookahead", "60"},
          {"ctu", "32"},          {"rd", "4"},
          {"rdoq-level", "2"},    {"qcomp", "0.75"},
          {"weightb", "1"},       {"weightp", "1"},
          {"cutree", "1"},        {"vbv-maxrate", "12000"},
          {"vbv-bufsize", "22000"}, {"keyint", "240"},
          {"min-keyint", "24"},   {"me", "umh"},
          {"subme", "7"},         {"merange", "57"}};
}

ParamSet complex_3d_params() {
  return {{"sao", "0"},           {"deblock", "1,1"},
          {"aq-mode", "3"},       {"aq-strength", "1.0"},
          {"psy-rd", "2.0"},      {"psy-rdoq", "2.5"},
          {"rskip", "2"},         {"rskip-edge-threshold", "2"},
          {"bframes", "8"},       {"b-adapt", "2"},
          {"ref", "6"},           {"rc-lookahead", "60"},
          {"ctu", "32"},          {"rd", "4"},
          {"rdoq-level", "2"},    {"qcomp", "0.75"},
          {"weightb", "1"},       {"weightp", "1"},
          {"cutree", "1"},        {"vbv-maxrate", "25000"},
          {"vbv-bufsize", "50000"}, {"keyint", "240"},
          {"min-keyint", "24"},   {"me", "hex"},
          {"subme", "6"},         {"merange", "57"}};
}

ParamSet anime_params() {
  return {{"limit-sao", "1"},     {"deblock", "1,1"},
          {"aq-mode", "3"},       {"aq-strength", "0.8"},
          {"psy-rd", "1.1"},      {"psy-rdoq", "1.0"},
          {"rskip", "2"},         {"rskip-edge-threshold", "2"},
          {"bframes", "5"},       {"b-adapt", "2"},
          {"ref", "6"},           {"rc-lookahead", "80"},
          {"ctu", "32"},          {"rd", "4"},
          {"rdoq-level", "2"},    {"qcomp", "0.75"},
          {"vbv-maxrate", "10000"}, {"vbv-bufsize", "18000"},
          {"keyint", "240"},      {"min-keyint", "24"},
          {"me", "hex"},          {"subme", "6"},
          {"merange", "57"}};
}

ParamSet classic_anime_params() {
  ParamSet p = anime_params();
  p.set("deblock", "0,0");
  p.set("psy-rd", "0.9");
  p.set("rc-lookahead", "50");
  p.set("subme", "5");
  return p;
}

ParamSet film_params() {
  return {{"aq-mode", "2"},       {"aq-strength", "1.0"},
          {"psy-rd", "1.0"},      {"psy-rdoq", "1.0"},
          {"bframes", "6"},       {"b-adapt", "2"},
          {"ref", "4"},           {"rc-lookahead", "40"},
          {"ctu", "32"},          {"rd", "4"},
          {"rdoq-level", "2"},    {"qcomp", "0.70"},
          {"deblock", "-1,-1"},   {"weightb", "1"},
          {"weightp", "1"},       {"cutree", "1"},
          {"keyint", "240"},      {"min-keyint", "24"},
          {"me", "umh"},          {"subme", "5"},
          {"merange", "57"}};
}

/// Family profiles leave VBV to the rate-control mode
ParamSet without_vbv(ParamSet p) {
  p.erase("vbv-maxrate");
  p.erase("vbv-bufsize");
  return p;
}

ParamSet light_grain_params() {
  ParamSet p = film_params();
  p.set("aq-mode", "3");
  p.set("aq-strength", "0.9");
  p.set("psy-rd", "1.3");
  p.set("psy-rdoq", "1.2");
  return p;
}

ParamSet action_params() {
  ParamSet p = film_params();
  p.set("aq-mode", "3");
  p.set("bframes", "4");
  p.set("rc-lookahead", "60");
  p.set("subme", "7");
  return p;
}

ParamSet clean_digital_params() {
  ParamSet p = without_vbv(cgi_params());
  p.set("deblock", "0,0");
  p.set("psy-rd", "1.0");
  p.set("aq-strength", "0.8");
  return p;
}

EncodingProfile make(const char *name, const char *title, double crf, int sdr,
                     int hdr, ParamSet params, ContentType type) {
  return {name, title, "slow", crf, sdr, hdr, PIX_FMT, CODEC_PROFILE,
          std::move(params), type};
}

std::vector<EncodingProfile> build_table() {
  std::vector<EncodingProfile> t;

  // **---- Named Profiles ----**

  t.push_back(make("4k", "4K general preset", 22, 12000, 15000,
                   general_4k_params(), ContentType::Mixed));
  t.push_back(make("4k_heavy_grain", "4K heavy grain (consider using --denoise)",
                   21, 12000, 15000, heavy_grain_params(),
                   ContentType::HeavyGrain));
  t.push_back(make("3d_cgi", "3D CGI (Pixar-like)", 22, 12000, 15000,
                   cgi_params(), ContentType::Animation3D));
  t.push_back(make("3d_complex", "3D complex content (Arcane-like)", 21, 12000,
                   15000, complex_3d_params(), ContentType::Animation3D));
  t.push_back(make("anime", "Anime", 23, 12000, 15000, anime_params(),
                   ContentType::Anime));
  t.push_back(make("classic_anime", "Classic 90s Anime with finer details", 22,
                   12000, 15000, classic_anime_params(),
                   ContentType::ClassicAnime));
  t.push_back(make("film", "Live-action film", 19, 4500, 5500, film_params(),
                   ContentType::Film));

  // **---- 1080p Family ----**

  t.push_back(make("1080p_anime", "1080p anime", 23, 3500, 4500,
                   without_vbv(anime_params()), ContentType::Anime));
  t.push_back(make("1080p_classic_anime", "1080p classic anime", 22, 4000, 5000,
                   without_vbv(classic_anime_params()),
                   ContentType::ClassicAnime));
  t.push_back(make("1080p_3d_animation", "1080p 3D animation", 21, 5000, 6000,
                   without_vbv(cgi_params()), ContentType::Animation3D));
  t.push_back(make("1080p_film", "1080p film", 19, 4500, 5500, film_params(),
                   ContentType::Film));
  t.push_back(make("1080p_heavygrain_film", "1080p heavy grain film", 20, 6000,
                   7500, without_vbv(heavy_grain_params()),
                   ContentType::HeavyGrain));
  t.push_back(make("1080p_light_grain", "1080p light grain", 20, 5000, 6000,
                   light_grain_params(), ContentType::LightGrain));
  t.push_back(make("1080p_action", "1080p action", 20, 6000, 7500,
                   action_params(), ContentType::Action));
  t.push_back(make("1080p_clean_digital", "1080p clean digital", 21, 3500, 4500,
                   clean_digital_params(), ContentType::CleanDigital));

  // **---- 4K Family ----**

  t.push_back(make("4k_anime", "4K anime", 23, 9000, 11000,
                   without_vbv(anime_params()), ContentType::Anime));
  t.push_back(make("4k_classic_anime", "4K classic anime", 22, 10000, 12000,
                   without_vbv(classic_anime_params()),
                   ContentType::ClassicAnime));
  t.push_back(make("4k_3d_animation", "4K 3D animation", 22, 12000, 15000,
                   without_vbv(cgi_params()), ContentType::Animation3D));
  t.push_back(make("4k_film", "4K film", 20, 12000, 15000, film_params(),
                   ContentType::Film));
  t.push_back(make("4k_heavygrain_film", "4K heavy grain film", 21, 15000,
                   18000, without_vbv(heavy_grain_params()),
                   ContentType::HeavyGrain));
  t.push_back(make("4k_light_grain", "4K light grain", 21, 12000, 15000,
                   light_grain_params(), ContentType::LightGrain));
  t.push_back(make("4k_action", "4K action", 21, 14000, 17000, action_params(),
                   ContentType::Action));
  t.push_back(make("4k_clean_digital", "4K clean digital", 22, 9000, 11000,
                   clean_digital_params(), ContentType::CleanDigital));
  t.push_back(make("4k_mixed_detail", "4K mixed detail", 22, 12000, 15000,
                   general_4k_params(), ContentType::Mixed));
  return t;
}

} // anonymous namespace

const std::vector<EncodingProfile> &all_profiles() {
  static const std::vector<EncodingProfile> table = build_table();
  return table;
}

const EncodingProfile *find_profile(const std::string &name) {
  for (const auto &p : all_profiles()) {
    if (p.name == name)
      return &p;
  }
  return nullptr;
}

std::vector<std::string> profile_names() {
  std::vector<std::string> names;
  for (const auto &p : all_profiles())
    names.push_back(p.name);
  return names;
}

} // namespace adaptive_encoder
