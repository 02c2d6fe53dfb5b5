/**
 * @file classifier.cpp
 * @brief Content type resolution
 */

#include "adaptive_encoder/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

#include <fmt/core.h>

#include "adaptive_encoder/content_oracle.hpp"
#include "adaptive_encoder/logging.hpp"
#include "adaptive_encoder/run_context.hpp"

namespace adaptive_encoder {

// **---- Technical Rules ----**

int motion_level_from_scene_rate(double cuts_per_minute) {
  if (cuts_per_minute > 20)
    return 25;
  if (cuts_per_minute < 4)
    return 5;
  return 10;
}

TechnicalFeatures make_features(const ComplexitySignals &signals,
                                const MediaProbe &probe) {
  TechnicalFeatures f;
  f.grain = signals.grain_level;
  f.motion_level = motion_level_from_scene_rate(signals.scene_change_rate);
  f.width = probe.width;
  f.height = probe.height;
  return f;
}

Classification classify_technical(const TechnicalFeatures &f) {
  if (f.grain == 0 && f.width >= 1920 && f.height >= 1080 &&
      f.motion_level < 20) {
    /// Two-decimal truncated aspect ratio; ultra-wide scope is live action
    double aspect = std::floor(f.width * 100.0 / f.height) / 100.0;
    if (aspect >= 1.33 && aspect <= 1.90)
      return {ContentType::Animation3D, 80};
  }

  if (f.grain <= 3 && f.motion_level < 15 && f.width <= 1920)
    return {ContentType::Anime, 70};

  if (f.grain >= 15)
    return {ContentType::HeavyGrain, 85};
  if (f.grain > 5 && f.grain < 15)
    return {ContentType::LightGrain, 70};
  if (f.motion_level > 20)
    return {ContentType::Action, 75};
  return {ContentType::Film, 75};
}

Classification merge_classification(const Classification &tech,
                                    const std::optional<Classification> &oracle) {
  if (!oracle)
    return tech;

  const bool known = oracle->type != ContentType::Unknown;
  if (known && oracle->confidence > tech.confidence)
    return *oracle;

  if (oracle->type == tech.type)
    return {tech.type, std::min(95, (tech.confidence + oracle->confidence) / 2 + 10)};

  if (known && oracle->confidence >= 70 && tech.confidence < 70)
    return *oracle;

  return tech;
}

ContentType classify_by_filename(const std::string &path) {
  std::string name = std::filesystem::path(path).filename().string();
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto has = [&name](const char *word) {
    return name.find(word) != std::string::npos;
  };

  if (has("anime") || has("animation") || has("cartoon"))
    return ContentType::Anime;
  if (has("cgi") || has("3d"))
    return ContentType::Animation3D;
  if (has("action") || has("sports"))
    return ContentType::Action;
  if (has("classic") || has("vintage") || has("old"))
    return ContentType::LightGrain;
  return ContentType::Film;
}

ContentType refine_declared_type(ContentType declared, double score) {
  if (declared == ContentType::Anime && score > 60)
    return ContentType::ClassicAnime;
  if (declared == ContentType::Film && score > 80)
    return ContentType::HeavyGrain;
  return declared;
}

std::string recommend_profile(ContentType type, int width) {
  const char *res = width >= 3000 ? "4k" : "1080p";
  switch (type) {
  case ContentType::HeavyGrain:
    return fmt::format("{}_heavygrain_film", res);
  case ContentType::Unknown:
  case ContentType::Mixed:
    return width >= 3000 ? "4k_mixed_detail" : "1080p_film";
  default:
    return fmt::format("{}_{}", res, to_string(type));
  }
}

// **---- ContentClassifier ----**

void ContentClassifier::info(const std::string &msg) const {
  if (ctx_)
    ctx_->log_info(msg);
  else
    LOG_INFO("{}", msg);
}

void ContentClassifier::warn(const std::string &msg) const {
  if (ctx_)
    ctx_->log_warn(msg);
  else
    LOG_WARN("{}", msg);
}

std::optional<Classification>
ContentClassifier::consult_oracle(const std::string &path,
                                  OracleMode mode) const {
  if (mode == OracleMode::Disabled)
    return std::nullopt;
  if (!oracle_) {
    warn("No content oracle available, using technical classification");
    return std::nullopt;
  }

  ExtractedTitle extracted = extract_title(path);
  info(fmt::format("Extracted title: '{}' (Year: {}, Confidence: {}%)",
                   extracted.query.title,
                   extracted.query.year ? std::to_string(*extracted.query.year)
                                        : std::string("unknown"),
                   extracted.confidence));

  if (extracted.query.title.size() < 3) {
    warn(fmt::format("Title extraction failed or too short: '{}'",
                     extracted.query.title));
    return std::nullopt;
  }
  if (extracted.confidence < MIN_TITLE_CONFIDENCE && mode != OracleMode::Force) {
    warn(fmt::format("Title extraction confidence too low: {}%",
                     extracted.confidence));
    return std::nullopt;
  }

  auto verdict = oracle_->classify(extracted.query);
  if (!verdict) {
    warn("Content oracle failed, using technical classification");
    return std::nullopt;
  }
  info(fmt::format("Oracle classification: {} ({}% confidence)",
                   to_string(verdict->type), verdict->confidence));
  return verdict;
}

Classification
ContentClassifier::resolve(const std::string &path,
                           const std::optional<ComplexitySignals> &signals,
                           const MediaProbe &probe, OracleMode mode) const {
  Classification tech;
  if (signals) {
    tech = classify_technical(make_features(*signals, probe));
  } else {
    tech = {classify_by_filename(path), FILENAME_CONFIDENCE};
    warn(fmt::format("Technical analysis unavailable, file name suggests {}",
                     to_string(tech.type)));
  }
  info(fmt::format("Technical classification: {} ({}% confidence)",
                   to_string(tech.type), tech.confidence));

  if (tech.confidence >= ORACLE_SKIP_CONFIDENCE && mode != OracleMode::Force) {
    info("High technical confidence, skipping oracle");
    return tech;
  }

  Classification merged = merge_classification(tech, consult_oracle(path, mode));
  if (!(merged == tech))
    info(fmt::format("Final classification: {} ({}% confidence)",
                     to_string(merged.type), merged.confidence));
  return merged;
}

} // namespace adaptive_encoder
