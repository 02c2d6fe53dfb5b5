/**
 * @file content_oracle.hpp
 * @brief Title-based content classification
 *
 * @details Provides:
 *
 *          - extract_title(): a title query parsed from a release-style
 *            file name, with an extraction confidence
 *
 *          - ContentOracle: pluggable classifier that labels a title
 *
 *          - KeywordOracle: the bundled oracle, scoring descriptive text
 *            against weighted keyword groups
 */

#ifndef ADAPTIVE_ENCODER_CONTENT_ORACLE_HPP
#define ADAPTIVE_ENCODER_CONTENT_ORACLE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace adaptive_encoder {

/**
 * @struct TitleQuery
 * @brief What the oracle is asked about.
 */
struct TitleQuery {
  std::string title;
  std::optional<int> year;
  bool is_series = false;
};

/**
 * @struct ExtractedTitle
 * @brief A title query plus how sure the file name parse is (0-100).
 */
struct ExtractedTitle {
  TitleQuery query;
  int confidence = 0;
};

/**
 * @brief Parse a title from a file name.
 *
 * @details Recognized shapes, in order:
 *          - `Show.Name.S01E02...`      series, confidence 85
 *          - `Movie.Name.2019.1080p...` title + year, confidence 80
 *          - `Movie Name 2019`          year at the end, confidence 75
 *          - `Name...`                  first token, confidence 40
 *          - anything else              first word, confidence 30
 *
 *          Separators (`.`, `-`, `_`) become spaces, and quality tags
 *          (2160p, 4K, UHD, 1080p, 720p, 480p, BluRay, BDRip, WEBRip, HDTV,
 *          x264, x265, HEVC) are removed.
 */
ExtractedTitle extract_title(const std::string &filename);

/**
 * @class ContentOracle
 * @brief External knowledge about a title.
 */
class ContentOracle {
public:
  virtual ~ContentOracle() = default;

  /**
   * @brief Classify a title.
   * @return A label (possibly ContentType::Unknown) or empty when the oracle
   *         could not be consulted
   */
  virtual std::optional<Classification> classify(const TitleQuery &query) = 0;
};

/**
 * @class KeywordOracle
 * @brief Offline oracle: descriptive text for well-known titles, scored by
 *        keyword groups.
 *
 * @note Weights per match: anime x10, 3D animation x10, live action x8,
 *       action x6. When live action leads and action exceeds half of it the
 *       label is action, otherwise film. Confidence is
 *       max * 100 / (total + 1) clamped to [20, 85], or 10 with no match.
 */
class KeywordOracle : public ContentOracle {
public:
  std::optional<Classification> classify(const TitleQuery &query) override;

  /// Descriptive text the oracle knows for a title (two lookups, joined)
  static std::string describe(const TitleQuery &query);

  /// Keyword scoring of free text
  static Classification score_text(const std::string &text);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_CONTENT_ORACLE_HPP
