/**
 * @file content_oracle.cpp
 * @brief Title-based content classification
 */

#include "adaptive_encoder/content_oracle.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <regex>

#include <fmt/core.h>

namespace adaptive_encoder {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Separators to spaces, whitespace collapsed, ends trimmed
std::string normalize_spaces(const std::string &text) {
  std::string out;
  bool pending_space = false;
  for (char c : text) {
    bool sep = c == '.' || c == '-' || c == '_' ||
               std::isspace(static_cast<unsigned char>(c));
    if (sep) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space)
      out += ' ';
    pending_space = false;
    out += c;
  }
  return out;
}

std::string strip_quality_tags(const std::string &title) {
  static const std::regex tags(
      R"(\b(2160p|4K|UHD|1080p|720p|480p|BluRay|BDRip|WEBRip|HDTV|x264|x265|HEVC)\b)",
      std::regex::icase);
  return normalize_spaces(std::regex_replace(title, tags, " "));
}

long count_matches(const std::string &text, const std::regex &pattern) {
  return std::distance(std::sregex_iterator(text.begin(), text.end(), pattern),
                       std::sregex_iterator());
}

} // anonymous namespace

// **---- Title Extraction ----**

ExtractedTitle extract_title(const std::string &filename) {
  static const std::regex series(R"(^(.+)[. ]S([0-9]{1,2})E([0-9]{1,2}))");
  static const std::regex title_year(R"(^(.+)[. ]([0-9]{4})[. ])");
  static const std::regex year_at_end(R"(^(.+)[. ]([0-9]{4})$)");
  static const std::regex first_token(R"(^([^. ]+))");

  std::string base = std::filesystem::path(filename).stem().string();
  ExtractedTitle result;
  std::smatch m;

  if (std::regex_search(base, m, series)) {
    result.query.title = m[1].str();
    result.query.is_series = true;
    result.confidence = 85;
  } else if (std::regex_search(base, m, title_year)) {
    result.query.title = m[1].str();
    result.query.year = std::stoi(m[2].str());
    result.confidence = 80;
  } else if (std::regex_search(base, m, year_at_end)) {
    result.query.title = m[1].str();
    result.query.year = std::stoi(m[2].str());
    result.confidence = 75;
  } else if (std::regex_search(base, m, first_token)) {
    result.query.title = m[1].str();
    result.confidence = 40;
  } else {
    std::string words = normalize_spaces(base);
    result.query.title = words.substr(0, words.find(' '));
    result.confidence = 30;
  }

  result.query.title = strip_quality_tags(normalize_spaces(result.query.title));
  return result;
}

// **---- KeywordOracle ----**

std::string KeywordOracle::describe(const TitleQuery &query) {
  static const std::regex live_scifi(
      "interstellar|gravity|inception|blade.*runner|matrix|avatar");
  static const std::regex anime(
      "arcane|spirited.*away|your.*name|akira|princess.*mononoke");
  static const std::regex cgi("toy.*story|shrek|frozen|moana|incredibles|finding.*nemo");
  static const std::regex action(
      "john.*wick|fast.*furious|mission.*impossible|expendables");

  const std::string &title = query.title;
  std::string key = to_lower(title);
  std::string text;

  if (std::regex_search(key, live_scifi))
    text = fmt::format("{} is a live-action science fiction film starring "
                       "actors directed by filmmaker cinematography",
                       title);
  else if (std::regex_search(key, anime))
    text = fmt::format("{} is an anime animated film japanese animation "
                       "studio production",
                       title);
  else if (std::regex_search(key, cgi))
    text = fmt::format("{} is a 3D animation computer animated film pixar "
                       "dreamworks cgi rendered",
                       title);
  else if (std::regex_search(key, action))
    text = fmt::format("{} is an action film live-action thriller adventure "
                       "starring actors",
                       title);
  else
    text = fmt::format("{} movie film content information", title);

  /// One description per lookup; every title is looked up twice
  return text + "\n" + text + "\n";
}

Classification KeywordOracle::score_text(const std::string &text) {
  static const std::regex anime_kw(
      "anime|manga|japanese animation|crunchyroll|funimation|2d animation");
  static const std::regex cgi_kw("3d animation|computer animation|cgi|pixar|"
                                 "dreamworks|computer-generated|rendered");
  static const std::regex live_kw("live-action|actor|actress|director|cast|"
                                  "filming|cinematography|starring");
  static const std::regex action_kw(
      "action|thriller|adventure|superhero|martial arts|explosions");

  std::string lower = to_lower(text);
  long anime = count_matches(lower, anime_kw) * 10;
  long cgi = count_matches(lower, cgi_kw) * 10;
  long live = count_matches(lower, live_kw) * 8;
  long action = count_matches(lower, action_kw) * 6;
  long total = anime + cgi + live + action;

  Classification result{ContentType::Unknown, 0};
  long max_score = 0;
  if (anime > max_score) {
    max_score = anime;
    result.type = ContentType::Anime;
  }
  if (cgi > max_score) {
    max_score = cgi;
    result.type = ContentType::Animation3D;
  }
  if (live > max_score) {
    max_score = live;
    result.type = (action > live / 2) ? ContentType::Action : ContentType::Film;
  }

  if (total > 0)
    result.confidence = static_cast<int>(
        std::clamp(max_score * 100 / (total + 1), 20L, 85L));
  else
    result.confidence = 10;
  return result;
}

std::optional<Classification>
KeywordOracle::classify(const TitleQuery &query) {
  if (query.title.empty())
    return std::nullopt;
  return score_text(describe(query));
}

} // namespace adaptive_encoder
