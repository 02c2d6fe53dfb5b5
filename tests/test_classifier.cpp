#include <gtest/gtest.h>

#include "adaptive_encoder/classifier.hpp"
#include "adaptive_encoder/content_oracle.hpp"
#include "adaptive_encoder/profiles.hpp"
#include "test_support.hpp"

using namespace adaptive_encoder;
using namespace adaptive_encoder::testing_support;

namespace {

MediaProbe probe_of(int w, int h) {
  MediaProbe p;
  p.width = w;
  p.height = h;
  p.duration_seconds = 600;
  return p;
}

TechnicalFeatures features(double grain, int motion, int w, int h) {
  TechnicalFeatures f;
  f.grain = grain;
  f.motion_level = motion;
  f.width = w;
  f.height = h;
  return f;
}

} // namespace

// **---- Merge ----**

TEST(ClassificationMerge, HighTechnicalConfidenceSkipsOracle) {
  CountingOracle oracle;
  oracle.verdict = Classification{ContentType::Anime, 85};
  ContentClassifier classifier(&oracle, nullptr);

  ComplexitySignals s;
  s.grain_level = 20; //< heavy_grain/85
  Classification c = classifier.resolve("Some.Movie.2019.1080p.mkv", s,
                                        probe_of(1920, 1080),
                                        OracleMode::Enabled);
  EXPECT_EQ(c, (Classification{ContentType::HeavyGrain, 85}));
  EXPECT_EQ(oracle.calls.load(), 0);
}

TEST(ClassificationMerge, ForcedOracleIsAlwaysAsked) {
  CountingOracle oracle;
  oracle.verdict = Classification{ContentType::Film, 60};
  ContentClassifier classifier(&oracle, nullptr);

  ComplexitySignals s;
  s.grain_level = 20;
  classifier.resolve("Some.Movie.2019.1080p.mkv", s, probe_of(1920, 1080),
                     OracleMode::Force);
  EXPECT_EQ(oracle.calls.load(), 1);
}

TEST(ClassificationMerge, DisabledOracleIsNeverAsked) {
  CountingOracle oracle;
  oracle.verdict = Classification{ContentType::Action, 90};
  ContentClassifier classifier(&oracle, nullptr);

  ComplexitySignals s;
  s.grain_level = 10; //< light_grain/70
  Classification c = classifier.resolve("Some.Movie.2019.1080p.mkv", s,
                                        probe_of(1920, 1080),
                                        OracleMode::Disabled);
  EXPECT_EQ(c.type, ContentType::LightGrain);
  EXPECT_EQ(oracle.calls.load(), 0);
}

TEST(ClassificationMerge, MoreConfidentOracleWins) {
  Classification c = merge_classification({ContentType::Film, 60},
                                           Classification{ContentType::Action, 75});
  EXPECT_EQ(c, (Classification{ContentType::Action, 75}));
}

TEST(ClassificationMerge, AgreementBoostsConfidence) {
  Classification c = merge_classification({ContentType::Film, 65},
                                           Classification{ContentType::Film, 65});
  /// min(95, (65 + 65) / 2 + 10)
  EXPECT_EQ(c, (Classification{ContentType::Film, 75}));

  Classification capped = merge_classification(
      {ContentType::Anime, 90}, Classification{ContentType::Anime, 90});
  EXPECT_EQ(capped.confidence, 95);
}

TEST(ClassificationMerge, UnknownOracleKeepsTechnical) {
  Classification c = merge_classification(
      {ContentType::Anime, 50}, Classification{ContentType::Unknown, 80});
  EXPECT_EQ(c, (Classification{ContentType::Anime, 50}));

  EXPECT_EQ(merge_classification({ContentType::Anime, 50}, std::nullopt),
            (Classification{ContentType::Anime, 50}));
}

TEST(ClassificationMerge, ConfidentOracleBeatsWeakTechnical) {
  Classification c = merge_classification(
      {ContentType::Film, 65}, Classification{ContentType::Anime, 65});
  EXPECT_EQ(c, (Classification{ContentType::Film, 65}));

  c = merge_classification({ContentType::Film, 69},
                           Classification{ContentType::Anime, 70});
  EXPECT_EQ(c, (Classification{ContentType::Anime, 70}));
}

// **---- Technical Rules ----**

TEST(TechnicalRules, OrderedRules) {
  EXPECT_EQ(classify_technical(features(0, 5, 1920, 1080)),
            (Classification{ContentType::Animation3D, 80}));
  /// Scope aspect ratio is not 3D animation
  EXPECT_EQ(classify_technical(features(0, 5, 1920, 800)).type,
            ContentType::Anime);
  EXPECT_EQ(classify_technical(features(2, 10, 1280, 720)),
            (Classification{ContentType::Anime, 70}));
  EXPECT_EQ(classify_technical(features(15, 10, 3840, 2160)),
            (Classification{ContentType::HeavyGrain, 85}));
  EXPECT_EQ(classify_technical(features(8, 10, 3840, 2160)),
            (Classification{ContentType::LightGrain, 70}));
  EXPECT_EQ(classify_technical(features(4, 25, 3840, 2160)),
            (Classification{ContentType::Action, 75}));
  EXPECT_EQ(classify_technical(features(5, 10, 3840, 2160)),
            (Classification{ContentType::Film, 75}));
}

TEST(TechnicalRules, MotionLevel) {
  EXPECT_EQ(motion_level_from_scene_rate(30), 25);
  EXPECT_EQ(motion_level_from_scene_rate(3), 5);
  EXPECT_EQ(motion_level_from_scene_rate(12), 10);
}

TEST(TechnicalRules, MissingSignalsFallBackToFileName) {
  ContentClassifier classifier(nullptr, nullptr);
  Classification c = classifier.resolve("/media/old_cartoon_collection.mkv",
                                        std::nullopt, probe_of(1440, 1080),
                                        OracleMode::Disabled);
  EXPECT_EQ(c.type, ContentType::Anime);
  EXPECT_EQ(c.confidence, FILENAME_CONFIDENCE);
}

TEST(TechnicalRules, FileNameHeuristic) {
  EXPECT_EQ(classify_by_filename("Some.Anime.mkv"), ContentType::Anime);
  EXPECT_EQ(classify_by_filename("/x/CGI_short.mp4"), ContentType::Animation3D);
  EXPECT_EQ(classify_by_filename("Sports.Final.ts"), ContentType::Action);
  EXPECT_EQ(classify_by_filename("vintage_reel.mov"), ContentType::LightGrain);
  EXPECT_EQ(classify_by_filename("holiday.mp4"), ContentType::Film);
}

TEST(TechnicalRules, DeclaredTypeRefinement) {
  EXPECT_EQ(refine_declared_type(ContentType::Anime, 61), ContentType::ClassicAnime);
  EXPECT_EQ(refine_declared_type(ContentType::Anime, 60), ContentType::Anime);
  EXPECT_EQ(refine_declared_type(ContentType::Film, 81), ContentType::HeavyGrain);
  EXPECT_EQ(refine_declared_type(ContentType::Action, 99), ContentType::Action);
}

TEST(TechnicalRules, RecommendedProfilesExist) {
  EXPECT_EQ(recommend_profile(ContentType::Anime, 1920), "1080p_anime");
  EXPECT_EQ(recommend_profile(ContentType::HeavyGrain, 3840),
            "4k_heavygrain_film");
  EXPECT_EQ(recommend_profile(ContentType::Animation3D, 3000),
            "4k_3d_animation");

  const ContentType types[] = {
      ContentType::Anime,      ContentType::ClassicAnime, ContentType::Animation3D,
      ContentType::Film,       ContentType::HeavyGrain,   ContentType::LightGrain,
      ContentType::Action,     ContentType::CleanDigital, ContentType::Mixed};
  for (ContentType t : types) {
    EXPECT_NE(find_profile(recommend_profile(t, 1920)), nullptr) << to_string(t);
    EXPECT_NE(find_profile(recommend_profile(t, 3840)), nullptr) << to_string(t);
  }
}

// **---- Title Extraction & Oracle ----**

TEST(TitleExtraction, SeriesPattern) {
  ExtractedTitle t = extract_title("/tv/Arcane.S01E03.1080p.WEBRip.x265.mkv");
  EXPECT_EQ(t.query.title, "Arcane");
  EXPECT_TRUE(t.query.is_series);
  EXPECT_EQ(t.confidence, 85);
}

TEST(TitleExtraction, TitleWithYear) {
  ExtractedTitle t = extract_title("Blade.Runner.2049.2017.2160p.UHD.BluRay.mkv");
  EXPECT_EQ(t.query.title, "Blade Runner 2049");
  ASSERT_TRUE(t.query.year.has_value());
  EXPECT_EQ(*t.query.year, 2017);
  EXPECT_EQ(t.confidence, 80);
}

TEST(TitleExtraction, GenericName) {
  ExtractedTitle t = extract_title("holiday.mp4");
  EXPECT_EQ(t.query.title, "holiday");
  EXPECT_EQ(t.confidence, 40);
}

TEST(KeywordOracle, KnownTitles) {
  KeywordOracle oracle;
  auto anime = oracle.classify({"Spirited Away", 2001, false});
  ASSERT_TRUE(anime.has_value());
  EXPECT_EQ(anime->type, ContentType::Anime);

  auto cgi = oracle.classify({"Toy Story", std::nullopt, false});
  ASSERT_TRUE(cgi.has_value());
  EXPECT_EQ(cgi->type, ContentType::Animation3D);

  auto action = oracle.classify({"John Wick", std::nullopt, false});
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->type, ContentType::Action);

  EXPECT_FALSE(oracle.classify({"", std::nullopt, false}).has_value());
}

TEST(KeywordOracle, ConfidenceBounds) {
  EXPECT_EQ(KeywordOracle::score_text("nothing relevant here"),
            (Classification{ContentType::Unknown, 10}));
  Classification c = KeywordOracle::score_text("anime anime anime anime");
  EXPECT_EQ(c.type, ContentType::Anime);
  EXPECT_GE(c.confidence, 20);
  EXPECT_LE(c.confidence, 85);
}
