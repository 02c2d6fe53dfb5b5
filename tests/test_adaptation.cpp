#include <gtest/gtest.h>

#include "adaptive_encoder/adaptation.hpp"
#include "adaptive_encoder/classifier.hpp"
#include "adaptive_encoder/profiles.hpp"

using namespace adaptive_encoder;

namespace {

const EncodingProfile &film() {
  const EncodingProfile *p = find_profile("film");
  EXPECT_NE(p, nullptr);
  return *p;
}

} // namespace

TEST(Adaptation, FilmRefinedToHeavyGrainScenario) {
  ContentType type = refine_declared_type(ContentType::Film, 85);
  EXPECT_EQ(type, ContentType::HeavyGrain);

  AdaptedParameters p = adapt(film(), 62, ContentType::HeavyGrain, false);
  EXPECT_DOUBLE_EQ(p.final_crf, 17.6);
  EXPECT_EQ(p.final_bitrate_kbps, 6030);
  EXPECT_EQ(p.content_type, ContentType::HeavyGrain);
  EXPECT_DOUBLE_EQ(p.complexity_score, 62);
  EXPECT_FALSE(p.is_hdr);
}

TEST(Adaptation, HdrSelectsHdrBaseBeforeModifiers) {
  AdaptedParameters p = adapt(film(), 50, ContentType::Film, true);
  /// 19 + 2, neutral score, film modifier 0
  EXPECT_DOUBLE_EQ(p.final_crf, 21.0);
  /// 5500 x 1.0 x 1.0
  EXPECT_EQ(p.final_bitrate_kbps, 5500);
  EXPECT_TRUE(p.is_hdr);
  EXPECT_EQ(p.encoder_params.get("colorprim"), std::string("bt2020"));
  EXPECT_EQ(p.encoder_params.get("transfer"), std::string("smpte2084"));
  EXPECT_EQ(p.encoder_params.get("colormatrix"), std::string("bt2020nc"));
  EXPECT_EQ(p.encoder_params.get("hdr10_opt"), std::string("1"));
}

TEST(Adaptation, SdrCarriesNoHdrParameters) {
  AdaptedParameters p = adapt(film(), 50, ContentType::Film, false);
  EXPECT_FALSE(p.encoder_params.contains("colorprim"));
  EXPECT_FALSE(p.encoder_params.contains("hdr10_opt"));
  EXPECT_EQ(p.final_bitrate_kbps, 4500);
}

TEST(Adaptation, CrfAlwaysWithinRange) {
  const ContentType types[] = {
      ContentType::Anime,       ContentType::ClassicAnime, ContentType::Animation3D,
      ContentType::Film,        ContentType::HeavyGrain,   ContentType::LightGrain,
      ContentType::Action,      ContentType::CleanDigital, ContentType::Mixed};
  for (double base = 0; base <= 60; base += 7.5) {
    for (double score = 10; score <= 100; score += 5) {
      for (ContentType t : types) {
        double crf = adapt_crf(base, score, t);
        EXPECT_GE(crf, 15.0);
        EXPECT_LE(crf, 28.0);
      }
    }
  }
}

TEST(Adaptation, CrfRoundedToOneDecimal) {
  /// 20 + 0.2 - 0.3
  EXPECT_NEAR(adapt_crf(20, 56, ContentType::Anime), 19.9, 1e-9);
  /// 18 - 0.8 - 1.1 = 16.1
  EXPECT_NEAR(adapt_crf(18, 72, ContentType::HeavyGrain), 16.1, 1e-9);
}

TEST(Adaptation, BitrateNonDecreasingInScore) {
  const ContentType types[] = {ContentType::Anime, ContentType::Film,
                               ContentType::HeavyGrain, ContentType::CleanDigital};
  for (ContentType t : types) {
    int previous = 0;
    for (double score = 10; score <= 100; score += 0.5) {
      int b = adapt_bitrate(4500, score, t);
      EXPECT_GE(b, previous) << "score " << score;
      previous = b;
    }
  }
}

TEST(Adaptation, BitrateIsNotClamped) {
  /// 18000 x 1.3 x 1.25
  EXPECT_EQ(adapt_bitrate(18000, 100, ContentType::HeavyGrain), 29250);
}

TEST(Adaptation, ModifierTables) {
  EXPECT_DOUBLE_EQ(crf_modifier(ContentType::ClassicAnime), 0.5);
  EXPECT_DOUBLE_EQ(crf_modifier(ContentType::Animation3D), -0.4);
  EXPECT_DOUBLE_EQ(crf_modifier(ContentType::Film), 0.0);
  EXPECT_DOUBLE_EQ(bitrate_modifier(ContentType::CleanDigital), 0.80);
  EXPECT_DOUBLE_EQ(bitrate_modifier(ContentType::Mixed), 1.0);
  EXPECT_DOUBLE_EQ(complexity_factor(50), 1.0);
}

TEST(Adaptation, IsDeterministic) {
  const EncodingProfile *p = find_profile("1080p_action");
  ASSERT_NE(p, nullptr);
  AdaptedParameters a = adapt(*p, 73.4, ContentType::Action, true);
  AdaptedParameters b = adapt(*p, 73.4, ContentType::Action, true);
  EXPECT_EQ(a.final_crf, b.final_crf);
  EXPECT_EQ(a.final_bitrate_kbps, b.final_bitrate_kbps);
  EXPECT_EQ(a.encoder_params.to_string(), b.encoder_params.to_string());
}

TEST(Adaptation, BaseParametersKeepProfileValues) {
  AdaptedParameters sdr = base_parameters(film(), false);
  EXPECT_DOUBLE_EQ(sdr.final_crf, 19.0);
  EXPECT_EQ(sdr.final_bitrate_kbps, 4500);
  EXPECT_EQ(sdr.preset, film().preset);

  AdaptedParameters hdr = base_parameters(film(), true);
  EXPECT_DOUBLE_EQ(hdr.final_crf, 21.0);
  EXPECT_EQ(hdr.final_bitrate_kbps, 5500);
  EXPECT_TRUE(hdr.encoder_params.contains("hdr10_opt"));
}
