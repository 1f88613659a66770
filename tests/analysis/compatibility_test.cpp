/**
 * @file compatibility_test.cpp
 * @brief Tests for compatibility scoring, key adjacency and the score matrix.
 */

#include "analysis/compatibility.h"

#include <gtest/gtest.h>

#include "test_support/track_builder.h"

namespace dynamix {
namespace {

using test::makeTrack;

// ============================================================================
// Sub-scores
// ============================================================================

TEST(TempoSubscoreTest, TwoPointsPerBpm) {
  EXPECT_DOUBLE_EQ(tempoSubscore(128.0, 128.0), 100.0);
  EXPECT_DOUBLE_EQ(tempoSubscore(128.0, 130.0), 96.0);
  EXPECT_DOUBLE_EQ(tempoSubscore(130.0, 128.0), 96.0);
}

TEST(TempoSubscoreTest, ClampedAtZero) {
  EXPECT_DOUBLE_EQ(tempoSubscore(90.0, 140.0), 0.0);
  EXPECT_DOUBLE_EQ(tempoSubscore(100.0, 150.0), 0.0);
}

TEST(KeySubscoreTest, IdenticalSameRootOther) {
  MusicalKey c_major{PitchClass::C, KeyMode::Major};
  MusicalKey c_minor{PitchClass::C, KeyMode::Minor};
  MusicalKey g_major{PitchClass::G, KeyMode::Major};
  EXPECT_DOUBLE_EQ(keySubscore(c_major, c_major), 100.0);
  EXPECT_DOUBLE_EQ(keySubscore(c_major, c_minor), 80.0);
  EXPECT_DOUBLE_EQ(keySubscore(c_major, g_major), 50.0);
}

TEST(KeySubscoreTest, EnharmonicKeysAreIdentical) {
  MusicalKey a;
  MusicalKey b;
  ASSERT_TRUE(parseKey("C# minor", a));
  ASSERT_TRUE(parseKey("Db minor", b));
  EXPECT_DOUBLE_EQ(keySubscore(a, b), 100.0);
}

TEST(EnergySubscoreTest, RelativeDifference) {
  EXPECT_NEAR(energySubscore(0.25, 0.26), 100.0 - 100.0 * 0.01 / 0.26, 1e-9);
  EXPECT_DOUBLE_EQ(energySubscore(0.0, 0.5), 0.0);
  EXPECT_DOUBLE_EQ(energySubscore(0.4, 0.4), 100.0);
}

TEST(EnergySubscoreTest, BothSilentIsFullScore) {
  EXPECT_DOUBLE_EQ(energySubscore(0.0, 0.0), 100.0);
}

// ============================================================================
// scoreCompatibility
// ============================================================================

TEST(ScoreCompatibilityTest, CloseTempoSameKey) {
  TrackFeatureSet a = makeTrack("a", 128.0, "A minor", 0.25);
  TrackFeatureSet b = makeTrack("b", 130.0, "A minor", 0.26);
  CompatibilityScore score;
  ASSERT_EQ(scoreCompatibility(a, b, score), DjError::OK);
  EXPECT_DOUBLE_EQ(score.tempo, 96.0);
  EXPECT_DOUBLE_EQ(score.key, 100.0);
  EXPECT_NEAR(score.energy, 96.1538, 1e-4);
  EXPECT_NEAR(score.overall, 97.246, 1e-3);
  EXPECT_DOUBLE_EQ(score.tempo_difference, 2.0);
}

TEST(ScoreCompatibilityTest, CloseTempoSameMajorKey) {
  CompatibilityScore score;
  ASSERT_EQ(scoreCompatibility(makeTrack("a", 128.0, "C major", 0.50),
                               makeTrack("b", 130.0, "C major", 0.52), score),
            DjError::OK);
  EXPECT_DOUBLE_EQ(score.tempo, 96.0);
  EXPECT_DOUBLE_EQ(score.key, 100.0);
  EXPECT_NEAR(score.energy, 96.15, 0.01);
  EXPECT_NEAR(score.overall, 97.25, 0.01);
}

TEST(ScoreCompatibilityTest, SelfScoreIsPerfect) {
  TrackFeatureSet a = makeTrack("a", 124.0, "F major", 0.3);
  CompatibilityScore score;
  ASSERT_EQ(scoreCompatibility(a, a, score), DjError::OK);
  EXPECT_DOUBLE_EQ(score.overall, 100.0);
}

TEST(ScoreCompatibilityTest, ScoresStayInRange) {
  const double tempos[] = {60.0, 100.0, 128.0, 174.0};
  const char* keys[] = {"C major", "C minor", "F# major", "A minor"};
  const double energies[] = {0.0, 0.05, 0.3, 1.0};
  for (double ta : tempos) {
    for (double tb : tempos) {
      for (size_t k = 0; k < 4; ++k) {
        TrackFeatureSet a = makeTrack("a", ta, keys[k], energies[k]);
        TrackFeatureSet b = makeTrack("b", tb, keys[3 - k], energies[(k + 1) % 4]);
        CompatibilityScore s;
        ASSERT_EQ(scoreCompatibility(a, b, s), DjError::OK);
        for (double v : {s.tempo, s.key, s.energy, s.overall}) {
          EXPECT_GE(v, 0.0);
          EXPECT_LE(v, 100.0);
        }
      }
    }
  }
}

TEST(ScoreCompatibilityTest, IsSymmetric) {
  TrackFeatureSet a = makeTrack("a", 120.0, "D minor", 0.2);
  TrackFeatureSet b = makeTrack("b", 126.0, "F major", 0.35);
  CompatibilityScore ab;
  CompatibilityScore ba;
  ASSERT_EQ(scoreCompatibility(a, b, ab), DjError::OK);
  ASSERT_EQ(scoreCompatibility(b, a, ba), DjError::OK);
  EXPECT_DOUBLE_EQ(ab.overall, ba.overall);
}

TEST(ScoreCompatibilityTest, RejectsInvalidTracks) {
  TrackFeatureSet good = makeTrack("a", 120.0, "C", 0.2);
  CompatibilityScore score;
  score.overall = 42.0;
  EXPECT_EQ(scoreCompatibility(good, makeTrack("b", 120.0, "C", 0.2, 0.0), score),
            DjError::InvalidDuration);
  EXPECT_EQ(scoreCompatibility(makeTrack("b", -1.0, "C", 0.2), good, score),
            DjError::InvalidTempo);
  EXPECT_DOUBLE_EQ(score.overall, 42.0);  // untouched on error
}

// ============================================================================
// Key adjacency
// ============================================================================

TEST(CompatibleRootsTest, FourthFifthRelative) {
  auto roots = compatibleRoots(PitchClass::C);
  EXPECT_EQ(roots[0], PitchClass::C);
  EXPECT_EQ(roots[1], PitchClass::F);
  EXPECT_EQ(roots[2], PitchClass::G);
  EXPECT_EQ(roots[3], PitchClass::A);
}

TEST(CompatibleRootsTest, WrapsAroundOctave) {
  EXPECT_TRUE(areRootsCompatible(PitchClass::A, PitchClass::D));
  EXPECT_TRUE(areRootsCompatible(PitchClass::A, PitchClass::E));
  EXPECT_TRUE(areRootsCompatible(PitchClass::A, PitchClass::Fs));
  EXPECT_FALSE(areRootsCompatible(PitchClass::A, PitchClass::C));
  EXPECT_FALSE(areRootsCompatible(PitchClass::C, PitchClass::Cs));
}

TEST(CompatibleKeysTest, MajorIncludesRelativeMinor) {
  auto keys = compatibleKeys({PitchClass::C, KeyMode::Major});
  ASSERT_EQ(keys.size(), 4u);
  EXPECT_EQ(keyName(keys[0]), "C major");
  EXPECT_EQ(keyName(keys[1]), "F major");
  EXPECT_EQ(keyName(keys[2]), "G major");
  EXPECT_EQ(keyName(keys[3]), "A minor");
}

TEST(CompatibleKeysTest, MinorIncludesRelativeMajor) {
  auto keys = compatibleKeys({PitchClass::A, KeyMode::Minor});
  ASSERT_EQ(keys.size(), 4u);
  EXPECT_EQ(keyName(keys[1]), "D minor");
  EXPECT_EQ(keyName(keys[2]), "E minor");
  EXPECT_EQ(keyName(keys[3]), "C major");
}

// ============================================================================
// Ratings and advice
// ============================================================================

TEST(CompatibilityRatingTest, Thresholds) {
  EXPECT_EQ(rateCompatibility(80.0), CompatibilityRating::Excellent);
  EXPECT_EQ(rateCompatibility(79.9), CompatibilityRating::Good);
  EXPECT_EQ(rateCompatibility(60.0), CompatibilityRating::Good);
  EXPECT_EQ(rateCompatibility(40.0), CompatibilityRating::Moderate);
  EXPECT_EQ(rateCompatibility(39.9), CompatibilityRating::Low);
  EXPECT_STREQ(compatibilityRatingName(CompatibilityRating::Moderate), "Moderate");
}

TEST(MixingAdviceTest, WellMatchedPair) {
  TrackFeatureSet a = makeTrack("a", 128.0, "A minor", 0.25);
  TrackFeatureSet b = makeTrack("b", 130.0, "A minor", 0.26);
  CompatibilityScore score;
  ASSERT_EQ(scoreCompatibility(a, b, score), DjError::OK);
  auto advice = mixingAdvice(score, a, b);
  ASSERT_EQ(advice.size(), 1u);
  EXPECT_EQ(advice[0], "Tempos are well matched");
}

TEST(MixingAdviceTest, TempoAdjustment) {
  TrackFeatureSet a = makeTrack("a", 120.0, "C", 0.2);
  TrackFeatureSet b = makeTrack("b", 127.5, "C", 0.2);
  CompatibilityScore score;
  ASSERT_EQ(scoreCompatibility(a, b, score), DjError::OK);
  auto advice = mixingAdvice(score, a, b);
  ASSERT_FALSE(advice.empty());
  EXPECT_EQ(advice[0], "Adjust tempo by 7.5 BPM to beatmatch");
}

TEST(MixingAdviceTest, DistantPairGetsAllLines) {
  TrackFeatureSet a = makeTrack("a", 100.0, "C major", 0.05);
  TrackFeatureSet b = makeTrack("b", 140.0, "F# minor", 0.4);
  CompatibilityScore score;
  ASSERT_EQ(scoreCompatibility(a, b, score), DjError::OK);
  auto advice = mixingAdvice(score, a, b);
  ASSERT_EQ(advice.size(), 3u);
  EXPECT_NE(advice[0].find("Large tempo difference (40.0 BPM)"), std::string::npos);
  EXPECT_NE(advice[1].find("C major -> F# minor"), std::string::npos);
  EXPECT_NE(advice[2].find("Energy"), std::string::npos);
}

// ============================================================================
// CompatibilityMatrix
// ============================================================================

TEST(CompatibilityMatrixTest, BuildsAllOrderedPairs) {
  std::vector<TrackFeatureSet> tracks = {makeTrack("a", 120.0, "C", 0.2),
                                         makeTrack("b", 124.0, "G", 0.3),
                                         makeTrack("c", 128.0, "Am", 0.4)};
  CompatibilityMatrix m = buildCompatibilityMatrix(tracks);
  EXPECT_EQ(m.size(), 3u);
  EXPECT_EQ(m.missingCount(), 0u);
  EXPECT_FALSE(m.has(1, 1));
  ASSERT_NE(m.get(0, 2), nullptr);
  EXPECT_DOUBLE_EQ(m.get(0, 2)->tempo, 84.0);
  EXPECT_DOUBLE_EQ(m.overall(0, 1), m.overall(1, 0));
}

TEST(CompatibilityMatrixTest, InvalidTrackLeavesMissingEntries) {
  std::vector<TrackFeatureSet> tracks = {makeTrack("a", 120.0, "C", 0.2),
                                         makeTrack("bad", 0.0, "C", 0.2),
                                         makeTrack("c", 122.0, "C", 0.2)};
  CompatibilityMatrix m = buildCompatibilityMatrix(tracks);
  EXPECT_EQ(m.missingCount(), 4u);
  EXPECT_FALSE(m.has(0, 1));
  EXPECT_EQ(m.get(1, 2), nullptr);
  EXPECT_DOUBLE_EQ(m.overall(1, 2), 0.0);
  EXPECT_TRUE(m.has(0, 2));
}

TEST(CompatibilityMatrixTest, OutOfRangeIsMissing) {
  CompatibilityMatrix m(2);
  m.set(0, 5, CompatibilityScore());
  EXPECT_FALSE(m.has(0, 5));
  EXPECT_EQ(m.missingCount(), 2u);
}

}  // namespace
}  // namespace dynamix
