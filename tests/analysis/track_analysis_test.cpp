/**
 * @file track_analysis_test.cpp
 * @brief Tests for the per-track analysis pipeline and notes report.
 */

#include "analysis/track_analysis.h"

#include <gtest/gtest.h>

#include <sstream>

#include "test_support/track_builder.h"

namespace dynamix {
namespace {

using test::beatGrid;
using test::makeTrack;
using test::series;

TrackFeatureSet performanceTrack() {
  TrackFeatureSet track = makeTrack("club.json", 120.0, "C major", 0.0, 120.0);
  std::vector<TimedValue> energy;
  for (int t = 0; t < 120; ++t) {
    double v = 0.3;
    if (t == 48) v = 0.6;
    if (t == 90) v = 0.05;
    energy.push_back({static_cast<double>(t), v});
  }
  test::setEnergy(track, energy);
  track.beats = beatGrid(0.0, 0.5, 240);
  track.onsets = series({0.0, 16.0, 48.0, 48.3, 90.5}, {0.5, 0.6, 1.0, 0.9, 0.3});
  track.sections = {{"Intro", 0.0, 16.0},
                    {"Build", 30.0, 46.0},
                    {"Drop", 48.0, 80.0},
                    {"Break", 86.0, 100.0},
                    {"Outro", 110.0, 120.0}};
  return track;
}

TEST(AnalyzeTrackTest, FillsEveryPart) {
  TrackAnalysis analysis;
  ASSERT_EQ(analyzeTrack(performanceTrack(), AnalysisConfig(), analysis), DjError::OK);

  ASSERT_EQ(analysis.cues.size(), 4u);  // 48.3 is within 2 s of 48.0
  EXPECT_DOUBLE_EQ(analysis.cues[0].time, 48.0);

  EXPECT_FALSE(analysis.loops.empty());
  EXPECT_LE(analysis.loops.size(), 10u);

  EXPECT_DOUBLE_EQ(analysis.zones[static_cast<size_t>(ZoneType::Drop)].start, 48.0);
  EXPECT_DOUBLE_EQ(analysis.zones[static_cast<size_t>(ZoneType::Intro)].end, 16.0);

  EXPECT_DOUBLE_EQ(analysis.energy_peak, 48.0);
  ASSERT_EQ(analysis.mix_points.size(), 1u);
  EXPECT_DOUBLE_EQ(analysis.mix_points[0], 90.0);
}

TEST(AnalyzeTrackTest, RejectsInvalidTrack) {
  TrackAnalysis analysis;
  EXPECT_EQ(analyzeTrack(makeTrack("x", 128.0, "C", 0.2, -1.0), AnalysisConfig(), analysis),
            DjError::InvalidDuration);
}

TEST(AnalyzeTrackTest, RejectsBadLoopBounds) {
  AnalysisConfig config;
  config.loops.min_duration = 20.0;
  config.loops.max_duration = 10.0;
  TrackAnalysis analysis;
  EXPECT_EQ(analyzeTrack(performanceTrack(), config, analysis), DjError::InvalidBounds);
}

TEST(AnalyzeTrackTest, FeaturelessTrack) {
  TrackAnalysis analysis;
  ASSERT_EQ(analyzeTrack(makeTrack("bare", 120.0, "G", 0.0), AnalysisConfig(), analysis),
            DjError::OK);
  EXPECT_TRUE(analysis.cues.empty());
  EXPECT_TRUE(analysis.loops.empty());
  EXPECT_TRUE(analysis.mix_points.empty());
  EXPECT_DOUBLE_EQ(analysis.energy_peak, 0.0);
}

TEST(EnergyLevelTest, Thresholds) {
  EXPECT_EQ(energyLevel(0.2), EnergyLevel::High);
  EXPECT_EQ(energyLevel(0.1), EnergyLevel::Medium);
  EXPECT_EQ(energyLevel(0.05), EnergyLevel::Low);
  EXPECT_STREQ(energyLevelName(EnergyLevel::Medium), "Medium");
}

TEST(TrackAnalysisJsonTest, WritesAllSections) {
  TrackAnalysis analysis;
  ASSERT_EQ(analyzeTrack(performanceTrack(), AnalysisConfig(), analysis), DjError::OK);

  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject();
  analysis.writeTo(w);
  w.endObject();

  json::Parser p(oss.str());
  ASSERT_TRUE(p.valid());
  std::vector<json::Parser> cues;
  ASSERT_TRUE(p.getObjectArray("cues", cues));
  EXPECT_EQ(cues.size(), 4u);
  EXPECT_EQ(cues[0].getString("type"), "beat_sync");
  EXPECT_TRUE(p.isArray("loops"));
  EXPECT_DOUBLE_EQ(p.getObject("zones").getObject("drop").getDouble("start"), 48.0);
  EXPECT_TRUE(p.getObject("zones").getObject("drop").getBool("set"));
  EXPECT_DOUBLE_EQ(p.getDouble("energy_peak"), 48.0);
  std::vector<double> mix;
  ASSERT_TRUE(p.getNumberArray("mix_points", mix));
  EXPECT_EQ(mix.size(), analysis.mix_points.size());
}

TEST(TrackNotesTest, ReportLayout) {
  TrackFeatureSet track = performanceTrack();
  TrackAnalysis analysis;
  ASSERT_EQ(analyzeTrack(track, AnalysisConfig(), analysis), DjError::OK);
  std::string notes = trackNotesText(track, analysis);

  EXPECT_NE(notes.find("DJ Performance Notes: club.json"), std::string::npos);
  EXPECT_NE(notes.find("--- Track Info ---"), std::string::npos);
  EXPECT_NE(notes.find("BPM: 120.0"), std::string::npos);
  EXPECT_NE(notes.find("Energy Level: High"), std::string::npos);
  EXPECT_NE(notes.find("--- Top Cue Points ---"), std::string::npos);
  EXPECT_NE(notes.find("1. 48.0s - Beat Sync (Strength: 1.00)"), std::string::npos);
  EXPECT_NE(notes.find("--- Loop Suggestions ---"), std::string::npos);
  EXPECT_NE(notes.find("--- Performance Zones ---"), std::string::npos);
  EXPECT_NE(notes.find("Drop: 48.0s - 80.0s"), std::string::npos);
  EXPECT_NE(notes.find("Key: C major - compatible with F major, G major, A minor"),
            std::string::npos);
  EXPECT_NE(notes.find("Best mixing points: 90.0s"), std::string::npos);
}

TEST(TrackNotesTest, EmptyListsSayNone) {
  TrackFeatureSet track = makeTrack("bare", 120.0, "A minor", 0.0);
  TrackAnalysis analysis;
  ASSERT_EQ(analyzeTrack(track, AnalysisConfig(), analysis), DjError::OK);
  std::string notes = trackNotesText(track, analysis);
  EXPECT_NE(notes.find("Energy Level: Low"), std::string::npos);
  EXPECT_NE(notes.find("(none)"), std::string::npos);
  EXPECT_NE(notes.find("Intro: (unset)"), std::string::npos);
  EXPECT_NE(notes.find("Outro: (unset)"), std::string::npos);
  EXPECT_NE(notes.find("compatible with D minor, E minor, C major"), std::string::npos);
}

}  // namespace
}  // namespace dynamix
