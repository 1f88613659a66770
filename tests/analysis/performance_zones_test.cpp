/**
 * @file performance_zones_test.cpp
 * @brief Tests for performance zone segmentation.
 */

#include "analysis/performance_zones.h"

#include <gtest/gtest.h>

namespace dynamix {
namespace {

const PerformanceZone& zoneOf(const PerformanceZones& zones, ZoneType type) {
  return zones[static_cast<size_t>(type)];
}

// One sample per second over [0, 100]; value per inclusive range, 0 elsewhere.
std::vector<TimedValue> steppedEnergy() {
  std::vector<TimedValue> energy;
  for (int t = 0; t <= 100; ++t) {
    double v = 0.0;
    if (t <= 10) v = 0.1;
    else if (t >= 25 && t <= 35) v = 0.3;
    else if (t >= 45 && t <= 65) v = 0.8;
    else if (t >= 66 && t <= 69) v = 0.6;
    else if (t >= 75 && t <= 85) v = 0.2;
    else if (t >= 92) v = 0.1;
    energy.push_back({static_cast<double>(t), v});
  }
  return energy;
}

TEST(ZoneForPositionTest, DefaultBoundaries) {
  ZoneConfig config;
  EXPECT_EQ(zoneForPosition(0.0, config), ZoneType::Intro);
  EXPECT_EQ(zoneForPosition(0.19, config), ZoneType::Intro);
  EXPECT_EQ(zoneForPosition(0.2, config), ZoneType::Build);
  EXPECT_EQ(zoneForPosition(0.4, config), ZoneType::Drop);
  EXPECT_EQ(zoneForPosition(0.7, config), ZoneType::Breakdown);
  EXPECT_EQ(zoneForPosition(0.9, config), ZoneType::Outro);
  EXPECT_EQ(zoneForPosition(1.0, config), ZoneType::Outro);
}

TEST(PerformanceZonesTest, NoSectionsLeavesAllUnset) {
  PerformanceZones zones;
  ASSERT_EQ(segmentPerformanceZones({}, steppedEnergy(), 100.0, ZoneConfig(), zones),
            DjError::OK);
  for (const auto& zone : zones) {
    EXPECT_FALSE(zone.isSet());
  }
}

TEST(PerformanceZonesTest, SectionsBucketedByStart) {
  std::vector<TrackSection> sections = {
      {"Intro", 0.0, 10.0},  {"Build", 25.0, 35.0},  {"Drop", 45.0, 65.0},
      {"Drop B", 66.0, 69.0}, {"Break", 75.0, 85.0}, {"Outro", 92.0, 100.0}};
  PerformanceZones zones;
  ASSERT_EQ(segmentPerformanceZones(sections, steppedEnergy(), 100.0, ZoneConfig(), zones),
            DjError::OK);

  EXPECT_DOUBLE_EQ(zoneOf(zones, ZoneType::Intro).end, 10.0);
  EXPECT_DOUBLE_EQ(zoneOf(zones, ZoneType::Build).start, 25.0);
  EXPECT_NEAR(zoneOf(zones, ZoneType::Build).energy, 0.3, 1e-9);

  // The louder of the two drop-zone sections wins.
  const PerformanceZone& drop = zoneOf(zones, ZoneType::Drop);
  EXPECT_DOUBLE_EQ(drop.start, 45.0);
  EXPECT_DOUBLE_EQ(drop.end, 65.0);
  EXPECT_NEAR(drop.energy, 0.8, 1e-9);
  EXPECT_NEAR(drop.complexity, 0.0, 1e-9);

  EXPECT_DOUBLE_EQ(zoneOf(zones, ZoneType::Breakdown).start, 75.0);
  EXPECT_DOUBLE_EQ(zoneOf(zones, ZoneType::Outro).start, 92.0);
}

TEST(PerformanceZonesTest, LouderLaterSectionReplaces) {
  std::vector<TrackSection> sections = {{"Drop B", 66.0, 69.0}, {"Drop", 45.0, 65.0}};
  PerformanceZones zones;
  ASSERT_EQ(segmentPerformanceZones(sections, steppedEnergy(), 100.0, ZoneConfig(), zones),
            DjError::OK);
  EXPECT_DOUBLE_EQ(zoneOf(zones, ZoneType::Drop).start, 45.0);
}

TEST(PerformanceZonesTest, SilentSectionsNeverAssign) {
  std::vector<TrackSection> sections = {{"Intro", 0.0, 10.0}, {"Gap", 40.0, 44.0}};
  PerformanceZones zones;
  ASSERT_EQ(segmentPerformanceZones(sections, {}, 100.0, ZoneConfig(), zones), DjError::OK);
  EXPECT_FALSE(zoneOf(zones, ZoneType::Intro).isSet());
  EXPECT_FALSE(zoneOf(zones, ZoneType::Drop).isSet());
}

TEST(PerformanceZonesTest, ComplexityIsEnergySpread) {
  std::vector<TimedValue> energy = {{0.0, 0.2}, {1.0, 0.4}, {2.0, 0.2}, {3.0, 0.4}};
  PerformanceZones zones;
  ASSERT_EQ(segmentPerformanceZones({{"Intro", 0.0, 3.0}}, energy, 100.0, ZoneConfig(), zones),
            DjError::OK);
  EXPECT_NEAR(zoneOf(zones, ZoneType::Intro).energy, 0.3, 1e-12);
  EXPECT_NEAR(zoneOf(zones, ZoneType::Intro).complexity, 0.1, 1e-12);
}

TEST(PerformanceZonesTest, CustomBoundaries) {
  ZoneConfig config;
  config.build_start = 0.1;
  PerformanceZones zones;
  ASSERT_EQ(segmentPerformanceZones({{"Rise", 15.0, 20.0}}, steppedEnergy(), 100.0, config,
                                    zones),
            DjError::OK);
  EXPECT_FALSE(zoneOf(zones, ZoneType::Build).isSet());  // no energy in [15, 20]

  ASSERT_EQ(segmentPerformanceZones({{"Rise", 10.0, 20.0}}, steppedEnergy(), 100.0, config,
                                    zones),
            DjError::OK);
  EXPECT_TRUE(zoneOf(zones, ZoneType::Build).isSet());
}

TEST(PerformanceZonesTest, RejectsNonPositiveDuration) {
  PerformanceZones zones;
  EXPECT_EQ(segmentPerformanceZones({}, {}, 0.0, ZoneConfig(), zones), DjError::InvalidDuration);
}

}  // namespace
}  // namespace dynamix
