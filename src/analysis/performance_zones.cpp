#include "analysis/performance_zones.h"

#include <cmath>

#include "core/track_features.h"

namespace dynamix {

ZoneType zoneForPosition(double fraction, const ZoneConfig& config) {
  if (fraction < config.build_start) return ZoneType::Intro;
  if (fraction < config.drop_start) return ZoneType::Build;
  if (fraction < config.breakdown_start) return ZoneType::Drop;
  if (fraction < config.outro_start) return ZoneType::Breakdown;
  return ZoneType::Outro;
}

DjError segmentPerformanceZones(const std::vector<TrackSection>& sections,
                                const std::vector<TimedValue>& energy, Seconds duration,
                                const ZoneConfig& config, PerformanceZones& out) {
  if (!std::isfinite(duration) || duration <= 0.0) {
    return DjError::InvalidDuration;
  }

  PerformanceZones zones{};
  for (const auto& section : sections) {
    double section_mean = 0.0;
    double section_stddev = 0.0;
    spanEnergy(energy, section.start, section.end, section_mean, section_stddev);

    auto& zone = zones[static_cast<size_t>(zoneForPosition(section.start / duration, config))];
    if (section_mean > zone.energy) {
      zone.start = section.start;
      zone.end = section.end;
      zone.energy = section_mean;
      zone.complexity = section_stddev;
    }
  }

  out = zones;
  return DjError::OK;
}

}  // namespace dynamix
