/**
 * @file performance_zones.h
 * @brief Position-based assignment of sections to performance zones.
 *
 * Zones are positional: "drop" means the section that starts in the middle
 * of the track with the highest energy, not an acoustically detected drop.
 */

#ifndef DYNAMIX_ANALYSIS_PERFORMANCE_ZONES_H
#define DYNAMIX_ANALYSIS_PERFORMANCE_ZONES_H

#include <vector>

#include "core/analysis_config.h"
#include "core/error.h"
#include "core/types.h"

namespace dynamix {

/// @brief Zone whose window contains the given fraction of the track.
ZoneType zoneForPosition(double fraction, const ZoneConfig& config);

/**
 * @brief Assign each zone its highest-energy section.
 *
 * A section belongs to the zone whose fractional window contains its start
 * time. A zone is replaced only by a section with strictly higher mean
 * energy, so zones without a qualifying section keep the zero default.
 *
 * @param sections Track sections
 * @param energy Energy series for section mean and complexity (stddev)
 * @param duration Track length in seconds
 * @param config Zone boundaries
 * @param out Zones indexed by ZoneType
 * @return InvalidDuration if duration <= 0
 */
DjError segmentPerformanceZones(const std::vector<TrackSection>& sections,
                                const std::vector<TimedValue>& energy, Seconds duration,
                                const ZoneConfig& config, PerformanceZones& out);

}  // namespace dynamix

#endif  // DYNAMIX_ANALYSIS_PERFORMANCE_ZONES_H
