#include "planner/set_list_builder.h"

#include <cstddef>

namespace dynamix {

namespace {

constexpr double kSecondsPerMinute = 60.0;

}  // namespace

size_t setListPrefixLength(const std::vector<TrackFeatureSet>& sequence, Seconds budget) {
  Seconds total = 0.0;
  size_t count = 0;
  for (const auto& track : sequence) {
    if (!(total + track.duration <= budget)) break;
    total += track.duration;
    ++count;
  }
  return count;
}

SetList buildSetList(const std::vector<TrackFeatureSet>& sequence, Seconds budget) {
  SetList set;
  set.budget = budget;
  size_t count = setListPrefixLength(sequence, budget);
  set.tracks.assign(sequence.begin(), sequence.begin() + static_cast<std::ptrdiff_t>(count));
  for (const auto& track : set.tracks) set.total_duration += track.duration;
  return set;
}

SetList createEnergyBasedSet(const std::vector<TrackFeatureSet>& tracks, double minutes,
                             EnergyCurve curve) {
  return buildSetList(reorderByEnergyCurve(tracks, curve), minutes * kSecondsPerMinute);
}

SetList createSetList(const std::vector<TrackFeatureSet>& tracks, double minutes,
                      const PlanOptions& options) {
  return buildSetList(planSequence(tracks, options), minutes * kSecondsPerMinute);
}

}  // namespace dynamix
