/**
 * @file set_list_builder.h
 * @brief Duration-bounded set lists from a planned sequence.
 */

#ifndef DYNAMIX_PLANNER_SET_LIST_BUILDER_H
#define DYNAMIX_PLANNER_SET_LIST_BUILDER_H

#include <vector>

#include "core/analysis_config.h"
#include "core/types.h"
#include "planner/sequence_planner.h"

namespace dynamix {

/// @brief A set list and its total running time.
struct SetList {
  std::vector<TrackFeatureSet> tracks;
  Seconds total_duration = 0.0;
  Seconds budget = 0.0;

  size_t size() const { return tracks.size(); }
  bool empty() const { return tracks.empty(); }
};

/**
 * @brief Longest prefix whose summed duration fits the budget.
 *
 * Accumulation stops at the first track that would exceed the budget;
 * later, shorter tracks are not considered. A budget of zero (or one
 * shorter than the first track) yields an empty list.
 *
 * @return Number of leading tracks that fit
 */
size_t setListPrefixLength(const std::vector<TrackFeatureSet>& sequence, Seconds budget);

/// @brief Apply setListPrefixLength to an ordered sequence.
SetList buildSetList(const std::vector<TrackFeatureSet>& sequence, Seconds budget);

/**
 * @brief Reorder by an energy curve, then fit into minutes * 60 seconds.
 */
SetList createEnergyBasedSet(const std::vector<TrackFeatureSet>& tracks, double minutes,
                             EnergyCurve curve);

/**
 * @brief Full plan (curve and passes), then fit into minutes * 60 seconds.
 */
SetList createSetList(const std::vector<TrackFeatureSet>& tracks, double minutes,
                      const PlanOptions& options);

}  // namespace dynamix

#endif  // DYNAMIX_PLANNER_SET_LIST_BUILDER_H
