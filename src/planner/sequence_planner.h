/**
 * @file sequence_planner.h
 * @brief Track ordering by energy curve, compatibility walk and refinement passes.
 *
 * Orderings are returned as index permutations of the input list; the
 * *Sequence helpers apply them to the track records.
 *
 * Zero tracks yield an empty ordering, never an error.
 */

#ifndef DYNAMIX_PLANNER_SEQUENCE_PLANNER_H
#define DYNAMIX_PLANNER_SEQUENCE_PLANNER_H

#include <cstddef>
#include <vector>

#include "analysis/compatibility.h"
#include "core/analysis_config.h"
#include "core/types.h"

namespace dynamix {

/// Index permutation of a track list.
using TrackOrder = std::vector<size_t>;

/// @brief Identity permutation of the given size.
TrackOrder identityOrder(size_t count);

/// @brief Tracks rearranged by an index permutation.
std::vector<TrackFeatureSet> applyOrder(const std::vector<TrackFeatureSet>& tracks,
                                        const TrackOrder& order);

/**
 * @brief Order by an energy-curve policy.
 *
 * - Build: ascending mean energy.
 * - Wave: tracks above the median mean energy (descending) interleaved
 *   with the rest (ascending), high first. Unpaired tracks follow: the
 *   remaining high tail, then the remaining low tail.
 * - PeakMiddle: ascending sort, first n/2 kept ascending, the rest
 *   descending.
 * - Constant: input order.
 *
 * All sorts are stable, so equal energies keep their input order.
 */
TrackOrder energyCurveOrder(const std::vector<TrackFeatureSet>& tracks, EnergyCurve curve);

/**
 * @brief Greedy nearest-neighbour walk over a compatibility matrix.
 *
 * Starts at index 0 and repeatedly appends the unplaced track with the
 * highest overall score from the last placed track. Missing edges count as
 * 0 and remain eligible; ties go to the lowest index. This is a heuristic
 * and does not search for an optimal path.
 */
TrackOrder greedyCompatibilityOrder(const CompatibilityMatrix& matrix);

/**
 * @brief Greedy walk preferring compatible key roots.
 *
 * Keeps the first track; each step takes the first remaining track (in the
 * current order) whose root is compatible with the last placed root, or
 * the first remaining track when none is.
 */
TrackOrder keyTransitionOrder(const std::vector<TrackFeatureSet>& tracks);

/// @brief Stable sort by tempo ascending.
TrackOrder tempoTransitionOrder(const std::vector<TrackFeatureSet>& tracks);

std::vector<TrackFeatureSet> reorderByEnergyCurve(const std::vector<TrackFeatureSet>& tracks,
                                                  EnergyCurve curve);
std::vector<TrackFeatureSet> greedyCompatibilitySequence(
    const std::vector<TrackFeatureSet>& tracks);
std::vector<TrackFeatureSet> keyTransitionPass(const std::vector<TrackFeatureSet>& tracks);
std::vector<TrackFeatureSet> tempoTransitionPass(const std::vector<TrackFeatureSet>& tracks);

/**
 * @brief Energy-curve order followed by the configured passes, in order.
 * @return Permutation of the input indices
 */
TrackOrder planOrder(const std::vector<TrackFeatureSet>& tracks, const PlanOptions& options);

std::vector<TrackFeatureSet> planSequence(const std::vector<TrackFeatureSet>& tracks,
                                          const PlanOptions& options);

}  // namespace dynamix

#endif  // DYNAMIX_PLANNER_SEQUENCE_PLANNER_H
