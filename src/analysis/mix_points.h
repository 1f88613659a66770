/**
 * @file mix_points.h
 * @brief Energy-profile landmarks: peaks, valleys, entry points and drops.
 *
 * All detectors compare each RMS sample with a centred moving average of
 * the series (zero padded at the edges).
 */

#ifndef DYNAMIX_ANALYSIS_MIX_POINTS_H
#define DYNAMIX_ANALYSIS_MIX_POINTS_H

#include <vector>

#include "core/analysis_config.h"
#include "core/error.h"
#include "core/types.h"

namespace dynamix {

/// @brief Suggested handover between an outgoing and an incoming track.
struct TransitionSuggestion {
  std::vector<Seconds> exit_points;   ///< Valleys in the outgoing track
  std::vector<Seconds> entry_points;  ///< Peaks in the incoming track
  Seconds recommended_mix_duration = 0.0;
  bool tempo_sync_required = false;
};

/// @brief Time of the loudest sample (first on ties), 0 for an empty series.
Seconds findEnergyPeak(const std::vector<TimedValue>& energy);

/**
 * @brief Exit candidates: samples below valley_factor * moving average.
 *
 * Samples in the first edge_guard seconds are skipped. Returns at most
 * config.max_mix_points, in time order.
 */
std::vector<Seconds> findMixPoints(const std::vector<TimedValue>& energy,
                                   const MixPointConfig& config = MixPointConfig());

/**
 * @brief Entry candidates: samples above peak_factor * moving average.
 *
 * Samples in the last edge_guard seconds of the track are skipped. Returns
 * at most config.max_transition_points, in time order.
 */
std::vector<Seconds> findEntryPoints(const std::vector<TimedValue>& energy, Seconds duration,
                                     const MixPointConfig& config = MixPointConfig());

/**
 * @brief Exit points of a, entry points of b and blend length.
 *
 * The recommended blend is min(16 s, 10% of a's duration). Tempo sync is
 * required when the tempos differ by more than 5 BPM.
 *
 * @return Validation error of either track, or OK
 */
DjError suggestTransition(const TrackFeatureSet& a, const TrackFeatureSet& b,
                          const MixPointConfig& config, TransitionSuggestion& out);

/**
 * @brief Energy breakdowns.
 *
 * The moving-average window is drop_window_fraction of the sample count.
 * A sample after the first window whose energy is below the average
 * divided by drop_threshold_factor is a drop; drops closer than
 * drop_min_spacing to an earlier drop are discarded.
 */
std::vector<Seconds> detectDrops(const std::vector<TimedValue>& energy,
                                 const MixPointConfig& config = MixPointConfig());

}  // namespace dynamix

#endif  // DYNAMIX_ANALYSIS_MIX_POINTS_H
