/**
 * @file track_features.h
 * @brief Validation and summaries for TrackFeatureSet records.
 */

#ifndef DYNAMIX_CORE_TRACK_FEATURES_H
#define DYNAMIX_CORE_TRACK_FEATURES_H

#include <vector>

#include "core/error.h"
#include "core/types.h"

namespace dynamix {

/**
 * @brief Validate a feature record before it is consumed.
 *
 * Checks, in order: duration > 0, tempo > 0, mean energy finite and >= 0,
 * confidences within [0, 1].
 *
 * @param track Record to validate
 * @return DjError::OK if usable
 */
DjError validateTrackFeatures(const TrackFeatureSet& track);

/// @brief Mean, max and population stddev of an energy series (zeros if empty).
EnergySummary computeEnergySummary(const std::vector<TimedValue>& energy);

/**
 * @brief Mean and stddev of the energy samples within [start, end].
 * @param energy Energy series
 * @param start Span start (inclusive)
 * @param end Span end (inclusive)
 * @param out_mean Mean energy (0 if no samples fall in the span)
 * @param out_stddev Population stddev (0 if no samples fall in the span)
 * @return Number of samples in the span
 */
size_t spanEnergy(const std::vector<TimedValue>& energy, Seconds start, Seconds end,
                  double& out_mean, double& out_stddev);

/**
 * @brief Energy stability of a span: 1 - stddev / mean.
 *
 * A span with zero mean energy (or no samples) has stability 0.
 */
double energyStability(double span_mean, double span_stddev);

}  // namespace dynamix

#endif  // DYNAMIX_CORE_TRACK_FEATURES_H
