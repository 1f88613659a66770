/**
 * @file series_utils.h
 * @brief Statistics over time series (energy, onsets, beats).
 */

#ifndef DYNAMIX_CORE_SERIES_UTILS_H
#define DYNAMIX_CORE_SERIES_UTILS_H

#include <cstddef>
#include <vector>

#include "core/types.h"

namespace dynamix {

/// @brief Arithmetic mean. Returns 0 for an empty input.
double mean(const std::vector<double>& values);

/// @brief Population standard deviation. Returns 0 for an empty input.
double populationStddev(const std::vector<double>& values);

/**
 * @brief Percentile with linear interpolation between closest ranks.
 * @param values Input values (any order)
 * @param pct Percentile in [0, 100]
 * @return Interpolated value, 0 for an empty input
 */
double percentile(std::vector<double> values, double pct);

/// @brief Values of samples whose time lies in [start, end] (both inclusive).
std::vector<double> valuesInSpan(const std::vector<TimedValue>& series, Seconds start,
                                 Seconds end);

/// @brief All sample values in series order.
std::vector<double> seriesValues(const std::vector<TimedValue>& series);

/**
 * @brief Centered moving average with zero padding at the edges.
 *
 * out[i] = (1/window) * sum(values[i - window/2 .. i + (window-1)/2]),
 * treating out-of-range samples as 0. The output has the input's length.
 *
 * @param values Input samples
 * @param window Window length in samples (0 or 1 returns a copy)
 */
std::vector<double> centeredMovingAverage(const std::vector<double>& values, size_t window);

/// @brief True if sample times are strictly increasing.
bool isStrictlyIncreasing(const std::vector<TimedValue>& series);

/// @brief True if sample times never decrease.
bool isTimeOrdered(const std::vector<TimedValue>& series);

/// @brief True if every sample time lies within [lo, hi].
bool timesWithin(const std::vector<TimedValue>& series, double lo, double hi);

}  // namespace dynamix

#endif  // DYNAMIX_CORE_SERIES_UTILS_H
