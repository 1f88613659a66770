/**
 * @file loops.h
 * @brief Loop candidates from sections and beat phrases.
 */

#ifndef DYNAMIX_ANALYSIS_LOOPS_H
#define DYNAMIX_ANALYSIS_LOOPS_H

#include <vector>

#include "core/analysis_config.h"
#include "core/error.h"
#include "core/types.h"

namespace dynamix {

/// @brief Section spans whose duration lies within the bounds (inclusive).
std::vector<LoopCandidate> sectionLoopCandidates(const std::vector<TrackSection>& sections,
                                                 const std::vector<TimedValue>& energy,
                                                 const LoopConfig& config);

/**
 * @brief Beat spans of exactly 4, 8, 16 or 32 beats within the bounds.
 *
 * Only index pairs (i, i + n) for the listed phrase lengths n are visited,
 * so generation is linear in the beat count.
 */
std::vector<LoopCandidate> beatPhraseLoopCandidates(const std::vector<TimedValue>& beats,
                                                    const std::vector<TimedValue>& energy,
                                                    const LoopConfig& config);

/// @brief True if the half-open spans [start, end) intersect.
bool loopsOverlap(const LoopCandidate& a, const LoopCandidate& b);

/**
 * @brief Ranked, non-overlapping loop suggestions.
 *
 * Section and beat-phrase candidates are merged, ordered by energy
 * stability (descending, stable), then accepted greedily when they do not
 * overlap an accepted loop, up to config.max_results.
 *
 * @param sections Track sections
 * @param beats Beat series
 * @param energy Energy series used for stability
 * @param config Duration bounds and cap
 * @param out Accepted loops in rank order
 * @return InvalidBounds if min_duration <= 0 or min_duration > max_duration
 */
DjError suggestLoops(const std::vector<TrackSection>& sections,
                     const std::vector<TimedValue>& beats, const std::vector<TimedValue>& energy,
                     const LoopConfig& config, std::vector<LoopCandidate>& out);

}  // namespace dynamix

#endif  // DYNAMIX_ANALYSIS_LOOPS_H
