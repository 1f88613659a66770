/**
 * @file cue_points.h
 * @brief Cue point candidates from a track's onset and beat series.
 */

#ifndef DYNAMIX_ANALYSIS_CUE_POINTS_H
#define DYNAMIX_ANALYSIS_CUE_POINTS_H

#include <vector>

#include "core/analysis_config.h"
#include "core/error.h"
#include "core/types.h"

namespace dynamix {

/**
 * @brief Detect ranked, spaced cue points.
 *
 * Each onset is matched to its nearest beat and classified as BeatSync
 * (distance below the threshold), StrongOnset (strength above the
 * percentile of all onset strengths) or Onset. Candidates are ranked by
 * strength and kept only when further than min_spacing from every kept
 * cue, up to max_results.
 *
 * @param onsets Onset series (time, strength)
 * @param beats Beat series (time, strength), may be empty
 * @param config Detection parameters
 * @return Cues in rank order (strongest first); empty for no onsets
 */
std::vector<CuePoint> detectCuePoints(const std::vector<TimedValue>& onsets,
                                      const std::vector<TimedValue>& beats,
                                      const CuePointConfig& config = CuePointConfig());

/**
 * @brief Drop weak onsets ahead of cue detection.
 *
 * Removes onsets weaker than sensitivity * kOnsetFloorScale * the strongest
 * onset. Sensitivity 0 keeps everything.
 *
 * @param onsets Series filtered in place
 * @param sensitivity 0.0-1.0, higher is stricter
 * @return InvalidSensitivity if out of range (onsets untouched), else OK
 */
DjError filterOnsetsBySensitivity(std::vector<TimedValue>& onsets, double sensitivity);

}  // namespace dynamix

#endif  // DYNAMIX_ANALYSIS_CUE_POINTS_H
