#include "analysis/cue_points.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/dj_constants.h"
#include "core/series_utils.h"

namespace dynamix {

namespace {

// Nearest beat by absolute distance; first beat wins ties.
void findNearestBeat(Seconds time, const std::vector<TimedValue>& beats, Seconds& nearest,
                     Seconds& distance) {
  nearest = time;
  distance = std::numeric_limits<double>::infinity();
  for (const auto& beat : beats) {
    double d = std::abs(beat.time - time);
    if (d < distance) {
      distance = d;
      nearest = beat.time;
    }
  }
}

bool isFarFromAll(Seconds time, const std::vector<CuePoint>& kept, double min_spacing) {
  for (const auto& cue : kept) {
    if (std::abs(cue.time - time) <= min_spacing) return false;
  }
  return true;
}

}  // namespace

std::vector<CuePoint> detectCuePoints(const std::vector<TimedValue>& onsets,
                                      const std::vector<TimedValue>& beats,
                                      const CuePointConfig& config) {
  std::vector<CuePoint> result;
  if (onsets.empty()) return result;

  double strong_cutoff = percentile(seriesValues(onsets), config.strong_onset_percentile);

  std::vector<CuePoint> candidates;
  candidates.reserve(onsets.size());
  for (const auto& onset : onsets) {
    CuePoint cue;
    cue.time = onset.time;
    cue.strength = onset.value;
    findNearestBeat(onset.time, beats, cue.nearest_beat, cue.beat_distance);

    if (cue.beat_distance < config.beat_sync_threshold) {
      cue.type = CueType::BeatSync;
    } else if (cue.strength > strong_cutoff) {
      cue.type = CueType::StrongOnset;
    } else {
      cue.type = CueType::Onset;
    }
    candidates.push_back(cue);
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const CuePoint& a, const CuePoint& b) { return a.strength > b.strength; });

  for (const auto& cue : candidates) {
    if (result.size() >= config.max_results) break;
    if (isFarFromAll(cue.time, result, config.min_spacing)) {
      result.push_back(cue);
    }
  }
  return result;
}

DjError filterOnsetsBySensitivity(std::vector<TimedValue>& onsets, double sensitivity) {
  if (!std::isfinite(sensitivity) || sensitivity < 0.0 || sensitivity > 1.0) {
    return DjError::InvalidSensitivity;
  }
  if (onsets.empty()) return DjError::OK;

  double max_strength = 0.0;
  for (const auto& onset : onsets) {
    max_strength = std::max(max_strength, onset.value);
  }
  const double floor = sensitivity * kOnsetFloorScale * max_strength;

  onsets.erase(std::remove_if(onsets.begin(), onsets.end(),
                              [floor](const TimedValue& onset) { return onset.value < floor; }),
               onsets.end());
  return DjError::OK;
}

}  // namespace dynamix
