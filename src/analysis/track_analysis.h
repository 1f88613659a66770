/**
 * @file track_analysis.h
 * @brief Per-track performance annotations bundled for reporting.
 */

#ifndef DYNAMIX_ANALYSIS_TRACK_ANALYSIS_H
#define DYNAMIX_ANALYSIS_TRACK_ANALYSIS_H

#include <string>
#include <vector>

#include "core/analysis_config.h"
#include "core/error.h"
#include "core/json_helpers.h"
#include "core/types.h"

namespace dynamix {

/// @brief Coarse loudness class used in DJ notes.
enum class EnergyLevel : uint8_t { Low, Medium, High };

/// @brief All per-track annotations for one TrackFeatureSet.
struct TrackAnalysis {
  std::vector<CuePoint> cues;
  std::vector<LoopCandidate> loops;
  PerformanceZones zones{};
  Seconds energy_peak = 0.0;
  std::vector<Seconds> mix_points;

  /// @brief Write fields into the currently open JSON object.
  void writeTo(json::Writer& w) const;
};

/**
 * @brief Run cue, loop, zone and mix-point analysis on one track.
 * @param track Validated feature record
 * @param config Per-call parameters
 * @param out Filled on success
 * @return Track validation error, InvalidBounds for bad loop bounds, or OK
 */
DjError analyzeTrack(const TrackFeatureSet& track, const AnalysisConfig& config,
                     TrackAnalysis& out);

/// @brief High above 0.1 mean RMS, Medium above 0.05, else Low.
EnergyLevel energyLevel(double mean_energy);
const char* energyLevelName(EnergyLevel level);

/**
 * @brief DJ performance notes as plain text.
 *
 * Track info, top 5 cues, top 3 loops, zones and mixing tips.
 */
std::string trackNotesText(const TrackFeatureSet& track, const TrackAnalysis& analysis);

}  // namespace dynamix

#endif  // DYNAMIX_ANALYSIS_TRACK_ANALYSIS_H
