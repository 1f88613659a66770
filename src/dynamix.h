/**
 * @file dynamix.h
 * @brief High-level session API for DJ set planning.
 */

#ifndef DYNAMIX_H
#define DYNAMIX_H

#include <string>
#include <vector>

#include "analysis/compatibility.h"
#include "analysis/track_analysis.h"
#include "core/analysis_config.h"
#include "core/error.h"
#include "core/types.h"
#include "io/batch_loader.h"
#include "io/i_feature_extractor.h"
#include "planner/sequence_planner.h"
#include "planner/set_list_builder.h"

namespace dynamix {

/**
 * @brief Session over a list of loaded tracks.
 *
 * Holds TrackFeatureSet records only; extractors are passed in per call and
 * never retained. All queries are recomputed from the loaded records.
 * Session queries on an empty session report DjError::EmptyInput.
 */
class DynaMix {
 public:
  DynaMix() = default;

  /**
   * @brief Load feature files with the built-in FeatureReader.
   * @param paths Feature file paths
   * @param options Extraction options
   * @return Per-track report; successful tracks are appended to the session
   */
  BatchReport loadTracks(const std::vector<std::string>& paths,
                         const ExtractionOptions& options = ExtractionOptions());

  /**
   * @brief Load tracks through a caller-supplied extractor.
   */
  BatchReport loadTracks(IFeatureExtractor& extractor, const std::vector<std::string>& refs,
                         const ExtractionOptions& options = ExtractionOptions());

  /**
   * @brief Append one record after validation.
   * @return Validation error (track not added), or OK
   */
  DjError addTrack(const TrackFeatureSet& track);

  const std::vector<TrackFeatureSet>& tracks() const { return tracks_; }
  size_t trackCount() const { return tracks_.size(); }
  void clear() { tracks_.clear(); }

  /// @brief Scores for every ordered pair of loaded tracks.
  DjError compatibilityMatrix(CompatibilityMatrix& out) const;

  /// @brief Energy-curve order plus configured passes.
  DjError suggestOrder(const PlanOptions& options, TrackOrder& out) const;

  /// @brief Greedy compatibility walk from the first loaded track.
  DjError greedyOrder(TrackOrder& out) const;

  /**
   * @brief Planned sequence truncated to fit the given number of minutes.
   * @return InvalidBounds for negative minutes, EmptyInput for no tracks
   */
  DjError createSetList(double minutes, const PlanOptions& options, SetList& out) const;

  /**
   * @brief Cue, loop, zone and mix-point analysis of one loaded track.
   * @return InvalidBounds for an out-of-range index
   */
  DjError analyzeTrack(size_t index, const AnalysisConfig& config, TrackAnalysis& out) const;

  /// @brief Compatibility of loaded track j following loaded track i.
  DjError compareTracks(size_t i, size_t j, CompatibilityScore& out) const;

  /**
   * @brief Get library version string.
   * @return Version string (e.g., "0.1.0")
   */
  static const char* version();

 private:
  std::vector<TrackFeatureSet> tracks_;
};

}  // namespace dynamix

#endif  // DYNAMIX_H
