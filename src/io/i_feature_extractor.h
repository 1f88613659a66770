/**
 * @file i_feature_extractor.h
 * @brief Boundary to the audio feature extraction collaborator.
 *
 * The decision layer never decodes audio. An extractor turns a track
 * reference into an immutable TrackFeatureSet, once per track.
 */

#ifndef DYNAMIX_IO_I_FEATURE_EXTRACTOR_H
#define DYNAMIX_IO_I_FEATURE_EXTRACTOR_H

#include <string>

#include "core/analysis_config.h"
#include "core/dj_constants.h"
#include "core/types.h"

namespace dynamix {

/// @brief Options applied by the extractor before records reach the core.
struct ExtractionOptions {
  /// Onset filtering strictness (0.0-1.0). Higher drops more weak onsets.
  double onset_sensitivity = kDefaultOnsetSensitivity;
  /// Drop detection parameters, used when a record carries no drops.
  MixPointConfig mix_points;
};

/**
 * @brief Produces TrackFeatureSet records from track references.
 */
class IFeatureExtractor {
 public:
  virtual ~IFeatureExtractor() = default;

  /**
   * @brief Extract features for one track.
   * @param track_ref Path or id of the track
   * @param options Extraction options
   * @param out Filled on success
   * @return true on success; getError() explains a failure
   */
  virtual bool extract(const std::string& track_ref, const ExtractionOptions& options,
                       TrackFeatureSet& out) = 0;

  /// @brief Error message of the last failed extract().
  virtual const std::string& getError() const = 0;
};

}  // namespace dynamix

#endif  // DYNAMIX_IO_I_FEATURE_EXTRACTOR_H
