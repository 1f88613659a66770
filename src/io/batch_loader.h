/**
 * @file batch_loader.h
 * @brief Load many tracks, continuing past per-track failures.
 */

#ifndef DYNAMIX_IO_BATCH_LOADER_H
#define DYNAMIX_IO_BATCH_LOADER_H

#include <string>
#include <vector>

#include "io/i_feature_extractor.h"

namespace dynamix {

/// @brief Outcome of one track in a batch.
struct BatchEntry {
  std::string track_ref;
  bool ok = false;
  std::string error;  ///< Extractor message when !ok
};

/// @brief Per-track results plus the successfully extracted records.
struct BatchReport {
  std::vector<BatchEntry> entries;      ///< One per requested track, in order
  std::vector<TrackFeatureSet> tracks;  ///< Successful records, in order

  size_t successCount() const;
  size_t failureCount() const;

  /// @brief Human-readable summary with one line per failure.
  std::string toTextReport() const;
};

/**
 * @brief Runs an extractor over a list of track references.
 *
 * Each reference is extracted exactly once. Failures are recorded and
 * logged; the batch always runs to completion.
 */
class BatchLoader {
 public:
  explicit BatchLoader(IFeatureExtractor& extractor) : extractor_(extractor) {}

  BatchReport load(const std::vector<std::string>& track_refs,
                   const ExtractionOptions& options = ExtractionOptions());

 private:
  IFeatureExtractor& extractor_;
};

}  // namespace dynamix

#endif  // DYNAMIX_IO_BATCH_LOADER_H
