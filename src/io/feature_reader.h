/**
 * @file feature_reader.h
 * @brief Reader for pre-extracted track feature files (JSON).
 *
 * Format:
 * @code
 * {
 *   "id": "track01.wav",
 *   "duration": 240.0,
 *   "tempo": {"bpm": 128.0, "confidence": 0.9},
 *   "key": {"name": "A minor", "confidence": 0.7},
 *   "energy": {"times": [...], "rms": [...]},
 *   "energy_summary": {"mean": 0.12, "max": 0.3, "stddev": 0.04},
 *   "beats": {"times": [...], "strengths": [...]},
 *   "onsets": {"times": [...], "strengths": [...]},
 *   "sections": [{"label": "Intro", "start": 0.0, "end": 16.0}],
 *   "drops": [61.5]
 * }
 * @endcode
 *
 * energy_summary is derived from the energy series when absent, and drops
 * are detected from it when absent. A missing id falls back to the path.
 */

#ifndef DYNAMIX_IO_FEATURE_READER_H
#define DYNAMIX_IO_FEATURE_READER_H

#include <string>

#include "io/i_feature_extractor.h"

namespace dynamix {

class FeatureReader : public IFeatureExtractor {
 public:
  /**
   * @brief Read a feature file from disk.
   * @param path Path to the JSON file
   * @param options Onset sensitivity applied after parsing
   * @param out Filled on success
   * @return true on success, false on error
   */
  bool extract(const std::string& path, const ExtractionOptions& options,
               TrackFeatureSet& out) override;

  /**
   * @brief Parse a feature document held in memory.
   * @param json Document text
   * @param track_ref Fallback id when the document has none
   * @param options Onset sensitivity applied after parsing
   * @param out Filled on success
   * @return true on success, false on error
   */
  bool parse(const std::string& json, const std::string& track_ref,
             const ExtractionOptions& options, TrackFeatureSet& out);

  const std::string& getError() const override { return error_; }

 private:
  bool fail(const std::string& message);

  std::string error_;
};

}  // namespace dynamix

#endif  // DYNAMIX_IO_FEATURE_READER_H
