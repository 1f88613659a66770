/**
 * @file dynamix.cpp
 * @brief Implementation of the DynaMix session API.
 */

#include "dynamix.h"

#include <cmath>

#include "core/logging.h"
#include "core/track_features.h"
#include "io/feature_reader.h"

namespace dynamix {

namespace {

constexpr const char* kVersion = "0.1.0";

}  // namespace

BatchReport DynaMix::loadTracks(const std::vector<std::string>& paths,
                                const ExtractionOptions& options) {
  FeatureReader reader;
  return loadTracks(reader, paths, options);
}

BatchReport DynaMix::loadTracks(IFeatureExtractor& extractor,
                                const std::vector<std::string>& refs,
                                const ExtractionOptions& options) {
  BatchLoader loader(extractor);
  BatchReport report = loader.load(refs, options);
  for (const auto& track : report.tracks) {
    tracks_.push_back(track);
  }
  return report;
}

DjError DynaMix::addTrack(const TrackFeatureSet& track) {
  DjError err = validateTrackFeatures(track);
  if (err != DjError::OK) {
    DYNAMIX_LOG_WARN("Rejected track " << track.id << ": " << errorString(err));
    return err;
  }
  tracks_.push_back(track);
  return DjError::OK;
}

DjError DynaMix::compatibilityMatrix(CompatibilityMatrix& out) const {
  if (tracks_.empty()) return DjError::EmptyInput;
  out = buildCompatibilityMatrix(tracks_);
  return DjError::OK;
}

DjError DynaMix::suggestOrder(const PlanOptions& options, TrackOrder& out) const {
  if (tracks_.empty()) return DjError::EmptyInput;
  out = planOrder(tracks_, options);
  return DjError::OK;
}

DjError DynaMix::greedyOrder(TrackOrder& out) const {
  if (tracks_.empty()) return DjError::EmptyInput;
  out = greedyCompatibilityOrder(buildCompatibilityMatrix(tracks_));
  return DjError::OK;
}

DjError DynaMix::createSetList(double minutes, const PlanOptions& options, SetList& out) const {
  if (!std::isfinite(minutes) || minutes < 0.0) return DjError::InvalidBounds;
  if (tracks_.empty()) return DjError::EmptyInput;
  out = dynamix::createSetList(tracks_, minutes, options);
  return DjError::OK;
}

DjError DynaMix::analyzeTrack(size_t index, const AnalysisConfig& config,
                              TrackAnalysis& out) const {
  if (tracks_.empty()) return DjError::EmptyInput;
  if (index >= tracks_.size()) return DjError::InvalidBounds;
  return dynamix::analyzeTrack(tracks_[index], config, out);
}

DjError DynaMix::compareTracks(size_t i, size_t j, CompatibilityScore& out) const {
  if (tracks_.empty()) return DjError::EmptyInput;
  if (i >= tracks_.size() || j >= tracks_.size()) return DjError::InvalidBounds;
  return scoreCompatibility(tracks_[i], tracks_[j], out);
}

const char* DynaMix::version() { return kVersion; }

}  // namespace dynamix
