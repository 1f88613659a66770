#include "core/track_features.h"

#include <algorithm>
#include <cmath>

#include "core/series_utils.h"

namespace dynamix {

namespace {

bool isConfidence(double value) { return std::isfinite(value) && value >= 0.0 && value <= 1.0; }

}  // namespace

DjError validateTrackFeatures(const TrackFeatureSet& track) {
  if (!std::isfinite(track.duration) || track.duration <= 0.0) {
    return DjError::InvalidDuration;
  }
  if (!std::isfinite(track.tempo) || track.tempo <= 0.0) {
    return DjError::InvalidTempo;
  }
  if (!std::isfinite(track.energy_summary.mean) || track.energy_summary.mean < 0.0) {
    return DjError::InvalidEnergy;
  }
  if (!isConfidence(track.tempo_confidence) || !isConfidence(track.key_confidence)) {
    return DjError::InvalidConfidence;
  }
  return DjError::OK;
}

EnergySummary computeEnergySummary(const std::vector<TimedValue>& energy) {
  EnergySummary summary;
  if (energy.empty()) return summary;

  std::vector<double> values = seriesValues(energy);
  summary.mean = mean(values);
  summary.max = *std::max_element(values.begin(), values.end());
  summary.stddev = populationStddev(values);
  return summary;
}

size_t spanEnergy(const std::vector<TimedValue>& energy, Seconds start, Seconds end,
                  double& out_mean, double& out_stddev) {
  std::vector<double> values = valuesInSpan(energy, start, end);
  out_mean = mean(values);
  out_stddev = populationStddev(values);
  return values.size();
}

double energyStability(double span_mean, double span_stddev) {
  if (span_mean == 0.0 || !std::isfinite(span_mean)) return 0.0;
  return 1.0 - span_stddev / span_mean;
}

}  // namespace dynamix
