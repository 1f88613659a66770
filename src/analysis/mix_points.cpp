#include "analysis/mix_points.h"

#include <algorithm>
#include <cmath>

#include "core/dj_constants.h"
#include "core/series_utils.h"
#include "core/track_features.h"

namespace dynamix {

namespace {

std::vector<Seconds> energyValleys(const std::vector<TimedValue>& energy,
                                   const MixPointConfig& config, size_t limit) {
  std::vector<Seconds> result;
  std::vector<double> avg = centeredMovingAverage(seriesValues(energy), config.window);
  for (size_t i = 0; i < energy.size() && result.size() < limit; ++i) {
    if (energy[i].value < avg[i] * config.valley_factor && energy[i].time > config.edge_guard) {
      result.push_back(energy[i].time);
    }
  }
  return result;
}

std::vector<Seconds> energyPeaks(const std::vector<TimedValue>& energy, Seconds duration,
                                 const MixPointConfig& config, size_t limit) {
  std::vector<Seconds> result;
  std::vector<double> avg = centeredMovingAverage(seriesValues(energy), config.window);
  for (size_t i = 0; i < energy.size() && result.size() < limit; ++i) {
    if (energy[i].value > avg[i] * config.peak_factor &&
        energy[i].time < duration - config.edge_guard) {
      result.push_back(energy[i].time);
    }
  }
  return result;
}

}  // namespace

Seconds findEnergyPeak(const std::vector<TimedValue>& energy) {
  if (energy.empty()) return 0.0;
  auto it = std::max_element(energy.begin(), energy.end(),
                             [](const TimedValue& a, const TimedValue& b) {
                               return a.value < b.value;
                             });
  return it->time;
}

std::vector<Seconds> findMixPoints(const std::vector<TimedValue>& energy,
                                   const MixPointConfig& config) {
  return energyValleys(energy, config, config.max_mix_points);
}

std::vector<Seconds> findEntryPoints(const std::vector<TimedValue>& energy, Seconds duration,
                                     const MixPointConfig& config) {
  return energyPeaks(energy, duration, config, config.max_transition_points);
}

DjError suggestTransition(const TrackFeatureSet& a, const TrackFeatureSet& b,
                          const MixPointConfig& config, TransitionSuggestion& out) {
  DjError err = validateTrackFeatures(a);
  if (err != DjError::OK) return err;
  err = validateTrackFeatures(b);
  if (err != DjError::OK) return err;

  TransitionSuggestion suggestion;
  suggestion.exit_points = energyValleys(a.energy, config, config.max_transition_points);
  suggestion.entry_points = energyPeaks(b.energy, b.duration, config, config.max_transition_points);
  suggestion.recommended_mix_duration =
      std::min(kMaxRecommendedMixSeconds, a.duration * kRecommendedMixFraction);
  suggestion.tempo_sync_required = std::abs(a.tempo - b.tempo) > kTempoSyncThresholdBpm;
  out = suggestion;
  return DjError::OK;
}

std::vector<Seconds> detectDrops(const std::vector<TimedValue>& energy,
                                 const MixPointConfig& config) {
  std::vector<Seconds> drops;
  const double fraction = config.drop_window_fraction;
  if (!(fraction > 0.0 && fraction <= 1.0)) return drops;
  const size_t window = static_cast<size_t>(static_cast<double>(energy.size()) * fraction);
  if (window == 0) return drops;

  std::vector<double> avg = centeredMovingAverage(seriesValues(energy), window);
  for (size_t i = window + 1; i < energy.size(); ++i) {
    if (!(energy[i].value < avg[i] / config.drop_threshold_factor)) continue;

    Seconds time = energy[i].time;
    bool near_kept = std::any_of(drops.begin(), drops.end(), [&](Seconds kept) {
      return std::abs(time - kept) < config.drop_min_spacing;
    });
    if (!near_kept) drops.push_back(time);
  }
  return drops;
}

}  // namespace dynamix
