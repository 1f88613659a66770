#include "planner/sequence_planner.h"

#include <algorithm>
#include <numeric>

namespace dynamix {

namespace {

// Median as the mean of the two middle values for even counts.
double medianEnergy(const std::vector<TrackFeatureSet>& tracks) {
  std::vector<double> values;
  values.reserve(tracks.size());
  for (const auto& track : tracks) values.push_back(track.meanEnergy());
  std::sort(values.begin(), values.end());
  size_t n = values.size();
  if (n % 2 == 1) return values[n / 2];
  return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

void sortByEnergy(TrackOrder& order, const std::vector<TrackFeatureSet>& tracks, bool ascending) {
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return ascending ? tracks[a].meanEnergy() < tracks[b].meanEnergy()
                     : tracks[a].meanEnergy() > tracks[b].meanEnergy();
  });
}

TrackOrder waveOrder(const std::vector<TrackFeatureSet>& tracks) {
  const double median = medianEnergy(tracks);

  TrackOrder high;
  TrackOrder low;
  for (size_t i = 0; i < tracks.size(); ++i) {
    (tracks[i].meanEnergy() > median ? high : low).push_back(i);
  }
  sortByEnergy(high, tracks, false);
  sortByEnergy(low, tracks, true);

  TrackOrder order;
  order.reserve(tracks.size());
  size_t paired = std::min(high.size(), low.size());
  for (size_t i = 0; i < paired; ++i) {
    order.push_back(high[i]);
    order.push_back(low[i]);
  }
  order.insert(order.end(), high.begin() + paired, high.end());
  order.insert(order.end(), low.begin() + paired, low.end());
  return order;
}

TrackOrder peakMiddleOrder(const std::vector<TrackFeatureSet>& tracks) {
  TrackOrder order = identityOrder(tracks.size());
  sortByEnergy(order, tracks, true);

  size_t mid = order.size() / 2;
  TrackOrder second(order.begin() + mid, order.end());
  sortByEnergy(second, tracks, false);
  std::copy(second.begin(), second.end(), order.begin() + mid);
  return order;
}

// Re-express a permutation of a reordered list in terms of the original indices.
TrackOrder compose(const TrackOrder& outer, const TrackOrder& inner) {
  TrackOrder result;
  result.reserve(inner.size());
  for (size_t idx : inner) result.push_back(outer[idx]);
  return result;
}

}  // namespace

TrackOrder identityOrder(size_t count) {
  TrackOrder order(count);
  std::iota(order.begin(), order.end(), size_t{0});
  return order;
}

std::vector<TrackFeatureSet> applyOrder(const std::vector<TrackFeatureSet>& tracks,
                                        const TrackOrder& order) {
  std::vector<TrackFeatureSet> result;
  result.reserve(order.size());
  for (size_t idx : order) {
    if (idx < tracks.size()) result.push_back(tracks[idx]);
  }
  return result;
}

TrackOrder energyCurveOrder(const std::vector<TrackFeatureSet>& tracks, EnergyCurve curve) {
  if (tracks.empty()) return {};

  switch (curve) {
    case EnergyCurve::Build: {
      TrackOrder order = identityOrder(tracks.size());
      sortByEnergy(order, tracks, true);
      return order;
    }
    case EnergyCurve::Wave:
      return waveOrder(tracks);
    case EnergyCurve::PeakMiddle:
      return peakMiddleOrder(tracks);
    case EnergyCurve::Constant:
      break;
  }
  return identityOrder(tracks.size());
}

TrackOrder greedyCompatibilityOrder(const CompatibilityMatrix& matrix) {
  const size_t n = matrix.size();
  TrackOrder order;
  if (n == 0) return order;

  std::vector<bool> placed(n, false);
  size_t current = 0;
  order.push_back(current);
  placed[current] = true;

  while (order.size() < n) {
    size_t best = n;
    double best_score = 0.0;
    for (size_t candidate = 0; candidate < n; ++candidate) {
      if (placed[candidate]) continue;
      double score = matrix.overall(current, candidate);
      if (best == n || score > best_score) {
        best = candidate;
        best_score = score;
      }
    }
    order.push_back(best);
    placed[best] = true;
    current = best;
  }
  return order;
}

TrackOrder keyTransitionOrder(const std::vector<TrackFeatureSet>& tracks) {
  TrackOrder order;
  if (tracks.empty()) return order;

  TrackOrder remaining = identityOrder(tracks.size());
  size_t current = remaining.front();
  remaining.erase(remaining.begin());
  order.push_back(current);

  while (!remaining.empty()) {
    PitchClass root = tracks[current].key.root;
    auto next = std::find_if(remaining.begin(), remaining.end(), [&](size_t idx) {
      return areRootsCompatible(root, tracks[idx].key.root);
    });
    if (next == remaining.end()) next = remaining.begin();

    current = *next;
    remaining.erase(next);
    order.push_back(current);
  }
  return order;
}

TrackOrder tempoTransitionOrder(const std::vector<TrackFeatureSet>& tracks) {
  TrackOrder order = identityOrder(tracks.size());
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return tracks[a].tempo < tracks[b].tempo; });
  return order;
}

std::vector<TrackFeatureSet> reorderByEnergyCurve(const std::vector<TrackFeatureSet>& tracks,
                                                  EnergyCurve curve) {
  return applyOrder(tracks, energyCurveOrder(tracks, curve));
}

std::vector<TrackFeatureSet> greedyCompatibilitySequence(
    const std::vector<TrackFeatureSet>& tracks) {
  return applyOrder(tracks, greedyCompatibilityOrder(buildCompatibilityMatrix(tracks)));
}

std::vector<TrackFeatureSet> keyTransitionPass(const std::vector<TrackFeatureSet>& tracks) {
  return applyOrder(tracks, keyTransitionOrder(tracks));
}

std::vector<TrackFeatureSet> tempoTransitionPass(const std::vector<TrackFeatureSet>& tracks) {
  return applyOrder(tracks, tempoTransitionOrder(tracks));
}

TrackOrder planOrder(const std::vector<TrackFeatureSet>& tracks, const PlanOptions& options) {
  TrackOrder order = energyCurveOrder(tracks, options.curve);

  for (RefinementPass pass : options.passes) {
    std::vector<TrackFeatureSet> current = applyOrder(tracks, order);
    TrackOrder step = pass == RefinementPass::KeyTransition ? keyTransitionOrder(current)
                                                            : tempoTransitionOrder(current);
    order = compose(order, step);
  }
  return order;
}

std::vector<TrackFeatureSet> planSequence(const std::vector<TrackFeatureSet>& tracks,
                                          const PlanOptions& options) {
  return applyOrder(tracks, planOrder(tracks, options));
}

}  // namespace dynamix
