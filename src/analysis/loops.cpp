#include "analysis/loops.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/dj_constants.h"
#include "core/track_features.h"

namespace dynamix {

namespace {

bool withinBounds(double duration, const LoopConfig& config) {
  return duration >= config.min_duration && duration <= config.max_duration;
}

void fillEnergy(LoopCandidate& loop, const std::vector<TimedValue>& energy) {
  double span_mean = 0.0;
  double span_stddev = 0.0;
  spanEnergy(energy, loop.start, loop.end, span_mean, span_stddev);
  loop.mean_energy = span_mean;
  loop.energy_stability = energyStability(span_mean, span_stddev);
}

}  // namespace

std::vector<LoopCandidate> sectionLoopCandidates(const std::vector<TrackSection>& sections,
                                                 const std::vector<TimedValue>& energy,
                                                 const LoopConfig& config) {
  std::vector<LoopCandidate> result;
  for (const auto& section : sections) {
    double duration = section.duration();
    if (!withinBounds(duration, config)) continue;

    LoopCandidate loop;
    loop.start = section.start;
    loop.end = section.end;
    loop.duration = duration;
    loop.source = LoopSource::Section;
    loop.label = section.label;
    fillEnergy(loop, energy);
    result.push_back(loop);
  }
  return result;
}

std::vector<LoopCandidate> beatPhraseLoopCandidates(const std::vector<TimedValue>& beats,
                                                    const std::vector<TimedValue>& energy,
                                                    const LoopConfig& config) {
  std::vector<LoopCandidate> result;
  for (size_t i = 0; i < beats.size(); ++i) {
    for (uint16_t phrase : kLoopPhraseBeats) {
      size_t j = i + phrase;
      if (j >= beats.size()) break;

      double duration = beats[j].time - beats[i].time;
      if (!withinBounds(duration, config)) continue;

      LoopCandidate loop;
      loop.start = beats[i].time;
      loop.end = beats[j].time;
      loop.duration = duration;
      loop.source = LoopSource::BeatPhrase;
      loop.beat_count = phrase;
      fillEnergy(loop, energy);
      result.push_back(loop);
    }
  }
  return result;
}

bool loopsOverlap(const LoopCandidate& a, const LoopCandidate& b) {
  return a.start < b.end && a.end > b.start;
}

DjError suggestLoops(const std::vector<TrackSection>& sections,
                     const std::vector<TimedValue>& beats, const std::vector<TimedValue>& energy,
                     const LoopConfig& config, std::vector<LoopCandidate>& out) {
  if (!(config.min_duration > 0.0) || config.min_duration > config.max_duration) {
    return DjError::InvalidBounds;
  }

  std::vector<LoopCandidate> pool = sectionLoopCandidates(sections, energy, config);
  std::vector<LoopCandidate> phrases = beatPhraseLoopCandidates(beats, energy, config);
  pool.insert(pool.end(), phrases.begin(), phrases.end());

  std::stable_sort(pool.begin(), pool.end(), [](const LoopCandidate& a, const LoopCandidate& b) {
    return a.energy_stability > b.energy_stability;
  });

  std::vector<LoopCandidate> accepted;
  for (const auto& candidate : pool) {
    if (accepted.size() >= config.max_results) break;
    bool overlaps = std::any_of(accepted.begin(), accepted.end(), [&](const LoopCandidate& kept) {
      return loopsOverlap(candidate, kept);
    });
    if (!overlaps) accepted.push_back(candidate);
  }

  out = std::move(accepted);
  return DjError::OK;
}

}  // namespace dynamix
