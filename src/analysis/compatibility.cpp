/**
 * @file compatibility.cpp
 * @brief Compatibility sub-scores, key adjacency and the score matrix.
 */

#include "analysis/compatibility.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "core/dj_constants.h"
#include "core/track_features.h"

namespace dynamix {

namespace {

// Semitone offsets of compatible roots: unison, fourth, fifth, relative minor.
constexpr std::array<int, 4> kCompatibleOffsets = {0, 5, 7, 9};

double clampScore(double value) { return std::clamp(value, 0.0, kMaxScore); }

}  // namespace

double tempoSubscore(double tempo_a, double tempo_b) {
  return clampScore(kMaxScore - kTempoPenaltyPerBpm * std::abs(tempo_a - tempo_b));
}

double keySubscore(const MusicalKey& a, const MusicalKey& b) {
  if (a == b) return kKeyScoreIdentical;
  if (a.root == b.root) return kKeyScoreSameRoot;
  return kKeyScoreOther;
}

double energySubscore(double mean_a, double mean_b) {
  double denom = std::max(mean_a, mean_b);
  if (denom <= 0.0) return kMaxScore;
  return clampScore(kMaxScore - kMaxScore * std::abs(mean_a - mean_b) / denom);
}

DjError scoreCompatibility(const TrackFeatureSet& a, const TrackFeatureSet& b,
                           CompatibilityScore& out) {
  DjError err = validateTrackFeatures(a);
  if (err != DjError::OK) return err;
  err = validateTrackFeatures(b);
  if (err != DjError::OK) return err;

  CompatibilityScore score;
  score.tempo = tempoSubscore(a.tempo, b.tempo);
  score.key = keySubscore(a.key, b.key);
  score.energy = energySubscore(a.meanEnergy(), b.meanEnergy());
  score.overall = clampScore(kTempoWeight * score.tempo + kKeyWeight * score.key +
                             kEnergyWeight * score.energy);
  score.tempo_difference = std::abs(a.tempo - b.tempo);
  out = score;
  return DjError::OK;
}

std::array<PitchClass, 4> compatibleRoots(PitchClass root) {
  std::array<PitchClass, 4> roots{};
  for (size_t i = 0; i < kCompatibleOffsets.size(); ++i) {
    roots[i] = transpose(root, kCompatibleOffsets[i]);
  }
  return roots;
}

bool areRootsCompatible(PitchClass from, PitchClass to) {
  auto roots = compatibleRoots(from);
  return std::find(roots.begin(), roots.end(), to) != roots.end();
}

std::vector<MusicalKey> compatibleKeys(const MusicalKey& key) {
  std::vector<MusicalKey> keys;
  keys.push_back(key);
  keys.push_back({transpose(key.root, 5), key.mode});
  keys.push_back({transpose(key.root, 7), key.mode});
  if (key.mode == KeyMode::Major) {
    keys.push_back({transpose(key.root, 9), KeyMode::Minor});
  } else {
    keys.push_back({transpose(key.root, 3), KeyMode::Major});
  }
  return keys;
}

CompatibilityRating rateCompatibility(double overall) {
  if (overall >= kRatingExcellent) return CompatibilityRating::Excellent;
  if (overall >= kRatingGood) return CompatibilityRating::Good;
  if (overall >= kRatingModerate) return CompatibilityRating::Moderate;
  return CompatibilityRating::Low;
}

const char* compatibilityRatingName(CompatibilityRating rating) {
  switch (rating) {
    case CompatibilityRating::Excellent: return "Excellent";
    case CompatibilityRating::Good: return "Good";
    case CompatibilityRating::Moderate: return "Moderate";
    case CompatibilityRating::Low: return "Low";
  }
  return "Low";
}

std::vector<std::string> mixingAdvice(const CompatibilityScore& score, const TrackFeatureSet& a,
                                      const TrackFeatureSet& b) {
  std::vector<std::string> advice;

  std::ostringstream tempo;
  tempo.setf(std::ios::fixed);
  tempo.precision(1);
  if (score.tempo_difference > kAdvicePitchShiftBpm) {
    tempo << "Large tempo difference (" << score.tempo_difference
          << " BPM); consider pitch shifting or a break-style transition";
  } else if (score.tempo_difference > kAdviceTempoAdjustBpm) {
    tempo << "Adjust tempo by " << score.tempo_difference << " BPM to beatmatch";
  } else {
    tempo << "Tempos are well matched";
  }
  advice.push_back(tempo.str());

  if (score.key < kAdviceHarmonicKeyScore) {
    advice.push_back("Keys differ (" + keyName(a.key) + " -> " + keyName(b.key) +
                     "); use harmonic mixing or a short blend");
  }

  if (std::abs(a.meanEnergy() - b.meanEnergy()) > kAdviceEnergyGap) {
    advice.push_back("Energy levels differ; balance with EQ during the blend");
  }
  return advice;
}

// ============================================================================
// CompatibilityMatrix
// ============================================================================

CompatibilityMatrix::CompatibilityMatrix(size_t size)
    : size_(size), scores_(size * size), present_(size * size, false) {}

void CompatibilityMatrix::set(size_t from, size_t to, const CompatibilityScore& score) {
  if (from >= size_ || to >= size_ || from == to) return;
  scores_[from * size_ + to] = score;
  present_[from * size_ + to] = true;
}

bool CompatibilityMatrix::has(size_t from, size_t to) const {
  if (from >= size_ || to >= size_) return false;
  return present_[from * size_ + to];
}

const CompatibilityScore* CompatibilityMatrix::get(size_t from, size_t to) const {
  return has(from, to) ? &scores_[from * size_ + to] : nullptr;
}

double CompatibilityMatrix::overall(size_t from, size_t to) const {
  const CompatibilityScore* score = get(from, to);
  return score ? score->overall : 0.0;
}

size_t CompatibilityMatrix::missingCount() const {
  size_t missing = 0;
  for (size_t i = 0; i < size_; ++i) {
    for (size_t j = 0; j < size_; ++j) {
      if (i != j && !present_[i * size_ + j]) ++missing;
    }
  }
  return missing;
}

CompatibilityMatrix buildCompatibilityMatrix(const std::vector<TrackFeatureSet>& tracks) {
  CompatibilityMatrix matrix(tracks.size());
  for (size_t i = 0; i < tracks.size(); ++i) {
    for (size_t j = 0; j < tracks.size(); ++j) {
      if (i == j) continue;
      CompatibilityScore score;
      if (scoreCompatibility(tracks[i], tracks[j], score) == DjError::OK) {
        matrix.set(i, j, score);
      }
    }
  }
  return matrix;
}

}  // namespace dynamix
