/**
 * @file compatibility.h
 * @brief Pairwise mixing compatibility between two tracks.
 */

#ifndef DYNAMIX_ANALYSIS_COMPATIBILITY_H
#define DYNAMIX_ANALYSIS_COMPATIBILITY_H

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "core/error.h"
#include "core/types.h"

namespace dynamix {

/// @brief Coarse rating bucket for an overall score.
enum class CompatibilityRating : uint8_t {
  Excellent,  ///< >= 80
  Good,       ///< >= 60
  Moderate,   ///< >= 40
  Low
};

/**
 * @brief Score how well track b can follow track a.
 *
 * tempo = max(0, 100 - 2 * |dBPM|), key = 100 / 80 / 50 for identical key,
 * same root, other root. energy = max(0, 100 - 100 * |dE| / max(Ea, Eb)),
 * 100 when both means are zero. overall = 0.4 tempo + 0.3 key + 0.3 energy.
 *
 * @param a Outgoing track
 * @param b Incoming track
 * @param out Filled on success
 * @return Validation error of either track, or OK
 */
DjError scoreCompatibility(const TrackFeatureSet& a, const TrackFeatureSet& b,
                           CompatibilityScore& out);

double tempoSubscore(double tempo_a, double tempo_b);
double keySubscore(const MusicalKey& a, const MusicalKey& b);
double energySubscore(double mean_a, double mean_b);

/**
 * @brief Roots that mix well with the given root.
 *
 * The root itself, a perfect fourth and fifth above, and the relative
 * minor (root + 9 semitones).
 */
std::array<PitchClass, 4> compatibleRoots(PitchClass root);

/// @brief True if b's root is in compatibleRoots(a's root).
bool areRootsCompatible(PitchClass from, PitchClass to);

/**
 * @brief Keys that mix harmonically with the given key.
 *
 * Root, fourth and fifth keep the mode; the relative is the relative minor
 * of a major key or the relative major of a minor key.
 */
std::vector<MusicalKey> compatibleKeys(const MusicalKey& key);

CompatibilityRating rateCompatibility(double overall);
const char* compatibilityRatingName(CompatibilityRating rating);

/**
 * @brief Human-readable mixing tips for a scored pair.
 * @return One line per tip (tempo, key, energy order)
 */
std::vector<std::string> mixingAdvice(const CompatibilityScore& score, const TrackFeatureSet& a,
                                      const TrackFeatureSet& b);

/**
 * @brief Scores for every ordered pair (i, j), i != j.
 *
 * Pairs whose scoring failed have no edge.
 */
class CompatibilityMatrix {
 public:
  CompatibilityMatrix() = default;
  explicit CompatibilityMatrix(size_t size);

  size_t size() const { return size_; }

  void set(size_t from, size_t to, const CompatibilityScore& score);

  /// @return true if an edge from -> to was scored
  bool has(size_t from, size_t to) const;

  /// @return The edge, or nullptr when missing (including the diagonal)
  const CompatibilityScore* get(size_t from, size_t to) const;

  /// @return Overall score of the edge, 0 when missing
  double overall(size_t from, size_t to) const;

  /// Number of off-diagonal pairs without an edge.
  size_t missingCount() const;

 private:
  size_t size_ = 0;
  std::vector<CompatibilityScore> scores_;
  std::vector<bool> present_;
};

/**
 * @brief Score all ordered pairs of a track list.
 *
 * Invalid tracks leave their row and column empty.
 */
CompatibilityMatrix buildCompatibilityMatrix(const std::vector<TrackFeatureSet>& tracks);

}  // namespace dynamix

#endif  // DYNAMIX_ANALYSIS_COMPATIBILITY_H
