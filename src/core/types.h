/**
 * @file types.h
 * @brief Track feature records and derived mixing annotations.
 */

#ifndef DYNAMIX_CORE_TYPES_H
#define DYNAMIX_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dynamix {

/// Time in seconds from the start of a track.
using Seconds = double;

// ============================================================================
// Musical key
// ============================================================================

/// @brief Pitch class of a key root (C=0 .. B=11).
enum class PitchClass : uint8_t {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11
};

constexpr uint8_t PITCH_CLASS_COUNT = 12;

/// @brief Tonal mode of a key.
enum class KeyMode : uint8_t { Major, Minor };

/// @brief Root note plus mode, e.g. "C major".
struct MusicalKey {
  PitchClass root = PitchClass::C;
  KeyMode mode = KeyMode::Major;

  bool operator==(const MusicalKey& other) const {
    return root == other.root && mode == other.mode;
  }
  bool operator!=(const MusicalKey& other) const { return !(*this == other); }
};

/**
 * @brief Parse a key string such as "C major", "F# minor", "Bb".
 *
 * Sharps ("#") and flats ("b") are accepted, so "Db minor" and "C# minor"
 * describe the same key. A missing mode defaults to major, and a trailing
 * "m" on the root ("Am") means minor.
 *
 * @param text Key text
 * @param out Parsed key (unchanged on failure)
 * @return true if the text names a key
 */
bool parseKey(const std::string& text, MusicalKey& out);

/** @brief Format a key as "<root> <mode>" using sharp spellings. */
std::string keyName(const MusicalKey& key);

/** @brief Root name using sharp spellings ("C", "C#", ...). */
const char* pitchClassName(PitchClass pc);

/** @brief Transpose a pitch class upward by the given number of semitones. */
PitchClass transpose(PitchClass pc, int semitones);

// ============================================================================
// Raw track features (consumed from the extraction collaborator)
// ============================================================================

/// @brief A timestamped measurement (energy sample, beat or onset).
struct TimedValue {
  Seconds time = 0.0;  ///< Position in seconds
  double value = 0.0;  ///< RMS energy or strength
};

/// @brief Labeled structural span of a track.
struct TrackSection {
  std::string label;   ///< "Intro", "Verse", "Section 6", ...
  Seconds start = 0.0;
  Seconds end = 0.0;

  Seconds duration() const { return end - start; }
};

/// @brief Scalar summaries of a track's energy series.
struct EnergySummary {
  double mean = 0.0;
  double max = 0.0;
  double stddev = 0.0;  ///< Population standard deviation
};

/**
 * @brief Per-track analysis record produced by the feature extractor.
 *
 * Immutable once produced. All derived annotations are pure functions of
 * this record.
 */
struct TrackFeatureSet {
  std::string id;                     ///< Stable track reference (path or id)
  Seconds duration = 0.0;             ///< Track length in seconds
  double tempo = 0.0;                 ///< Beats per minute
  double tempo_confidence = 0.0;      ///< 0.0-1.0
  MusicalKey key;                     ///< Detected key
  double key_confidence = 0.0;        ///< 0.0-1.0
  std::vector<TimedValue> energy;     ///< RMS energy, strictly increasing time
  EnergySummary energy_summary;       ///< Derived from energy
  std::vector<TimedValue> beats;      ///< Beat grid (time, strength)
  std::vector<TrackSection> sections; ///< Ordered, non-overlapping
  std::vector<TimedValue> onsets;     ///< Onsets (time, strength)
  std::vector<Seconds> drops;         ///< Energy breakdown positions

  double meanEnergy() const { return energy_summary.mean; }
};

// ============================================================================
// Derived annotations
// ============================================================================

/// @brief Pairwise mixing compatibility. All scores are in [0, 100].
struct CompatibilityScore {
  double tempo = 0.0;             ///< Tempo sub-score
  double key = 0.0;               ///< Key sub-score
  double energy = 0.0;            ///< Energy sub-score
  double overall = 0.0;           ///< Weighted total
  double tempo_difference = 0.0;  ///< |tempoA - tempoB| in BPM
};

/// @brief Cue point classification.
enum class CueType : uint8_t {
  BeatSync,     ///< Onset within the beat-sync threshold of a beat
  StrongOnset,  ///< Strength above the track's strong-onset percentile
  Onset         ///< Any other onset
};

/// @brief A candidate cue point.
struct CuePoint {
  Seconds time = 0.0;
  CueType type = CueType::Onset;
  double strength = 0.0;
  Seconds nearest_beat = 0.0;    ///< Equal to time when the track has no beats
  Seconds beat_distance = 0.0;   ///< Infinity when the track has no beats
};

/// @brief Origin of a loop candidate.
enum class LoopSource : uint8_t {
  Section,    ///< A detected section span
  BeatPhrase  ///< A span of 4/8/16/32 beats
};

/// @brief A candidate loop span.
struct LoopCandidate {
  Seconds start = 0.0;
  Seconds end = 0.0;
  Seconds duration = 0.0;
  LoopSource source = LoopSource::Section;
  std::string label;             ///< Section label, empty for beat phrases
  uint16_t beat_count = 0;       ///< Beat phrase length, 0 for sections
  double energy_stability = 0.0; ///< 1 - stddev/mean of the span's energy
  double mean_energy = 0.0;
};

/// @brief Canonical performance zones, in track order.
enum class ZoneType : uint8_t { Intro = 0, Build, Drop, Breakdown, Outro };

constexpr size_t ZONE_COUNT = 5;

/// @brief Highest-energy section assigned to a zone. Zero when unset.
struct PerformanceZone {
  Seconds start = 0.0;
  Seconds end = 0.0;
  double energy = 0.0;
  double complexity = 0.0;  ///< Energy standard deviation over the section

  bool isSet() const { return end > start || energy > 0.0; }
};

/// Zones indexed by ZoneType.
using PerformanceZones = std::array<PerformanceZone, ZONE_COUNT>;

/** @brief Lower-case cue type name ("beat_sync", "strong_onset", "onset"). */
const char* cueTypeName(CueType type);

/** @brief Human-readable cue type ("Beat Sync", "Strong Onset", "Onset"). */
const char* cueTypeLabel(CueType type);

/** @brief Lower-case zone name ("intro" .. "outro"). */
const char* zoneName(ZoneType zone);

/** @brief Loop description, e.g. "Section: Intro" or "Beat Loop: 8 beats". */
std::string loopDescription(const LoopCandidate& loop);

}  // namespace dynamix

#endif  // DYNAMIX_CORE_TYPES_H
