/**
 * @file dj_constants.h
 * @brief Policy constants for scoring, cue, loop, zone and mix-point heuristics.
 *
 * These values define observable behavior. Per-call configuration structs
 * (see analysis_config.h) are seeded from them.
 */

#ifndef DYNAMIX_CORE_DJ_CONSTANTS_H_
#define DYNAMIX_CORE_DJ_CONSTANTS_H_

#include <array>
#include <cstddef>
#include <cstdint>

namespace dynamix {

// ============================================================================
// Compatibility scoring
// ============================================================================

constexpr double kTempoWeight = 0.4;
constexpr double kKeyWeight = 0.3;
constexpr double kEnergyWeight = 0.3;

// Tempo sub-score loses this many points per BPM of difference.
constexpr double kTempoPenaltyPerBpm = 2.0;

constexpr double kKeyScoreIdentical = 100.0;
constexpr double kKeyScoreSameRoot = 80.0;
constexpr double kKeyScoreOther = 50.0;

constexpr double kMaxScore = 100.0;

// Rating thresholds on the overall score.
constexpr double kRatingExcellent = 80.0;
constexpr double kRatingGood = 60.0;
constexpr double kRatingModerate = 40.0;

// Mixing advice thresholds.
constexpr double kAdvicePitchShiftBpm = 10.0;
constexpr double kAdviceTempoAdjustBpm = 5.0;
constexpr double kAdviceHarmonicKeyScore = 70.0;
constexpr double kAdviceEnergyGap = 0.1;

// ============================================================================
// Cue points
// ============================================================================

constexpr double kBeatSyncThreshold = 0.1;       // seconds
constexpr double kStrongOnsetPercentile = 80.0;  // percent
constexpr double kCueMinSpacing = 2.0;           // seconds
constexpr size_t kMaxCuePoints = 20;

// Onsets weaker than sensitivity * scale * peak strength are dropped upstream.
constexpr double kOnsetFloorScale = 0.25;
constexpr double kDefaultOnsetSensitivity = 0.7;

// ============================================================================
// Loops
// ============================================================================

constexpr double kDefaultLoopMinDuration = 4.0;   // seconds
constexpr double kDefaultLoopMaxDuration = 16.0;  // seconds
constexpr std::array<uint16_t, 4> kLoopPhraseBeats = {4, 8, 16, 32};
constexpr size_t kMaxLoopCandidates = 10;

// ============================================================================
// Performance zones (fractions of track duration, by section start)
// ============================================================================

constexpr double kZoneBuildStart = 0.2;
constexpr double kZoneDropStart = 0.4;
constexpr double kZoneBreakdownStart = 0.7;
constexpr double kZoneOutroStart = 0.9;

// ============================================================================
// Mix points, entry points and drops
// ============================================================================

constexpr size_t kMixPointWindow = 20;        // samples in the moving average
constexpr double kValleyFactor = 0.8;         // rms < avg * factor
constexpr double kPeakFactor = 1.2;           // rms > avg * factor
constexpr double kEdgeGuardSeconds = 30.0;    // ignore the first/last 30 s
constexpr size_t kMaxMixPoints = 3;
constexpr size_t kMaxTransitionPoints = 5;
constexpr double kMaxRecommendedMixSeconds = 16.0;
constexpr double kRecommendedMixFraction = 0.1;
constexpr double kTempoSyncThresholdBpm = 5.0;

constexpr double kDropThresholdFactor = 1.5;  // rms < avg / factor
constexpr double kDropWindowFraction = 0.1;   // of the sample count
constexpr double kDropMinSpacing = 5.0;       // seconds

// Energy level labels in track notes.
constexpr double kEnergyLevelHigh = 0.1;
constexpr double kEnergyLevelMedium = 0.05;

}  // namespace dynamix

#endif  // DYNAMIX_CORE_DJ_CONSTANTS_H_
