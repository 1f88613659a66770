/**
 * @file analysis_config.h
 * @brief Overridable per-call configuration for analysis and planning.
 *
 * Defaults come from dj_constants.h. AnalysisConfig round-trips through JSON
 * so the CLI can load it with --config.
 */

#ifndef DYNAMIX_CORE_ANALYSIS_CONFIG_H
#define DYNAMIX_CORE_ANALYSIS_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/dj_constants.h"
#include "core/error.h"
#include "core/json_helpers.h"

namespace dynamix {

/// @brief Cue point detection parameters.
struct CuePointConfig {
  double beat_sync_threshold = kBeatSyncThreshold;         ///< Seconds
  double strong_onset_percentile = kStrongOnsetPercentile; ///< 0-100
  double min_spacing = kCueMinSpacing;                     ///< Seconds between kept cues
  uint32_t max_results = static_cast<uint32_t>(kMaxCuePoints);

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("beat_sync_threshold", self.beat_sync_threshold);
    v("strong_onset_percentile", self.strong_onset_percentile);
    v("min_spacing", self.min_spacing);
    v("max_results", self.max_results);
  }

  void writeTo(json::Writer& w) const {
    json::WriteVisitor v{w};
    visitFields(*this, v);
  }

  void readFrom(const json::Parser& p) {
    json::ReadVisitor v{p};
    visitFields(*this, v);
  }
};

/// @brief Loop suggestion parameters.
struct LoopConfig {
  double min_duration = kDefaultLoopMinDuration;  ///< Seconds, inclusive
  double max_duration = kDefaultLoopMaxDuration;  ///< Seconds, inclusive
  uint32_t max_results = static_cast<uint32_t>(kMaxLoopCandidates);

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("min_duration", self.min_duration);
    v("max_duration", self.max_duration);
    v("max_results", self.max_results);
  }

  void writeTo(json::Writer& w) const {
    json::WriteVisitor v{w};
    visitFields(*this, v);
  }

  void readFrom(const json::Parser& p) {
    json::ReadVisitor v{p};
    visitFields(*this, v);
  }
};

/// @brief Fractional zone boundaries (by section start time).
struct ZoneConfig {
  double build_start = kZoneBuildStart;
  double drop_start = kZoneDropStart;
  double breakdown_start = kZoneBreakdownStart;
  double outro_start = kZoneOutroStart;

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("build_start", self.build_start);
    v("drop_start", self.drop_start);
    v("breakdown_start", self.breakdown_start);
    v("outro_start", self.outro_start);
  }

  void writeTo(json::Writer& w) const {
    json::WriteVisitor v{w};
    visitFields(*this, v);
  }

  void readFrom(const json::Parser& p) {
    json::ReadVisitor v{p};
    visitFields(*this, v);
  }
};

/// @brief Mix point, entry point and drop detection parameters.
struct MixPointConfig {
  uint32_t window = static_cast<uint32_t>(kMixPointWindow);
  double valley_factor = kValleyFactor;
  double peak_factor = kPeakFactor;
  double edge_guard = kEdgeGuardSeconds;
  uint32_t max_mix_points = static_cast<uint32_t>(kMaxMixPoints);
  uint32_t max_transition_points = static_cast<uint32_t>(kMaxTransitionPoints);
  double drop_threshold_factor = kDropThresholdFactor;
  double drop_window_fraction = kDropWindowFraction;
  double drop_min_spacing = kDropMinSpacing;

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("window", self.window);
    v("valley_factor", self.valley_factor);
    v("peak_factor", self.peak_factor);
    v("edge_guard", self.edge_guard);
    v("max_mix_points", self.max_mix_points);
    v("max_transition_points", self.max_transition_points);
    v("drop_threshold_factor", self.drop_threshold_factor);
    v("drop_window_fraction", self.drop_window_fraction);
    v("drop_min_spacing", self.drop_min_spacing);
  }

  void writeTo(json::Writer& w) const {
    json::WriteVisitor v{w};
    visitFields(*this, v);
  }

  void readFrom(const json::Parser& p) {
    json::ReadVisitor v{p};
    visitFields(*this, v);
  }
};

/// @brief Energy-curve reordering policy.
enum class EnergyCurve : uint8_t {
  Constant = 0,  ///< Input order
  Build,         ///< Ascending mean energy
  Wave,          ///< Alternate high/low halves around the median
  PeakMiddle     ///< Rise to a single peak at the midpoint, then fall
};

/// @brief Optional post-pass applied after energy-curve reordering.
enum class RefinementPass : uint8_t {
  KeyTransition,   ///< Greedy walk preferring compatible key roots
  TempoTransition  ///< Stable sort by tempo ascending
};

/// @brief Set ordering options. Passes run in the listed order.
struct PlanOptions {
  EnergyCurve curve = EnergyCurve::Build;
  std::vector<RefinementPass> passes;

  void writeTo(json::Writer& w) const;
  void readFrom(const json::Parser& p);
};

/// @brief All overridable analysis parameters.
struct AnalysisConfig {
  double onset_sensitivity = kDefaultOnsetSensitivity;  ///< Applied at extraction
  CuePointConfig cues;
  LoopConfig loops;
  ZoneConfig zones;
  MixPointConfig mix_points;
  PlanOptions plan;

  void writeTo(json::Writer& w) const;
  void readFrom(const json::Parser& p);
};

/**
 * @brief Parse an energy curve name.
 *
 * Accepts "build", "build_up", "wave", "peak_middle" and "constant".
 * Anything else maps to Constant (input order).
 */
EnergyCurve parseEnergyCurve(const std::string& name);

/** @brief Canonical curve name ("build", "wave", "peak_middle", "constant"). */
const char* energyCurveName(EnergyCurve curve);

/**
 * @brief Parse a pass name ("key" or "tempo").
 * @return true if recognized
 */
bool parseRefinementPass(const std::string& name, RefinementPass& out);

/** @brief Pass name ("key" or "tempo"). */
const char* refinementPassName(RefinementPass pass);

/**
 * @brief Parse a finite decimal number, such as a command-line value.
 * @return false if text is empty, has trailing characters, or is not finite
 */
bool parseNumber(const std::string& text, double& out);

/**
 * @brief Validate an analysis configuration.
 * @return InvalidSensitivity, InvalidBounds, or OK
 */
DjError validateAnalysisConfig(const AnalysisConfig& config);

}  // namespace dynamix

#endif  // DYNAMIX_CORE_ANALYSIS_CONFIG_H
