/**
 * @file analysis_config.cpp
 * @brief Name tables, JSON round-trip and validation for analysis config.
 */

#include "core/analysis_config.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace dynamix {

namespace {

// "key,tempo" -> passes. Unknown names are skipped.
std::vector<RefinementPass> parsePassList(const std::string& text) {
  std::vector<RefinementPass> passes;
  std::istringstream iss(text);
  std::string token;
  while (std::getline(iss, token, ',')) {
    RefinementPass pass;
    if (parseRefinementPass(token, pass)) passes.push_back(pass);
  }
  return passes;
}

bool isUnitInterval(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

}  // namespace

void PlanOptions::writeTo(json::Writer& w) const {
  w.write("curve", energyCurveName(curve));
  std::string list;
  for (size_t i = 0; i < passes.size(); ++i) {
    if (i > 0) list += ",";
    list += refinementPassName(passes[i]);
  }
  w.write("passes", list);
}

void PlanOptions::readFrom(const json::Parser& p) {
  if (p.has("curve")) curve = parseEnergyCurve(p.getString("curve"));
  if (p.has("passes")) passes = parsePassList(p.getString("passes"));
}

void AnalysisConfig::writeTo(json::Writer& w) const {
  w.write("onset_sensitivity", onset_sensitivity);
  json::WriteVisitor v{w};
  v.nested("cues", cues);
  v.nested("loops", loops);
  v.nested("zones", zones);
  v.nested("mix_points", mix_points);
  v.nested("plan", plan);
}

void AnalysisConfig::readFrom(const json::Parser& p) {
  onset_sensitivity = p.getDouble("onset_sensitivity", onset_sensitivity);
  json::ReadVisitor v{p};
  v.nested("cues", cues);
  v.nested("loops", loops);
  v.nested("zones", zones);
  v.nested("mix_points", mix_points);
  v.nested("plan", plan);
}

EnergyCurve parseEnergyCurve(const std::string& name) {
  if (name == "build" || name == "build_up") return EnergyCurve::Build;
  if (name == "wave") return EnergyCurve::Wave;
  if (name == "peak_middle") return EnergyCurve::PeakMiddle;
  return EnergyCurve::Constant;
}

const char* energyCurveName(EnergyCurve curve) {
  switch (curve) {
    case EnergyCurve::Constant: return "constant";
    case EnergyCurve::Build: return "build";
    case EnergyCurve::Wave: return "wave";
    case EnergyCurve::PeakMiddle: return "peak_middle";
  }
  return "constant";
}

bool parseRefinementPass(const std::string& name, RefinementPass& out) {
  if (name == "key") {
    out = RefinementPass::KeyTransition;
    return true;
  }
  if (name == "tempo" || name == "bpm") {
    out = RefinementPass::TempoTransition;
    return true;
  }
  return false;
}

const char* refinementPassName(RefinementPass pass) {
  return pass == RefinementPass::KeyTransition ? "key" : "tempo";
}

bool parseNumber(const std::string& text, double& out) {
  if (text.empty()) return false;
  const char* begin = text.c_str();
  char* end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || !std::isfinite(value)) return false;
  out = value;
  return true;
}

DjError validateAnalysisConfig(const AnalysisConfig& config) {
  if (!isUnitInterval(config.onset_sensitivity)) {
    return DjError::InvalidSensitivity;
  }

  const LoopConfig& loops = config.loops;
  if (!(loops.min_duration > 0.0) || !(loops.max_duration >= loops.min_duration)) {
    return DjError::InvalidBounds;
  }

  const ZoneConfig& z = config.zones;
  bool ordered = 0.0 <= z.build_start && z.build_start <= z.drop_start &&
                 z.drop_start <= z.breakdown_start && z.breakdown_start <= z.outro_start &&
                 z.outro_start <= 1.0;
  if (!ordered) return DjError::InvalidBounds;

  if (!(config.cues.min_spacing >= 0.0) || !(config.cues.beat_sync_threshold >= 0.0)) {
    return DjError::InvalidBounds;
  }

  const MixPointConfig& mix = config.mix_points;
  if (!isUnitInterval(mix.drop_window_fraction) || !std::isfinite(mix.drop_threshold_factor) ||
      !(mix.drop_threshold_factor > 0.0) || !(mix.drop_min_spacing >= 0.0)) {
    return DjError::InvalidBounds;
  }
  return DjError::OK;
}

}  // namespace dynamix
