#include "analysis/track_analysis.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

#include "analysis/compatibility.h"
#include "analysis/cue_points.h"
#include "analysis/loops.h"
#include "analysis/mix_points.h"
#include "analysis/performance_zones.h"
#include "core/dj_constants.h"
#include "core/track_features.h"

namespace dynamix {

namespace {

constexpr size_t kNotesCueCount = 5;
constexpr size_t kNotesLoopCount = 3;

constexpr ZoneType kZoneOrder[ZONE_COUNT] = {ZoneType::Intro, ZoneType::Build, ZoneType::Drop,
                                             ZoneType::Breakdown, ZoneType::Outro};

const char* zoneTitle(ZoneType zone) {
  switch (zone) {
    case ZoneType::Intro: return "Intro";
    case ZoneType::Build: return "Build";
    case ZoneType::Drop: return "Drop";
    case ZoneType::Breakdown: return "Breakdown";
    case ZoneType::Outro: return "Outro";
  }
  return "";
}

// "F major, G major, E minor" from the keys after the track's own key.
std::string compatibleKeyList(const MusicalKey& key) {
  std::vector<MusicalKey> keys = compatibleKeys(key);
  std::string list;
  for (size_t i = 1; i < keys.size(); ++i) {
    if (i > 1) list += ", ";
    list += keyName(keys[i]);
  }
  return list;
}

}  // namespace

void TrackAnalysis::writeTo(json::Writer& w) const {
  w.beginArray("cues");
  for (const auto& cue : cues) {
    w.beginObject()
        .write("time", cue.time)
        .write("type", cueTypeName(cue.type))
        .write("strength", cue.strength)
        .write("nearest_beat", cue.nearest_beat)
        .write("beat_distance", cue.beat_distance)
        .endObject();
  }
  w.endArray();

  w.beginArray("loops");
  for (const auto& loop : loops) {
    w.beginObject()
        .write("start", loop.start)
        .write("end", loop.end)
        .write("duration", loop.duration)
        .write("source", loop.source == LoopSource::Section ? "section" : "beat_phrase")
        .write("description", loopDescription(loop))
        .write("energy_stability", loop.energy_stability)
        .write("mean_energy", loop.mean_energy)
        .endObject();
  }
  w.endArray();

  w.beginObject("zones");
  for (ZoneType zone : kZoneOrder) {
    const auto& z = zones[static_cast<size_t>(zone)];
    w.beginObject(zoneName(zone))
        .write("set", z.isSet())
        .write("start", z.start)
        .write("end", z.end)
        .write("energy", z.energy)
        .write("complexity", z.complexity)
        .endObject();
  }
  w.endObject();

  w.write("energy_peak", energy_peak);
  w.beginArray("mix_points");
  for (Seconds t : mix_points) w.value(t);
  w.endArray();
}

DjError analyzeTrack(const TrackFeatureSet& track, const AnalysisConfig& config,
                     TrackAnalysis& out) {
  DjError err = validateTrackFeatures(track);
  if (err != DjError::OK) return err;

  TrackAnalysis analysis;
  analysis.cues = detectCuePoints(track.onsets, track.beats, config.cues);

  err = suggestLoops(track.sections, track.beats, track.energy, config.loops, analysis.loops);
  if (err != DjError::OK) return err;

  err = segmentPerformanceZones(track.sections, track.energy, track.duration, config.zones,
                                analysis.zones);
  if (err != DjError::OK) return err;

  analysis.energy_peak = findEnergyPeak(track.energy);
  analysis.mix_points = findMixPoints(track.energy, config.mix_points);

  out = std::move(analysis);
  return DjError::OK;
}

EnergyLevel energyLevel(double mean_energy) {
  if (mean_energy > kEnergyLevelHigh) return EnergyLevel::High;
  if (mean_energy > kEnergyLevelMedium) return EnergyLevel::Medium;
  return EnergyLevel::Low;
}

const char* energyLevelName(EnergyLevel level) {
  switch (level) {
    case EnergyLevel::High: return "High";
    case EnergyLevel::Medium: return "Medium";
    case EnergyLevel::Low: return "Low";
  }
  return "Low";
}

std::string trackNotesText(const TrackFeatureSet& track, const TrackAnalysis& analysis) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1);

  ss << std::string(50, '=') << "\n";
  ss << "DJ Performance Notes: " << track.id << "\n";
  ss << std::string(50, '=') << "\n\n";

  ss << "--- Track Info ---\n";
  ss << "BPM: " << track.tempo << "\n";
  ss << "Key: " << keyName(track.key) << "\n";
  ss << "Duration: " << track.duration << "s\n";
  ss << "Energy Level: " << energyLevelName(energyLevel(track.meanEnergy())) << "\n\n";

  ss << "--- Top Cue Points ---\n";
  size_t cue_count = std::min(kNotesCueCount, analysis.cues.size());
  for (size_t i = 0; i < cue_count; ++i) {
    const auto& cue = analysis.cues[i];
    ss << "  " << (i + 1) << ". " << cue.time << "s - " << cueTypeLabel(cue.type)
       << " (Strength: " << std::setprecision(2) << cue.strength << std::setprecision(1)
       << ")\n";
  }
  if (cue_count == 0) ss << "  (none)\n";
  ss << "\n";

  ss << "--- Loop Suggestions ---\n";
  size_t loop_count = std::min(kNotesLoopCount, analysis.loops.size());
  for (size_t i = 0; i < loop_count; ++i) {
    const auto& loop = analysis.loops[i];
    ss << "  " << (i + 1) << ". " << loop.start << "s - " << loop.end << "s (" << loop.duration
       << "s)\n";
    ss << "     Type: " << loopDescription(loop) << "\n";
  }
  if (loop_count == 0) ss << "  (none)\n";
  ss << "\n";

  ss << "--- Performance Zones ---\n";
  for (ZoneType zone : kZoneOrder) {
    const auto& z = analysis.zones[static_cast<size_t>(zone)];
    ss << "  " << zoneTitle(zone) << ": ";
    if (z.isSet()) {
      ss << z.start << "s - " << z.end << "s\n";
    } else {
      ss << "(unset)\n";
    }
  }
  ss << "\n";

  ss << "--- Mixing Tips ---\n";
  ss << "  Use " << track.tempo << " BPM for tempo matching\n";
  ss << "  Key: " << keyName(track.key) << " - compatible with " << compatibleKeyList(track.key)
     << "\n";
  ss << "  Energy peaks at " << analysis.energy_peak << "s\n";
  ss << "  Best mixing points: ";
  if (analysis.mix_points.empty()) {
    ss << "(none)";
  }
  for (size_t i = 0; i < analysis.mix_points.size(); ++i) {
    if (i > 0) ss << ", ";
    ss << analysis.mix_points[i] << "s";
  }
  ss << "\n";

  return ss.str();
}

}  // namespace dynamix
