#include "io/feature_reader.h"

#include <fstream>
#include <sstream>
#include <utility>

#include "analysis/cue_points.h"
#include "analysis/mix_points.h"
#include "core/json_helpers.h"
#include "core/logging.h"
#include "core/series_utils.h"
#include "core/track_features.h"

namespace dynamix {

namespace {

enum class SeriesStatus { Ok, Malformed, LengthMismatch };

// Reads {"<times_key>": [...], "<values_key>": [...]} under key. A missing
// key yields an empty series.
SeriesStatus readSeries(const json::Parser& root, const char* key, const char* values_key,
                        std::vector<TimedValue>& out) {
  out.clear();
  if (!root.has(key)) return SeriesStatus::Ok;
  if (!root.isObject(key)) return SeriesStatus::Malformed;

  json::Parser obj = root.getObject(key);
  std::vector<double> times;
  std::vector<double> values;
  if (!obj.getNumberArray("times", times) || !obj.getNumberArray(values_key, values)) {
    return SeriesStatus::Malformed;
  }
  if (times.size() != values.size()) return SeriesStatus::LengthMismatch;

  out.reserve(times.size());
  for (size_t i = 0; i < times.size(); ++i) {
    out.push_back({times[i], values[i]});
  }
  return SeriesStatus::Ok;
}

std::string seriesError(SeriesStatus status, const char* key) {
  if (status == SeriesStatus::LengthMismatch) {
    return std::string("Mismatched array lengths in '") + key + "'";
  }
  return std::string("Malformed series '") + key + "'";
}

// Checks that every time value lies within [0, duration], series are
// time-ordered and sections are ordered without overlap.
std::string timelineError(const TrackFeatureSet& track) {
  const double duration = track.duration;
  if (!timesWithin(track.energy, 0.0, duration)) {
    return "Energy timestamps outside track duration";
  }
  const std::pair<const char*, const std::vector<TimedValue>*> events[] = {
      {"beats", &track.beats}, {"onsets", &track.onsets}};
  for (const auto& e : events) {
    if (!isTimeOrdered(*e.second)) {
      return std::string("Timestamps in '") + e.first + "' are not time-ordered";
    }
    if (!timesWithin(*e.second, 0.0, duration)) {
      return std::string("Timestamps in '") + e.first + "' outside track duration";
    }
  }
  for (Seconds drop : track.drops) {
    if (!(drop >= 0.0 && drop <= duration)) {
      return "Drop time outside track duration";
    }
  }
  for (size_t i = 0; i < track.sections.size(); ++i) {
    const TrackSection& section = track.sections[i];
    if (!(section.start >= 0.0 && section.end <= duration)) {
      return "Section '" + section.label + "' lies outside track duration";
    }
    if (i > 0 && section.start < track.sections[i - 1].end) {
      return "Section '" + section.label + "' overlaps the previous section";
    }
  }
  return std::string();
}

}  // namespace

bool FeatureReader::fail(const std::string& message) {
  error_ = message;
  return false;
}

bool FeatureReader::extract(const std::string& path, const ExtractionOptions& options,
                            TrackFeatureSet& out) {
  error_.clear();
  std::ifstream file(path);
  if (!file) {
    return fail("Failed to open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return fail("Failed to read file: " + path);
  }
  return parse(buffer.str(), path, options, out);
}

bool FeatureReader::parse(const std::string& json, const std::string& track_ref,
                          const ExtractionOptions& options, TrackFeatureSet& out) {
  error_.clear();

  json::Parser root(json);
  if (!root.valid()) {
    return fail("Malformed JSON in " + track_ref);
  }

  TrackFeatureSet track;
  track.id = root.getString("id", track_ref);
  if (track.id.empty()) track.id = track_ref;

  if (!root.isNumber("duration")) {
    return fail("Missing or non-numeric 'duration'");
  }
  track.duration = root.getDouble("duration");

  if (!root.isObject("tempo") || !root.getObject("tempo").isNumber("bpm")) {
    return fail("Missing 'tempo.bpm'");
  }
  json::Parser tempo = root.getObject("tempo");
  track.tempo = tempo.getDouble("bpm");
  track.tempo_confidence = tempo.getDouble("confidence", 0.0);

  if (root.isObject("key")) {
    json::Parser key = root.getObject("key");
    std::string name = key.getString("name");
    if (!name.empty() && !parseKey(name, track.key)) {
      return fail("Unrecognized key '" + name + "'");
    }
    track.key_confidence = key.getDouble("confidence", 0.0);
  }

  SeriesStatus status = readSeries(root, "energy", "rms", track.energy);
  if (status != SeriesStatus::Ok) return fail(seriesError(status, "energy"));
  if (!isStrictlyIncreasing(track.energy)) {
    return fail("Energy timestamps are not strictly increasing");
  }

  status = readSeries(root, "beats", "strengths", track.beats);
  if (status != SeriesStatus::Ok) return fail(seriesError(status, "beats"));

  status = readSeries(root, "onsets", "strengths", track.onsets);
  if (status != SeriesStatus::Ok) return fail(seriesError(status, "onsets"));

  if (root.has("sections")) {
    std::vector<json::Parser> sections;
    if (!root.getObjectArray("sections", sections)) {
      return fail("Malformed 'sections'");
    }
    for (const auto& s : sections) {
      TrackSection section;
      section.label = s.getString("label");
      section.start = s.getDouble("start");
      section.end = s.getDouble("end");
      if (section.end < section.start) {
        return fail("Section '" + section.label + "' ends before it starts");
      }
      track.sections.push_back(section);
    }
  }

  if (root.isObject("energy_summary")) {
    json::Parser summary = root.getObject("energy_summary");
    track.energy_summary.mean = summary.getDouble("mean");
    track.energy_summary.max = summary.getDouble("max");
    track.energy_summary.stddev = summary.getDouble("stddev");
  } else {
    track.energy_summary = computeEnergySummary(track.energy);
  }

  if (root.has("drops")) {
    if (!root.getNumberArray("drops", track.drops)) {
      return fail("Malformed 'drops'");
    }
  } else {
    track.drops = detectDrops(track.energy, options.mix_points);
  }

  if (filterOnsetsBySensitivity(track.onsets, options.onset_sensitivity) != DjError::OK) {
    return fail(errorString(DjError::InvalidSensitivity));
  }

  DjError err = validateTrackFeatures(track);
  if (err != DjError::OK) {
    return fail(std::string("Invalid features: ") + errorString(err));
  }

  std::string timeline = timelineError(track);
  if (!timeline.empty()) {
    return fail(timeline);
  }

  DYNAMIX_LOG_DEBUG_STREAM() << "Read " << track.id << ": " << track.energy.size()
                             << " energy samples, " << track.beats.size() << " beats, "
                             << track.onsets.size() << " onsets, " << track.sections.size()
                             << " sections";

  out = std::move(track);
  return true;
}

}  // namespace dynamix
