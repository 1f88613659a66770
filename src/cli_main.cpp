/**
 * @file cli_main.cpp
 * @brief Command-line interface for track analysis and set planning.
 */

#include "dynamix.h"
#include "analysis/mix_points.h"
#include "core/json_helpers.h"
#include "core/logging.h"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [options] FEATURE_FILE...\n\n";
  std::cout << "Options:\n";
  std::cout << "  --notes           Print DJ notes (cues, loops, zones) for each track\n";
  std::cout << "  --compare         Compare the first two tracks and suggest a transition\n";
  std::cout << "  --matrix          Print the pairwise compatibility matrix\n";
  std::cout << "  --order CURVE     Suggest an order (build, wave, peak_middle, constant)\n";
  std::cout << "  --greedy          Order by greedy compatibility walk\n";
  std::cout << "  --key-pass        Refine the order by key transitions\n";
  std::cout << "  --tempo-pass      Refine the order by tempo (passes run in given order)\n";
  std::cout << "  --set-minutes N   Build a set list of at most N minutes\n";
  std::cout << "  --sensitivity F   Onset sensitivity (0.0-1.0, default 0.7)\n";
  std::cout << "  --loop-min F      Minimum loop duration in seconds (default 4)\n";
  std::cout << "  --loop-max F      Maximum loop duration in seconds (default 16)\n";
  std::cout << "  --config FILE     Load analysis config from JSON\n";
  std::cout << "  --json            Output JSON to stdout\n";
  std::cout << "  --verbose         Log debug messages to stderr\n";
  std::cout << "  --quiet           Log errors only\n";
  std::cout << "  --help            Show this help message\n";
}

bool readFile(const std::string& path, std::string& out) {
  std::ifstream file(path);
  if (!file) return false;
  std::stringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

void printTrackSummary(const dynamix::DynaMix& session) {
  std::cout << "--- Tracks ---\n";
  const auto& tracks = session.tracks();
  for (size_t i = 0; i < tracks.size(); ++i) {
    const auto& t = tracks[i];
    std::cout << "  [" << i << "] " << t.id << ": " << std::fixed << std::setprecision(1)
              << t.tempo << " BPM, " << dynamix::keyName(t.key) << ", " << t.duration
              << "s, energy " << std::setprecision(3) << t.meanEnergy() << "\n";
  }
  std::cout << "\n";
}

void printOrder(const char* title, const dynamix::DynaMix& session,
                const dynamix::TrackOrder& order) {
  std::cout << "--- " << title << " ---\n";
  for (size_t pos = 0; pos < order.size(); ++pos) {
    const auto& t = session.tracks()[order[pos]];
    std::cout << "  " << (pos + 1) << ". " << t.id << " (" << std::fixed << std::setprecision(1)
              << t.tempo << " BPM, " << dynamix::keyName(t.key) << ", energy "
              << std::setprecision(3) << t.meanEnergy() << ")\n";
  }
  std::cout << "\n";
}

void writeOrderJson(dynamix::json::Writer& w, const char* key, const dynamix::DynaMix& session,
                    const dynamix::TrackOrder& order) {
  w.beginArray(key);
  for (size_t idx : order) w.value(session.tracks()[idx].id);
  w.endArray();
}

void printMatrix(const dynamix::CompatibilityMatrix& matrix) {
  std::cout << "--- Compatibility Matrix (overall) ---\n";
  std::cout << "        ";
  for (size_t j = 0; j < matrix.size(); ++j) std::cout << std::setw(7) << j;
  std::cout << "\n";
  for (size_t i = 0; i < matrix.size(); ++i) {
    std::cout << "  " << std::setw(4) << i << "  ";
    for (size_t j = 0; j < matrix.size(); ++j) {
      if (matrix.has(i, j)) {
        std::cout << std::setw(7) << std::fixed << std::setprecision(1) << matrix.overall(i, j);
      } else {
        std::cout << std::setw(7) << "-";
      }
    }
    std::cout << "\n";
  }
  if (matrix.missingCount() > 0) {
    std::cout << "  (" << matrix.missingCount() << " pairs could not be scored)\n";
  }
  std::cout << "\n";
}

void writeScoreJson(dynamix::json::Writer& w, const dynamix::CompatibilityScore& s) {
  w.write("tempo", s.tempo)
      .write("key", s.key)
      .write("energy", s.energy)
      .write("overall", s.overall)
      .write("tempo_difference", s.tempo_difference)
      .write("rating", dynamix::compatibilityRatingName(dynamix::rateCompatibility(s.overall)));
}

int reportError(dynamix::DjError err, const char* what) {
  std::cerr << "Error: " << what << ": " << dynamix::errorString(err) << "\n";
  return 1;
}

int usageError(const char* option, const char* value) {
  std::cerr << "Invalid value for " << option << ": " << value << "\n";
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  bool notes = false;
  bool compare = false;
  bool matrix_mode = false;
  bool greedy = false;
  bool order_mode = false;
  bool json_output = false;
  bool passes_given = false;
  double set_minutes = -1.0;  // < 0 = no set list
  std::string config_file;
  std::vector<std::string> inputs;
  std::vector<dynamix::RefinementPass> passes;

  // Overrides applied after --config
  bool has_sensitivity = false;
  double sensitivity = 0.0;
  bool has_loop_min = false;
  double loop_min = 0.0;
  bool has_loop_max = false;
  double loop_max = 0.0;
  std::string curve_name;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--notes") == 0) {
      notes = true;
    } else if (std::strcmp(argv[i], "--compare") == 0) {
      compare = true;
    } else if (std::strcmp(argv[i], "--matrix") == 0) {
      matrix_mode = true;
    } else if (std::strcmp(argv[i], "--order") == 0 && i + 1 < argc) {
      curve_name = argv[++i];
      order_mode = true;
    } else if (std::strcmp(argv[i], "--greedy") == 0) {
      greedy = true;
    } else if (std::strcmp(argv[i], "--key-pass") == 0) {
      passes.push_back(dynamix::RefinementPass::KeyTransition);
      passes_given = true;
    } else if (std::strcmp(argv[i], "--tempo-pass") == 0) {
      passes.push_back(dynamix::RefinementPass::TempoTransition);
      passes_given = true;
    } else if (std::strcmp(argv[i], "--set-minutes") == 0 && i + 1 < argc) {
      const char* value = argv[++i];
      if (!dynamix::parseNumber(value, set_minutes) || set_minutes < 0.0) {
        return usageError("--set-minutes", value);
      }
    } else if (std::strcmp(argv[i], "--sensitivity") == 0 && i + 1 < argc) {
      const char* value = argv[++i];
      if (!dynamix::parseNumber(value, sensitivity)) return usageError("--sensitivity", value);
      has_sensitivity = true;
    } else if (std::strcmp(argv[i], "--loop-min") == 0 && i + 1 < argc) {
      const char* value = argv[++i];
      if (!dynamix::parseNumber(value, loop_min)) return usageError("--loop-min", value);
      has_loop_min = true;
    } else if (std::strcmp(argv[i], "--loop-max") == 0 && i + 1 < argc) {
      const char* value = argv[++i];
      if (!dynamix::parseNumber(value, loop_max)) return usageError("--loop-max", value);
      has_loop_max = true;
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_file = argv[++i];
    } else if (std::strcmp(argv[i], "--json") == 0) {
      json_output = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      dynamix::setLogLevel(dynamix::LogLevel::Debug);
    } else if (std::strcmp(argv[i], "--quiet") == 0) {
      dynamix::setLogLevel(dynamix::LogLevel::Error);
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (argv[i][0] == '-' && argv[i][1] == '-') {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      return 1;
    } else {
      inputs.push_back(argv[i]);
    }
  }

  dynamix::AnalysisConfig config;
  if (!config_file.empty()) {
    std::string text;
    if (!readFile(config_file, text)) {
      std::cerr << "Error: Failed to open config: " << config_file << "\n";
      return 1;
    }
    dynamix::json::Parser parser(text);
    if (!parser.valid()) {
      std::cerr << "Error: Malformed config: " << config_file << "\n";
      return 1;
    }
    config.readFrom(parser);
  }
  if (has_sensitivity) config.onset_sensitivity = sensitivity;
  if (has_loop_min) config.loops.min_duration = loop_min;
  if (has_loop_max) config.loops.max_duration = loop_max;
  if (order_mode) config.plan.curve = dynamix::parseEnergyCurve(curve_name);
  if (passes_given) config.plan.passes = passes;

  dynamix::DjError config_err = dynamix::validateAnalysisConfig(config);
  if (config_err != dynamix::DjError::OK) {
    return reportError(config_err, "Invalid configuration");
  }

  if (inputs.empty()) {
    std::cerr << "Error: " << dynamix::errorString(dynamix::DjError::EmptyInput) << "\n\n";
    printUsage(argv[0]);
    return 1;
  }

  dynamix::DynaMix session;
  dynamix::ExtractionOptions extraction;
  extraction.onset_sensitivity = config.onset_sensitivity;
  extraction.mix_points = config.mix_points;
  dynamix::BatchReport report = session.loadTracks(inputs, extraction);

  if (session.trackCount() == 0) {
    std::cerr << report.toTextReport();
    return reportError(dynamix::DjError::EmptyInput, "No tracks loaded");
  }

  bool set_mode = set_minutes >= 0.0;
  bool any_mode = notes || compare || matrix_mode || greedy || order_mode || set_mode;

  std::ostringstream json_buffer;
  dynamix::json::Writer w(json_buffer, true);

  if (json_output) {
    w.beginObject();
    w.write("version", dynamix::DynaMix::version());
    w.beginArray("load_failures");
    for (const auto& entry : report.entries) {
      if (!entry.ok) {
        w.beginObject().write("track", entry.track_ref).write("error", entry.error).endObject();
      }
    }
    w.endArray();
  } else {
    std::cout << "DynaMix v" << dynamix::DynaMix::version() << "\n\n";
    std::cout << report.toTextReport() << "\n";
    printTrackSummary(session);
  }

  if (notes) {
    if (json_output) w.beginArray("tracks");
    for (size_t i = 0; i < session.trackCount(); ++i) {
      dynamix::TrackAnalysis analysis;
      dynamix::DjError err = session.analyzeTrack(i, config, analysis);
      if (err != dynamix::DjError::OK) {
        DYNAMIX_LOG_WARN("Analysis failed for " << session.tracks()[i].id << ": "
                                                << dynamix::errorString(err));
        continue;
      }
      if (json_output) {
        w.beginObject().write("id", session.tracks()[i].id);
        analysis.writeTo(w);
        w.endObject();
      } else {
        std::cout << dynamix::trackNotesText(session.tracks()[i], analysis) << "\n";
      }
    }
    if (json_output) w.endArray();
  }

  if (compare) {
    if (session.trackCount() < 2) {
      std::cerr << "Error: --compare needs at least two tracks\n";
      return 1;
    }
    const auto& a = session.tracks()[0];
    const auto& b = session.tracks()[1];
    dynamix::CompatibilityScore score;
    dynamix::DjError err = session.compareTracks(0, 1, score);
    if (err != dynamix::DjError::OK) return reportError(err, "Compare failed");

    dynamix::TransitionSuggestion transition;
    err = dynamix::suggestTransition(a, b, config.mix_points, transition);
    if (err != dynamix::DjError::OK) return reportError(err, "Transition failed");

    std::vector<std::string> advice = dynamix::mixingAdvice(score, a, b);
    if (json_output) {
      w.beginObject("compare");
      w.write("from", a.id).write("to", b.id);
      writeScoreJson(w, score);
      w.beginArray("advice");
      for (const auto& line : advice) w.value(line);
      w.endArray();
      w.beginArray("exit_points");
      for (double t : transition.exit_points) w.value(t);
      w.endArray();
      w.beginArray("entry_points");
      for (double t : transition.entry_points) w.value(t);
      w.endArray();
      w.write("recommended_mix_duration", transition.recommended_mix_duration);
      w.write("tempo_sync_required", transition.tempo_sync_required);
      w.endObject();
    } else {
      std::cout << "--- Compatibility: " << a.id << " -> " << b.id << " ---\n";
      std::cout << std::fixed << std::setprecision(1);
      std::cout << "  Tempo:   " << score.tempo << " (difference " << score.tempo_difference
                << " BPM)\n";
      std::cout << "  Key:     " << score.key << "\n";
      std::cout << "  Energy:  " << score.energy << "\n";
      std::cout << "  Overall: " << score.overall << " ("
                << dynamix::compatibilityRatingName(dynamix::rateCompatibility(score.overall))
                << ")\n\n";
      std::cout << "  Recommended mix duration: " << transition.recommended_mix_duration << "s\n";
      if (transition.tempo_sync_required) {
        std::cout << "  Tempo sync required for a smooth transition\n";
      }
      std::cout << "  Exit points:";
      for (double t : transition.exit_points) std::cout << " " << t << "s";
      std::cout << "\n  Entry points:";
      for (double t : transition.entry_points) std::cout << " " << t << "s";
      std::cout << "\n\n  Tips:\n";
      for (const auto& line : advice) std::cout << "  - " << line << "\n";
      std::cout << "\n";
    }
  }

  if (matrix_mode) {
    dynamix::CompatibilityMatrix matrix;
    dynamix::DjError err = session.compatibilityMatrix(matrix);
    if (err != dynamix::DjError::OK) return reportError(err, "Matrix failed");
    if (json_output) {
      w.beginArray("matrix");
      for (size_t i = 0; i < matrix.size(); ++i) {
        for (size_t j = 0; j < matrix.size(); ++j) {
          const dynamix::CompatibilityScore* s = matrix.get(i, j);
          if (!s) continue;
          w.beginObject();
          w.write("from", session.tracks()[i].id).write("to", session.tracks()[j].id);
          writeScoreJson(w, *s);
          w.endObject();
        }
      }
      w.endArray();
    } else {
      printMatrix(matrix);
    }
  }

  if (greedy) {
    dynamix::TrackOrder order;
    dynamix::DjError err = session.greedyOrder(order);
    if (err != dynamix::DjError::OK) return reportError(err, "Greedy order failed");
    if (json_output) {
      writeOrderJson(w, "greedy_order", session, order);
    } else {
      printOrder("Greedy Compatibility Order", session, order);
    }
  }

  if (order_mode) {
    dynamix::TrackOrder order;
    dynamix::DjError err = session.suggestOrder(config.plan, order);
    if (err != dynamix::DjError::OK) return reportError(err, "Order failed");
    if (json_output) {
      writeOrderJson(w, "order", session, order);
    } else {
      std::string title = std::string("Order (") + dynamix::energyCurveName(config.plan.curve) + ")";
      printOrder(title.c_str(), session, order);
    }
  }

  if (set_mode) {
    dynamix::SetList set;
    dynamix::DjError err = session.createSetList(set_minutes, config.plan, set);
    if (err != dynamix::DjError::OK) return reportError(err, "Set list failed");
    if (json_output) {
      w.beginObject("set_list");
      w.write("budget", set.budget).write("total_duration", set.total_duration);
      w.beginArray("tracks");
      for (const auto& t : set.tracks) w.value(t.id);
      w.endArray();
      w.endObject();
    } else {
      std::cout << "--- Set List (" << std::fixed << std::setprecision(1) << set_minutes
                << " min) ---\n";
      for (size_t i = 0; i < set.tracks.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << set.tracks[i].id << " ("
                  << set.tracks[i].duration << "s)\n";
      }
      std::cout << "  Total: " << set.total_duration << "s of " << set.budget << "s\n\n";
    }
  }

  if (json_output) {
    w.endObject();
    std::cout << json_buffer.str() << "\n";
  } else if (!any_mode) {
    std::cout << "Use --notes, --compare, --matrix, --order, --greedy or --set-minutes "
                 "for analysis (see --help).\n";
  }

  return report.failureCount() > 0 ? 2 : 0;
}
