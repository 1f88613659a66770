/**
 * @file types.cpp
 * @brief Key parsing and display names for core types.
 */

#include "core/types.h"

#include <cctype>
#include <sstream>

namespace dynamix {

namespace {

constexpr const char* PITCH_CLASS_NAMES[PITCH_CLASS_COUNT] = {"C",  "C#", "D",  "D#", "E",  "F",
                                                             "F#", "G",  "G#", "A",  "A#", "B"};

// Natural note letter to pitch class.
int letterToPitchClass(char letter) {
  switch (std::toupper(static_cast<unsigned char>(letter))) {
    case 'C': return 0;
    case 'D': return 2;
    case 'E': return 4;
    case 'F': return 5;
    case 'G': return 7;
    case 'A': return 9;
    case 'B': return 11;
    default: return -1;
  }
}

std::string toLower(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

}  // namespace

bool parseKey(const std::string& text, MusicalKey& out) {
  std::istringstream iss(text);
  std::string root_token;
  std::string mode_token;
  if (!(iss >> root_token)) return false;
  iss >> mode_token;

  int pc = letterToPitchClass(root_token[0]);
  if (pc < 0) return false;

  size_t pos = 1;
  if (pos < root_token.size() && root_token[pos] == '#') {
    pc += 1;
    ++pos;
  } else if (pos < root_token.size() && root_token[pos] == 'b') {
    pc += 11;
    ++pos;
  }

  KeyMode mode = KeyMode::Major;
  // "Am" / "F#m" shorthand
  if (pos < root_token.size()) {
    if (root_token.substr(pos) == "m") {
      mode = KeyMode::Minor;
    } else {
      return false;
    }
  }

  if (!mode_token.empty()) {
    std::string lowered = toLower(mode_token);
    if (lowered == "major" || lowered == "maj") {
      mode = KeyMode::Major;
    } else if (lowered == "minor" || lowered == "min") {
      mode = KeyMode::Minor;
    } else {
      return false;
    }
  }

  out.root = static_cast<PitchClass>(pc % PITCH_CLASS_COUNT);
  out.mode = mode;
  return true;
}

std::string keyName(const MusicalKey& key) {
  std::string name = pitchClassName(key.root);
  name += key.mode == KeyMode::Major ? " major" : " minor";
  return name;
}

const char* pitchClassName(PitchClass pc) {
  return PITCH_CLASS_NAMES[static_cast<uint8_t>(pc) % PITCH_CLASS_COUNT];
}

PitchClass transpose(PitchClass pc, int semitones) {
  int value = (static_cast<int>(pc) + semitones) % PITCH_CLASS_COUNT;
  if (value < 0) value += PITCH_CLASS_COUNT;
  return static_cast<PitchClass>(value);
}

const char* cueTypeName(CueType type) {
  switch (type) {
    case CueType::BeatSync: return "beat_sync";
    case CueType::StrongOnset: return "strong_onset";
    case CueType::Onset: return "onset";
  }
  return "onset";
}

const char* cueTypeLabel(CueType type) {
  switch (type) {
    case CueType::BeatSync: return "Beat Sync";
    case CueType::StrongOnset: return "Strong Onset";
    case CueType::Onset: return "Onset";
  }
  return "Onset";
}

const char* zoneName(ZoneType zone) {
  switch (zone) {
    case ZoneType::Intro: return "intro";
    case ZoneType::Build: return "build";
    case ZoneType::Drop: return "drop";
    case ZoneType::Breakdown: return "breakdown";
    case ZoneType::Outro: return "outro";
  }
  return "unknown";
}

std::string loopDescription(const LoopCandidate& loop) {
  std::ostringstream oss;
  if (loop.source == LoopSource::Section) {
    oss << "Section: " << loop.label;
  } else {
    oss << "Beat Loop: " << loop.beat_count << " beats";
  }
  return oss.str();
}

}  // namespace dynamix
