#include "dablo_ai/npc_profile.hpp"
#include "dablo/errors.hpp"

namespace dablo_ai {

StyleWeights default_weights(Style style) {
  StyleWeights w;
  switch (style) {
    case Style::Aggressive:
      w.material = 1.0f;
      w.capture = 1.5f;
      w.chain = 8.0f;
      w.king_safety = 0.3f;
      w.advancement = 1.0f;
      w.protection = 0.5f;
      w.threat = 1.0f;
      w.mobility = 0.15f;
      w.stranded = 0.4f;
      w.center = 0.2f;
      break;
    case Style::Defensive:
      w.material = 1.0f;
      w.capture = 0.3f;
      w.chain = 4.0f;
      w.king_safety = 1.5f;
      w.advancement = 0.2f;
      w.protection = 1.2f;
      w.threat = 0.3f;
      w.mobility = 0.3f;
      w.stranded = 0.8f;
      w.center = 0.3f;
      break;
    case Style::Smart:
    case Style::Random:
    default:
      break;
  }
  return w;
}

const DifficultyLevel& DifficultySchedule::at(Difficulty d) const {
  switch (d) {
    case Difficulty::Easy: return easy;
    case Difficulty::Hard: return hard;
    case Difficulty::Medium:
    default: return medium;
  }
}

Style parse_style(const std::string& name) {
  if (name == "smart") return Style::Smart;
  if (name == "aggressive") return Style::Aggressive;
  if (name == "defensive") return Style::Defensive;
  if (name == "random") return Style::Random;
  throw dablo::ConfigError("unknown NPC style: " + name);
}

Difficulty parse_difficulty(const std::string& name) {
  if (name == "easy") return Difficulty::Easy;
  if (name == "medium") return Difficulty::Medium;
  if (name == "hard") return Difficulty::Hard;
  throw dablo::ConfigError("unknown difficulty: " + name);
}

const char* to_string(Style s) {
  switch (s) {
    case Style::Smart: return "smart";
    case Style::Aggressive: return "aggressive";
    case Style::Defensive: return "defensive";
    case Style::Random: return "random";
  }
  return "unknown";
}

const char* to_string(Difficulty d) {
  switch (d) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard: return "hard";
  }
  return "unknown";
}

} // namespace dablo_ai
