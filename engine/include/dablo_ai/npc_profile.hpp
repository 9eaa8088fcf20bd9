#pragma once
#include <optional>
#include <string>

namespace dablo_ai {

enum class Style { Smart, Aggressive, Defensive, Random };

enum class Difficulty { Easy, Medium, Hard };

/**
 * Feature weights of the evaluation function.
 *
 * Every candidate move is scored on the state it produces, from the mover's
 * point of view, as the weighted sum of the features in heuristic.hpp.
 */
struct StyleWeights {
  float material = 1.0f;     // rank-value balance after the move
  float capture = 0.8f;      // value taken by this move
  float chain = 6.0f;        // flat bonus when the capture continues as a chain
  float king_safety = 1.0f;  // reply threat and distance of the nearest enemy
  float advancement = 0.5f;  // forward progress of own pieces minus the opponent's
  float protection = 0.9f;   // worst material loss to a full opponent reply
  float threat = 0.7f;       // captures available next turn (capped)
  float mobility = 0.25f;    // legal moves available next turn (capped)
  float stranded = 0.6f;     // pieces parked where they can no longer step
  float center = 0.2f;       // destination in the middle of the board
};

StyleWeights default_weights(Style style);

// How often a difficulty abandons the heuristic and how wide it samples among the best.
struct DifficultyLevel {
  float random_move_probability = 0.0f;
  int top_k = 1;  // candidates considered, picked with linear weights k, k-1, ..., 1
};

struct DifficultySchedule {
  DifficultyLevel easy{0.40f, 3};
  DifficultyLevel medium{0.20f, 2};
  DifficultyLevel hard{0.0f, 1};

  const DifficultyLevel& at(Difficulty d) const;
};

struct NpcProfile {
  Style style = Style::Smart;
  Difficulty difficulty = Difficulty::Medium;
  DifficultySchedule schedule;
  std::optional<StyleWeights> weights;  // overrides default_weights(style)

  StyleWeights effective_weights() const {
    return weights ? *weights : default_weights(style);
  }
  const DifficultyLevel& level() const { return schedule.at(difficulty); }
};

// Accept lower-case names ("smart", "hard", ...). Throw dablo::ConfigError otherwise.
Style parse_style(const std::string& name);
Difficulty parse_difficulty(const std::string& name);

const char* to_string(Style s);
const char* to_string(Difficulty d);

} // namespace dablo_ai
