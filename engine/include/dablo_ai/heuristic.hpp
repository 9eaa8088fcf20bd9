#pragma once
#include "dablo/game_state.hpp"
#include "dablo/move.hpp"
#include "dablo_ai/npc_profile.hpp"

namespace dablo_ai {

constexpr float kTerminalScore = 1000.0f;
// Charged when some opponent reply wins the game outright.
constexpr float kLosingReplyScore = 500.0f;

// King-safety bands, in board units (one row = 1.0).
constexpr float kKingLostPenalty = -50.0f;
constexpr float kKingCapturablePenalty = -5.0f;
constexpr float kImmediateDangerDist = 1.1f;
constexpr float kCloseDangerDist = 1.6f;
constexpr float kMediumSafetyDist = 2.5f;
constexpr float kImmediateDangerPenalty = -4.0f;
constexpr float kCloseDangerPenalty = -2.0f;
constexpr float kSafeBonus = 0.2f;
constexpr float kVerySafeBonus = 0.5f;

constexpr float kThreatScale = 0.3f;
constexpr float kMaxThreat = 3.0f;
constexpr int kMobilityCap = 8;

// Raw features of one candidate, all from the mover's point of view.
struct Features {
  float material = 0.0f;     // own piece value minus opponent's, after the move
  float captured = 0.0f;     // value of the piece taken by this move
  float chain = 0.0f;        // 1 when the move leaves a forced continuation
  float follow_up = 0.0f;    // best capture value available in that continuation
  float king_safety = 0.0f;  // one of the king-safety bands above
  float advancement = 0.0f;  // own forward progress minus opponent's, in rows
  float exposure = 0.0f;     // worst material loss over the opponent's full replies
  float danger = 0.0f;       // 1 when some opponent reply wins the game
  float threat = 0.0f;       // scaled, capped value of captures available next turn
  float mobility = 0.0f;     // own legal moves next turn, capped at kMobilityCap
  float stranded = 0.0f;     // own non-king pieces left without a forward step
  float center = 0.0f;       // 0, 0.5 or 1 depending on the destination
  float terminal = 0.0f;     // +1 the move wins, -1 it loses, 0 otherwise
};

// `after` must be Rules::apply_move(before, m). Positional terms are taken once the
// mover's turn is over, with any chain played out greedily.
Features extract_features(const dablo::GameState& before, const dablo::Move& m,
                          const dablo::GameState& after);

// Plays a pending chain to its end, taking the most valuable piece at every leg.
dablo::GameState finish_turn(dablo::GameState s);

float score(const Features& f, const StyleWeights& w);

// Individual terms, exposed for tests and debugging tools.
float material_balance(const dablo::GameState& s, dablo::Player me);
float advancement_balance(const dablo::GameState& s, dablo::Player me);
float king_safety(const dablo::GameState& s, dablo::Player me);
float capture_exposure(const dablo::GameState& s, dablo::Player me);
int mobility(const dablo::GameState& s, dablo::Player me);
int stranded_pieces(const dablo::GameState& s, dablo::Player me);
// 0 for kNoNode and nodes outside `g`.
float center_bonus(const dablo::BoardGraph& g, dablo::NodeId n);

} // namespace dablo_ai
