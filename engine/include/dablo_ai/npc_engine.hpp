#pragma once
#include "dablo/game_state.hpp"
#include "dablo/move.hpp"
#include "dablo_ai/heuristic.hpp"
#include "dablo_ai/npc_profile.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace dablo_ai {

struct ScoredMove {
  dablo::Move move;
  float score = 0.0f;
  Features features;
};

/**
 * One-ply NPC move selection.
 *
 * Every legal move is applied to a private copy of the state and the result is
 * scored with the profile's style weights. The difficulty then decides how often
 * a uniformly random legal move is played instead, and how many of the best
 * candidates share the remaining probability.
 *
 * An engine owns its random generator; give each thread its own engine.
 */
class NpcEngine {
public:
  NpcEngine();
  explicit NpcEngine(uint32_t seed);

  // Throws dablo::PreconditionError when the state has no legal move or is finished.
  dablo::Move select_move(const dablo::GameState& s, const NpcProfile& profile);

  // Candidates in legal_moves order, unsorted.
  std::vector<ScoredMove> score_moves(const dablo::GameState& s, const StyleWeights& w) const;

  void seed(uint32_t s) { rng_.seed(s); }
  void set_num_threads(int n) { num_threads_ = n < 1 ? 1 : n; }
  int num_threads() const { return num_threads_; }
  void set_verbose(bool v) { verbose_ = v; }

private:
  std::mt19937 rng_;
  int num_threads_ = 1;
  bool verbose_ = false;

  dablo::Move pick_from_ranked(std::vector<ScoredMove>& ranked, int top_k);
};

// A profile bound to its own engine, for game loops that alternate two NPCs.
class NpcPolicy {
public:
  explicit NpcPolicy(const NpcProfile& profile);
  NpcPolicy(const NpcProfile& profile, uint32_t seed);

  dablo::Move pick(const dablo::GameState& s) { return engine_.select_move(s, profile_); }

  const NpcProfile& profile() const { return profile_; }
  NpcEngine& engine() { return engine_; }

private:
  NpcProfile profile_;
  NpcEngine engine_;
};

} // namespace dablo_ai
