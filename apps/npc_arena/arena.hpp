#pragma once
#include "dablo/game_state.hpp"
#include "dablo/rules.hpp"
#include "dablo/move_list.hpp"
#include "dablo_ai/npc_engine.hpp"
#include "dablo_ai/npc_profile.hpp"
#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

namespace dablo_arena {

struct ArenaConfig {
  int num_games = 100;
  dablo_ai::NpcProfile npc_a;
  dablo_ai::NpcProfile npc_b;
  int num_threads = 4;
  dablo::GameConfig game = dablo::GameConfig::quick();
  int progress_every = 25;  // games between progress lines, 0 for none
};

struct GameResult {
  dablo::Outcome outcome;
  int num_moves = 0;
};

// Shared by all workers. Every member is touched under mutex_, and so is the log.
struct Tally {
  std::mutex mutex_;
  int a_wins = 0;
  int b_wins = 0;
  int draws = 0;
  int failures = 0;
  long long total_moves = 0;
  std::map<std::string, int> reasons;

  void fail(const std::string& what, std::ostream& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures++;
    err << "Worker error: " << what << "\n";
  }

  void add(const GameResult& r) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (r.outcome.is_win_for(dablo::Player::A)) a_wins++;
    else if (r.outcome.is_win_for(dablo::Player::B)) b_wins++;
    else draws++;
    total_moves += r.num_moves;
    reasons[dablo::to_string(r.outcome.reason)]++;
  }

  void progress(int done, int total, std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out << "  Progress: " << done << "/" << total << "\n";
  }

  int games() {
    std::lock_guard<std::mutex> lock(mutex_);
    return a_wins + b_wins + draws;
  }
};

inline GameResult play_game(dablo_ai::NpcPolicy& a, dablo_ai::NpcPolicy& b,
                            const dablo::GameConfig& config) {
  dablo::GameState state = dablo::new_game(config);

  while (true) {
    dablo::MoveList moves;
    dablo::Rules::legal_moves(state, moves);

    dablo::Outcome o = dablo::Rules::evaluate(state, moves.empty());
    if (o.finished()) {
      return GameResult{o, state.move_count()};
    }

    dablo_ai::NpcPolicy& npc = (state.current_player() == dablo::Player::A) ? a : b;
    state.apply_move(npc.pick(state));
  }
}

// Plays games until the shared counter passes cfg.num_games.
inline void worker(const ArenaConfig& cfg, uint32_t seed, std::atomic<int>& next_game,
                   Tally& tally, std::ostream& log) {
  dablo_ai::NpcPolicy a(cfg.npc_a, seed);
  dablo_ai::NpcPolicy b(cfg.npc_b, seed ^ 0x9e3779b9u);

  try {
    while (true) {
      int game = next_game.fetch_add(1);
      if (game >= cfg.num_games) break;
      tally.add(play_game(a, b, cfg.game));

      if (cfg.progress_every > 0 && (game + 1) % cfg.progress_every == 0) {
        tally.progress(game + 1, cfg.num_games, log);
      }
    }
  } catch (const std::exception& e) {
    tally.fail(e.what(), std::cerr);
  }
}

} // namespace dablo_arena
