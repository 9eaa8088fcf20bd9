#include "dablo_ai/npc_engine.hpp"
#include "dablo/errors.hpp"
#include "dablo/rules.hpp"
#include "dablo/move_list.hpp"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace dablo;

namespace dablo_ai {

NpcEngine::NpcEngine() : rng_(std::random_device{}()) {}

NpcEngine::NpcEngine(uint32_t seed) : rng_(seed) {}

std::vector<ScoredMove> NpcEngine::score_moves(const GameState& s, const StyleWeights& w) const {
  MoveList moves;
  Rules::legal_moves(s, moves);

  std::vector<ScoredMove> out(moves.size);
  auto work = [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
      GameState after = Rules::apply_move(s, moves[i]);
      ScoredMove& sm = out[i];
      sm.move = moves[i];
      sm.features = extract_features(s, moves[i], after);
      sm.score = score(sm.features, w);
    }
  };

  const size_t n = moves.size;
  const size_t workers = std::min(static_cast<size_t>(num_threads_), n);
  if (workers <= 1) {
    work(0, n);
    return out;
  }

  // Each worker scores a contiguous slice on its own copies of the state.
  std::vector<std::thread> threads;
  std::vector<std::exception_ptr> errors(workers);
  const size_t chunk = (n + workers - 1) / workers;
  for (size_t t = 0; t < workers; ++t) {
    size_t begin = t * chunk;
    size_t end = std::min(n, begin + chunk);
    threads.emplace_back([&, t, begin, end]() {
      try {
        work(begin, end);
      } catch (...) {
        errors[t] = std::current_exception();
      }
    });
  }
  for (auto& th : threads) th.join();
  for (auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  return out;
}

Move NpcEngine::select_move(const GameState& s, const NpcProfile& profile) {
  MoveList moves;
  Rules::legal_moves(s, moves);
  if (moves.empty()) {
    throw PreconditionError("select_move called with no legal move");
  }
  if (!s.in_chain()) {
    Outcome o = Rules::evaluate(s, false);
    if (o.finished()) {
      throw PreconditionError("select_move called on a finished game: " + describe(o));
    }
  }

  std::uniform_int_distribution<size_t> any(0, moves.size - 1);
  if (profile.style == Style::Random) {
    return moves[any(rng_)];
  }

  const DifficultyLevel& level = profile.level();
  if (level.random_move_probability > 0.0f) {
    std::uniform_real_distribution<float> coin(0.0f, 1.0f);
    if (coin(rng_) < level.random_move_probability) {
      return moves[any(rng_)];
    }
  }

  if (moves.size == 1) return moves[0];

  std::vector<ScoredMove> ranked = score_moves(s, profile.effective_weights());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const ScoredMove& a, const ScoredMove& b) { return a.score > b.score; });

  if (verbose_) {
    std::cout << "[npc " << to_string(profile.style) << "/" << to_string(profile.difficulty)
              << "] player " << to_string(s.current_player()) << ", "
              << ranked.size() << " candidates\n";
    for (size_t i = 0; i < ranked.size() && i < 5; ++i) {
      std::cout << "  " << std::fixed << std::setprecision(2) << std::setw(8) << ranked[i].score
                << "  " << to_string(ranked[i].move, s.graph()) << "\n";
    }
  }

  return pick_from_ranked(ranked, level.top_k);
}

Move NpcEngine::pick_from_ranked(std::vector<ScoredMove>& ranked, int top_k) {
  if (top_k <= 1) {
    // Best score wins; exact ties are broken uniformly.
    size_t ties = 1;
    while (ties < ranked.size() && ranked[ties].score == ranked[0].score) ++ties;
    if (ties == 1) return ranked[0].move;
    std::uniform_int_distribution<size_t> pick(0, ties - 1);
    return ranked[pick(rng_)].move;
  }

  const size_t k = std::min(static_cast<size_t>(top_k), ranked.size());
  std::vector<double> weights;
  weights.reserve(k);
  for (size_t i = 0; i < k; ++i) weights.push_back(static_cast<double>(k - i));
  std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
  return ranked[pick(rng_)].move;
}

NpcPolicy::NpcPolicy(const NpcProfile& profile) : profile_(profile) {}

NpcPolicy::NpcPolicy(const NpcProfile& profile, uint32_t seed)
  : profile_(profile), engine_(seed) {}

} // namespace dablo_ai
