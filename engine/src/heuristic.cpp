#include "dablo_ai/heuristic.hpp"
#include "dablo/rules.hpp"
#include "dablo/move_list.hpp"
#include <algorithm>
#include <bitset>
#include <cmath>
#include <cstdlib>
#include <limits>

using namespace dablo;

namespace dablo_ai {

namespace {

// Sum of the values of distinct pieces taken by the capturing moves in `moves`.
float captured_value(const GameState& s, const MoveList& moves) {
  std::bitset<kMaxNodes> seen;
  float total = 0.0f;
  for (const Move& m : moves) {
    if (!m.is_capture() || seen.test(m.captured)) continue;
    seen.set(m.captured);
    total += piece_value(s.at(m.captured).rank);
  }
  return total;
}

struct ReplyScan {
  float worst_loss = 0.0f;
  bool losing = false;
};

// Every full reply of the opponent, chains included.
ReplyScan scan_replies(const GameState& s, Player me) {
  ReplyScan scan;
  const GameState turn = s.with_side_to_move(opponent(me));
  if (Rules::evaluate(turn).finished()) return scan;

  const float base = material_balance(turn, me);
  MoveList replies;
  Rules::legal_moves(turn, replies);
  for (const Move& r : replies) {
    GameState next = finish_turn(Rules::apply_move(turn, r));
    scan.worst_loss = std::max(scan.worst_loss, base - material_balance(next, me));
    if (Rules::evaluate(next).is_win_for(opponent(me))) scan.losing = true;
  }
  return scan;
}

} // namespace

GameState finish_turn(GameState s) {
  while (s.in_chain()) {
    MoveList cont;
    Rules::legal_moves(s, cont);
    const Move* best = &cont[0];
    for (const Move& c : cont) {
      if (piece_value(s.at(c.captured).rank) > piece_value(s.at(best->captured).rank)) best = &c;
    }
    s.apply_move(*best);
  }
  return s;
}

float material_balance(const GameState& s, Player me) {
  const BoardGraph& g = s.graph();
  float total = 0.0f;
  for (int i = 0; i < g.size(); ++i) {
    const Piece& p = s.at(static_cast<NodeId>(i));
    if (p.empty()) continue;
    float v = piece_value(p.rank);
    total += (p.owner == me) ? v : -v;
  }
  return total;
}

float advancement_balance(const GameState& s, Player me) {
  const BoardGraph& g = s.graph();
  float total = 0.0f;
  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    const Piece& p = s.at(n);
    if (p.empty() || p.rank == Rank::King) continue;
    float rows = g.progress2(n, p.owner) / 2.0f;
    total += (p.owner == me) ? rows : -rows;
  }
  return total / static_cast<float>(g.rows() - 1);
}

float king_safety(const GameState& s, Player me) {
  NodeId king = s.king_node(me);
  if (king == kNoNode) return kKingLostPenalty;

  MoveList replies;
  Rules::legal_moves(s.with_side_to_move(opponent(me)), replies);
  for (const Move& m : replies) {
    if (m.captured == king) return kKingCapturablePenalty;
  }

  const BoardGraph& g = s.graph();
  float min_dist = std::numeric_limits<float>::infinity();
  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    if (s.at(n).owner != opponent(me)) continue;
    float dr = (g.row2(n) - g.row2(king)) / 2.0f;
    float dc = (g.col2(n) - g.col2(king)) / 2.0f;
    min_dist = std::min(min_dist, std::sqrt(dr * dr + dc * dc));
  }

  if (min_dist < kImmediateDangerDist) return kImmediateDangerPenalty;
  if (min_dist < kCloseDangerDist) return kCloseDangerPenalty;
  if (min_dist < kMediumSafetyDist) return kSafeBonus;
  return kVerySafeBonus;
}

float capture_exposure(const GameState& s, Player me) {
  return scan_replies(s, me).worst_loss;
}

int mobility(const GameState& s, Player me) {
  MoveList moves;
  Rules::legal_moves(s.with_side_to_move(me), moves);
  return static_cast<int>(moves.size);
}

int stranded_pieces(const GameState& s, Player me) {
  const BoardGraph& g = s.graph();
  int count = 0;
  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    const Piece& p = s.at(n);
    if (p.owner != me || p.rank == Rank::King) continue;
    if (g.forward_neighbors(n, me).count == 0) ++count;
  }
  return count;
}

float center_bonus(const BoardGraph& g, NodeId n) {
  if (n == kNoNode || n >= g.size()) return 0.0f;
  float bonus = 0.0f;
  if (std::abs(g.row2(n) - (g.rows() - 1)) <= 1) bonus += 0.5f;
  if (std::abs(g.col2(n) - (g.cols() - 1)) <= 1) bonus += 0.5f;
  return bonus;
}

Features extract_features(const GameState& before, const Move& m, const GameState& after) {
  const Player me = before.current_player();
  Features f;

  if (m.is_capture()) f.captured = piece_value(before.at(m.captured).rank);

  if (after.in_chain()) {
    f.chain = 1.0f;
    MoveList cont;
    Rules::legal_moves(after, cont);
    for (const Move& c : cont) {
      f.follow_up = std::max(f.follow_up, piece_value(after.at(c.captured).rank));
    }
  }

  const GameState settled = finish_turn(after);
  f.material = material_balance(settled, me);
  f.center = center_bonus(settled.graph(), m.to);

  Outcome o = Rules::evaluate(settled);
  if (o.is_win_for(me)) f.terminal = 1.0f;
  else if (o.is_win_for(opponent(me))) f.terminal = -1.0f;
  if (o.finished()) return f;

  f.king_safety = king_safety(settled, me);
  f.advancement = advancement_balance(settled, me);
  f.stranded = static_cast<float>(stranded_pieces(settled, me));

  ReplyScan scan = scan_replies(settled, me);
  f.exposure = scan.worst_loss;
  f.danger = scan.losing ? 1.0f : 0.0f;

  MoveList mine;
  Rules::legal_moves(settled.with_side_to_move(me), mine);
  f.mobility = static_cast<float>(std::min(static_cast<int>(mine.size), kMobilityCap));
  f.threat = std::min(captured_value(settled, mine) * kThreatScale, kMaxThreat);
  return f;
}

float score(const Features& f, const StyleWeights& w) {
  return w.material * f.material
       + w.capture * (f.captured + f.follow_up)
       + w.chain * f.chain
       + w.king_safety * f.king_safety
       + w.advancement * f.advancement
       - w.protection * f.exposure
       + w.threat * f.threat
       + w.mobility * f.mobility
       - w.stranded * f.stranded
       + w.center * f.center
       + kTerminalScore * f.terminal
       - kLosingReplyScore * f.danger;
}

} // namespace dablo_ai
