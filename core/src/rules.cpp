#include "dablo/rules.hpp"
#include "dablo/game_state.hpp"
#include "dablo/board_graph.hpp"

namespace dablo {

namespace {

// Jumps over adjacent capturable enemies onto empty landings, in any direction.
void gen_captures(const GameState& s, NodeId from, NodeId forbidden, bool chain, MoveList& out) {
  const BoardGraph& g = s.graph();
  const Piece& attacker = s.at(from);

  for (NodeId over : g.neighbors(from)) {
    const Piece& target = s.at(over);
    if (!can_capture(attacker, target)) continue;

    NodeId land = g.landing(from, over);
    if (land == kNoNode || land == forbidden) continue;
    if (!s.at(land).empty()) continue;

    Move m;
    m.from = from; m.to = land; m.captured = over; m.chain = chain;
    out.push_back(m);
  }
}

void gen_steps(const GameState& s, NodeId from, MoveList& out) {
  const BoardGraph& g = s.graph();
  for (NodeId to : g.forward_neighbors(from, s.at(from).owner)) {
    if (!s.at(to).empty()) continue;
    Move m;
    m.from = from; m.to = to;
    out.push_back(m);
  }
}

} // namespace

void Rules::legal_moves(const GameState& s, MoveList& out) {
  out.clear();

  // Forced continuation: only the chain piece may move, and only by capturing.
  const PendingChain& chain = s.pending_chain();
  if (chain.active()) {
    gen_captures(s, chain.node, chain.origin, true, out);
    return;
  }

  const BoardGraph& g = s.graph();
  Player p = s.current_player();

  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    if (s.at(n).owner != p) continue;
    gen_captures(s, n, kNoNode, false, out);
  }
  if (!out.empty()) return;  // captures are compulsory across the whole side

  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    if (s.at(n).owner != p) continue;
    gen_steps(s, n, out);
  }
}

void Rules::piece_moves(const GameState& s, NodeId from, MoveList& out) {
  out.clear();
  if (from == kNoNode || from >= s.graph().size() || s.at(from).empty()) return;
  gen_captures(s, from, kNoNode, false, out);
  gen_steps(s, from, out);
}

bool Rules::has_capture(const GameState& s, Player p) {
  const BoardGraph& g = s.graph();
  MoveList tmp;
  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    if (s.at(n).owner != p) continue;
    gen_captures(s, n, kNoNode, false, tmp);
    if (!tmp.empty()) return true;
  }
  return false;
}

bool Rules::is_legal(const GameState& s, const Move& m) {
  MoveList moves;
  legal_moves(s, moves);
  for (const Move& l : moves) {
    if (l.from == m.from && l.to == m.to && l.captured == m.captured) return true;
  }
  return false;
}

GameState Rules::apply_move(const GameState& s, const Move& m) {
  GameState next = s;
  next.apply_move(m);
  return next;
}

} // namespace dablo
