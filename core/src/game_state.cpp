#include "dablo/game_state.hpp"
#include "dablo/errors.hpp"
#include "dablo/rules.hpp"
#include "dablo/move_list.hpp"

namespace dablo {

GameState::GameState() : GameState(GameConfig{}) {}

GameState::GameState(const GameConfig& config) {
  config.validate();
  graph_ = &BoardGraph::get(config.rows, config.cols);
  topology_ = config.topology;
  move_limit_ = config.move_limit;
  reset();
}

void GameState::clear_board() {
  cells_.fill(Piece{});
  counts_ = {0, 0};
  king_ = {kNoNode, kNoNode};
}

void GameState::place(NodeId n, const Piece& p) {
  cells_[n] = p;
  counts_[player_index(p.owner)]++;
  if (p.rank == Rank::King) king_[player_index(p.owner)] = n;
}

Piece GameState::remove(NodeId n) {
  Piece p = cells_[n];
  if (p.empty()) return p;
  cells_[n] = Piece{};
  counts_[player_index(p.owner)]--;
  if (p.rank == Rank::King) king_[player_index(p.owner)] = kNoNode;
  return p;
}

void GameState::reset() {
  clear_board();
  const BoardGraph& g = *graph_;
  const int last_r2 = 2 * (g.rows() - 1);
  const int last_c2 = 2 * (g.cols() - 1);

  // Player A fills the three rows nearest its edge; B mirrors it at row 0.
  for (int i = 0; i < g.size(); ++i) {
    NodeId n = static_cast<NodeId>(i);
    int r2 = g.row2(n);
    if (r2 >= last_r2 - 2) {
      place(n, Piece{Player::A, Rank::Warrior});
    } else if (r2 <= 2) {
      place(n, Piece{Player::B, Rank::Warrior});
    }
  }
  place(g.find(last_r2 - 4, last_c2), Piece{Player::A, Rank::King});
  place(g.find(last_r2 - 3, last_c2 - 1), Piece{Player::A, Rank::Prince});
  place(g.find(4, 0), Piece{Player::B, Rank::King});
  place(g.find(3, 1), Piece{Player::B, Rank::Prince});

  to_move_ = Player::A;
  move_count_ = 0;
  chain_ = PendingChain{};
}

GameState GameState::from_placements(const GameConfig& config,
                                     const std::vector<Placement>& pieces,
                                     Player to_move,
                                     int move_count,
                                     const PendingChain& chain) {
  GameState s(config);
  s.clear_board();

  if (to_move != Player::A && to_move != Player::B) {
    throw ConfigError("side to move must be A or B");
  }
  if (move_count < 0) {
    throw ConfigError("move_count must not be negative");
  }

  for (const auto& pl : pieces) {
    if (pl.node == kNoNode || pl.node >= s.graph().size()) {
      throw ConfigError("placement on undefined node " + std::to_string(pl.node));
    }
    if (pl.piece.empty() || pl.piece.rank == Rank::None) {
      throw ConfigError("placement of an empty piece at " + s.graph().label(pl.node));
    }
    if (!s.cells_[pl.node].empty()) {
      throw ConfigError("node " + s.graph().label(pl.node) + " placed twice");
    }
    if (pl.piece.rank == Rank::King && s.has_king(pl.piece.owner)) {
      throw ConfigError(std::string("player ") + to_string(pl.piece.owner) + " has two kings");
    }
    s.place(pl.node, pl.piece);
  }

  if (chain.active()) {
    if (chain.node >= s.graph().size()) {
      throw ConfigError("pending chain on undefined node");
    }
    const Piece& p = s.cells_[chain.node];
    if (chain.owner != to_move || p.owner != to_move || p.rank != chain.rank) {
      throw ConfigError("pending chain does not match the piece at " + s.graph().label(chain.node));
    }
    if (chain.origin != kNoNode && chain.origin >= s.graph().size()) {
      throw ConfigError("pending chain origin on undefined node");
    }
  }

  s.to_move_ = to_move;
  s.move_count_ = move_count;
  s.chain_ = chain;

  // A chain only stays pending while the piece still has a capture to make.
  if (chain.active()) {
    MoveList next;
    Rules::legal_moves(s, next);
    if (next.empty()) {
      throw ConfigError("pending chain at " + s.graph().label(chain.node) +
                        " has no capture to continue");
    }
  }
  return s;
}

std::vector<NodeId> GameState::nodes_of(Player p) const {
  std::vector<NodeId> out;
  out.reserve(counts_[player_index(p)]);
  for (int i = 0; i < graph_->size(); ++i) {
    if (cells_[i].owner == p) out.push_back(static_cast<NodeId>(i));
  }
  return out;
}

void GameState::apply_move(const Move& m) {
  MoveList legal;
  Rules::legal_moves(*this, legal);

  if (!chain_.active()) {
    Outcome o = Rules::evaluate(*this, legal.empty());
    if (o.finished()) {
      throw PreconditionError("game is already over: " + describe(o));
    }
  }

  // Callers need not set the chain flag; it is derived from the matching legal move.
  for (const Move& l : legal) {
    if (l.from == m.from && l.to == m.to && l.captured == m.captured) {
      commit(l);
      return;
    }
  }
  throw IllegalMoveError("illegal move " + to_string(m, *graph_) + " for player " +
                         to_string(to_move_));
}

void GameState::commit(const Move& m) {
  Piece mover = remove(m.from);
  if (m.is_capture()) remove(m.captured);
  place(m.to, mover);

  if (m.is_capture()) {
    chain_ = PendingChain{m.to, m.from, mover.rank, mover.owner};
    MoveList next;
    Rules::legal_moves(*this, next);
    if (!next.empty()) return;  // same player continues the chain
  }

  chain_ = PendingChain{};
  to_move_ = opponent(to_move_);
  ++move_count_;
}

GameState GameState::with_side_to_move(Player p) const {
  GameState s = *this;
  s.to_move_ = p;
  s.chain_ = PendingChain{};
  return s;
}

bool GameState::operator==(const GameState& o) const {
  if (graph_ != o.graph_ || topology_ != o.topology_ || to_move_ != o.to_move_ ||
      move_count_ != o.move_count_ || move_limit_ != o.move_limit_ || !(chain_ == o.chain_)) {
    return false;
  }
  for (int i = 0; i < graph_->size(); ++i) {
    if (cells_[i] != o.cells_[i]) return false;
  }
  return true;
}

} // namespace dablo
