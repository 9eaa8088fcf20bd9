#pragma once
#include "dablo/types.hpp"
#include "dablo/move.hpp"
#include "dablo/move_list.hpp"
#include "dablo/outcome.hpp"

namespace dablo {

class GameState; // forward

namespace Rules {
  // Mid-chain: only the chain piece's further captures. Otherwise every capture of the
  // side to move if it has any, else every forward step.
  void legal_moves(const GameState& s, MoveList& out);

  // All captures and steps of the piece on `from`, ignoring the side-wide capture rule.
  void piece_moves(const GameState& s, NodeId from, MoveList& out);

  bool has_capture(const GameState& s, Player p);
  bool is_legal(const GameState& s, const Move& m);

  // Returns the successor state. Throws IllegalMoveError / PreconditionError.
  GameState apply_move(const GameState& s, const Move& m);

  // Win/draw check after a committed turn. A pending chain is always Ongoing.
  Outcome evaluate(const GameState& s);
  // Same, with the caller vouching whether the side to move has any legal move.
  Outcome evaluate(const GameState& s, bool side_to_move_has_no_moves);
}

} // namespace dablo
