#include "dablo/outcome.hpp"
#include "dablo/rules.hpp"
#include "dablo/game_state.hpp"
#include "dablo/move_list.hpp"

namespace dablo {

const char* to_string(EndReason r) {
  switch (r) {
    case EndReason::None: return "none";
    case EndReason::KingCaptured: return "king_captured";
    case EndReason::LoneKing: return "lone_king";
    case EndReason::Stalemate: return "stalemate";
    case EndReason::MoveLimit: return "move_limit";
    case EndReason::BothKingsOnly: return "both_kings_only";
  }
  return "unknown";
}

std::string describe(const Outcome& o) {
  switch (o.kind) {
    case OutcomeKind::Ongoing:
      return "ongoing";
    case OutcomeKind::Win:
      return std::string("player ") + to_string(o.winner) + " wins (" + to_string(o.reason) + ")";
    case OutcomeKind::Draw:
      return std::string("draw (") + to_string(o.reason) + ")";
  }
  return "unknown";
}

namespace {

bool lone_king(const GameState& s, Player p) {
  return s.piece_count(p) == 1 && s.has_king(p);
}

} // namespace

Outcome Rules::evaluate(const GameState& s, bool side_to_move_has_no_moves) {
  if (s.in_chain()) return Outcome::ongoing();

  const Player me = s.current_player();
  const Player other = opponent(me);

  // 1. King captured
  if (!s.has_king(me)) return Outcome::win(other, EndReason::KingCaptured);
  if (!s.has_king(other)) return Outcome::win(me, EndReason::KingCaptured);

  // 2. Reduced to a lone king
  if (lone_king(s, me) && lone_king(s, other)) return Outcome::draw(EndReason::BothKingsOnly);
  if (lone_king(s, me)) return Outcome::win(other, EndReason::LoneKing);
  if (lone_king(s, other)) return Outcome::win(me, EndReason::LoneKing);

  // 3. Stalemate
  if (side_to_move_has_no_moves) return Outcome::win(other, EndReason::Stalemate);

  // 4. Move limit
  if (s.move_count() >= s.move_limit()) return Outcome::draw(EndReason::MoveLimit);

  return Outcome::ongoing();
}

Outcome Rules::evaluate(const GameState& s) {
  if (s.in_chain()) return Outcome::ongoing();
  MoveList moves;
  legal_moves(s, moves);
  return evaluate(s, moves.empty());
}

} // namespace dablo
