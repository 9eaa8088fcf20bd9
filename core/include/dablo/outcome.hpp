#pragma once
#include "dablo/types.hpp"
#include <string>

namespace dablo {

enum class OutcomeKind : uint8_t { Ongoing, Win, Draw };

enum class EndReason : uint8_t {
  None,
  KingCaptured,
  LoneKing,
  Stalemate,
  MoveLimit,
  BothKingsOnly,
};

struct Outcome {
  OutcomeKind kind = OutcomeKind::Ongoing;
  Player winner = Player::None;
  EndReason reason = EndReason::None;

  static Outcome ongoing() { return Outcome{}; }
  static Outcome win(Player p, EndReason r) { return Outcome{OutcomeKind::Win, p, r}; }
  static Outcome draw(EndReason r) { return Outcome{OutcomeKind::Draw, Player::None, r}; }

  bool finished() const { return kind != OutcomeKind::Ongoing; }
  bool is_win_for(Player p) const { return kind == OutcomeKind::Win && winner == p; }

  bool operator==(const Outcome& o) const {
    return kind == o.kind && winner == o.winner && reason == o.reason;
  }
  bool operator!=(const Outcome& o) const { return !(*this == o); }
};

const char* to_string(EndReason r);
std::string describe(const Outcome& o);

} // namespace dablo
