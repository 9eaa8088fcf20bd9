#include "dablo/types.hpp"
#include "dablo/move.hpp"
#include "dablo/board_graph.hpp"

namespace dablo {

const char* to_string(Player p) {
  switch (p) {
    case Player::A: return "A";
    case Player::B: return "B";
    default: return "-";
  }
}

const char* to_string(Rank r) {
  switch (r) {
    case Rank::Warrior: return "Warrior";
    case Rank::Prince: return "Prince";
    case Rank::King: return "King";
    default: return "None";
  }
}

std::string to_string(const Move& m, const BoardGraph& g) {
  std::string s = g.label(m.from) + " -> " + g.label(m.to);
  if (m.is_capture()) s += " x " + g.label(m.captured);
  return s;
}

} // namespace dablo
