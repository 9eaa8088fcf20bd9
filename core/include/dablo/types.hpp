#pragma once
#include <cstdint>

namespace dablo {

using NodeId = uint8_t;

constexpr NodeId kNoNode = 0xFF;
constexpr int kMaxNodes = 181;     // 10x10 lattice: 100 primary + 81 secondary
constexpr int kMaxNeighbors = 8;
constexpr int kMaxMoves = kMaxNodes * kMaxNeighbors;

enum class Player : uint8_t { None = 0, A = 1, B = 2 };

enum class Rank : uint8_t { None = 0, Warrior = 1, Prince = 2, King = 3 };

enum class NodeClass : uint8_t { Primary, Secondary };

inline Player opponent(Player p) {
  if (p == Player::A) return Player::B;
  if (p == Player::B) return Player::A;
  return Player::None;
}

inline int player_index(Player p) { return p == Player::A ? 0 : 1; }

const char* to_string(Player p);
const char* to_string(Rank r);

struct Piece {
  Player owner = Player::None;
  Rank rank = Rank::None;

  bool empty() const { return owner == Player::None; }
  bool operator==(const Piece& o) const { return owner == o.owner && rank == o.rank; }
  bool operator!=(const Piece& o) const { return !(*this == o); }
};

// rank_can_capture[attacker][target]
inline constexpr bool kCaptureTable[4][4] = {
  // None   Warrior Prince King
  { false, false, false, false }, // None
  { false, true,  false, false }, // Warrior
  { false, true,  true,  false }, // Prince
  { false, true,  true,  true  }, // King
};

inline bool can_capture(Rank attacker, Rank target) {
  return kCaptureTable[static_cast<int>(attacker)][static_cast<int>(target)];
}

inline bool can_capture(const Piece& attacker, const Piece& target) {
  if (attacker.empty() || target.empty()) return false;
  if (attacker.owner == target.owner) return false;
  return can_capture(attacker.rank, target.rank);
}

// Strategic value used by evaluation code.
inline float piece_value(Rank r) {
  switch (r) {
    case Rank::Warrior: return 1.0f;
    case Rank::Prince: return 3.0f;
    case Rank::King: return 10.0f;
    default: return 0.0f;
  }
}

} // namespace dablo
