#pragma once
#include "dablo/move.hpp"
#include <array>
#include <cstddef>

namespace dablo {

// Fixed-capacity move buffer. Every (node, direction) pair yields at most one
// move, so kMaxMoves can never be exceeded.
struct MoveList {
  std::array<Move, kMaxMoves> moves;
  size_t size = 0;

  void clear() { size = 0; }
  bool empty() const { return size == 0; }
  void push_back(const Move& m) { moves[size++] = m; }

  Move& operator[](size_t i) { return moves[i]; }
  const Move& operator[](size_t i) const { return moves[i]; }

  Move* begin() { return moves.data(); }
  Move* end() { return moves.data() + size; }
  const Move* begin() const { return moves.data(); }
  const Move* end() const { return moves.data() + size; }

  bool contains(const Move& m) const {
    for (size_t i = 0; i < size; ++i) {
      if (moves[i] == m) return true;
    }
    return false;
  }
};

} // namespace dablo
