#pragma once
#include "dablo/board_graph.hpp"

namespace dablo {

constexpr int kMinMoveLimit = 50;
constexpr int kMaxMoveLimit = 2000;

// The standard setup needs two free primary rows between the armies' home
// rows and the kings, so smaller boards cannot be set up.
constexpr int kMinBoardRows = 5;
constexpr int kMinBoardCols = kMinLatticeSize;

struct GameConfig {
  int move_limit = 500;                           // committed turns before a draw
  BoardTopology topology = BoardTopology::Standard;
  int rows = kStandardRows;                       // primary rows of the lattice
  int cols = kStandardCols;                       // primary columns of the lattice

  static GameConfig standard() { return GameConfig{}; }
  static GameConfig quick() { return GameConfig{200}; }
  static GameConfig testing() { return GameConfig{100}; }
  static GameConfig custom(int rows, int cols, int move_limit = 500) {
    return GameConfig{move_limit, BoardTopology::Standard, rows, cols};
  }

  // Throws ConfigError when a field is out of range.
  void validate() const;
};

} // namespace dablo
