#pragma once
#include "dablo/game_state.hpp"
#include <string>
#include <vector>

namespace dablo {

// Flat integer encoding of a game state:
// [0]: topology id
// [1]: primary rows
// [2]: primary columns
// [3]: move limit
// [4]: side to move (1 = A, 2 = B)
// [5]: move count
// [6]: pending chain node (-1 when no chain)
// [7]: pending chain origin (-1 when none)
// [8..8+N): one entry per node, 0 = empty, +rank for Player A, -rank for Player B
//           (rank: 1 Warrior, 2 Prince, 3 King)
constexpr int kCodecHeaderSize = 8;

std::vector<int> encode_state(const GameState& s);

// Returns false and fills err_msg when the array does not describe a valid state.
bool decode_state(const std::vector<int>& data, GameState& out, std::string& err_msg);

// Helpers for a single node entry.
int encode_piece(const Piece& p);
bool decode_piece(int value, Piece& p);

} // namespace dablo
