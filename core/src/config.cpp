#include "dablo/config.hpp"
#include "dablo/errors.hpp"
#include <string>

namespace dablo {

void GameConfig::validate() const {
  if (move_limit < kMinMoveLimit || move_limit > kMaxMoveLimit) {
    throw ConfigError("move_limit " + std::to_string(move_limit) + " outside " +
                      std::to_string(kMinMoveLimit) + ".." + std::to_string(kMaxMoveLimit));
  }
  if (topology != BoardTopology::Standard) {
    throw ConfigError("unknown board topology id " + std::to_string(static_cast<int>(topology)));
  }
  if (rows < kMinBoardRows || rows > kMaxLatticeSize) {
    throw ConfigError("rows " + std::to_string(rows) + " outside " +
                      std::to_string(kMinBoardRows) + ".." + std::to_string(kMaxLatticeSize));
  }
  if (cols < kMinBoardCols || cols > kMaxLatticeSize) {
    throw ConfigError("cols " + std::to_string(cols) + " outside " +
                      std::to_string(kMinBoardCols) + ".." + std::to_string(kMaxLatticeSize));
  }
}

} // namespace dablo
