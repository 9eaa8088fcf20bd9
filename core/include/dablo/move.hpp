#pragma once
#include "dablo/types.hpp"
#include <string>

namespace dablo {

class BoardGraph;

struct Move {
  NodeId from = kNoNode;
  NodeId to = kNoNode;
  NodeId captured = kNoNode;  // kNoNode for a plain step
  bool chain = false;         // forced continuation leg of a capture chain

  bool is_capture() const { return captured != kNoNode; }
  bool valid() const { return from != kNoNode && to != kNoNode; }

  bool operator==(const Move& o) const {
    return from == o.from && to == o.to && captured == o.captured && chain == o.chain;
  }
  bool operator!=(const Move& o) const { return !(*this == o); }
};

// "(4,2) -> (3,2)" or "(4,2) -> (2,2) x (3,2)", in board coordinates.
std::string to_string(const Move& m, const BoardGraph& g);

} // namespace dablo
