#pragma once
#include "dablo/types.hpp"
#include <array>
#include <string>
#include <vector>

namespace dablo {

// Board family. Standard is the Dablo lattice; its size is configured separately.
enum class BoardTopology : uint8_t { Standard = 0 };

constexpr int kStandardRows = 6;
constexpr int kStandardCols = 5;
constexpr int kMinLatticeSize = 3;
constexpr int kMaxLatticeSize = 10;

// Positions are stored doubled (row2 = 2*row) so secondary nodes at half steps stay integral.
struct NodeSpec {
  int row2 = 0;
  int col2 = 0;
  NodeClass cls = NodeClass::Primary;
};

struct TopologyDefinition {
  int rows = 0;
  int cols = 0;
  std::vector<NodeSpec> nodes;
  std::vector<std::vector<int>> adjacency;  // indices into nodes
};

// Dablo lattice: primary nodes on integer points, secondary nodes in the centre of every cell.
// Primary nodes link orthogonally to primary nodes and diagonally to secondary nodes;
// secondary nodes link only to their four diagonal primary nodes.
TopologyDefinition lattice(int rows, int cols);

struct Neighbors {
  std::array<NodeId, kMaxNeighbors> ids{};
  uint8_t count = 0;

  const NodeId* begin() const { return ids.data(); }
  const NodeId* end() const { return ids.data() + count; }
  bool contains(NodeId n) const {
    for (uint8_t i = 0; i < count; ++i) if (ids[i] == n) return true;
    return false;
  }
};

class BoardGraph {
public:
  explicit BoardGraph(const TopologyDefinition& def);

  // Process-wide immutable lattice of the given size, built on first use and
  // kept for the life of the process. Safe to call from several threads.
  static const BoardGraph& get(int rows, int cols);
  static const BoardGraph& standard();

  int size() const { return static_cast<int>(nodes_.size()); }
  int rows() const { return rows_; }
  int cols() const { return cols_; }

  const NodeSpec& node(NodeId n) const { return nodes_[n]; }
  NodeClass node_class(NodeId n) const { return nodes_[n].cls; }
  int row2(NodeId n) const { return nodes_[n].row2; }
  int col2(NodeId n) const { return nodes_[n].col2; }

  const Neighbors& neighbors(NodeId n) const { return adj_[n]; }
  const Neighbors& forward_neighbors(NodeId n, Player p) const {
    return forward_[player_index(p)][n];
  }
  bool adjacent(NodeId a, NodeId b) const { return adj_[a].contains(b); }

  // Node reached by jumping from `from` over its neighbour `over`, or kNoNode.
  NodeId landing(NodeId from, NodeId over) const;

  // Lookup by doubled coordinates; kNoNode when absent.
  NodeId find(int row2, int col2) const;
  NodeId at(double row, double col) const;

  // Row progress of a node towards the far side for `p`, in half rows (0 at the home edge).
  int progress2(NodeId n, Player p) const;

  std::string label(NodeId n) const;

private:
  int rows_ = 0;
  int cols_ = 0;
  std::vector<NodeSpec> nodes_;
  std::vector<Neighbors> adj_;
  std::array<std::vector<Neighbors>, 2> forward_;
  std::vector<std::array<NodeId, kMaxNeighbors>> landing_;  // parallel to adj_
  std::vector<NodeId> index_;                               // (row2, col2) -> node
  int index_w_ = 0;

  void validate(const TopologyDefinition& def) const;
};

BoardTopology parse_topology(const std::string& name);
const char* to_string(BoardTopology t);

} // namespace dablo
