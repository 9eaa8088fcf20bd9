#include "dablo/board_graph.hpp"
#include "dablo/errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>

namespace dablo {

TopologyDefinition lattice(int rows, int cols) {
  if (rows < kMinLatticeSize || rows > kMaxLatticeSize ||
      cols < kMinLatticeSize || cols > kMaxLatticeSize) {
    std::ostringstream oss;
    oss << "lattice size " << rows << "x" << cols << " outside "
        << kMinLatticeSize << ".." << kMaxLatticeSize;
    throw TopologyError(oss.str());
  }

  TopologyDefinition def;
  def.rows = rows;
  def.cols = cols;

  // Ascending (row, col) order: primary row r, then the secondary row r + 0.5.
  for (int r2 = 0; r2 <= 2 * (rows - 1); ++r2) {
    bool secondary_row = (r2 % 2) == 1;
    for (int c2 = secondary_row ? 1 : 0; c2 <= 2 * (cols - 1); c2 += 2) {
      def.nodes.push_back({r2, c2, secondary_row ? NodeClass::Secondary : NodeClass::Primary});
    }
  }

  auto index_of = [&](int r2, int c2) -> int {
    for (size_t i = 0; i < def.nodes.size(); ++i) {
      if (def.nodes[i].row2 == r2 && def.nodes[i].col2 == c2) return static_cast<int>(i);
    }
    return -1;
  };

  static const int kPrimaryDeltas[8][2] = {
    {-2, 0}, {2, 0}, {0, -2}, {0, 2}, {-1, -1}, {-1, 1}, {1, -1}, {1, 1}};
  static const int kSecondaryDeltas[4][2] = {{-1, -1}, {-1, 1}, {1, -1}, {1, 1}};

  def.adjacency.resize(def.nodes.size());
  for (size_t i = 0; i < def.nodes.size(); ++i) {
    const NodeSpec& n = def.nodes[i];
    if (n.cls == NodeClass::Primary) {
      for (const auto& d : kPrimaryDeltas) {
        int j = index_of(n.row2 + d[0], n.col2 + d[1]);
        if (j >= 0) def.adjacency[i].push_back(j);
      }
    } else {
      for (const auto& d : kSecondaryDeltas) {
        int j = index_of(n.row2 + d[0], n.col2 + d[1]);
        if (j >= 0) def.adjacency[i].push_back(j);
      }
    }
  }
  return def;
}

void BoardGraph::validate(const TopologyDefinition& def) const {
  if (def.rows < 1 || def.cols < 1 || def.rows > kMaxLatticeSize || def.cols > kMaxLatticeSize) {
    throw TopologyError("board dimensions must be within 1.." + std::to_string(kMaxLatticeSize));
  }
  if (def.nodes.empty()) {
    throw TopologyError("topology has no nodes");
  }
  if (def.nodes.size() > static_cast<size_t>(kMaxNodes)) {
    throw TopologyError("topology has more than " + std::to_string(kMaxNodes) + " nodes");
  }
  if (def.adjacency.size() != def.nodes.size()) {
    throw TopologyError("adjacency list count does not match node count");
  }

  const int n = static_cast<int>(def.nodes.size());
  const int max_r2 = 2 * (def.rows - 1);
  const int max_c2 = 2 * (def.cols - 1);
  for (int i = 0; i < n; ++i) {
    const NodeSpec& s = def.nodes[i];
    if (s.row2 < 0 || s.row2 > max_r2 || s.col2 < 0 || s.col2 > max_c2) {
      throw TopologyError("node " + std::to_string(i) + " lies outside the board");
    }
    for (int j = 0; j < i; ++j) {
      if (def.nodes[j].row2 == s.row2 && def.nodes[j].col2 == s.col2) {
        throw TopologyError("nodes " + std::to_string(j) + " and " + std::to_string(i) +
                            " share a position");
      }
    }
  }

  for (int i = 0; i < n; ++i) {
    const auto& list = def.adjacency[i];
    if (list.size() > static_cast<size_t>(kMaxNeighbors)) {
      throw TopologyError("node " + std::to_string(i) + " has too many neighbours");
    }
    for (size_t k = 0; k < list.size(); ++k) {
      int j = list[k];
      if (j < 0 || j >= n) {
        throw TopologyError("node " + std::to_string(i) + " references undefined node " +
                            std::to_string(j));
      }
      if (j == i) {
        throw TopologyError("node " + std::to_string(i) + " is adjacent to itself");
      }
      if (std::find(list.begin(), list.begin() + k, j) != list.begin() + k) {
        throw TopologyError("node " + std::to_string(i) + " lists neighbour " +
                            std::to_string(j) + " twice");
      }
      const auto& back = def.adjacency[j];
      if (std::find(back.begin(), back.end(), i) == back.end()) {
        throw TopologyError("adjacency " + std::to_string(i) + " -> " + std::to_string(j) +
                            " is not mutual");
      }
    }
  }

  std::vector<bool> seen(n, false);
  std::queue<int> q;
  q.push(0);
  seen[0] = true;
  int reached = 1;
  while (!q.empty()) {
    int cur = q.front();
    q.pop();
    for (int j : def.adjacency[cur]) {
      if (!seen[j]) {
        seen[j] = true;
        ++reached;
        q.push(j);
      }
    }
  }
  if (reached != n) {
    throw TopologyError("topology has " + std::to_string(n - reached) + " unreachable nodes");
  }
}

BoardGraph::BoardGraph(const TopologyDefinition& def) {
  validate(def);

  rows_ = def.rows;
  cols_ = def.cols;
  nodes_ = def.nodes;
  const int n = size();

  index_w_ = 2 * cols_ - 1;
  index_.assign(static_cast<size_t>(2 * rows_ - 1) * index_w_, kNoNode);
  for (int i = 0; i < n; ++i) {
    index_[nodes_[i].row2 * index_w_ + nodes_[i].col2] = static_cast<NodeId>(i);
  }

  adj_.assign(n, Neighbors{});
  forward_[0].assign(n, Neighbors{});
  forward_[1].assign(n, Neighbors{});
  landing_.assign(n, std::array<NodeId, kMaxNeighbors>{});

  for (int i = 0; i < n; ++i) {
    Neighbors& nb = adj_[i];
    for (int j : def.adjacency[i]) {
      nb.ids[nb.count++] = static_cast<NodeId>(j);

      // Player A advances towards row 0, Player B towards the last row.
      if (nodes_[j].row2 < nodes_[i].row2) {
        Neighbors& f = forward_[player_index(Player::A)][i];
        f.ids[f.count++] = static_cast<NodeId>(j);
      } else if (nodes_[j].row2 > nodes_[i].row2) {
        Neighbors& f = forward_[player_index(Player::B)][i];
        f.ids[f.count++] = static_cast<NodeId>(j);
      }
    }
  }

  // Jump landing is two hops along the same direction; no node there means no capture.
  for (int i = 0; i < n; ++i) {
    for (uint8_t k = 0; k < adj_[i].count; ++k) {
      NodeId over = adj_[i].ids[k];
      int r2 = 2 * nodes_[over].row2 - nodes_[i].row2;
      int c2 = 2 * nodes_[over].col2 - nodes_[i].col2;
      NodeId land = find(r2, c2);
      if (land != kNoNode && !adjacent(over, land)) land = kNoNode;
      landing_[i][k] = land;
    }
    for (uint8_t k = adj_[i].count; k < kMaxNeighbors; ++k) landing_[i][k] = kNoNode;
  }
}

const BoardGraph& BoardGraph::get(int rows, int cols) {
  static std::mutex mutex;
  static std::map<std::pair<int, int>, std::unique_ptr<BoardGraph>> graphs;

  std::lock_guard<std::mutex> lock(mutex);
  auto& slot = graphs[std::make_pair(rows, cols)];
  if (!slot) {
    auto graph = std::make_unique<BoardGraph>(lattice(rows, cols));
    slot = std::move(graph);
  }
  return *slot;
}

const BoardGraph& BoardGraph::standard() {
  static const BoardGraph& graph = get(kStandardRows, kStandardCols);
  return graph;
}

NodeId BoardGraph::landing(NodeId from, NodeId over) const {
  const Neighbors& nb = adj_[from];
  for (uint8_t k = 0; k < nb.count; ++k) {
    if (nb.ids[k] == over) return landing_[from][k];
  }
  return kNoNode;
}

NodeId BoardGraph::find(int row2, int col2) const {
  if (row2 < 0 || col2 < 0 || row2 > 2 * (rows_ - 1) || col2 > 2 * (cols_ - 1)) return kNoNode;
  return index_[row2 * index_w_ + col2];
}

NodeId BoardGraph::at(double row, double col) const {
  return find(static_cast<int>(std::lround(row * 2.0)), static_cast<int>(std::lround(col * 2.0)));
}

int BoardGraph::progress2(NodeId n, Player p) const {
  if (p == Player::A) return 2 * (rows_ - 1) - nodes_[n].row2;
  return nodes_[n].row2;
}

std::string BoardGraph::label(NodeId n) const {
  if (n == kNoNode || n >= nodes_.size()) return "(none)";
  std::ostringstream oss;
  oss << "(" << nodes_[n].row2 / 2.0 << "," << nodes_[n].col2 / 2.0 << ")";
  return oss.str();
}

BoardTopology parse_topology(const std::string& name) {
  if (name == "standard") return BoardTopology::Standard;
  throw ConfigError("unknown board topology: " + name);
}

const char* to_string(BoardTopology t) {
  switch (t) {
    case BoardTopology::Standard: return "standard";
  }
  return "unknown";
}

} // namespace dablo
