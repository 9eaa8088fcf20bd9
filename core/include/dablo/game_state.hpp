#pragma once
#include "dablo/board_graph.hpp"
#include "dablo/config.hpp"
#include "dablo/move.hpp"
#include "dablo/types.hpp"
#include <array>
#include <vector>

namespace dablo {

// Set only between the legs of a multi-capture by one piece.
struct PendingChain {
  NodeId node = kNoNode;    // where the capturing piece stands now
  NodeId origin = kNoNode;  // where the previous leg started; the next leg may not land there
  Rank rank = Rank::None;
  Player owner = Player::None;

  bool active() const { return node != kNoNode; }
  bool operator==(const PendingChain& o) const {
    return node == o.node && origin == o.origin && rank == o.rank && owner == o.owner;
  }
};

struct Placement {
  NodeId node = kNoNode;
  Piece piece;
};

class GameState {
public:
  GameState();
  explicit GameState(const GameConfig& config);

  // Arbitrary position for analysis, tests and restoring saved games.
  // Throws ConfigError for unknown or doubly occupied nodes and inconsistent chains.
  static GameState from_placements(const GameConfig& config,
                                   const std::vector<Placement>& pieces,
                                   Player to_move,
                                   int move_count = 0,
                                   const PendingChain& chain = PendingChain{});

  // Standard Dablo setup, Player A to move.
  void reset();

  const BoardGraph& graph() const { return *graph_; }
  BoardTopology topology() const { return topology_; }
  const Piece& at(NodeId n) const { return cells_[n]; }

  Player current_player() const { return to_move_; }
  int move_count() const { return move_count_; }
  int move_limit() const { return move_limit_; }
  const PendingChain& pending_chain() const { return chain_; }
  bool in_chain() const { return chain_.active(); }

  int piece_count(Player p) const { return counts_[player_index(p)]; }
  bool has_king(Player p) const { return king_[player_index(p)] != kNoNode; }
  NodeId king_node(Player p) const { return king_[player_index(p)]; }
  std::vector<NodeId> nodes_of(Player p) const;

  // Validates against Rules::legal_moves and commits in place.
  // Throws IllegalMoveError or PreconditionError; on throw the state is unchanged.
  void apply_move(const Move& m);

  // Copy with `p` to move and no chain pending; occupancy is unchanged. Used for
  // "what could this side do here" questions during evaluation.
  GameState with_side_to_move(Player p) const;

  bool operator==(const GameState& o) const;
  bool operator!=(const GameState& o) const { return !(*this == o); }

private:
  const BoardGraph* graph_;
  BoardTopology topology_;
  std::array<Piece, kMaxNodes> cells_{};
  Player to_move_ = Player::A;
  int move_count_ = 0;
  int move_limit_ = 500;
  PendingChain chain_;
  std::array<int, 2> counts_{};
  std::array<NodeId, 2> king_{};

  void clear_board();
  void place(NodeId n, const Piece& p);
  Piece remove(NodeId n);
  void commit(const Move& m);
};

inline GameState new_game(const GameConfig& config) { return GameState(config); }

} // namespace dablo
