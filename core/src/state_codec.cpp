#include "dablo/state_codec.hpp"
#include "dablo/errors.hpp"

namespace dablo {

int encode_piece(const Piece& p) {
  if (p.empty()) return 0;
  int rank = static_cast<int>(p.rank);
  return p.owner == Player::A ? rank : -rank;
}

bool decode_piece(int value, Piece& p) {
  if (value == 0) {
    p = Piece{};
    return true;
  }
  int rank = value > 0 ? value : -value;
  if (rank < 1 || rank > 3) return false;
  p.owner = value > 0 ? Player::A : Player::B;
  p.rank = static_cast<Rank>(rank);
  return true;
}

std::vector<int> encode_state(const GameState& s) {
  const BoardGraph& g = s.graph();
  std::vector<int> out;
  out.reserve(kCodecHeaderSize + g.size());

  const PendingChain& chain = s.pending_chain();
  out.push_back(static_cast<int>(s.topology()));
  out.push_back(g.rows());
  out.push_back(g.cols());
  out.push_back(s.move_limit());
  out.push_back(static_cast<int>(s.current_player()));
  out.push_back(s.move_count());
  out.push_back(chain.active() ? static_cast<int>(chain.node) : -1);
  out.push_back(chain.origin != kNoNode ? static_cast<int>(chain.origin) : -1);

  for (int i = 0; i < g.size(); ++i) {
    out.push_back(encode_piece(s.at(static_cast<NodeId>(i))));
  }
  return out;
}

bool decode_state(const std::vector<int>& data, GameState& out, std::string& err_msg) {
  if (data.size() < static_cast<size_t>(kCodecHeaderSize)) {
    err_msg = "state array too short";
    return false;
  }

  GameConfig config;
  if (data[0] != static_cast<int>(BoardTopology::Standard)) {
    err_msg = "unknown topology id " + std::to_string(data[0]);
    return false;
  }
  config.topology = static_cast<BoardTopology>(data[0]);
  config.rows = data[1];
  config.cols = data[2];
  config.move_limit = data[3];
  try {
    config.validate();
  } catch (const ConfigError& e) {
    err_msg = e.what();
    return false;
  }

  const BoardGraph& g = BoardGraph::get(config.rows, config.cols);
  if (data.size() != static_cast<size_t>(kCodecHeaderSize + g.size())) {
    err_msg = "expected " + std::to_string(kCodecHeaderSize + g.size()) + " entries, got " +
              std::to_string(data.size());
    return false;
  }

  if (data[4] != static_cast<int>(Player::A) && data[4] != static_cast<int>(Player::B)) {
    err_msg = "invalid side to move " + std::to_string(data[4]);
    return false;
  }
  Player to_move = static_cast<Player>(data[4]);

  std::vector<Placement> pieces;
  std::vector<Piece> cells(g.size());
  for (int i = 0; i < g.size(); ++i) {
    Piece& p = cells[i];
    if (!decode_piece(data[kCodecHeaderSize + i], p)) {
      err_msg = "invalid piece code " + std::to_string(data[kCodecHeaderSize + i]) +
                " at node " + std::to_string(i);
      return false;
    }
    if (!p.empty()) pieces.push_back(Placement{static_cast<NodeId>(i), p});
  }

  PendingChain chain;
  const int chain_node = data[6];
  const int chain_origin = data[7];
  if (chain_node >= 0) {
    if (chain_node >= g.size()) {
      err_msg = "pending chain node out of range";
      return false;
    }
    const Piece& p = cells[chain_node];
    chain.node = static_cast<NodeId>(chain_node);
    chain.owner = p.owner;
    chain.rank = p.rank;
    if (chain_origin >= 0) {
      if (chain_origin >= g.size()) {
        err_msg = "pending chain origin out of range";
        return false;
      }
      chain.origin = static_cast<NodeId>(chain_origin);
    }
  } else if (chain_origin >= 0) {
    err_msg = "chain origin given without a chain node";
    return false;
  }

  try {
    out = GameState::from_placements(config, pieces, to_move, data[5], chain);
  } catch (const ConfigError& e) {
    err_msg = e.what();
    return false;
  }
  return true;
}

} // namespace dablo
