#include <gtest/gtest.h>
#include "dablo/rules.hpp"
#include "dablo/game_state.hpp"
#include "dablo/move_list.hpp"
#include "dablo/errors.hpp"

using namespace dablo;

namespace {

NodeId N(double row, double col) {
  NodeId n = BoardGraph::standard().at(row, col);
  EXPECT_NE(n, kNoNode) << "(" << row << "," << col << ")";
  return n;
}

Placement P(double row, double col, Player owner, Rank rank) {
  return Placement{N(row, col), Piece{owner, rank}};
}

GameState position(const std::vector<Placement>& pieces, Player to_move) {
  return GameState::from_placements(GameConfig{}, pieces, to_move);
}

Move step(NodeId from, NodeId to) {
  Move m;
  m.from = from;
  m.to = to;
  return m;
}

Move jump(NodeId from, NodeId over, NodeId to) {
  Move m;
  m.from = from;
  m.to = to;
  m.captured = over;
  return m;
}

// Two-leg chain for Player A: (3,1) x (2.5,1.5) -> (2,2), then x (1.5,2.5) -> (1,3).
GameState chain_position() {
  return position({
    P(3, 1, Player::A, Rank::Warrior),
    P(4, 4, Player::A, Rank::Warrior),
    P(5, 0, Player::A, Rank::King),
    P(2.5, 1.5, Player::B, Rank::Warrior),
    P(1.5, 2.5, Player::B, Rank::Warrior),
    P(0, 0, Player::B, Rank::Warrior),
    P(0, 4, Player::B, Rank::King),
  }, Player::A);
}

} // namespace

TEST(RulesTest, InitialSetup) {
  GameState s;
  EXPECT_EQ(s.current_player(), Player::A);
  EXPECT_EQ(s.move_count(), 0);
  EXPECT_FALSE(s.in_chain());
  EXPECT_EQ(s.piece_count(Player::A), 16);
  EXPECT_EQ(s.piece_count(Player::B), 16);

  EXPECT_EQ(s.at(N(3, 4)), (Piece{Player::A, Rank::King}));
  EXPECT_EQ(s.at(N(3.5, 3.5)), (Piece{Player::A, Rank::Prince}));
  EXPECT_EQ(s.at(N(2, 0)), (Piece{Player::B, Rank::King}));
  EXPECT_EQ(s.at(N(1.5, 0.5)), (Piece{Player::B, Rank::Prince}));

  EXPECT_EQ(s.at(N(5, 0)), (Piece{Player::A, Rank::Warrior}));
  EXPECT_EQ(s.at(N(4.5, 2.5)), (Piece{Player::A, Rank::Warrior}));
  EXPECT_EQ(s.at(N(0, 4)), (Piece{Player::B, Rank::Warrior}));
  EXPECT_EQ(s.at(N(0.5, 1.5)), (Piece{Player::B, Rank::Warrior}));

  // The middle of the board starts empty.
  EXPECT_TRUE(s.at(N(2.5, 2.5)).empty());
  EXPECT_TRUE(s.at(N(3, 0)).empty());
  EXPECT_TRUE(s.at(N(2, 4)).empty());
  EXPECT_EQ(s.king_node(Player::A), N(3, 4));
}

TEST(RulesTest, InitialHasMoves) {
  GameState s;
  MoveList moves;
  Rules::legal_moves(s, moves);

  // Front warriors 2+3+3+2, King 2, Prince 1; nothing is in contact yet.
  EXPECT_EQ(moves.size, 13u);
  for (const Move& m : moves) {
    EXPECT_FALSE(m.is_capture());
    EXPECT_EQ(s.at(m.from).owner, Player::A);
  }
}

TEST(RulesTest, CaptureTableFollowsRank) {
  EXPECT_TRUE(can_capture(Rank::Warrior, Rank::Warrior));
  EXPECT_FALSE(can_capture(Rank::Warrior, Rank::Prince));
  EXPECT_FALSE(can_capture(Rank::Warrior, Rank::King));
  EXPECT_TRUE(can_capture(Rank::Prince, Rank::Warrior));
  EXPECT_TRUE(can_capture(Rank::Prince, Rank::Prince));
  EXPECT_FALSE(can_capture(Rank::Prince, Rank::King));
  EXPECT_TRUE(can_capture(Rank::King, Rank::Warrior));
  EXPECT_TRUE(can_capture(Rank::King, Rank::Prince));
  EXPECT_TRUE(can_capture(Rank::King, Rank::King));
}

TEST(RulesTest, CaptureGenerationMatchesRankTable) {
  const Rank ranks[] = {Rank::Warrior, Rank::Prince, Rank::King};
  for (Rank attacker : ranks) {
    for (Rank target : ranks) {
      GameState s = position({
        P(3, 2, Player::A, attacker),
        P(2, 2, Player::B, target),
      }, Player::A);

      MoveList moves;
      Rules::legal_moves(s, moves);
      bool expected = can_capture(attacker, target);
      EXPECT_EQ(moves.contains(jump(N(3, 2), N(2, 2), N(1, 2))), expected)
        << to_string(attacker) << " x " << to_string(target);
      EXPECT_EQ(Rules::has_capture(s, Player::A), expected);
    }
  }
}

TEST(RulesTest, OwnPiecesAreNeverCaptured) {
  GameState s = position({
    P(3, 2, Player::A, Rank::King),
    P(2, 2, Player::A, Rank::Warrior),
  }, Player::A);
  EXPECT_FALSE(Rules::has_capture(s, Player::A));
}

TEST(RulesTest, CaptureIsMandatoryForTheWholeSide) {
  GameState s = chain_position();
  MoveList moves;
  Rules::legal_moves(s, moves);

  ASSERT_EQ(moves.size, 1u);
  EXPECT_EQ(moves[0], jump(N(3, 1), N(2.5, 1.5), N(2, 2)));
  EXPECT_FALSE(moves[0].chain);

  // A quiet move by another piece is rejected while the capture is available.
  EXPECT_FALSE(Rules::is_legal(s, step(N(4, 4), N(3, 4))));
  GameState before = s;
  EXPECT_THROW(s.apply_move(step(N(4, 4), N(3, 4))), IllegalMoveError);
  EXPECT_EQ(s, before);
}

TEST(RulesTest, PieceMovesIgnoresCompulsoryCapture) {
  GameState s = chain_position();
  MoveList moves;
  Rules::piece_moves(s, N(4, 4), moves);
  EXPECT_TRUE(moves.contains(step(N(4, 4), N(3, 4))));
  EXPECT_TRUE(moves.contains(step(N(4, 4), N(3.5, 3.5))));
  EXPECT_EQ(moves.size, 2u);

  Rules::piece_moves(s, N(2, 4), moves);
  EXPECT_TRUE(moves.empty());
}

TEST(RulesTest, StepsAreForwardOnly) {
  GameState a = position({P(3, 2, Player::A, Rank::Warrior)}, Player::A);
  MoveList moves;
  Rules::legal_moves(a, moves);
  ASSERT_EQ(moves.size, 3u);
  EXPECT_TRUE(moves.contains(step(N(3, 2), N(2, 2))));
  EXPECT_TRUE(moves.contains(step(N(3, 2), N(2.5, 1.5))));
  EXPECT_TRUE(moves.contains(step(N(3, 2), N(2.5, 2.5))));

  GameState b = position({P(3, 2, Player::B, Rank::King)}, Player::B);
  Rules::legal_moves(b, moves);
  ASSERT_EQ(moves.size, 3u);
  EXPECT_TRUE(moves.contains(step(N(3, 2), N(4, 2))));
  EXPECT_TRUE(moves.contains(step(N(3, 2), N(3.5, 1.5))));
  EXPECT_TRUE(moves.contains(step(N(3, 2), N(3.5, 2.5))));
}

TEST(RulesTest, SecondaryNodeStepsToPrimaries) {
  GameState s = position({P(2.5, 2.5, Player::A, Rank::Prince)}, Player::A);
  MoveList moves;
  Rules::legal_moves(s, moves);
  ASSERT_EQ(moves.size, 2u);
  EXPECT_TRUE(moves.contains(step(N(2.5, 2.5), N(2, 2))));
  EXPECT_TRUE(moves.contains(step(N(2.5, 2.5), N(2, 3))));
}

TEST(RulesTest, CaptureBackwardsIsAllowed) {
  GameState s = position({
    P(2, 2, Player::A, Rank::Warrior),
    P(3, 2, Player::B, Rank::Warrior),
  }, Player::A);
  MoveList moves;
  Rules::legal_moves(s, moves);
  ASSERT_EQ(moves.size, 1u);
  EXPECT_EQ(moves[0], jump(N(2, 2), N(3, 2), N(4, 2)));
}

TEST(RulesTest, CaptureNeedsAnEmptyLandingOnTheBoard) {
  // Landing beyond the edge.
  GameState edge = position({
    P(1, 2, Player::A, Rank::Warrior),
    P(0, 2, Player::B, Rank::Warrior),
  }, Player::A);
  MoveList moves;
  Rules::legal_moves(edge, moves);
  EXPECT_EQ(moves.size, 2u);
  for (const Move& m : moves) EXPECT_FALSE(m.is_capture());

  // Landing occupied.
  GameState blocked = position({
    P(3, 2, Player::A, Rank::Warrior),
    P(2, 2, Player::B, Rank::Warrior),
    P(1, 2, Player::B, Rank::Warrior),
  }, Player::A);
  EXPECT_FALSE(Rules::has_capture(blocked, Player::A));
}

TEST(RulesTest, QuietMovePassesTheTurn) {
  GameState s;
  Move m = step(N(4, 0), N(3, 0));
  s.apply_move(m);

  EXPECT_EQ(s.current_player(), Player::B);
  EXPECT_EQ(s.move_count(), 1);
  EXPECT_TRUE(s.at(N(4, 0)).empty());
  EXPECT_EQ(s.at(N(3, 0)), (Piece{Player::A, Rank::Warrior}));
  EXPECT_FALSE(s.in_chain());
}

TEST(RulesTest, ApplyReturnsNewState) {
  GameState s;
  GameState copy = s;
  GameState next = Rules::apply_move(s, step(N(4, 2), N(3, 2)));

  EXPECT_EQ(s, copy);
  EXPECT_NE(next, s);
  EXPECT_EQ(next.current_player(), Player::B);
}

TEST(RulesTest, CaptureStartsChainAndKeepsTurn) {
  GameState s = chain_position();
  s.apply_move(jump(N(3, 1), N(2.5, 1.5), N(2, 2)));

  EXPECT_TRUE(s.in_chain());
  EXPECT_EQ(s.pending_chain().node, N(2, 2));
  EXPECT_EQ(s.pending_chain().origin, N(3, 1));
  EXPECT_EQ(s.pending_chain().rank, Rank::Warrior);
  EXPECT_EQ(s.current_player(), Player::A);
  EXPECT_EQ(s.move_count(), 0);
  EXPECT_EQ(s.piece_count(Player::B), 3);

  // Only the chain piece may continue, and only by capturing.
  MoveList moves;
  Rules::legal_moves(s, moves);
  ASSERT_EQ(moves.size, 1u);
  EXPECT_EQ(moves[0].from, N(2, 2));
  EXPECT_EQ(moves[0].to, N(1, 3));
  EXPECT_EQ(moves[0].captured, N(1.5, 2.5));
  EXPECT_TRUE(moves[0].chain);
  EXPECT_FALSE(Rules::is_legal(s, step(N(4, 4), N(3, 4))));
}

TEST(RulesTest, ChainEndsWhenNoCaptureRemains) {
  GameState s = chain_position();
  s.apply_move(jump(N(3, 1), N(2.5, 1.5), N(2, 2)));
  // The chain flag is optional on input.
  s.apply_move(jump(N(2, 2), N(1.5, 2.5), N(1, 3)));

  EXPECT_FALSE(s.in_chain());
  EXPECT_EQ(s.current_player(), Player::B);
  EXPECT_EQ(s.move_count(), 1);
  EXPECT_EQ(s.piece_count(Player::B), 2);
  EXPECT_EQ(s.at(N(1, 3)), (Piece{Player::A, Rank::Warrior}));
  EXPECT_TRUE(s.at(N(2, 2)).empty());
}

TEST(RulesTest, SingleCaptureEndsTurn) {
  GameState s = position({
    P(3, 2, Player::A, Rank::Warrior),
    P(5, 0, Player::A, Rank::King),
    P(2, 2, Player::B, Rank::Warrior),
    P(0, 0, Player::B, Rank::Warrior),
    P(0, 4, Player::B, Rank::King),
  }, Player::A);
  s.apply_move(jump(N(3, 2), N(2, 2), N(1, 2)));

  EXPECT_FALSE(s.in_chain());
  EXPECT_EQ(s.current_player(), Player::B);
  EXPECT_EQ(s.move_count(), 1);
}

TEST(RulesTest, ChainContinuationUsesTheCapturingPiece) {
  GameState s = chain_position();
  s.apply_move(jump(N(3, 1), N(2.5, 1.5), N(2, 2)));
  GameState before = s;

  EXPECT_THROW(s.apply_move(jump(N(3, 1), N(2.5, 1.5), N(2, 2))), IllegalMoveError);
  EXPECT_THROW(s.apply_move(step(N(5, 0), N(4, 0))), IllegalMoveError);
  EXPECT_EQ(s, before);
}

TEST(RulesTest, IllegalMoveLeavesStateUnchanged) {
  GameState s;
  GameState before = s;

  // Onto an occupied node.
  EXPECT_THROW(s.apply_move(step(N(4, 4), N(3, 4))), IllegalMoveError);
  // Opponent's piece.
  EXPECT_THROW(s.apply_move(step(N(1, 0), N(2, 1))), IllegalMoveError);
  // Backwards.
  GameState lone = position({
    P(3, 2, Player::A, Rank::Warrior),
    P(3, 3, Player::A, Rank::King),
    P(0, 0, Player::B, Rank::Warrior),
    P(0, 4, Player::B, Rank::King),
  }, Player::A);
  EXPECT_THROW(lone.apply_move(step(N(3, 2), N(4, 2))), IllegalMoveError);
  // Sideways.
  EXPECT_THROW(lone.apply_move(step(N(3, 2), N(3, 1))), IllegalMoveError);

  EXPECT_EQ(s, before);
  EXPECT_FALSE(Rules::is_legal(s, Move{}));
}

TEST(RulesTest, ApplyAfterGameOverThrows) {
  // Player B has no king: the game is already decided.
  GameState s = position({
    P(3, 2, Player::A, Rank::Warrior),
    P(5, 0, Player::A, Rank::King),
    P(0, 0, Player::B, Rank::Warrior),
    P(0, 2, Player::B, Rank::Prince),
  }, Player::A);
  GameState before = s;
  EXPECT_THROW(s.apply_move(step(N(3, 2), N(2, 2))), PreconditionError);
  EXPECT_EQ(s, before);
}

TEST(RulesTest, FromPlacementsRejectsInvalidPositions) {
  EXPECT_THROW(position({P(3, 2, Player::A, Rank::Warrior), P(3, 2, Player::B, Rank::Warrior)},
                        Player::A),
               ConfigError);
  EXPECT_THROW(position({P(3, 2, Player::A, Rank::King), P(4, 2, Player::A, Rank::King)},
                        Player::A),
               ConfigError);
  EXPECT_THROW(position({Placement{200, Piece{Player::A, Rank::Warrior}}}, Player::A),
               ConfigError);
  EXPECT_THROW(position({P(3, 2, Player::A, Rank::Warrior)}, Player::None), ConfigError);

  PendingChain wrong;
  wrong.node = N(3, 2);
  wrong.owner = Player::B;
  wrong.rank = Rank::Warrior;
  EXPECT_THROW(GameState::from_placements(GameConfig{}, {P(3, 2, Player::A, Rank::Warrior)},
                                          Player::A, 0, wrong),
               ConfigError);
}

TEST(RulesTest, PendingChainNeedsACapture) {
  PendingChain chain;
  chain.node = N(3, 2);
  chain.origin = N(4, 1);
  chain.rank = Rank::Warrior;
  chain.owner = Player::A;

  // Nothing next to the chain piece, so the turn would have ended already.
  std::vector<Placement> pieces = {
    P(3, 2, Player::A, Rank::Warrior),
    P(5, 0, Player::A, Rank::King),
    P(0, 4, Player::B, Rank::King),
    P(0, 0, Player::B, Rank::Warrior),
  };
  EXPECT_THROW(GameState::from_placements(GameConfig{}, pieces, Player::A, 0, chain),
               ConfigError);

  // Only a capture the side could make with another piece does not count either.
  pieces.push_back(P(4.5, 0.5, Player::B, Rank::Warrior));
  EXPECT_THROW(GameState::from_placements(GameConfig{}, pieces, Player::A, 0, chain),
               ConfigError);

  pieces.push_back(P(2.5, 2.5, Player::B, Rank::Warrior));
  GameState s = GameState::from_placements(GameConfig{}, pieces, Player::A, 0, chain);
  EXPECT_TRUE(s.in_chain());
  MoveList moves;
  Rules::legal_moves(s, moves);
  ASSERT_EQ(moves.size, 1u);
  EXPECT_EQ(moves[0].captured, N(2.5, 2.5));
}

TEST(RulesTest, MoveToString) {
  const BoardGraph& g = BoardGraph::standard();
  EXPECT_EQ(to_string(step(N(4, 0), N(3, 0)), g), g.label(N(4, 0)) + " -> " + g.label(N(3, 0)));
  EXPECT_EQ(to_string(jump(N(3, 2), N(2, 2), N(1, 2)), g),
            g.label(N(3, 2)) + " -> " + g.label(N(1, 2)) + " x " + g.label(N(2, 2)));
}

TEST(RulesTest, ChainNeverLandsOnPreviousOrigin) {
  PendingChain chain;
  chain.node = N(2, 2);
  chain.origin = N(0, 2);
  chain.rank = Rank::King;
  chain.owner = Player::A;

  GameState s = GameState::from_placements(GameConfig{}, {
    P(2, 2, Player::A, Rank::King),
    P(1, 2, Player::B, Rank::Warrior),
    P(2.5, 2.5, Player::B, Rank::Warrior),
    P(0, 4, Player::B, Rank::King),
  }, Player::A, 0, chain);

  MoveList moves;
  Rules::legal_moves(s, moves);
  ASSERT_EQ(moves.size, 1u);
  EXPECT_EQ(moves[0].to, N(3, 3));
  EXPECT_EQ(moves[0].captured, N(2.5, 2.5));
  EXPECT_FALSE(Rules::is_legal(s, jump(N(2, 2), N(1, 2), N(0, 2))));
}

TEST(RulesTest, GameConfigValidation) {
  EXPECT_NO_THROW(GameConfig::standard().validate());
  EXPECT_EQ(GameConfig::quick().move_limit, 200);
  EXPECT_EQ(GameConfig::testing().move_limit, 100);

  GameConfig low;
  low.move_limit = kMinMoveLimit - 1;
  EXPECT_THROW(low.validate(), ConfigError);
  EXPECT_THROW(GameState{low}, ConfigError);

  GameConfig high;
  high.move_limit = kMaxMoveLimit + 1;
  EXPECT_THROW(new_game(high), ConfigError);

  GameState s = new_game(GameConfig::testing());
  EXPECT_EQ(s.move_limit(), 100);
  EXPECT_EQ(s.piece_count(Player::A), 16);

  EXPECT_THROW(GameConfig::custom(kMinBoardRows - 1, 5).validate(), ConfigError);
  EXPECT_THROW(GameConfig::custom(6, kMinBoardCols - 1).validate(), ConfigError);
  EXPECT_THROW(new_game(GameConfig::custom(kMaxLatticeSize + 1, 5)), ConfigError);
  EXPECT_NO_THROW(GameConfig::custom(kMaxLatticeSize, kMaxLatticeSize).validate());
}

TEST(RulesTest, LargerBoardSetup) {
  GameState s = new_game(GameConfig::custom(7, 5));
  const BoardGraph& g = s.graph();
  EXPECT_EQ(g.rows(), 7);
  EXPECT_EQ(g.cols(), 5);
  EXPECT_NE(&g, &BoardGraph::standard());
  EXPECT_EQ(s.piece_count(Player::A), 16);
  EXPECT_EQ(s.piece_count(Player::B), 16);

  // Kings keep their places relative to each home edge.
  EXPECT_EQ(s.king_node(Player::A), g.at(4, 4));
  EXPECT_EQ(s.at(g.at(4.5, 3.5)), (Piece{Player::A, Rank::Prince}));
  EXPECT_EQ(s.king_node(Player::B), g.at(2, 0));
  EXPECT_EQ(s.at(g.at(1.5, 0.5)), (Piece{Player::B, Rank::Prince}));
  EXPECT_TRUE(s.at(g.at(3, 2)).empty());

  MoveList moves;
  Rules::legal_moves(s, moves);
  EXPECT_FALSE(moves.empty());
  for (const Move& m : moves) EXPECT_FALSE(m.is_capture());

  // Same pieces on a different board size are a different state.
  EXPECT_NE(s, new_game(GameConfig::custom(7, 6)));
  EXPECT_NE(new_game(GameConfig::custom(6, 5)), s);
  EXPECT_EQ(new_game(GameConfig::custom(6, 5)), GameState{});

  GameState small = new_game(GameConfig::custom(kMinBoardRows, 3));
  EXPECT_EQ(small.piece_count(Player::A), small.piece_count(Player::B));
  EXPECT_TRUE(small.has_king(Player::A));
  EXPECT_TRUE(small.has_king(Player::B));
}
