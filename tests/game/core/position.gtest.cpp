#include "core/errors.hpp"
#include "core/position.hpp"

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <vector>

namespace quorum::gtest {

TEST(Position, Start) {
	const Position position;
	EXPECT_EQ(position.board(), Board::startLayout());
	EXPECT_EQ(position.board().size(), 64u);
	EXPECT_EQ(position.ply(), 0u);
	EXPECT_FALSE(position.lastMove().has_value());
	EXPECT_EQ(position.toMove(), Player::White);
	EXPECT_EQ(position.wholeMove(), 1u);
	EXPECT_EQ(position.winProgress(), 0);
	EXPECT_EQ(position.winner(), Player::Empty);
	EXPECT_DOUBLE_EQ(position.staticEvaluation(), 0.0);
}

TEST(Position, BuiltFromBoardOnlyExplicitly) {
	static_assert(!std::is_convertible_v<Board, Position>);
	static_assert(std::is_constructible_v<Position, Board>);

	Board board;
	board.set(E4, kBlack);
	const Position position{board, 3u};
	EXPECT_EQ(position.board(), board);
	EXPECT_EQ(position.ply(), 3u);
	EXPECT_EQ(position.toMove(), Player::Black);
}

TEST(Position, TurnOrder) {
	const std::vector<Move> moves{Move{B1, D3}, Move{G8, E6}, Move::placement(), Move::placement(), Move{A2, C4}};

	Position position;
	for (std::size_t i = 0; i != moves.size(); ++i) {
		const auto before = position.toMove();
		position          = position.move(moves[i]);

		EXPECT_NE(position.toMove(), before);
		EXPECT_EQ(position.ply(), i + 1u);
		EXPECT_EQ(position.wholeMove(), (i + 1u) / 2u + 1u);
		EXPECT_EQ(position.lastMove(), moves[i]);
		EXPECT_EQ(position.board().size(), 64u);
	}
	EXPECT_EQ(position.toMove(), Player::Black);
}

TEST(Position, MoveLeavesSourceUnchanged) {
	const Position start;
	const auto next = start.move(Move{B1, D3});

	EXPECT_EQ(start, Position{});
	EXPECT_EQ(start[B1], kWhite);
	EXPECT_TRUE(start[D3].isEmpty());
	EXPECT_TRUE(next[B1].isEmpty());
	EXPECT_EQ(next[D3], kWhite);

	EXPECT_EQ(quorum::move(start, Move{B1, D3}), next);
}

// All home squares are taken in the opening, so a placement has to wait until one is vacated.
TEST(Position, PlacementFillsEmptyHomeSquares) {
	const Position start;
	EXPECT_THROW(start.move(Move::placement()), HomeSquaresFull);

	const auto afterWhite = start.move(Move{B1, D3});
	const auto afterBlack = afterWhite.move(Move{G8, E6});

	MoveEffects effects;
	const auto placed = afterBlack.move(Move::placement(), effects);
	EXPECT_EQ(placed[B1], kWhite);
	ASSERT_EQ(effects.placed.size(), 1u);
	EXPECT_EQ(effects.placed[0], B1);
	for (const auto s: homeSquares(Player::White)) {
		EXPECT_EQ(placed[s], kWhite);
	}

	// Nothing else changed.
	for (std::size_t i = 0; i != Board::kSquareCount; ++i) {
		const auto s = Board::square(i);
		if (s != B1) {
			EXPECT_EQ(placed[s], afterBlack[s]);
		}
	}

	// Black refills G8 the same way.
	const auto blackPlaced = placed.move(Move::placement());
	EXPECT_EQ(blackPlaced[G8], kBlack);
	EXPECT_EQ(blackPlaced.board().count(Player::Black), 11u);
}

TEST(Position, PlacementAllHomeSquaresEmpty) {
	Board board;
	board.set(D4, kWhite);
	const Position position{board, 1u};

	const auto next = position.move(Move::placement());
	for (const auto s: homeSquares(Player::Black)) {
		EXPECT_EQ(next[s], kBlack);
	}
	EXPECT_EQ(next.board().count(Player::Black), 4u);
	EXPECT_EQ(next[D4], kWhite);
}

TEST(Position, JumpOntoOccupiedTargetRejected) {
	Board board;
	board.set(B2, kWhite);
	board.set(C3, kWhite);

	for (const auto target: {kWhite, kBlack}) {
		board.set(D4, target);
		const Position position{board};
		EXPECT_THROW(position.move(Move{B2, D4}), IllegalJump);
	}

	// Also with an empty origin and center.
	board.set(F6, kBlack);
	EXPECT_THROW(Position{board}.move(Move{H8, F6}), IllegalJump);
}

TEST(Position, JumpMovesStone) {
	const Position start;
	const auto next = start.move(Move{A2, C4});

	EXPECT_EQ(next[C4], start[A2]);
	EXPECT_TRUE(next[A2].isEmpty());
	EXPECT_EQ(next[B3], kWhite);
	EXPECT_EQ(next.board().count(Player::White), 10u);
}

TEST(Position, JumpOverOtherColorRejected) {
	Board board;
	board.set(B2, kWhite);
	board.set(C3, kBlack);
	const Position position{board};

	EXPECT_THROW(position.move(Move{B2, D4}), IllegalJump);

	try {
		position.move(Move{B2, D4});
		FAIL() << "Expected IllegalJump";
	} catch (const IllegalMove& e) {
		EXPECT_NE(std::string{e.what()}.find("must be empty"), std::string::npos);
	}
}

// Moving an empty square over an empty square is accepted and leaves the board as it was.
TEST(Position, JumpFromEmptySquareAccepted) {
	const Position start;
	const auto next = start.move(Move{D4, D6});

	EXPECT_EQ(next.board(), start.board());
	EXPECT_EQ(next.ply(), 1u);
	EXPECT_EQ(next.lastMove(), (Move{D4, D6}));
}

TEST(Position, Suffocation) {
	// Black E5 is enclosed by White except E4, which White jumps into.
	Board board;
	board.set(E5, kBlack);
	for (const auto s: {D4, D5, D6, F4, F5, F6}) {
		board.set(s, kWhite);
	}
	board.set(E6, kBlack);
	board.set(E2, kWhite);
	board.set(E3, kWhite);

	const auto next = Position{board}.move(Move{E2, E4});
	EXPECT_TRUE(next[E5].isEmpty());
	EXPECT_EQ(next[E6], kBlack);
	EXPECT_EQ(next[E4], kWhite);

	// With D6 empty the stone keeps a liberty.
	board.set(D6, kEmpty);
	const auto survived = Position{board}.move(Move{E2, E4});
	EXPECT_EQ(survived[E5], kBlack);
}

TEST(Position, Conversion) {
	// White jumps B4 -> D4, Black E4 is caught against White F4.
	Board board;
	board.set(B4, kWhite);
	board.set(C4, kWhite);
	board.set(E4, kBlack);
	board.set(F4, kWhite);

	MoveEffects effects;
	const auto next = Position{board}.move(Move{B4, D4}, effects);
	EXPECT_EQ(next[E4], kWhite);
	ASSERT_EQ(effects.converted.size(), 1u);
	EXPECT_EQ(effects.converted[0], E4);

	// Empty middle square: nothing to convert.
	board.set(E4, kEmpty);
	const auto unchanged = Position{board}.move(Move{B4, D4}, effects);
	EXPECT_TRUE(unchanged[E4].isEmpty());
	EXPECT_TRUE(effects.converted.empty());
}

TEST(Position, ConversionByBlack) {
	Board board;
	board.set(G7, kBlack);
	board.set(F6, kBlack);
	board.set(D4, kWhite);
	board.set(C3, kBlack);
	board.set(E6, kWhite);
	const Position position{board, 1u};

	const auto next = position.move(Move{G7, E5});
	EXPECT_EQ(next[D4], kBlack); // Against C3.
	EXPECT_EQ(next[E6], kWhite); // Nothing behind it.
	EXPECT_EQ(next[E5], kBlack);
}

TEST(Position, Winner) {
	Board board;
	EXPECT_EQ(Position{board}.winner(), Player::Empty);

	for (const auto s: kCenterSquares) {
		board.set(s, kBlack);
	}
	EXPECT_EQ(Position{board}.winProgress(), -4);
	EXPECT_EQ(Position{board}.winner(), Player::Black);

	board.set(E5, kWhite);
	EXPECT_EQ(Position{board}.winProgress(), -2);
	EXPECT_EQ(Position{board}.winner(), Player::Empty);

	board.set(E5, kEmpty);
	EXPECT_EQ(Position{board}.winProgress(), -3);
	EXPECT_EQ(Position{board}.winner(), Player::Empty);

	for (const auto s: kCenterSquares) {
		board.set(s, kWhite);
	}
	EXPECT_EQ(Position{board}.winProgress(), 4);
	EXPECT_EQ(Position{board}.winner(), Player::White);
}

TEST(Position, StaticEvaluation) {
	Board board;
	board.set(D4, kWhite);
	EXPECT_DOUBLE_EQ(Position{board}.staticEvaluation(), 1.0);

	board.set(A1, kBlack);
	EXPECT_DOUBLE_EQ(Position{board}.staticEvaluation(), 0.9);

	board.set(D6, kBlack);
	EXPECT_DOUBLE_EQ(Position{board}.staticEvaluation(), 0.4);
}

// Only an origin or only a target: the board stays, the turn passes.
TEST(Position, HalfMoveOnlyAdvancesPly) {
	const Position start;
	const Move originOnly{std::optional<Square>{B1}, std::nullopt};
	const auto next = start.move(originOnly);

	EXPECT_EQ(next.board(), start.board());
	EXPECT_EQ(next.ply(), 1u);
	EXPECT_EQ(next.lastMove(), originOnly);
	EXPECT_EQ(next.toMove(), Player::Black);
}

} // namespace quorum::gtest
