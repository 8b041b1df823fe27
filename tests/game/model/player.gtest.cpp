#include "model/piece.hpp"
#include "model/player.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace quorum::gtest {

TEST(Player, Value) {
	EXPECT_EQ(value(Player::Black), -1);
	EXPECT_EQ(value(Player::Empty), 0);
	EXPECT_EQ(value(Player::White), +1);

	EXPECT_EQ(fromValue(-4), Player::Black);
	EXPECT_EQ(fromValue(0), Player::Empty);
	EXPECT_EQ(fromValue(3), Player::White);
}

TEST(Player, Opponent) {
	EXPECT_EQ(opponent(Player::Black), Player::White);
	EXPECT_EQ(opponent(Player::White), Player::Black);
	EXPECT_THROW(opponent(Player::Empty), std::invalid_argument);
}

TEST(Player, HomeSquares) {
	const auto& black = homeSquares(Player::Black);
	EXPECT_NE(std::find(black.begin(), black.end(), H8), black.end());
	EXPECT_NE(std::find(black.begin(), black.end(), H7), black.end());
	EXPECT_NE(std::find(black.begin(), black.end(), G8), black.end());
	EXPECT_NE(std::find(black.begin(), black.end(), G7), black.end());

	const auto& white = homeSquares(Player::White);
	EXPECT_NE(std::find(white.begin(), white.end(), A1), white.end());
	EXPECT_NE(std::find(white.begin(), white.end(), A2), white.end());
	EXPECT_NE(std::find(white.begin(), white.end(), B1), white.end());
	EXPECT_NE(std::find(white.begin(), white.end(), B2), white.end());

	EXPECT_THROW(homeSquares(Player::Empty), std::invalid_argument);
}

TEST(Piece, Basics) {
	EXPECT_TRUE(kEmpty.isEmpty());
	EXPECT_FALSE(kBlack.isEmpty());
	EXPECT_EQ(Piece{}, kEmpty);

	EXPECT_EQ(kBlack.opponent(), kWhite);
	EXPECT_EQ(kWhite.opponent(), kBlack);
	EXPECT_THROW(kEmpty.opponent(), std::invalid_argument);

	EXPECT_EQ(value(kWhite) - value(kBlack), 2);
}

} // namespace quorum::gtest
