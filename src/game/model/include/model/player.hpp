#pragma once

#include "model/square.hpp"

#include <array>
#include <stdexcept>

namespace quorum {

//! Owner of a stone. Empty is a sentinel for "nobody", never a participant.
enum class Player { Black, Empty, White };

//! Signed projection used in sums: Black -1, Empty 0, White +1.
inline constexpr int value(const Player player) {
	switch (player) {
	case Player::Black:
		return -1;
	case Player::White:
		return +1;
	case Player::Empty:
		break;
	}
	return 0;
}

//! Returns the opponent enum value of input player.
//! \throws std::invalid_argument for Player::Empty.
inline constexpr Player opponent(const Player player) {
	if (player == Player::Empty) {
		throw std::invalid_argument("Player::Empty has no opponent");
	}
	return player == Player::White ? Player::Black : Player::White;
}

//! Player for a signed value. Negative -> Black, positive -> White, zero -> Empty.
inline constexpr Player fromValue(const int value) {
	return value < 0 ? Player::Black : (value > 0 ? Player::White : Player::Empty);
}

//! Capitalized player name ("Black", "White", "Empty").
const char* toString(Player player);

//! The four squares a player generates stones on.
//! \throws std::invalid_argument for Player::Empty.
const std::array<Square, 4>& homeSquares(Player player);

} // namespace quorum
