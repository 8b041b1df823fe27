#pragma once

#include "model/player.hpp"

namespace quorum {

//! Content of a single board square.
struct Piece {
	Player player{Player::Empty};

	constexpr bool isEmpty() const {
		return player == Player::Empty;
	}

	//! Stone of the other player. Throws std::invalid_argument on an empty piece.
	constexpr Piece opponent() const {
		return Piece{quorum::opponent(player)};
	}

	constexpr bool operator==(const Piece&) const = default;
};

//! Signed value of the piece owner (see value(Player)).
inline constexpr int value(const Piece piece) {
	return value(piece.player);
}

inline constexpr Piece kEmpty{Player::Empty};
inline constexpr Piece kBlack{Player::Black};
inline constexpr Piece kWhite{Player::White};

} // namespace quorum
