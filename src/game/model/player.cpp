#include "model/player.hpp"

namespace quorum {

static constexpr std::array<Square, 4> kBlackHome{H8, H7, G8, G7};
static constexpr std::array<Square, 4> kWhiteHome{A1, A2, B1, B2};

const char* toString(const Player player) {
	switch (player) {
	case Player::Black:
		return "Black";
	case Player::White:
		return "White";
	case Player::Empty:
		break;
	}
	return "Empty";
}

const std::array<Square, 4>& homeSquares(const Player player) {
	switch (player) {
	case Player::Black:
		return kBlackHome;
	case Player::White:
		return kWhiteHome;
	case Player::Empty:
		break;
	}
	throw std::invalid_argument("Player::Empty has no home squares");
}

} // namespace quorum
