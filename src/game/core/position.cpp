#include "core/position.hpp"

#include <numeric>

namespace quorum {

// clang-format off
const std::array<int, Board::kSquareCount> Position::kPieceWeights{
//  a  b  c   d   e  f  g  h
    1, 1, 1,  1,  1, 1, 1, 1, // 8
    1, 1, 1,  2,  2, 1, 1, 1, // 7
    1, 1, 2,  5,  5, 2, 1, 1, // 6
    1, 2, 5, 10, 10, 5, 2, 1, // 5
    1, 2, 5, 10, 10, 5, 2, 1, // 4
    1, 1, 2,  5,  5, 2, 1, 1, // 3
    1, 1, 1,  2,  2, 1, 1, 1, // 2
    1, 1, 1,  1,  1, 1, 1, 1, // 1
};
// clang-format on

Position::Position() : m_board{Board::startLayout()} {
}

Position::Position(Board board, const unsigned ply, std::optional<Move> lastMove) : m_board{board}, m_ply{ply}, m_lastMove{std::move(lastMove)} {
}

Position Position::move(const Move& move) const {
	MoveEffects effects;
	return this->move(move, effects);
}

Position Position::move(const Move& move, MoveEffects& outEffects) const {
	auto nextBoard = applyMove(m_board, toMove(), move, outEffects);
	return Position{nextBoard, m_ply + 1u, move};
}

const Board& Position::board() const {
	return m_board;
}

unsigned Position::ply() const {
	return m_ply;
}

const std::optional<Move>& Position::lastMove() const {
	return m_lastMove;
}

Piece Position::operator[](const Square s) const {
	return m_board.get(s);
}

Player Position::toMove() const {
	return m_ply % 2u == 0u ? Player::White : Player::Black;
}

unsigned Position::wholeMove() const {
	return m_ply / 2u + 1u;
}

int Position::winProgress() const {
	return std::accumulate(kCenterSquares.begin(), kCenterSquares.end(), 0, [&](int sum, const Square s) { return sum + value(m_board.get(s)); });
}

Player Position::winner() const {
	const auto progress = winProgress();
	if (progress == static_cast<int>(kCenterSquares.size()) || progress == -static_cast<int>(kCenterSquares.size())) {
		return fromValue(progress);
	}
	return Player::Empty;
}

double Position::staticEvaluation() const {
	int sum = 0;
	for (std::size_t i = 0; i != Board::kSquareCount; ++i) {
		sum += value(m_board.pieces()[i]) * kPieceWeights[i];
	}
	return sum / 10.0;
}

Position move(const Position& position, const Move& move) {
	return position.move(move);
}

} // namespace quorum
