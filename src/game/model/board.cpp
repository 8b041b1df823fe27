#include "model/board.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace quorum {

static void checkBounds(const Square s) {
	if (!s.inBounds()) {
		throw std::out_of_range(std::format("Square ({}, {}) is not on the board", s.file, s.rank));
	}
}

Board::Board(const Storage& pieces) : m_pieces(pieces) {
}

Board Board::startLayout() {
	constexpr Piece B = kBlack;
	constexpr Piece W = kWhite;
	constexpr Piece _ = kEmpty;

	// clang-format off
	return Board{Storage{
	//  a  b  c  d  e  f  g  h
	    _, _, _, _, B, B, B, B, // 8
	    _, _, _, _, _, B, B, B, // 7
	    _, _, _, _, _, _, B, B, // 6
	    _, _, _, _, _, _, _, B, // 5
	    W, _, _, _, _, _, _, _, // 4
	    W, W, _, _, _, _, _, _, // 3
	    W, W, W, _, _, _, _, _, // 2
	    W, W, W, W, _, _, _, _, // 1
	}};
	// clang-format on
}

Piece Board::get(const Square s) const {
	checkBounds(s);
	return m_pieces[index(s)];
}

void Board::set(const Square s, const Piece piece) {
	checkBounds(s);
	m_pieces[index(s)] = piece;
}

bool Board::isEmpty(const Square s) const {
	return get(s).isEmpty();
}

std::size_t Board::size() const {
	return m_pieces.size();
}

std::span<const Piece, kBoardSize> Board::row(const std::size_t index) const {
	if (index >= kBoardSize) {
		throw std::out_of_range(std::format("Row {} is not on the board", index));
	}
	return std::span<const Piece, kBoardSize>{m_pieces.data() + index * kBoardSize, kBoardSize};
}

const Board::Storage& Board::pieces() const {
	return m_pieces;
}

Board::Storage::const_iterator Board::begin() const {
	return m_pieces.begin();
}

Board::Storage::const_iterator Board::end() const {
	return m_pieces.end();
}

std::size_t Board::count(const Player player) const {
	return static_cast<std::size_t>(std::count(m_pieces.begin(), m_pieces.end(), Piece{player}));
}

} // namespace quorum
