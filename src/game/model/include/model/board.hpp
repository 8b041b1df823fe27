#pragma once

#include "model/piece.hpp"
#include "model/square.hpp"

#include <array>
#include <cstddef>
#include <span>

namespace quorum {

//! 8x8 Quorum board.
//! \note Storage is row-major from rank 8 down to rank 1, file a to h. Square (f, r) lives at f - 8r + 63.
class Board {
public:
	static constexpr std::size_t kSquareCount = kBoardSize * kBoardSize;
	using Storage                             = std::array<Piece, kSquareCount>;

public:
	Board() = default; //!< Empty board.
	explicit Board(const Storage& pieces);

	static Board startLayout(); //!< Opening layout with 10 stones per side.

	Piece get(Square s) const;        //!< Piece at square. Throws std::out_of_range when off board.
	void set(Square s, Piece piece); //!< Replace piece at square. Throws std::out_of_range when off board.
	bool isEmpty(Square s) const;    //!< True if no stone on the square.

	std::size_t size() const; //!< Always 64.

	std::span<const Piece, kBoardSize> row(std::size_t index) const; //!< Row 0 is rank 8.
	const Storage& pieces() const;                                    //!< All squares in storage order.

	Storage::const_iterator begin() const;
	Storage::const_iterator end() const;

	std::size_t count(Player player) const; //!< Number of squares owned by player.

	bool operator==(const Board&) const = default;

	//! Storage index of an in-bounds square.
	static constexpr std::size_t index(const Square s) {
		return static_cast<std::size_t>(s.file - kBoardSize * s.rank + 63);
	}

	//! Square at a storage index.
	static constexpr Square square(const std::size_t index) {
		const auto i = static_cast<int>(index);
		return {i % kBoardSize + 1, kBoardSize - i / kBoardSize};
	}

private:
	Storage m_pieces{}; //!< Board data.
};

} // namespace quorum
