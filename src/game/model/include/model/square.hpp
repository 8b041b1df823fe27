#pragma once

#include <array>
#include <cstddef>
#include <utility>

namespace quorum {

inline constexpr int kBoardSize = 8; //!< Files and ranks per side.

//! File/rank pair. Files a..h map to 1..8, ranks 1..8 map to 1..8.
//! \note Values outside [1, 8] are valid while doing neighbour arithmetic. Check inBounds() before touching a board.
struct Square {
	int file{0};
	int rank{0};

	constexpr bool inBounds() const {
		return file >= 1 && file <= kBoardSize && rank >= 1 && rank <= kBoardSize;
	}

	constexpr Square operator+(const Square other) const {
		return {file + other.file, rank + other.rank};
	}

	constexpr Square operator+(const std::pair<int, int> delta) const {
		return {file + delta.first, rank + delta.second};
	}

	//! Floor division of both components.
	constexpr Square operator/(const int n) const {
		return {floorDiv(file, n), floorDiv(rank, n)};
	}

	constexpr bool operator==(const Square&) const = default;

private:
	static constexpr int floorDiv(const int a, const int b) {
		const int q = a / b;
		return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
	}
};

//! Integer center of two squares. Only a real line center when the displacement is even.
inline constexpr Square midpoint(const Square a, const Square b) {
	return (a + b) / 2;
}

//! King-move offsets. Order is stable but carries no meaning for the rules.
inline constexpr std::array<Square, 8> kDirections{{
        {-1, -1},
        {-1, 0},
        {-1, +1},
        {0, +1},
        {+1, +1},
        {+1, 0},
        {+1, -1},
        {0, -1},
}};

// clang-format off
inline constexpr Square A1{1, 1}, A2{1, 2}, A3{1, 3}, A4{1, 4}, A5{1, 5}, A6{1, 6}, A7{1, 7}, A8{1, 8};
inline constexpr Square B1{2, 1}, B2{2, 2}, B3{2, 3}, B4{2, 4}, B5{2, 5}, B6{2, 6}, B7{2, 7}, B8{2, 8};
inline constexpr Square C1{3, 1}, C2{3, 2}, C3{3, 3}, C4{3, 4}, C5{3, 5}, C6{3, 6}, C7{3, 7}, C8{3, 8};
inline constexpr Square D1{4, 1}, D2{4, 2}, D3{4, 3}, D4{4, 4}, D5{4, 5}, D6{4, 6}, D7{4, 7}, D8{4, 8};
inline constexpr Square E1{5, 1}, E2{5, 2}, E3{5, 3}, E4{5, 4}, E5{5, 5}, E6{5, 6}, E7{5, 7}, E8{5, 8};
inline constexpr Square F1{6, 1}, F2{6, 2}, F3{6, 3}, F4{6, 4}, F5{6, 5}, F6{6, 6}, F7{6, 7}, F8{6, 8};
inline constexpr Square G1{7, 1}, G2{7, 2}, G3{7, 3}, G4{7, 4}, G5{7, 5}, G6{7, 6}, G7{7, 7}, G8{7, 8};
inline constexpr Square H1{8, 1}, H2{8, 2}, H3{8, 3}, H4{8, 4}, H5{8, 5}, H6{8, 6}, H7{8, 7}, H8{8, 8};
// clang-format on

//! Squares whose joint control wins the game.
inline constexpr std::array<Square, 4> kCenterSquares{D4, D5, E4, E5};

} // namespace quorum
