#pragma once

#include "model/board.hpp"
#include "model/move.hpp"
#include "model/player.hpp"

#include <cstddef>
#include <vector>

namespace quorum {

//! Board changes caused by a single move besides the moved stone itself.
struct MoveEffects {
	std::vector<Square> placed;     //!< Home squares filled by a placement.
	std::vector<Square> suffocated; //!< Opponent stones removed next to the jump target.
	std::vector<Square> converted;  //!< Opponent stones flipped to the mover.
};

//! Number of empty on-board neighbours of a square.
std::size_t countLiberties(const Board& board, Square s);

//! True if at least one home square of the player is empty.
bool canPlace(const Board& board, Player player);

//! Jump legality: origin and center hold equal values and the target is empty.
//! \note An empty origin over an empty center is legal.
bool isValidJump(const Board& board, const Move& move);

//! Opponent stones adjacent to target without a single empty neighbour.
std::vector<Square> findSuffocated(const Board& board, Square target, Player mover);

//! Opponent stones between target and a mover stone two steps further in the same direction.
std::vector<Square> findConverted(const Board& board, Square target, Player mover);

//! Compute the board after mover plays move. The input board is left untouched.
//! \param [out] outEffects Squares changed by placement, suffocation and conversion.
//! \throws HomeSquaresFull, IllegalJump
Board applyMove(const Board& board, Player mover, const Move& move, MoveEffects& outEffects);

} // namespace quorum
