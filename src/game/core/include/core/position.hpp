#pragma once

#include "core/rules.hpp"
#include "model/board.hpp"
#include "model/move.hpp"
#include "model/player.hpp"

#include <array>
#include <optional>

namespace quorum {

//! Board, ply and last move of a game. Each applied move produces a new value.
class Position {
public:
	//! Relative value of each square for the static evaluation, storage order.
	static const std::array<int, Board::kSquareCount> kPieceWeights;

public:
	Position(); //!< Opening position.
	explicit Position(Board board, unsigned ply = 0u, std::optional<Move> lastMove = std::nullopt);

	//! Position after the player to move plays move.
	//! \throws HomeSquaresFull, IllegalJump. This position is never modified.
	Position move(const Move& move) const;

	//! Same as move(), also reporting placed, suffocated and converted squares.
	Position move(const Move& move, MoveEffects& outEffects) const;

	const Board& board() const;
	unsigned ply() const;                        //!< Moves played since the opening. White moves on even plies.
	const std::optional<Move>& lastMove() const; //!< Not set for the opening position.

	Piece operator[](Square s) const; //!< Piece at square. Throws std::out_of_range when off board.

	Player toMove() const;           //!< Player whose turn it is.
	unsigned wholeMove() const;      //!< Conventional move number, starting at 1.
	int winProgress() const;         //!< Sum of center square values in [-4, 4].
	Player winner() const;           //!< Owner of all center squares or Empty.
	double staticEvaluation() const; //!< Weighted material balance, positive favours White.

	bool operator==(const Position&) const = default;

private:
	Board m_board;                    //!< Current board.
	unsigned m_ply{0u};               //!< Move number of game.
	std::optional<Move> m_lastMove{}; //!< Move leading to this position.
};

//! Position reached by playing move in position.
//! \throws HomeSquaresFull, IllegalJump
Position move(const Position& position, const Move& move);

} // namespace quorum
