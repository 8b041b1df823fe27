#pragma once

#include "model/move.hpp"
#include "model/player.hpp"

#include <cstdint>
#include <vector>

namespace quorum {

//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Board was modified.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_StateChange  = 1 << 2, //!< Game state changed. Won or taken back.
};

//! Type of move.
enum class GameAction {
	Place, //!< Home squares filled.
	Jump,  //!< Stone jumped.
	Pass,  //!< Move with only an origin or only a target. Only the ply advances.
	Undo   //!< Last move taken back.
};

//! Symbolises the game state change after one move.
struct GameDelta {
	unsigned moveId;                 //!< Ply after the change.
	GameAction action;               //!< Move type.
	Player player;                   //!< Player who made the move.
	Move move;                       //!< Applied move. For undo: the move taken back.
	std::vector<Square> placed;      //!< Home squares filled by a placement.
	std::vector<Square> suffocated;  //!< Removed opponent stones.
	std::vector<Square> converted;   //!< Opponent stones flipped to the mover.
	Player nextPlayer;               //!< Player to make the next move.
	bool gameActive;                 //!< Game active after the move.
};

} // namespace quorum
