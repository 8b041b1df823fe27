#pragma once

#include "core/eventHub.hpp"
#include "core/gameEvent.hpp"
#include "core/position.hpp"
#include "model/gameStatus.hpp"

#include <cstdint>
#include <vector>

namespace quorum {

//! Game session on top of the position engine.
//! Keeps the position history, refuses moves once the game is won and notifies listeners about every change.
class Game {
public:
	Game(); //!< Start from the opening position.
	explicit Game(Position start);

	//! Apply a move for the player to move.
	//! \returns False if the move is illegal or the game is already won. The game is unchanged then.
	bool play(const Move& move);

	//! Take back the last move. False at the start position.
	bool undo();

	const Position& position() const;
	const std::vector<Position>& history() const; //!< Every position of the game. Starts with the start position.
	std::vector<Move> moves() const;              //!< Moves played since the start position.

	GameStatus status() const;
	Player winner() const; //!< Winner of the current position or Player::Empty.

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	static GameAction actionOf(const Move& move);

private:
	std::vector<Position> m_history; //!< Never empty. Back is the current position.
	EventHub m_eventHub;             //!< Hub to signal updates of the game state to external components.
};

} // namespace quorum
