#include "core/game.hpp"

#include "Logging.hpp"
#include "core/errors.hpp"
#include "core/notation.hpp"

#include <format>

namespace quorum {

Game::Game() : Game(Position{}) {
}

Game::Game(Position start) : m_history{std::move(start)} {
}

GameAction Game::actionOf(const Move& move) {
	if (move.isPlacement())
		return GameAction::Place;
	if (move.isJump())
		return GameAction::Jump;
	return GameAction::Pass;
}

bool Game::play(const Move& move) {
	auto logger         = Logger();
	const auto& current = position();
	const auto mover    = current.toMove();
	const auto moveStr  = toString(move);

	if (status() == GameStatus::Done) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejected {} by {}: game already won by {}.", moveStr, toString(mover), toString(winner())));
		return false;
	}

	const auto action = actionOf(move);
	if (action == GameAction::Pass) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Move {} by {} has only one square; only the ply advances.", moveStr, toString(mover)));
	}

	MoveEffects effects;
	try {
		m_history.push_back(current.move(move, effects));
	} catch (const IllegalMove& e) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejected {} by {}: {}", moveStr, toString(mover), e.what()));
		return false;
	}

	const auto& next = position();
	logger.Log(Logging::LogLevel::Debug, std::format("[Game] Ply {}: {} played {} ({} placed, {} suffocated, {} converted).", next.ply(), toString(mover), moveStr,
	                                                 effects.placed.size(), effects.suffocated.size(), effects.converted.size()));

	const bool gameActive = status() == GameStatus::Active;
	if (!gameActive) {
		logger.Log(Logging::LogLevel::Info, std::format("[Game] {} wins by quorum after {} plies.", toString(winner()), next.ply()));
	}

	m_eventHub.publish(
	        GameDelta{
	                .moveId     = next.ply(),
	                .action     = action,
	                .player     = mover,
	                .move       = move,
	                .placed     = std::move(effects.placed),
	                .suffocated = std::move(effects.suffocated),
	                .converted  = std::move(effects.converted),
	                .nextPlayer = next.toMove(),
	                .gameActive = gameActive,
	        },
	        true);
	return true;
}

bool Game::undo() {
	if (m_history.size() < 2u) {
		return false;
	}

	const bool wasActive = status() == GameStatus::Active;
	const auto taken     = *position().lastMove();
	m_history.pop_back();

	Logger().Log(Logging::LogLevel::Info, std::format("[Game] Took back {} at ply {}.", toString(taken), position().ply() + 1u));

	m_eventHub.publish(
	        GameDelta{
	                .moveId     = position().ply(),
	                .action     = GameAction::Undo,
	                .player     = position().toMove(),
	                .move       = taken,
	                .placed     = {},
	                .suffocated = {},
	                .converted  = {},
	                .nextPlayer = position().toMove(),
	                .gameActive = status() == GameStatus::Active,
	        },
	        wasActive);
	return true;
}

const Position& Game::position() const {
	return m_history.back();
}

const std::vector<Position>& Game::history() const {
	return m_history;
}

std::vector<Move> Game::moves() const {
	std::vector<Move> result;
	result.reserve(m_history.size() - 1u);
	for (auto it = m_history.begin() + 1; it != m_history.end(); ++it) {
		result.push_back(*it->lastMove());
	}
	return result;
}

GameStatus Game::status() const {
	return winner() == Player::Empty ? GameStatus::Active : GameStatus::Done;
}

Player Game::winner() const {
	return position().winner();
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace quorum
