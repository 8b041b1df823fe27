#pragma once

#include "core/game.hpp"
#include "core/position.hpp"
#include "display/displayStyle.hpp"
#include "model/move.hpp"
#include "model/piece.hpp"

#include <optional>
#include <span>
#include <string>

namespace quorum::display {

std::string formatPiece(Piece piece, const DisplayStyle& style);
std::string formatSquare(Square s, const DisplayStyle& style); //!< Off-board components print as "<n>".
std::string formatMove(const Move& move, const DisplayStyle& style);

//! "1-0" for White, "0-1" for Black, "½-½" otherwise.
std::string formatResult(Player winner);

//! Board diagram, rank 8 on top, with side information next to the first rows.
std::string renderPosition(const Position& position, const DisplayStyle& style);

//! Numbered move list with two moves per line. The result, if given, is appended as the last entry.
std::string formatMoveList(std::span<const Move> moves, std::optional<Player> result, const DisplayStyle& style);

//! Move list of the game, result included once it is won, followed by every position from the opening on.
std::string renderGame(const Game& game, const DisplayStyle& style);

} // namespace quorum::display
