#include "display/printer.hpp"

#include <format>
#include <vector>

namespace quorum::display {

static std::string padRight(std::string text, const std::size_t width) {
	const auto current = displayWidth(text);
	if (current < width) {
		text.append(width - current, ' ');
	}
	return text;
}

static std::string padLeft(std::string text, const std::size_t width) {
	const auto current = displayWidth(text);
	if (current < width) {
		text.insert(0u, width - current, ' ');
	}
	return text;
}

//! Decimal number that always shows a fraction ("0.0", "-1.3").
static std::string formatDecimal(const double value) {
	auto text = std::format("{}", value);
	if (text.find_first_of(".en") == std::string::npos) {
		text += ".0";
	}
	return text;
}

std::string formatPiece(const Piece piece, const DisplayStyle& style) {
	switch (piece.player) {
	case Player::Black:
		return style.pieces[0];
	case Player::White:
		return style.pieces[1];
	case Player::Empty:
		break;
	}
	return style.pieces[2];
}

std::string formatSquare(const Square s, const DisplayStyle& style) {
	const auto onBoard = [](const int v) { return v >= 1 && v <= kBoardSize; };

	const auto file = onBoard(s.file) ? style.files[s.file - 1] : std::format("<{}>", s.file);
	const auto rank = onBoard(s.rank) ? style.ranks[s.rank - 1] : std::format("<{}>", s.rank);
	return file + rank;
}

std::string formatMove(const Move& move, const DisplayStyle& style) {
	std::string text = move.origin() ? formatSquare(*move.origin(), style) : style.placement;
	if (move.target()) {
		text += style.fromToSeparator + formatSquare(*move.target(), style);
	}
	return text;
}

std::string formatResult(const Player winner) {
	switch (winner) {
	case Player::White:
		return "1-0";
	case Player::Black:
		return "0-1";
	case Player::Empty:
		break;
	}
	return "½-½";
}

std::string renderPosition(const Position& position, const DisplayStyle& style) {
	const auto winner = position.winner();
	const auto status = winner == Player::Empty ? formatPiece(Piece{position.toMove()}, style) + " to move"
	                                            : formatPiece(Piece{winner}, style) + " wins by quorum";
	const auto& lastMove = position.lastMove();

	const std::vector<std::string> extras{
	        status,
	        std::format("Move: {} (ply {})", position.wholeMove(), position.ply()),
	        std::format("Last move: {}", lastMove ? formatMove(*lastMove, style) : "None"),
	        std::format("Win progress: {}", position.winProgress()),
	        std::format("Static evaluation: {}", formatDecimal(position.staticEvaluation())),
	};

	const auto sep = std::format("  {}  ", style.separator);

	std::string out = " ";
	for (const auto& file: style.files) {
		out += " " + file;
	}
	out += sep;

	for (std::size_t row = 0; row != kBoardSize; ++row) {
		out += "\n" + style.ranks[kBoardSize - 1 - row];
		for (const auto piece: position.board().row(row)) {
			out += " " + formatPiece(piece, style);
		}
		out += sep;
		if (row < extras.size()) {
			out += extras[row];
		}
	}
	return out;
}

std::string formatMoveList(const std::span<const Move> moves, const std::optional<Player> result, const DisplayStyle& style) {
	std::vector<std::string> entries;
	entries.reserve(moves.size() + 1u);
	for (const auto& move: moves) {
		entries.push_back(formatMove(move, style));
	}
	if (result) {
		entries.push_back(formatResult(*result));
	}

	const auto width = style.moveWidth();
	std::string out;
	for (std::size_t i = 0; i < entries.size(); i += 2u) {
		if (i != 0u) {
			out += "\n";
		}
		out += padLeft(std::format("{}.", i / 2u + 1u), 3u) + " " + padRight(entries[i], width);
		if (i + 1u < entries.size()) {
			out += " " + padRight(entries[i + 1u], width);
		}
	}
	return out;
}

std::string renderGame(const Game& game, const DisplayStyle& style) {
	std::optional<Player> result;
	if (game.status() == GameStatus::Done) {
		result = game.winner();
	}

	std::string out = formatMoveList(game.moves(), result, style) + "\n";
	for (const auto& position: game.history()) {
		out += "\n" + renderPosition(position, style) + "\n";
	}
	return out;
}

} // namespace quorum::display
