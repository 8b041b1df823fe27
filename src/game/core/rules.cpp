#include "core/rules.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace quorum {

static std::string describe(const Piece piece) {
	return piece.isEmpty() ? "empty" : toString(piece.player);
}

static void checkOnBoard(const Square s, const char* role) {
	if (!s.inBounds()) {
		throw IllegalJump(std::format("Jump {} ({}, {}) is not on the board", role, s.file, s.rank));
	}
}

std::size_t countLiberties(const Board& board, const Square s) {
	std::size_t liberties = 0;
	for (const auto d: kDirections) {
		const auto neighbor = s + d;
		if (!neighbor.inBounds())
			continue;

		if (board.isEmpty(neighbor)) {
			++liberties;
		}
	}
	return liberties;
}

bool canPlace(const Board& board, const Player player) {
	const auto& home = homeSquares(player);
	return std::any_of(home.begin(), home.end(), [&](const Square s) { return board.isEmpty(s); });
}

bool isValidJump(const Board& board, const Move& move) {
	if (!move.isJump())
		return false;

	const auto origin = *move.origin();
	const auto center = *move.center();
	const auto target = *move.target();
	if (!origin.inBounds() || !center.inBounds() || !target.inBounds())
		return false;

	// Values are -1, 0, +1: a zero difference means same owner, a zero target means empty.
	return value(board.get(origin)) - value(board.get(center)) == 0 && value(board.get(target)) == 0;
}

std::vector<Square> findSuffocated(const Board& board, const Square target, const Player mover) {
	const Piece enemy{opponent(mover)};

	std::vector<Square> suffocated;
	for (const auto d: kDirections) {
		const auto neighbor = target + d;
		if (!neighbor.inBounds() || board.get(neighbor) != enemy)
			continue;

		if (countLiberties(board, neighbor) == 0) {
			suffocated.push_back(neighbor);
		}
	}
	return suffocated;
}

std::vector<Square> findConverted(const Board& board, const Square target, const Player mover) {
	const Piece own{mover};
	const Piece enemy{opponent(mover)};

	std::vector<Square> converted;
	for (const auto d: kDirections) {
		const auto far = target + Square{2 * d.file, 2 * d.rank};
		if (!far.inBounds())
			continue;

		const auto mid = midpoint(far, target);
		if (board.get(mid) == enemy && board.get(far) == own) {
			converted.push_back(mid);
		}
	}
	return converted;
}

static Board applyPlacement(const Board& board, const Player mover, MoveEffects& outEffects) {
	if (!canPlace(board, mover)) {
		throw HomeSquaresFull{};
	}

	Board next = board;
	for (const auto s: homeSquares(mover)) {
		if (board.isEmpty(s)) {
			next.set(s, Piece{mover});
			outEffects.placed.push_back(s);
		}
	}
	return next;
}

static Board applyJump(const Board& board, const Player mover, const Move& move, MoveEffects& outEffects) {
	const auto origin = *move.origin();
	const auto center = *move.center();
	const auto target = *move.target();
	checkOnBoard(origin, "origin");
	checkOnBoard(center, "center");
	checkOnBoard(target, "target");

	if (!isValidJump(board, move)) {
		throw IllegalJump(std::format("Origin (was {}) and center (was {}) must be the same player's piece, and target (was {}) must be empty",
		                              describe(board.get(origin)), describe(board.get(center)), describe(board.get(target))));
	}

	Board next = board;
	next.set(target, board.get(origin));
	next.set(origin, kEmpty);

	// Suffocation and conversion both read the board as it is right after the jump.
	const Board landed = next;
	outEffects.suffocated = findSuffocated(landed, target, mover);
	for (const auto s: outEffects.suffocated) {
		next.set(s, kEmpty);
	}

	for (const auto s: findConverted(landed, target, mover)) {
		// A suffocated stone is gone and cannot be converted.
		if (std::find(outEffects.suffocated.begin(), outEffects.suffocated.end(), s) != outEffects.suffocated.end())
			continue;

		next.set(s, Piece{mover});
		outEffects.converted.push_back(s);
	}
	return next;
}

Board applyMove(const Board& board, const Player mover, const Move& move, MoveEffects& outEffects) {
	outEffects = MoveEffects{};

	if (move.isPlacement()) {
		return applyPlacement(board, mover, outEffects);
	}
	if (move.isJump()) {
		return applyJump(board, mover, move, outEffects);
	}

	// Only one of origin/target given: nothing changes on the board.
	return board;
}

} // namespace quorum
