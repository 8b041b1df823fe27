#include "core/notation.hpp"

#include <cctype>
#include <format>

namespace quorum {

static constexpr std::string_view kFiles = "abcdefgh";
static constexpr std::string_view kRanks = "12345678";

static std::string fileToString(const int file) {
	if (file < 1 || file > kBoardSize)
		return std::format("<{}>", file);
	return std::string(1u, kFiles[file - 1]);
}

static std::string rankToString(const int rank) {
	if (rank < 1 || rank > kBoardSize)
		return std::format("<{}>", rank);
	return std::string(1u, kRanks[rank - 1]);
}

std::string toString(const Square s) {
	return fileToString(s.file) + rankToString(s.rank);
}

std::optional<Square> squareFromString(const std::string_view text) {
	if (text.size() != 2u)
		return {};

	const auto file = kFiles.find(static_cast<char>(std::tolower(static_cast<unsigned char>(text[0]))));
	const auto rank = kRanks.find(text[1]);
	if (file == std::string_view::npos || rank == std::string_view::npos)
		return {};

	return Square{static_cast<int>(file) + 1, static_cast<int>(rank) + 1};
}

std::string toString(const Move& move) {
	if (move.isPlacement())
		return "+";

	std::string result = move.origin() ? toString(*move.origin()) : "+";
	if (move.target()) {
		result += "-" + toString(*move.target());
	}
	return result;
}

std::optional<Move> moveFromString(std::string_view text) {
	if (text == "+" || text == "++")
		return Move::placement();

	std::string squares{text};
	if (squares.size() == 5u && squares[2] == '-') {
		squares.erase(2u, 1u);
	}
	if (squares.size() != 4u)
		return {};

	const auto origin = squareFromString(std::string_view{squares}.substr(0u, 2u));
	const auto target = squareFromString(std::string_view{squares}.substr(2u, 2u));
	if (!origin || !target)
		return {};

	return Move::jump(*origin, *target);
}

} // namespace quorum
