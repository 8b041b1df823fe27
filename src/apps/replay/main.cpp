#include "Logging.hpp"

#include "core/game.hpp"
#include "core/notation.hpp"
#include "display/printer.hpp"

#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace quorum;

//! Demonstration game. Black completes the quorum on the last move.
static const std::vector<Move> kDemoGame{
        Move{B1, D3}, Move{G8, E6}, Move{C1, E5}, Move{E8, E4}, Move{A1, E3}, Move{F7, D5}, Move{D1, F5}, Move{H8, F6},
        Move{},       Move{F8, F4}, Move{C2, G4}, Move{H7, H3}, Move{A2, C4}, Move{},       Move{B2, D6}, Move{H5, F3},
        Move{A1, C5}, Move{H6, D4}, Move{B1, B5}, Move{G6, C6}, Move{},       Move{G7, E5},
};

static void printUsage() {
	std::cout << "Usage: quorum_replay [--style circles|lowercase_ascii|uppercase_ascii|greek] [move...]\n"
	             "Moves use '+' for a placement and 'b1-d3' for a jump. Without moves the demonstration game is replayed.\n";
}

int main(int argc, char** argv) {
	auto logger = replay::Logger();

	auto style = display::circles();
	std::vector<Move> moves;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg{argv[i]};
		if (arg == "--help" || arg == "-h") {
			printUsage();
			return 0;
		}

		if (arg == "--style") {
			if (i + 1 >= argc) {
				printUsage();
				return 1;
			}
			const auto chosen = display::styleByName(argv[++i]);
			if (!chosen) {
				logger.Log(Logging::LogLevel::Error, std::format("[Replay] Unknown style '{}'.", argv[i]));
				return 1;
			}
			style = *chosen;
			continue;
		}

		const auto move = moveFromString(arg);
		if (!move) {
			logger.Log(Logging::LogLevel::Error, std::format("[Replay] Could not read move '{}'.", arg));
			return 1;
		}
		moves.push_back(*move);
	}

	if (moves.empty()) {
		moves = kDemoGame;
	}

	Game game;
	for (const auto& move: moves) {
		if (!game.play(move)) {
			logger.Log(Logging::LogLevel::Error, std::format("[Replay] Stopped at ply {}: {} is not playable.", game.position().ply(), toString(move)));
			return 1;
		}
	}

	std::cout << display::renderGame(game, style) << "\n";

	logger.Log(Logging::LogLevel::Info, std::format("[Replay] Replayed {} moves. Winner: {}.", game.moves().size(), toString(game.winner())));
	return 0;
}
