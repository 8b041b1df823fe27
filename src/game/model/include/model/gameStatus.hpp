#pragma once

namespace quorum {

enum class GameStatus {
	Active, //!< Moves are accepted.
	Done    //!< A player controls all center squares.
};

} // namespace quorum
