#pragma once

#include "model/move.hpp"
#include "model/square.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace quorum {

//! Square in algebraic notation ("a1" .. "h8"). Off-board components are written as "<n>".
std::string toString(Square s);

//! Parse algebraic square notation. File letters are case-insensitive.
std::optional<Square> squareFromString(std::string_view text);

//! Move as "+" for a placement or "b1-d3" for a jump.
std::string toString(const Move& move);

//! Parse "+", "++", "b1d3" or "b1-d3".
std::optional<Move> moveFromString(std::string_view text);

} // namespace quorum
