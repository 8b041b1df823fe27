#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace quorum::display {

//! Glyphs and labels used to print positions and move lists. All strings are UTF-8.
struct DisplayStyle {
	std::array<std::string, 3> pieces;   //!< Black, White and empty square glyphs.
	std::string placement{"+"};          //!< Token printed for a placement move.
	std::string fromToSeparator{};       //!< Printed between origin and target of a jump.
	std::string separator;               //!< Column separator between board and side information.
	std::array<std::string, 8> files{"a", "b", "c", "d", "e", "f", "g", "h"};
	std::array<std::string, 8> ranks{"1", "2", "3", "4", "5", "6", "7", "8"};

	//! Column width of one move in a move list.
	std::size_t moveWidth() const;
};

DisplayStyle circles();        //!< "●○·" pieces, "++" placement. Default style.
DisplayStyle lowercaseAscii(); //!< "xo." pieces.
DisplayStyle uppercaseAscii(); //!< "XO." pieces, upper case files.
DisplayStyle greek();          //!< "●○·" pieces, greek files.

//! Built-in style by name ("circles", "lowercase_ascii", "uppercase_ascii", "greek").
std::optional<DisplayStyle> styleByName(std::string_view name);

//! Number of code points in a UTF-8 string.
std::size_t displayWidth(std::string_view text);

} // namespace quorum::display
