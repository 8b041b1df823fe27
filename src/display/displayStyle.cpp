#include "display/displayStyle.hpp"

#include <algorithm>

namespace quorum::display {

std::size_t DisplayStyle::moveWidth() const {
	return std::max<std::size_t>(4u + displayWidth(fromToSeparator) + 1u, displayWidth(placement));
}

DisplayStyle circles() {
	return DisplayStyle{
	        .pieces          = {"●", "○", "·"},
	        .placement       = "++",
	        .fromToSeparator = "-",
	        .separator       = "⎸",
	};
}

DisplayStyle lowercaseAscii() {
	return DisplayStyle{
	        .pieces    = {"x", "o", "."},
	        .separator = "|",
	};
}

DisplayStyle uppercaseAscii() {
	return DisplayStyle{
	        .pieces    = {"X", "O", "."},
	        .separator = "|",
	        .files     = {"A", "B", "C", "D", "E", "F", "G", "H"},
	};
}

DisplayStyle greek() {
	return DisplayStyle{
	        .pieces    = {"●", "○", "·"},
	        .separator = "⎸",
	        .files     = {"α", "β", "γ", "δ", "ε", "ζ", "η", "θ"},
	};
}

std::optional<DisplayStyle> styleByName(const std::string_view name) {
	if (name == "circles")
		return circles();
	if (name == "lowercase_ascii")
		return lowercaseAscii();
	if (name == "uppercase_ascii")
		return uppercaseAscii();
	if (name == "greek")
		return greek();
	return {};
}

std::size_t displayWidth(const std::string_view text) {
	// Count every byte that is not a UTF-8 continuation byte.
	return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](const char c) { return (static_cast<unsigned char>(c) & 0xC0u) != 0x80u; }));
}

} // namespace quorum::display
