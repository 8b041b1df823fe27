#pragma once

#include "model/square.hpp"

#include <optional>

namespace quorum {

//! A placement (no squares) or a jump (origin and target).
//! \note The jump geometry is not validated here. The midpoint is only meaningful when origin and target are two steps apart.
class Move {
public:
	Move() = default; //!< Placement.
	Move(Square origin, Square target);
	Move(std::optional<Square> origin, std::optional<Square> target);

	static Move placement();
	static Move jump(Square origin, Square target);

	const std::optional<Square>& origin() const;
	const std::optional<Square>& target() const;
	const std::optional<Square>& center() const; //!< Set only when both origin and target are set.

	bool isPlacement() const; //!< Neither origin nor target.
	bool isJump() const;      //!< Origin and target.

	bool operator==(const Move&) const = default;

private:
	std::optional<Square> m_origin{};
	std::optional<Square> m_target{};
	std::optional<Square> m_center{};
};

} // namespace quorum
