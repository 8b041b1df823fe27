#include "model/move.hpp"

namespace quorum {

Move::Move(const Square origin, const Square target) : Move(std::optional<Square>{origin}, std::optional<Square>{target}) {
}

Move::Move(const std::optional<Square> origin, const std::optional<Square> target) : m_origin{origin}, m_target{target} {
	if (m_origin && m_target) {
		m_center = midpoint(*m_origin, *m_target);
	}
}

Move Move::placement() {
	return Move{};
}

Move Move::jump(const Square origin, const Square target) {
	return Move{origin, target};
}

const std::optional<Square>& Move::origin() const {
	return m_origin;
}

const std::optional<Square>& Move::target() const {
	return m_target;
}

const std::optional<Square>& Move::center() const {
	return m_center;
}

bool Move::isPlacement() const {
	return !m_origin && !m_target;
}

bool Move::isJump() const {
	return m_origin && m_target;
}

} // namespace quorum
