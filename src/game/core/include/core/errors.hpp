#pragma once

#include <stdexcept>

namespace quorum {

//! Base of all move rejections. The position the move was applied to stays unchanged.
class IllegalMove : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Placement while every home square of the mover is occupied.
class HomeSquaresFull : public IllegalMove {
public:
	HomeSquaresFull() : IllegalMove("home squares full") {
	}
};

//! Jump whose origin and center do not hold the same player's piece, or whose target is not empty.
class IllegalJump : public IllegalMove {
public:
	using IllegalMove::IllegalMove;
};

} // namespace quorum
