#pragma once

#include "data/coordinate.hpp"
#include "data/player.hpp"

#include <string_view>

namespace menagerie {

enum class PieceType { Chinchilla, Wombat, Emu, Cuttlefish };

enum class Axis {
	Orthogonal, //!< Along a row or column.
	Diagonal    //!< Equal number of rows and columns.
};

enum class MoveMode {
	Sliding, //!< Any distance up to the maximum, blocked by pieces in between.
	Jumping  //!< Exactly the given distance, pieces in between are ignored.
};

//! Primary movement of a piece type.
//! Every piece can also step one square on the axis perpendicular to its primary axis.
struct MovementProfile {
	Axis axis;
	unsigned distance;
	MoveMode mode;
};

//! How a piece reaches a target square.
enum class MoveKind {
	Primary,   //!< Move along the primary axis.
	Secondary, //!< Single step on the perpendicular axis.
	Illegal    //!< Piece cannot reach the square.
};

//! A piece on the board. Identity never changes after creation.
struct Piece {
	PieceType type;
	Player owner;

	bool operator==(const Piece&) const = default;
};

//! Returns the fixed primary movement of a piece type.
inline constexpr MovementProfile movementProfile(PieceType type) {
	switch (type) {
	case PieceType::Chinchilla:
		return {Axis::Diagonal, 1u, MoveMode::Sliding};
	case PieceType::Wombat:
		return {Axis::Orthogonal, 4u, MoveMode::Jumping};
	case PieceType::Emu:
		return {Axis::Orthogonal, 3u, MoveMode::Sliding};
	case PieceType::Cuttlefish:
		return {Axis::Diagonal, 2u, MoveMode::Jumping};
	}
	return {Axis::Orthogonal, 0u, MoveMode::Sliding};
}

//! Axis perpendicular to the given one.
inline constexpr Axis perpendicular(Axis axis) {
	return axis == Axis::Orthogonal ? Axis::Diagonal : Axis::Orthogonal;
}

//! Classify a requested displacement by geometry only. Blocking pieces are not considered.
MoveKind classifyMove(const MovementProfile& profile, Delta delta);

//! Single character symbol of a piece type (C, W, E, U).
char symbol(PieceType type);

//! Piece type name used in log messages.
std::string_view toString(PieceType type);

} // namespace menagerie
