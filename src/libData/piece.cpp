#include "data/piece.hpp"

#include <cstdlib>

namespace menagerie {

//! Number of squares covered along the axis. Zero if the delta is not on that axis.
static unsigned stepsAlong(const Axis axis, const Delta delta) {
	const auto rows = std::abs(delta.rows);
	const auto cols = std::abs(delta.cols);

	switch (axis) {
	case Axis::Diagonal:
		return rows == cols ? static_cast<unsigned>(rows) : 0u;
	case Axis::Orthogonal:
		if (rows == 0) {
			return static_cast<unsigned>(cols);
		}
		return cols == 0 ? static_cast<unsigned>(rows) : 0u;
	}
	return 0u;
}

MoveKind classifyMove(const MovementProfile& profile, const Delta delta) {
	const auto primarySteps = stepsAlong(profile.axis, delta);
	if (primarySteps != 0u) {
		const bool inRange = profile.mode == MoveMode::Sliding ? primarySteps <= profile.distance : primarySteps == profile.distance;
		if (inRange) {
			return MoveKind::Primary;
		}
	}

	if (stepsAlong(perpendicular(profile.axis), delta) == 1u) {
		return MoveKind::Secondary;
	}

	return MoveKind::Illegal;
}

char symbol(const PieceType type) {
	switch (type) {
	case PieceType::Chinchilla:
		return 'C';
	case PieceType::Wombat:
		return 'W';
	case PieceType::Emu:
		return 'E';
	case PieceType::Cuttlefish:
		return 'U';
	}
	return '?';
}

std::string_view toString(const PieceType type) {
	switch (type) {
	case PieceType::Chinchilla:
		return "Chinchilla";
	case PieceType::Wombat:
		return "Wombat";
	case PieceType::Emu:
		return "Emu";
	case PieceType::Cuttlefish:
		return "Cuttlefish";
	}
	return "Unknown";
}

} // namespace menagerie
