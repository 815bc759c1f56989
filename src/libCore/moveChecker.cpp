#include "core/moveChecker.hpp"

#include <cassert>

namespace menagerie {

static constexpr int unitStep(const int value) {
	return (value > 0) - (value < 0);
}

bool isPathClear(const Board& board, const Coord from, const Coord to) {
	const auto delta  = deltaTo(from, to);
	const int rowStep = unitStep(delta.rows);
	const int colStep = unitStep(delta.cols);
	assert(delta.rows == 0 || delta.cols == 0 || delta.rows * colStep == delta.cols * rowStep);

	int row = static_cast<int>(from.row) + rowStep;
	int col = static_cast<int>(from.col) + colStep;
	while (row != static_cast<int>(to.row) || col != static_cast<int>(to.col)) {
		if (!board.isEmpty({static_cast<Id>(row), static_cast<Id>(col)})) {
			return false;
		}
		row += rowStep;
		col += colStep;
	}
	return true;
}

MoveCheck checkMove(const Board& board, const Player mover, const Coord from, const Coord to) {
	if (!isOnBoard(from) || !isOnBoard(to) || from == to) {
		return IllegalReason::SameOrOutOfBounds;
	}

	const auto piece = board.get(from);
	if (!piece || piece->owner != mover) {
		return IllegalReason::NoOwnedPiece;
	}

	const auto profile = movementProfile(piece->type);
	const auto kind    = classifyMove(profile, deltaTo(from, to));
	if (kind == MoveKind::Illegal) {
		return IllegalReason::BadGeometry;
	}

	// Jumping pieces and single steps have no squares in between worth checking.
	if (kind == MoveKind::Primary && profile.mode == MoveMode::Sliding && !isPathClear(board, from, to)) {
		return IllegalReason::Blocked;
	}

	if (board.isOccupiedBy(to, mover)) {
		return IllegalReason::FriendlyOccupied;
	}

	return LegalMove{.kind = kind, .capture = board.isOccupiedBy(to, opponent(mover))};
}

bool isLegalMove(const Board& board, const Player mover, const Coord from, const Coord to) {
	return std::holds_alternative<LegalMove>(checkMove(board, mover, from, to));
}

std::string_view toString(const IllegalReason reason) {
	switch (reason) {
	case IllegalReason::SameOrOutOfBounds:
		return "same or off-board square";
	case IllegalReason::NoOwnedPiece:
		return "no own piece on start square";
	case IllegalReason::BadGeometry:
		return "piece cannot reach target";
	case IllegalReason::Blocked:
		return "path blocked";
	case IllegalReason::FriendlyOccupied:
		return "target holds own piece";
	}
	return "unknown";
}

} // namespace menagerie
