#include "core/position.hpp"

#include <cassert>

namespace menagerie {

bool isWinningCapture(const Piece& captured, const Player mover) {
	return captured.type == PieceType::Cuttlefish && captured.owner == opponent(mover);
}

std::optional<Piece> GamePosition::movePiece(const Coord from, const Coord to) {
	assert(state == GameState::Unfinished);

	const auto captured = board.move(from, to);
	++moveId;

	if (captured && isWinningCapture(*captured, currentPlayer)) {
		state = winState(currentPlayer);
		return captured;
	}

	currentPlayer = opponent(currentPlayer);
	return captured;
}

} // namespace menagerie
