#pragma once

#include "data/board.hpp"
#include "data/coordinate.hpp"
#include "data/piece.hpp"
#include "data/player.hpp"

#include <string_view>
#include <variant>

namespace menagerie {

//! Why a move request was rejected.
enum class IllegalReason {
	SameOrOutOfBounds, //!< Square off the board, or from equals to.
	NoOwnedPiece,      //!< No piece of the moving player on the from square.
	BadGeometry,       //!< The piece cannot reach the target square.
	Blocked,           //!< A sliding move passes over an occupied square.
	FriendlyOccupied   //!< Target square holds a piece of the moving player.
};

//! Accepted move.
struct LegalMove {
	MoveKind kind; //!< Primary or secondary move.
	bool capture;  //!< Target square holds an opposing piece.
};

using MoveCheck = std::variant<LegalMove, IllegalReason>;

//! Full legality check of a move request for the given player.
//! \note Turn order and game end are the caller's concern.
MoveCheck checkMove(const Board& board, Player mover, Coord from, Coord to);

//! Convenience wrapper returning only whether checkMove accepted the move.
bool isLegalMove(const Board& board, Player mover, Coord from, Coord to);

//! True if every square strictly between from and to is empty.
//! \note Assumes from and to lie on a common row, column or diagonal.
bool isPathClear(const Board& board, Coord from, Coord to);

std::string_view toString(IllegalReason reason);

} // namespace menagerie
