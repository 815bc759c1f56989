#pragma once

#include "data/coordinate.hpp"
#include "data/piece.hpp"
#include "data/player.hpp"

#include <array>
#include <optional>

namespace menagerie {

//! The 7x7 game board. Each square holds at most one piece.
//! \note The board does not check game rules. Callers validate moves first.
//! \note Every coordinate passed in must satisfy isOnBoard. Only debug builds assert this; the game checks via checkMove.
class Board {
public:
	using Square = std::optional<Piece>;

	Board() = default;

	//! Board with both players' pieces on their home rows.
	static Board initial();

	bool place(Coord c, Piece piece);   //!< Put a piece on an empty square. False if occupied. Caller should verify the coordinate.
	Square remove(Coord c);             //!< Take the piece off a square. Returns the removed piece, if any.
	Square move(Coord from, Coord to);  //!< Move the piece at from to to. Returns the piece it replaced at to, if any.

	Square get(Coord c) const;                          //!< Get the piece on a square. Caller should verify the coordinate.
	bool isEmpty(Coord c) const;                        //!< True if no piece is on the square.
	bool isOccupiedBy(Coord c, Player player) const;    //!< True if a piece of the player is on the square.
	std::size_t countPieces(Player player) const;       //!< Number of pieces the player has left.

	bool operator==(const Board&) const = default;

private:
	static std::size_t index(Coord c);

private:
	std::array<Square, BOARD_SIZE * BOARD_SIZE> m_squares{}; //!< Row major, starting at a1.
};

} // namespace menagerie
