#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace menagerie {

using Id = unsigned; //!< Row or column index on the board.

inline constexpr Id BOARD_SIZE = 7u; //!< Number of rows and columns.

//! Square on the board.
//! \note Origin is the bottom left square (a1). Column: a->0, b->1, etc. Row: 1->0, 2->1, etc.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

//! Signed distance between two squares.
struct Delta {
	int rows, cols;
};

//! True if the coordinate lies on the 7x7 board.
inline constexpr bool isOnBoard(Coord c) {
	return c.row < BOARD_SIZE && c.col < BOARD_SIZE;
}

//! Signed offset required to go from one square to another.
inline constexpr Delta deltaTo(Coord from, Coord to) {
	return {static_cast<int>(to.row) - static_cast<int>(from.row), static_cast<int>(to.col) - static_cast<int>(from.col)};
}

//! Convert algebraic notation ("a1".."g7") to a board coordinate.
//! \returns Empty optional if the text is not exactly one letter a-g followed by one digit 1-7.
std::optional<Coord> fromNotation(std::string_view text);

//! Convert a board coordinate to algebraic notation.
std::string toNotation(Coord c);

} // namespace menagerie
