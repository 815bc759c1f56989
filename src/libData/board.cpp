#include "data/board.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace menagerie {

//! Home squares. Tangerine starts on rank 1, Amethyst mirrors it on rank 7 so every piece faces its counterpart on the same file.
//!   b1 / b7: Chinchilla
//!   c1 / c7: Wombat
//!   d1 / d7: Cuttlefish
//!   e1 / e7: Emu
struct HomeSquare {
	Id col;
	PieceType type;
};
static constexpr std::array<HomeSquare, 4> HOME_ROW{{
        {1u, PieceType::Chinchilla},
        {2u, PieceType::Wombat},
        {3u, PieceType::Cuttlefish},
        {4u, PieceType::Emu},
}};
static constexpr Id TANGERINE_HOME = 0u;
static constexpr Id AMETHYST_HOME  = BOARD_SIZE - 1u;

Board Board::initial() {
	Board board;
	for (const auto& [col, type]: HOME_ROW) {
		board.place({TANGERINE_HOME, col}, Piece{type, Player::Tangerine});
		board.place({AMETHYST_HOME, col}, Piece{type, Player::Amethyst});
	}
	return board;
}

std::size_t Board::index(const Coord c) {
	assert(isOnBoard(c)); // Caller should verify valid coordinate.
	return c.row * BOARD_SIZE + c.col;
}

bool Board::place(const Coord c, const Piece piece) {
	auto& square = m_squares[index(c)];
	if (square) {
		return false;
	}
	square = piece;
	return true;
}

Board::Square Board::remove(const Coord c) {
	Square removed{};
	std::swap(removed, m_squares[index(c)]);
	return removed;
}

Board::Square Board::move(const Coord from, const Coord to) {
	assert(from != to);
	assert(!isEmpty(from)); // Use place for new pieces.

	auto captured        = remove(to);
	m_squares[index(to)] = remove(from);
	return captured;
}

Board::Square Board::get(const Coord c) const {
	return m_squares[index(c)];
}

bool Board::isEmpty(const Coord c) const {
	return !m_squares[index(c)].has_value();
}

bool Board::isOccupiedBy(const Coord c, const Player player) const {
	const auto& square = m_squares[index(c)];
	return square && square->owner == player;
}

std::size_t Board::countPieces(const Player player) const {
	return static_cast<std::size_t>(
	        std::count_if(m_squares.begin(), m_squares.end(), [&](const Square& square) { return square && square->owner == player; }));
}

} // namespace menagerie
