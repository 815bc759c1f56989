#include "data/board.hpp"

#include <gtest/gtest.h>

namespace menagerie::gtest {

TEST(Board, InitialLayout) {
	const auto board = Board::initial();

	EXPECT_EQ(board.get(*fromNotation("b1")), (Piece{PieceType::Chinchilla, Player::Tangerine}));
	EXPECT_EQ(board.get(*fromNotation("c1")), (Piece{PieceType::Wombat, Player::Tangerine}));
	EXPECT_EQ(board.get(*fromNotation("d1")), (Piece{PieceType::Cuttlefish, Player::Tangerine}));
	EXPECT_EQ(board.get(*fromNotation("e1")), (Piece{PieceType::Emu, Player::Tangerine}));

	EXPECT_EQ(board.get(*fromNotation("b7")), (Piece{PieceType::Chinchilla, Player::Amethyst}));
	EXPECT_EQ(board.get(*fromNotation("c7")), (Piece{PieceType::Wombat, Player::Amethyst}));
	EXPECT_EQ(board.get(*fromNotation("d7")), (Piece{PieceType::Cuttlefish, Player::Amethyst}));
	EXPECT_EQ(board.get(*fromNotation("e7")), (Piece{PieceType::Emu, Player::Amethyst}));

	EXPECT_EQ(board.countPieces(Player::Tangerine), 4u);
	EXPECT_EQ(board.countPieces(Player::Amethyst), 4u);

	// Everything between the home rows is empty
	for (Id row = 1u; row != BOARD_SIZE - 1u; ++row) {
		for (Id col = 0u; col != BOARD_SIZE; ++col) {
			EXPECT_TRUE(board.isEmpty({row, col}));
		}
	}
	EXPECT_TRUE(board.isEmpty(*fromNotation("a1")));
	EXPECT_TRUE(board.isEmpty(*fromNotation("g7")));
}

TEST(Board, PlaceAndRemove) {
	Board board;
	const Coord c{3u, 3u};
	const Piece emu{PieceType::Emu, Player::Amethyst};

	EXPECT_TRUE(board.isEmpty(c));
	EXPECT_TRUE(board.place(c, emu));
	EXPECT_FALSE(board.place(c, Piece{PieceType::Wombat, Player::Tangerine})); // Occupied
	EXPECT_EQ(board.get(c), emu);

	EXPECT_TRUE(board.isOccupiedBy(c, Player::Amethyst));
	EXPECT_FALSE(board.isOccupiedBy(c, Player::Tangerine));

	EXPECT_EQ(board.remove(c), emu);
	EXPECT_TRUE(board.isEmpty(c));
	EXPECT_FALSE(board.remove(c));
	EXPECT_FALSE(board.isOccupiedBy(c, Player::Amethyst));
}

TEST(Board, MoveCaptures) {
	Board board;
	const Piece wombat{PieceType::Wombat, Player::Tangerine};
	const Piece chinchilla{PieceType::Chinchilla, Player::Amethyst};
	board.place({0u, 2u}, wombat);
	board.place({4u, 2u}, chinchilla);

	// Onto an empty square
	EXPECT_FALSE(board.move({0u, 2u}, {0u, 6u}));
	EXPECT_TRUE(board.isEmpty({0u, 2u}));
	EXPECT_EQ(board.get({0u, 6u}), wombat);

	// Onto an occupied square replaces the occupant
	EXPECT_EQ(board.move({0u, 6u}, {4u, 2u}), chinchilla);
	EXPECT_EQ(board.get({4u, 2u}), wombat);
	EXPECT_EQ(board.countPieces(Player::Amethyst), 0u);
	EXPECT_EQ(board.countPieces(Player::Tangerine), 1u);
}

TEST(Board, Equality) {
	auto board = Board::initial();
	EXPECT_EQ(board, Board::initial());

	board.move(*fromNotation("c1"), *fromNotation("c5"));
	EXPECT_NE(board, Board::initial());
}

} // namespace menagerie::gtest
