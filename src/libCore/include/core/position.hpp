#pragma once

#include "data/board.hpp"
#include "data/gameState.hpp"
#include "data/player.hpp"

#include <optional>

namespace menagerie {

//! The current game position.
struct GamePosition {
	Board board{Board::initial()};             //!< Current board.
	Player currentPlayer{Player::Tangerine};   //!< Player to move.
	GameState state{GameState::Unfinished};    //!< Outcome so far.
	unsigned moveId{0};                        //!< Number of moves played.

public:
	//! Current player moves a piece and the win condition is evaluated.
	//! \note Assumes the move is legal.
	//! \returns The captured piece, if any.
	std::optional<Piece> movePiece(Coord from, Coord to);

	bool operator==(const GamePosition&) const = default;
};

//! Capturing the opponent's Cuttlefish wins the game.
bool isWinningCapture(const Piece& captured, Player mover);

} // namespace menagerie
