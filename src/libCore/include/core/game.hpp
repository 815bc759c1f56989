#pragma once

#include "core/IMoveListener.hpp"
#include "core/moveNotifier.hpp"
#include "core/position.hpp"

#include <cstdint>
#include <string_view>

namespace menagerie {

//! Core game setup.
//! Owns the position and applies the rules; external code requests moves and listens for updates.
class Game {
public:
	//! New game with the starting layout and Tangerine to move.
	Game();

	//! Continue from a given position.
	explicit Game(GamePosition position);

	//! Try to move the piece on one square to another, both given in algebraic notation.
	//! \returns False if the move is rejected. The game is unchanged in that case.
	bool makeMove(std::string_view from, std::string_view to);

	GameState gameState() const;  //!< Current outcome of the game.
	Player currentPlayer() const; //!< Returns the currently active player.
	const Board& board() const;   //!< Board data for rendering.
	unsigned moveCount() const;   //!< Number of accepted moves.

	const GamePosition& position() const;

public:
	//! Get notified of accepted moves whose outcome matches the mask (MoveOutcome bits).
	void subscribeMoves(IMoveListener* listener, std::uint8_t outcomeMask = MO_All);
	void unsubscribeMoves(IMoveListener* listener);

private:
	GamePosition m_position;
	MoveNotifier m_notifier; //!< Reports accepted moves to external components.
};

} // namespace menagerie
