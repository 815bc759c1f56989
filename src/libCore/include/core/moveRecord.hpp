#pragma once

#include "data/coordinate.hpp"
#include "data/gameState.hpp"
#include "data/piece.hpp"

#include <cstdint>
#include <optional>

namespace menagerie {

//! What an accepted move did to the game. Listeners filter on these bits.
enum MoveOutcome : std::uint8_t {
	MO_Quiet   = 1 << 0, //!< Piece moved to an empty square.
	MO_Capture = 1 << 1, //!< Opposing piece taken, game continues.
	MO_Win     = 1 << 2, //!< Opposing Cuttlefish taken, game over.
	MO_All     = MO_Quiet | MO_Capture | MO_Win,
};

//! One accepted move, as reported to listeners.
struct MoveRecord {
	unsigned moveId;               //!< Move number, starting at 1.
	Piece piece;                   //!< Piece that moved. Its owner made the move.
	Coord from;
	Coord to;
	std::optional<Piece> captured; //!< Piece removed from the target square.
	GameState state;               //!< Game state after the move.
};

inline constexpr MoveOutcome outcomeOf(const MoveRecord& record) {
	if (record.state != GameState::Unfinished) {
		return MO_Win;
	}
	return record.captured ? MO_Capture : MO_Quiet;
}

} // namespace menagerie
