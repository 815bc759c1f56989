#pragma once

#include "data/player.hpp"

#include <string_view>

namespace menagerie {

//! Outcome of the game. Once won it never changes again.
enum class GameState { Unfinished, TangerineWon, AmethystWon };

//! State a player reaches by winning.
inline constexpr GameState winState(Player player) {
	return player == Player::Amethyst ? GameState::AmethystWon : GameState::TangerineWon;
}

inline constexpr std::string_view toString(GameState state) {
	switch (state) {
	case GameState::Unfinished:
		return "UNFINISHED";
	case GameState::TangerineWon:
		return "TANGERINE_WON";
	case GameState::AmethystWon:
		return "AMETHYST_WON";
	}
	return "UNKNOWN";
}

} // namespace menagerie
