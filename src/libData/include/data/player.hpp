#pragma once

#include <string_view>

namespace menagerie {

enum class Player { Tangerine = 1, Amethyst = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::Amethyst ? Player::Tangerine : Player::Amethyst;
}

//! Player name used in log messages.
inline constexpr std::string_view toString(Player player) {
	return player == Player::Amethyst ? "Amethyst" : "Tangerine";
}

} // namespace menagerie
