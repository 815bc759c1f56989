#include "data/coordinate.hpp"

#include <cassert>

namespace menagerie {

std::optional<Coord> fromNotation(const std::string_view text) {
	if (text.size() != 2u) {
		return std::nullopt;
	}

	const char file = text[0u];
	const char rank = text[1u];
	if (file < 'a' || file >= static_cast<char>('a' + BOARD_SIZE)) {
		return std::nullopt;
	}
	if (rank < '1' || rank >= static_cast<char>('1' + BOARD_SIZE)) {
		return std::nullopt;
	}

	return Coord{static_cast<Id>(rank - '1'), static_cast<Id>(file - 'a')};
}

std::string toNotation(const Coord c) {
	assert(isOnBoard(c));
	return {static_cast<char>('a' + c.col), static_cast<char>('1' + c.row)};
}

} // namespace menagerie
