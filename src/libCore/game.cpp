#include "core/game.hpp"
#include "core/moveChecker.hpp"

#include "logging.hpp"

#include <format>
#include <utility>

namespace menagerie {

static constexpr char LOG_REJ_NOTATION[] = "[Game] Rejected move '{}' -> '{}': invalid notation.";
static constexpr char LOG_REJ_FINISHED[] = "[Game] Rejected move {} -> {}: game already finished ({}).";
static constexpr char LOG_REJ_ILLEGAL[]  = "[Game] Rejected move {} -> {} by {}: {}.";
static constexpr char LOG_MOVE[]         = "[Game] Move {}: {} {} {} -> {}{}.";
static constexpr char LOG_WIN[]          = "[Game] {} captured the Cuttlefish. Game over ({}).";

Game::Game() = default;

Game::Game(GamePosition position) : m_position{std::move(position)} {
}

bool Game::makeMove(const std::string_view fromText, const std::string_view toText) {
	const auto from = fromNotation(fromText);
	const auto to   = fromNotation(toText);
	if (!from || !to) {
		core::Logger().Log(Logging::LogLevel::Info, std::format(LOG_REJ_NOTATION, fromText, toText));
		return false;
	}

	if (m_position.state != GameState::Unfinished) {
		core::Logger().Log(Logging::LogLevel::Info, std::format(LOG_REJ_FINISHED, fromText, toText, toString(m_position.state)));
		return false;
	}

	const auto player = m_position.currentPlayer;
	const auto check  = checkMove(m_position.board, player, *from, *to);
	if (const auto* reason = std::get_if<IllegalReason>(&check)) {
		core::Logger().Log(Logging::LogLevel::Info, std::format(LOG_REJ_ILLEGAL, fromText, toText, toString(player), toString(*reason)));
		return false;
	}

	const auto moved    = *m_position.board.get(*from);
	const auto captured = m_position.movePiece(*from, *to);

	core::Logger().Log(Logging::LogLevel::Info, std::format(LOG_MOVE, m_position.moveId, toString(player), symbol(moved.type), fromText, toText,
	                                                        captured ? std::format(" capturing {}", toString(captured->type)) : ""));

	if (m_position.state != GameState::Unfinished) {
		core::Logger().Log(Logging::LogLevel::Info, std::format(LOG_WIN, toString(player), toString(m_position.state)));
	}

	m_notifier.notify(MoveRecord{
	        .moveId   = m_position.moveId,
	        .piece    = moved,
	        .from     = *from,
	        .to       = *to,
	        .captured = captured,
	        .state    = m_position.state,
	});
	return true;
}

GameState Game::gameState() const {
	return m_position.state;
}

Player Game::currentPlayer() const {
	return m_position.currentPlayer;
}

const Board& Game::board() const {
	return m_position.board;
}

unsigned Game::moveCount() const {
	return m_position.moveId;
}

const GamePosition& Game::position() const {
	return m_position;
}

void Game::subscribeMoves(IMoveListener* listener, std::uint8_t outcomeMask) {
	m_notifier.subscribe(listener, outcomeMask);
}

void Game::unsubscribeMoves(IMoveListener* listener) {
	m_notifier.unsubscribe(listener);
}

} // namespace menagerie
