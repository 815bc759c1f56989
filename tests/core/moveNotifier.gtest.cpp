#include "core/moveNotifier.hpp"

#include <gtest/gtest.h>

namespace menagerie::gtest {

static Coord at(const char* text) {
	return *fromNotation(text);
}

static MoveRecord quietMove() {
	return MoveRecord{
	    .moveId   = 1u,
	    .piece    = Piece{PieceType::Emu, Player::Tangerine},
	    .from     = at("e1"),
	    .to       = at("e2"),
	    .captured = std::nullopt,
	    .state    = GameState::Unfinished,
	};
}

static MoveRecord captureMove() {
	auto record     = quietMove();
	record.captured = Piece{PieceType::Wombat, Player::Amethyst};
	return record;
}

static MoveRecord winningMove() {
	auto record     = quietMove();
	record.captured = Piece{PieceType::Cuttlefish, Player::Amethyst};
	record.state    = GameState::TangerineWon;
	return record;
}

class CountingListener : public IMoveListener {
public:
	void onMove(const MoveRecord&) override {
		++calls;
	}
	unsigned calls = 0;
};

//! Leaves the notifier on its first notification.
class OneShotListener : public IMoveListener {
public:
	explicit OneShotListener(MoveNotifier& notifier) : m_notifier(notifier) {}

	void onMove(const MoveRecord&) override {
		++calls;
		m_notifier.unsubscribe(this);
	}
	unsigned calls = 0;

private:
	MoveNotifier& m_notifier;
};

TEST(MoveNotifier, Outcome) {
	EXPECT_EQ(outcomeOf(quietMove()), MO_Quiet);
	EXPECT_EQ(outcomeOf(captureMove()), MO_Capture);
	EXPECT_EQ(outcomeOf(winningMove()), MO_Win);
}

TEST(MoveNotifier, OutcomeMask) {
	MoveNotifier notifier;
	CountingListener all;
	CountingListener captures;
	CountingListener ends;
	notifier.subscribe(&all);
	notifier.subscribe(&captures, MO_Capture);
	notifier.subscribe(&ends, MO_Win);

	notifier.notify(quietMove());
	notifier.notify(captureMove());
	notifier.notify(winningMove());

	EXPECT_EQ(all.calls, 3u);
	EXPECT_EQ(captures.calls, 1u);
	EXPECT_EQ(ends.calls, 1u);
}

TEST(MoveNotifier, Unsubscribe) {
	MoveNotifier notifier;
	CountingListener first;
	CountingListener second;
	notifier.subscribe(&first);
	notifier.subscribe(&second);

	notifier.notify(quietMove());
	notifier.unsubscribe(&first);
	notifier.notify(quietMove());

	EXPECT_EQ(first.calls, 1u);
	EXPECT_EQ(second.calls, 2u);

	// Unknown listeners are ignored
	notifier.unsubscribe(&first);
	notifier.notify(quietMove());
	EXPECT_EQ(second.calls, 3u);
}

TEST(MoveNotifier, UnsubscribeFromCallback) {
	MoveNotifier notifier;
	OneShotListener oneShot(notifier);
	CountingListener other;
	notifier.subscribe(&oneShot);
	notifier.subscribe(&other);

	// Must return instead of blocking on the listener mutex
	notifier.notify(quietMove());
	EXPECT_EQ(oneShot.calls, 1u);
	EXPECT_EQ(other.calls, 1u);

	notifier.notify(captureMove());
	EXPECT_EQ(oneShot.calls, 1u);
	EXPECT_EQ(other.calls, 2u);
}

} // namespace menagerie::gtest
