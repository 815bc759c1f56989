#pragma once

#include "core/IMoveListener.hpp"
#include "core/moveRecord.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace menagerie {

//! Reports accepted moves to listeners that asked for their outcome.
//! \note Listeners run on the caller thread and may unsubscribe from inside onMove.
//!       A listener removed during a notification can still receive that notification.
class MoveNotifier {
	struct ListenerEntry {
		IMoveListener* listener; //!< Pointer to the listener.
		std::uint8_t outcomeMask; //!< MoveOutcome bits the listener cares about.
	};

public:
	void subscribe(IMoveListener* listener, std::uint8_t outcomeMask = MO_All);
	void unsubscribe(IMoveListener* listener);

	void notify(const MoveRecord& record); //!< Pass the move to every interested listener.

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
};

} // namespace menagerie
