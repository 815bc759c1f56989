#include "core/moveNotifier.hpp"

#include <algorithm>

namespace menagerie {

void MoveNotifier::subscribe(IMoveListener* listener, std::uint8_t outcomeMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener, outcomeMask});
}

void MoveNotifier::unsubscribe(IMoveListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void MoveNotifier::notify(const MoveRecord& record) {
	const auto outcome = outcomeOf(record);

	// Collect under the lock, call without it. Listeners may unsubscribe from their callback.
	std::vector<IMoveListener*> interested;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		for (const auto& [listener, outcomeMask]: m_listeners) {
			if (outcomeMask & outcome) {
				interested.push_back(listener);
			}
		}
	}

	for (auto* listener: interested) {
		listener->onMove(record);
	}
}

} // namespace menagerie
