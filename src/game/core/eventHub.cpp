#include "core/eventHub.hpp"

#include <algorithm>
#include <initializer_list>

namespace quorum {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	std::erase_if(m_signalListeners, [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	std::erase(m_stateListeners, listener);
}

uint64_t EventHub::signalsFor(const GameDelta& delta, const bool wasActive) {
	uint64_t signals = GS_PlayerChange;

	const bool boardChanged = delta.action == GameAction::Jump || delta.action == GameAction::Undo || !delta.placed.empty();
	if (boardChanged) {
		signals |= GS_BoardChange;
	}
	if (wasActive != delta.gameActive) {
		signals |= GS_StateChange;
	}
	return signals;
}

void EventHub::publish(const GameDelta& delta, const bool wasActive) {
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		for (auto* listener: m_stateListeners) {
			listener->onGameDelta(delta);
		}
	}
	signal(signalsFor(delta, wasActive));
}

void EventHub::signal(const uint64_t signals) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	// One callback per set bit keeps listeners on the single-signal interface.
	for (const auto bit: {GS_BoardChange, GS_PlayerChange, GS_StateChange}) {
		if (!(signals & bit))
			continue;

		for (const auto& [listener, signalMask]: m_signalListeners) {
			if (signalMask & bit) {
				listener->onGameEvent(bit);
			}
		}
	}
}

} // namespace quorum
