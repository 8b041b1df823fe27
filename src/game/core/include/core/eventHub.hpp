#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace quorum {

//! Fans game changes out to subscribed listeners.
//! \note Listeners are called synchronously on the thread that publishes. They must not (un)subscribe from within a callback.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	//! Send the delta to state listeners and the derived signals to signal listeners.
	//! \param wasActive Whether the game accepted moves before this change.
	void publish(const GameDelta& delta, bool wasActive);

	//! Signals implied by a delta.
	static uint64_t signalsFor(const GameDelta& delta, bool wasActive);

private:
	void signal(uint64_t signals);

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace quorum
