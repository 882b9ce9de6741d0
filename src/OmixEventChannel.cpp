/*
  OmixEventChannel.cpp - Fan-out of routed events to any number of listeners.
*/
#include "OmixEventChannel.h"

size_t OmixEventChannel::subscribe(Listener listener) {
    const size_t id = _nextId++;
    _listeners.emplace_back(id, std::move(listener));
    return id;
}

void OmixEventChannel::unsubscribe(const size_t id) {
    for (auto it = _listeners.begin(); it != _listeners.end(); ++it) {
        if (it->first == id) {
            _listeners.erase(it);
            return;
        }
    }
}

void OmixEventChannel::publish(const OmixEvent& event) const {
    // Copy so a listener may unsubscribe itself while being called
    const auto listeners = _listeners;

    for (const auto& entry : listeners) {
        if (entry.second) {
            entry.second(event);
        }
    }
}
