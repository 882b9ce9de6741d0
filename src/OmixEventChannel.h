/*
  OmixEventChannel.h - Fan-out of routed events to any number of listeners.
*/
#pragma once

#include "OmixEvents.h"

#include <functional>
#include <stddef.h>
#include <utility>
#include <vector>

class OmixEventChannel {
    public:
        using Listener = std::function<void(const OmixEvent&)>;

        size_t subscribe(Listener listener);
        void unsubscribe(size_t id);
        void publish(const OmixEvent& event) const;

        [[nodiscard]] size_t listenerCount() const {
            return _listeners.size();
        }

    private:
        std::vector<std::pair<size_t, Listener>> _listeners;
        size_t _nextId = 1;
};
