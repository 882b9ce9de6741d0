/*
  OmixPeerAddresses.h - Platform addresses of Omix peers seen while scanning.

  Only advertisements that identify as an Omix are kept, and the oldest
  entry is dropped once capacity is reached.
*/
#pragma once

#include "OmixBlePlatform.h"
#include "OmixConfig.h"
#include "OmixDeviceMatch.h"

#include <stddef.h>
#include <string>
#include <utility>
#include <vector>

template <typename Address>
class OmixPeerAddresses {
    public:
        explicit OmixPeerAddresses(const size_t capacity = OMIX_MAX_PEER_ADDRESSES) : _capacity(capacity) {}

        // Returns false when the advertisement is not an Omix
        bool remember(const OmixAdvertisement& advertisement, const Address& address) {
            if (!isOmixAdvertisement(advertisement)) {
                return false;
            }

            put(advertisement.id, address);
            return true;
        }

        // Peers already connected to this host were matched by service
        void put(const std::string& id, const Address& address) {
            for (auto& entry : _entries) {
                if (entry.first == id) {
                    entry.second = address;
                    return;
                }
            }

            if (_capacity == 0) {
                return;
            }

            if (_entries.size() >= _capacity) {
                _entries.erase(_entries.begin());
            }

            _entries.emplace_back(id, address);
        }

        [[nodiscard]] bool find(const std::string& id, Address& address) const {
            for (const auto& entry : _entries) {
                if (entry.first == id) {
                    address = entry.second;
                    return true;
                }
            }
            return false;
        }

        void clear() {
            _entries.clear();
        }

        [[nodiscard]] size_t size() const {
            return _entries.size();
        }

    private:
        size_t _capacity;
        std::vector<std::pair<std::string, Address>> _entries;
};
