/*
  OmixNotificationRouter.h - Turns raw notification bytes into an OmixEvent.
*/
#pragma once

#include "OmixEvents.h"

#include <optional>
#include <stddef.h>
#include <stdint.h>
#include <vector>

/**
 * Returns std::nullopt when the buffer fails framing or checksum checks.
 * A valid packet with an unrecognised (func, cmd), or with a payload shorter
 * than its command's layout, yields UnknownEvent.
 */
std::optional<OmixEvent> routeNotification(const uint8_t* data, size_t length);

inline std::optional<OmixEvent> routeNotification(const std::vector<uint8_t>& data) {
    return routeNotification(data.data(), data.size());
}
