/*
  OmixDeviceInfo.h - Identity and battery state reported by the analyser.
*/
#pragma once

#include "OmixEvents.h"

#include <optional>
#include <string>

struct OmixDeviceInfo {
    std::string serialNumber;
    std::string firmwareVersion;
    std::string model;
    std::optional<BatteryStatus> battery;
};

// Folds a device-info reply into info. Returns false for any other event.
bool updateDeviceInfo(OmixDeviceInfo& info, const OmixEvent& event);
