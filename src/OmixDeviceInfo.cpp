/*
  OmixDeviceInfo.cpp - Identity and battery state reported by the analyser.
*/
#include "OmixDeviceInfo.h"

bool updateDeviceInfo(OmixDeviceInfo& info, const OmixEvent& event) {
    if (const auto* serial = std::get_if<SerialNumberEvent>(&event)) {
        info.serialNumber = serial->value;
        return true;
    }
    if (const auto* firmware = std::get_if<FirmwareVersionEvent>(&event)) {
        info.firmwareVersion = firmware->value;
        return true;
    }
    if (const auto* model = std::get_if<DeviceModelEvent>(&event)) {
        info.model = model->value;
        return true;
    }
    if (const auto* battery = std::get_if<BatteryEvent>(&event)) {
        info.battery = battery->data;
        return true;
    }
    return false;
}
