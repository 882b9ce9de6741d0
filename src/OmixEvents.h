/*
  OmixEvents.h - Typed events decoded from Omix notifications.
*/
#pragma once

#include "OmixParsers.h"

#include <stdint.h>
#include <string>
#include <variant>

struct MeasurementStartedEvent {};
struct MeasurementBusyEvent {};
struct MeasurementFailedEvent {
    uint8_t status;
};
struct BeanTypeEvent {
    BeanTypeResult data;
};
struct MoistureDensityEvent {
    MoistureDensityResult data;
};
struct WaterActivityEvent {
    WaterActivityResult data;
};
struct AgtronEvent {
    AgtronResult data;
};
struct EnvironmentEvent {
    EnvironmentResult data;
};
struct WaterActivityStartEvent {
    uint8_t startStatus;
};
struct SerialNumberEvent {
    std::string value;
};
struct FirmwareVersionEvent {
    std::string value;
};
struct DeviceModelEvent {
    std::string value;
};
struct BatteryEvent {
    BatteryStatus data;
};
struct UnknownEvent {
    uint8_t func;
    uint8_t cmd;
};

using OmixEvent = std::variant<
    MeasurementStartedEvent,
    MeasurementBusyEvent,
    MeasurementFailedEvent,
    BeanTypeEvent,
    MoistureDensityEvent,
    WaterActivityEvent,
    AgtronEvent,
    EnvironmentEvent,
    WaterActivityStartEvent,
    SerialNumberEvent,
    FirmwareVersionEvent,
    DeviceModelEvent,
    BatteryEvent,
    UnknownEvent>;

// Short snake_case name for logging, e.g. "moisture_density"
const char* eventName(const OmixEvent& event);
