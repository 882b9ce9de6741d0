/*
  OmixNotificationRouter.cpp - Turns raw notification bytes into an OmixEvent.
*/
#include "OmixNotificationRouter.h"
#include "OmixProtocol.h"

namespace {
    struct EventNameVisitor {
        const char* operator()(const MeasurementStartedEvent&) const { return "measurement_started"; }
        const char* operator()(const MeasurementBusyEvent&) const { return "measurement_busy"; }
        const char* operator()(const MeasurementFailedEvent&) const { return "measurement_failed"; }
        const char* operator()(const BeanTypeEvent&) const { return "bean_type"; }
        const char* operator()(const MoistureDensityEvent&) const { return "moisture_density"; }
        const char* operator()(const WaterActivityEvent&) const { return "water_activity"; }
        const char* operator()(const AgtronEvent&) const { return "agtron"; }
        const char* operator()(const EnvironmentEvent&) const { return "environment"; }
        const char* operator()(const WaterActivityStartEvent&) const { return "water_activity_start"; }
        const char* operator()(const SerialNumberEvent&) const { return "serial_number"; }
        const char* operator()(const FirmwareVersionEvent&) const { return "firmware_version"; }
        const char* operator()(const DeviceModelEvent&) const { return "device_model"; }
        const char* operator()(const BatteryEvent&) const { return "battery"; }
        const char* operator()(const UnknownEvent&) const { return "unknown"; }
    };

    std::optional<OmixEvent> routeDetection(const OmixPacket& packet) {
        const uint8_t* payload = packet.payload.data();
        const size_t length = packet.payload.size();

        switch (packet.cmd) {
            case CMD_START_MEAS: {
                if (length < 1) break;
                const uint8_t status = payload[0];
                if (status == MEAS_RESPONSE_STARTED) return OmixEvent{MeasurementStartedEvent{}};
                if (status == MEAS_RESPONSE_BUSY) return OmixEvent{MeasurementBusyEvent{}};
                return OmixEvent{MeasurementFailedEvent{status}};
            }
            case CMD_BEAN_TYPE:
                if (length < BEAN_TYPE_PAYLOAD_LENGTH) break;
                return OmixEvent{BeanTypeEvent{parseBeanType(payload)}};
            case CMD_MOISTURE_DENSITY:
                if (length < MOISTURE_DENSITY_PAYLOAD_LENGTH) break;
                return OmixEvent{MoistureDensityEvent{parseMoistureDensity(payload)}};
            case CMD_WATER_ACTIVITY:
                if (length < WATER_ACTIVITY_PAYLOAD_LENGTH) break;
                return OmixEvent{WaterActivityEvent{parseWaterActivity(payload)}};
            case CMD_AGTRON:
                if (length < AGTRON_PAYLOAD_LENGTH) break;
                return OmixEvent{AgtronEvent{parseAgtron(payload)}};
            case CMD_ENV_DATA:
                if (length < ENVIRONMENT_PAYLOAD_LENGTH) break;
                return OmixEvent{EnvironmentEvent{parseEnvironment(payload)}};
            case CMD_WATER_ACTIVITY_START:
                if (length < WATER_ACTIVITY_START_PAYLOAD_LENGTH) break;
                return OmixEvent{WaterActivityStartEvent{parseWaterActivityStart(payload).startStatus}};
            default:
                break;
        }

        return std::nullopt;
    }

    std::optional<OmixEvent> routeDeviceInfo(const OmixPacket& packet) {
        const uint8_t* payload = packet.payload.data();
        const size_t length = packet.payload.size();

        switch (packet.cmd) {
            case CMD_GET_SN:
                return OmixEvent{SerialNumberEvent{parseDeviceString(payload, length)}};
            case CMD_GET_VERSION:
                return OmixEvent{FirmwareVersionEvent{parseDeviceString(payload, length)}};
            case CMD_GET_MODEL:
                return OmixEvent{DeviceModelEvent{parseDeviceString(payload, length)}};
            case CMD_GET_BATTERY:
                if (length < BATTERY_PAYLOAD_LENGTH) break;
                return OmixEvent{BatteryEvent{parseBattery(payload)}};
            default:
                break;
        }

        return std::nullopt;
    }
}

const char* eventName(const OmixEvent& event) {
    return std::visit(EventNameVisitor{}, event);
}

std::optional<OmixEvent> routeNotification(const uint8_t* data, const size_t length) {
    if (!validatePacket(data, length)) {
        return std::nullopt;
    }

    const OmixPacket packet = extractPayload(data, length);
    std::optional<OmixEvent> event;

    if (packet.func == FUNC_DETECTION) {
        event = routeDetection(packet);
    }
    else if (packet.func == FUNC_DEVICE_INFO) {
        event = routeDeviceInfo(packet);
    }

    if (!event) {
        return OmixEvent{UnknownEvent{packet.func, packet.cmd}};
    }

    return event;
}
