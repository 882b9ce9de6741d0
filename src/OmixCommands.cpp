/*
  OmixCommands.cpp - Command packets sent to the Omix and coffee type codes.
*/
#include "OmixCommands.h"
#include "OmixProtocol.h"

namespace {
    struct CoffeeTypeEntry {
        OmixCoffeeType type;
        const char* name;
    };

    const CoffeeTypeEntry COFFEE_TYPES[] = {
        {OmixCoffeeType::General, "general"},
        {OmixCoffeeType::Cherry, "cherry"},
        {OmixCoffeeType::Parchment, "parchment"},
        {OmixCoffeeType::Green, "green"},
        {OmixCoffeeType::Roasted, "roasted"},
        {OmixCoffeeType::Ground, "ground"},
        {OmixCoffeeType::Auto, "auto"},
    };
}

const char* coffeeTypeName(const OmixCoffeeType type) {
    for (const auto& entry : COFFEE_TYPES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "auto";
}

bool coffeeTypeFromName(const std::string& name, OmixCoffeeType& type) {
    for (const auto& entry : COFFEE_TYPES) {
        if (name == entry.name) {
            type = entry.type;
            return true;
        }
    }
    return false;
}

bool coffeeTypeFromCode(const uint8_t code, OmixCoffeeType& type) {
    if (code > static_cast<uint8_t>(OmixCoffeeType::Auto)) {
        return false;
    }
    type = static_cast<OmixCoffeeType>(code);
    return true;
}

std::vector<uint8_t> buildStartMeasurement(const OmixCoffeeType type) {
    const uint8_t code = static_cast<uint8_t>(type);
    return buildPacket(FUNC_DETECTION, CMD_START_MEAS, &code, 1);
}

std::vector<uint8_t> buildGetSerialNumber() {
    return buildPacket(FUNC_DEVICE_INFO, CMD_GET_SN);
}

std::vector<uint8_t> buildGetFirmwareVersion() {
    return buildPacket(FUNC_DEVICE_INFO, CMD_GET_VERSION);
}

std::vector<uint8_t> buildGetModel() {
    return buildPacket(FUNC_DEVICE_INFO, CMD_GET_MODEL);
}

std::vector<uint8_t> buildGetBattery() {
    return buildPacket(FUNC_DEVICE_INFO, CMD_GET_BATTERY);
}
