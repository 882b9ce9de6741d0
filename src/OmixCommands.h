/*
  OmixCommands.h - Command packets sent to the Omix and coffee type codes.
*/
#pragma once

#include <stdint.h>
#include <string>
#include <vector>

enum class OmixCoffeeType : uint8_t {
    General = 0,
    Cherry = 1,
    Parchment = 2,
    Green = 3,
    Roasted = 4,
    Ground = 5,
    Auto = 6
};

const char* coffeeTypeName(OmixCoffeeType type);

// Accepts the lower-case names returned by coffeeTypeName(), e.g. "roasted".
[[nodiscard]] bool coffeeTypeFromName(const std::string& name, OmixCoffeeType& type);

// Maps a protocol code back to a type; codes above 6 are rejected.
[[nodiscard]] bool coffeeTypeFromCode(uint8_t code, OmixCoffeeType& type);

std::vector<uint8_t> buildStartMeasurement(OmixCoffeeType type);
std::vector<uint8_t> buildGetSerialNumber();
std::vector<uint8_t> buildGetFirmwareVersion();
std::vector<uint8_t> buildGetModel();
std::vector<uint8_t> buildGetBattery();
