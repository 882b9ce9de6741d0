/*
  OmixParsers.cpp - Decoders for the fixed-layout Omix response payloads.
*/
#include "OmixParsers.h"

#include <cstring>

uint64_t readUint64LE(const uint8_t* buf, const size_t offset) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; i--) {
        value = (value << 8) | buf[offset + i];
    }
    return value;
}

int32_t readInt32LE(const uint8_t* buf, const size_t offset) {
    const uint32_t raw = static_cast<uint32_t>(buf[offset]) |
                         (static_cast<uint32_t>(buf[offset + 1]) << 8) |
                         (static_cast<uint32_t>(buf[offset + 2]) << 16) |
                         (static_cast<uint32_t>(buf[offset + 3]) << 24);
    int32_t value;
    memcpy(&value, &raw, sizeof(value));
    return value;
}

float readFloatLE(const uint8_t* buf, const size_t offset) {
    const uint32_t raw = static_cast<uint32_t>(readInt32LE(buf, offset));
    float value;
    memcpy(&value, &raw, sizeof(value));
    return value;
}

BeanTypeResult parseBeanType(const uint8_t* payload) {
    BeanTypeResult result{};
    result.timestamp = readUint64LE(payload, 0);
    result.historyId = readInt32LE(payload, 8);
    result.beanType = payload[12];
    result.detectWaterActivity = payload[13] == 1;
    result.detectEnvironment = payload[14] == 1;
    return result;
}

MoistureDensityResult parseMoistureDensity(const uint8_t* payload) {
    MoistureDensityResult result{};
    result.timestamp = readUint64LE(payload, 0);
    result.historyId = readInt32LE(payload, 8);
    result.dataVersion = payload[12];
    result.beanType = payload[13];
    result.screenSizeGrade = readInt32LE(payload, 16);
    result.screenSizeDiameter = readFloatLE(payload, 20);
    result.moisture = readFloatLE(payload, 24);
    result.estimatedDensity = readFloatLE(payload, 28);
    // 32..35 reserved
    result.bulkDensity = readFloatLE(payload, 36);
    result.weight = readFloatLE(payload, 40);
    return result;
}

WaterActivityResult parseWaterActivity(const uint8_t* payload) {
    WaterActivityResult result{};
    result.timestamp = readUint64LE(payload, 0);
    result.historyId = readInt32LE(payload, 8);
    result.dataVersion = payload[12];
    result.beanType = payload[13];
    result.success = readInt32LE(payload, 16) == 1;
    result.waterActivity = readFloatLE(payload, 20);
    result.mirrorTemperature = readFloatLE(payload, 24);
    result.beanTemperature = readFloatLE(payload, 28);
    return result;
}

AgtronResult parseAgtron(const uint8_t* payload) {
    AgtronResult result{};
    result.timestamp = readUint64LE(payload, 0);
    result.historyId = readInt32LE(payload, 8);
    result.dataVersion = payload[12];
    result.agtronRange = payload[13];
    result.beanType = payload[15];
    result.agtronMean = readFloatLE(payload, 16);
    result.variance = readFloatLE(payload, 20);
    result.roastStandard = payload[80];
    memcpy(result.barChart31.data(), payload + AGTRON_BAR_CHART_OFFSET, AGTRON_BAR_CHART_SIZE);
    memcpy(result.pieChart8.data(), payload + AGTRON_PIE_CHART_OFFSET, AGTRON_PIE_CHART_SIZE);
    return result;
}

EnvironmentResult parseEnvironment(const uint8_t* payload) {
    EnvironmentResult result{};
    result.timestamp = readUint64LE(payload, 0);
    result.historyId = readInt32LE(payload, 8);
    result.temperature = readFloatLE(payload, 12);
    result.humidity = readInt32LE(payload, 16);
    result.pressure = readFloatLE(payload, 20);
    result.altitude = readInt32LE(payload, 24);
    return result;
}

WaterActivityStartResult parseWaterActivityStart(const uint8_t* payload) {
    return WaterActivityStartResult{payload[0]};
}

BatteryStatus parseBattery(const uint8_t* payload) {
    BatteryStatus status{};
    status.mainCharging = payload[0];
    status.mainBattery = payload[1];
    status.baseCharging = payload[2];
    status.baseBattery = payload[3];
    return status;
}

const char* chargingStatusName(const uint8_t status) {
    switch (status) {
        case CHARGING_NOT_CHARGING: return "not charging";
        case CHARGING_IN_PROGRESS:  return "charging";
        case CHARGING_FULL:         return "fully charged";
        default:                    return "error";
    }
}

std::string parseDeviceString(const uint8_t* payload, const size_t length) {
    std::string result;
    result.reserve(length);

    for (size_t i = 0; i < length; i++) {
        if (payload[i] != 0) {
            result.push_back(static_cast<char>(payload[i]));
        }
    }

    return result;
}
