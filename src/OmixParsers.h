/*
  OmixParsers.h - Decoders for the fixed-layout Omix response payloads.

  All multi-byte fields are little endian. The parsers trust their input:
  callers must check the payload is at least the listed length.
*/
#pragma once

#include <array>
#include <stddef.h>
#include <stdint.h>
#include <string>

#define BEAN_TYPE_PAYLOAD_LENGTH            15
#define MOISTURE_DENSITY_PAYLOAD_LENGTH     44
#define WATER_ACTIVITY_PAYLOAD_LENGTH       32
#define AGTRON_PAYLOAD_LENGTH               120
#define ENVIRONMENT_PAYLOAD_LENGTH          28
#define WATER_ACTIVITY_START_PAYLOAD_LENGTH 1
#define BATTERY_PAYLOAD_LENGTH              4

#define AGTRON_BAR_CHART_OFFSET   81
#define AGTRON_BAR_CHART_SIZE     31
#define AGTRON_PIE_CHART_OFFSET   112
#define AGTRON_PIE_CHART_SIZE     8

struct BeanTypeResult {
    uint64_t timestamp;
    int32_t historyId;
    uint8_t beanType;
    bool detectWaterActivity;
    bool detectEnvironment;
};

struct MoistureDensityResult {
    uint64_t timestamp;
    int32_t historyId;
    uint8_t dataVersion;
    uint8_t beanType;
    int32_t screenSizeGrade;
    float screenSizeDiameter;
    float moisture;
    float estimatedDensity;
    float bulkDensity;
    float weight;
};

struct WaterActivityResult {
    uint64_t timestamp;
    int32_t historyId;
    uint8_t dataVersion;
    uint8_t beanType;
    bool success;
    float waterActivity;
    float mirrorTemperature;
    float beanTemperature;
};

struct AgtronResult {
    uint64_t timestamp;
    int32_t historyId;
    uint8_t dataVersion;
    uint8_t agtronRange;
    uint8_t beanType;
    float agtronMean;
    float variance;
    uint8_t roastStandard;
    std::array<uint8_t, AGTRON_BAR_CHART_SIZE> barChart31;
    std::array<uint8_t, AGTRON_PIE_CHART_SIZE> pieChart8;
};

struct EnvironmentResult {
    uint64_t timestamp;
    int32_t historyId;
    float temperature;
    int32_t humidity;
    float pressure;
    int32_t altitude;
};

struct WaterActivityStartResult {
    uint8_t startStatus;
};

// Charging status codes as reported in the battery reply
enum OmixChargingStatus : uint8_t {
    CHARGING_ERROR = 0,
    CHARGING_NOT_CHARGING = 1,
    CHARGING_IN_PROGRESS = 2,
    CHARGING_FULL = 3
};

struct BatteryStatus {
    uint8_t mainCharging;
    uint8_t mainBattery;
    uint8_t baseCharging;
    uint8_t baseBattery;
};

const char* chargingStatusName(uint8_t status);

uint64_t readUint64LE(const uint8_t* buf, size_t offset);
int32_t readInt32LE(const uint8_t* buf, size_t offset);
float readFloatLE(const uint8_t* buf, size_t offset);

BeanTypeResult parseBeanType(const uint8_t* payload);
MoistureDensityResult parseMoistureDensity(const uint8_t* payload);
WaterActivityResult parseWaterActivity(const uint8_t* payload);
AgtronResult parseAgtron(const uint8_t* payload);
EnvironmentResult parseEnvironment(const uint8_t* payload);
WaterActivityStartResult parseWaterActivityStart(const uint8_t* payload);
BatteryStatus parseBattery(const uint8_t* payload);

// ASCII device-info reply with every NUL byte removed
std::string parseDeviceString(const uint8_t* payload, size_t length);
