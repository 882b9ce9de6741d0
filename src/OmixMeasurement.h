/*
  OmixMeasurement.h - Accumulated and finished Omix measurements.
*/
#pragma once

#include "OmixCommands.h"
#include "OmixParsers.h"

#include <array>
#include <optional>
#include <stdint.h>
#include <string>

enum class OmixLinkType {
    None,
    Inventory,
    Roast
};

const char* linkTypeName(OmixLinkType type);
[[nodiscard]] bool linkTypeFromName(const std::string& name, OmixLinkType& type);

struct OmixMeasurementLink {
    OmixLinkType type = OmixLinkType::None;
    std::string targetId;

    [[nodiscard]] bool isSet() const {
        return type != OmixLinkType::None && !targetId.empty();
    }
};

// Every field stays empty until the matching result arrives.
struct OmixPartialMeasurement {
    std::optional<OmixCoffeeType> coffeeType;
    std::optional<uint8_t> beanType;

    std::optional<float> moisture;
    std::optional<float> density;
    std::optional<float> bulkDensity;
    std::optional<int32_t> screenSizeGrade;
    std::optional<float> screenSizeDiameter;
    std::optional<float> weight;

    std::optional<float> waterActivity;
    std::optional<float> mirrorTemperature;
    std::optional<float> beanTemperature;

    std::optional<float> agtronNumber;
    std::optional<float> variance;
    std::optional<uint8_t> roastStandard;
    std::optional<std::array<uint8_t, AGTRON_BAR_CHART_SIZE>> barChart31;
    std::optional<std::array<uint8_t, AGTRON_PIE_CHART_SIZE>> pieChart8;

    std::optional<float> temperature;
    std::optional<int32_t> humidity;
    std::optional<float> pressure;
    std::optional<int32_t> altitude;
};

struct OmixMeasurement {
    std::string id;
    std::string deviceIdentifier;
    std::string measuredAt;
    OmixPartialMeasurement data;
    OmixMeasurementLink link;
    std::string syncedAt;   // empty until the backend confirmed it

    [[nodiscard]] bool isSynced() const {
        return !syncedAt.empty();
    }
};

// "df_<millis>_<7 base36 chars>"
std::string generateMeasurementId(uint32_t nowMs);

// UTC wall clock as "2025-01-31T12:00:00.000Z". Before SNTP sync on ESP32
// this reports 1970.
std::string currentTimestamp();
