/*
  OmixMeasurementPayload.cpp - JSON bodies for the measurement upload endpoints.
*/
#include "OmixMeasurementPayload.h"

namespace {
    template <typename T>
    void setIfPresent(JsonObject object, const char* key, const std::optional<T>& value) {
        if (value) {
            object[key] = *value;
        }
    }

    template <size_t N>
    void setChart(JsonObject object, const char* key, const std::optional<std::array<uint8_t, N>>& chart) {
        if (!chart) {
            return;
        }

        JsonArray array = object[key].to<JsonArray>();
        for (const uint8_t value : *chart) {
            array.add(value);
        }
    }
}

void writeMeasurementJson(const OmixMeasurement& measurement, JsonObject object) {
    const OmixPartialMeasurement& m = measurement.data;

    if (m.coffeeType) {
        object["coffee_type"] = coffeeTypeName(*m.coffeeType);
    }

    setIfPresent(object, "moisture", m.moisture);
    setIfPresent(object, "water_activity", m.waterActivity);
    setIfPresent(object, "density", m.density);
    setIfPresent(object, "bulk_density", m.bulkDensity);
    setIfPresent(object, "agtron_number", m.agtronNumber);
    setIfPresent(object, "variance", m.variance);
    setIfPresent(object, "roast_standard", m.roastStandard);
    setChart(object, "bar_chart_31", m.barChart31);
    setChart(object, "pie_chart_8", m.pieChart8);
    setIfPresent(object, "screen_size_grade", m.screenSizeGrade);
    setIfPresent(object, "screen_size_diameter", m.screenSizeDiameter);
    setIfPresent(object, "weight", m.weight);
    setIfPresent(object, "mirror_temperature", m.mirrorTemperature);
    setIfPresent(object, "bean_temperature", m.beanTemperature);
    setIfPresent(object, "temperature", m.temperature);
    setIfPresent(object, "humidity", m.humidity);
    setIfPresent(object, "pressure", m.pressure);
    setIfPresent(object, "altitude", m.altitude);

    if (!measurement.deviceIdentifier.empty()) {
        object["device_identifier"] = measurement.deviceIdentifier;
    }
    object["measured_at"] = measurement.measuredAt;

    if (measurement.link.isSet()) {
        object["measurable_type"] = linkTypeName(measurement.link.type);
        object["measurable_id"] = measurement.link.targetId;
    }
}

std::string buildMeasurementPayload(const OmixMeasurement& measurement) {
    JsonDocument doc;
    writeMeasurementJson(measurement, doc.to<JsonObject>());

    std::string payload;
    serializeJson(doc, payload);
    return payload;
}

std::string buildBatchPayload(const std::vector<OmixMeasurement>& measurements) {
    JsonDocument doc;
    JsonArray array = doc["measurements"].to<JsonArray>();

    for (const auto& measurement : measurements) {
        writeMeasurementJson(measurement, array.add<JsonObject>());
    }

    std::string payload;
    serializeJson(doc, payload);
    return payload;
}

std::string buildLinkPayload(const OmixLinkType type, const std::string& targetId) {
    JsonDocument doc;
    doc["measurable_type"] = linkTypeName(type);
    doc["measurable_id"] = targetId;

    std::string payload;
    serializeJson(doc, payload);
    return payload;
}
