/*
  OmixMeasurementPayload.h - JSON bodies for the measurement upload endpoints.

  Field names are the backend's snake_case keys. Fields the device never
  reported are left out.
*/
#pragma once

#include "OmixMeasurement.h"

#include <ArduinoJson.h>

#include <string>
#include <vector>

void writeMeasurementJson(const OmixMeasurement& measurement, JsonObject object);

// Body for "store measurement"
std::string buildMeasurementPayload(const OmixMeasurement& measurement);

// Body for "batch store": {"measurements": [...]}
std::string buildBatchPayload(const std::vector<OmixMeasurement>& measurements);

// Body for "link measurement": {"measurable_type": ..., "measurable_id": ...}
std::string buildLinkPayload(OmixLinkType type, const std::string& targetId);
