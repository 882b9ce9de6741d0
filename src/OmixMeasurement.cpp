/*
  OmixMeasurement.cpp - Accumulated and finished Omix measurements.
*/
#include "OmixMeasurement.h"
#include "OmixPlatform.h"

#include <stdio.h>
#include <sys/time.h>
#include <time.h>

const char* linkTypeName(const OmixLinkType type) {
    switch (type) {
        case OmixLinkType::Inventory: return "inventory";
        case OmixLinkType::Roast:     return "roast";
        default:                      return "";
    }
}

bool linkTypeFromName(const std::string& name, OmixLinkType& type) {
    if (name == "inventory") {
        type = OmixLinkType::Inventory;
        return true;
    }
    if (name == "roast") {
        type = OmixLinkType::Roast;
        return true;
    }
    return false;
}

std::string generateMeasurementId(const uint32_t nowMs) {
    static const char BASE36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    char suffix[8];
    uint32_t value = omix_platform_random();

    for (int i = 0; i < 7; i++) {
        suffix[i] = BASE36[value % 36];
        value /= 36;
        if (value == 0) {
            value = omix_platform_random();
        }
    }
    suffix[7] = '\0';

    char id[32];
    snprintf(id, sizeof(id), "df_%lu_%s", static_cast<unsigned long>(nowMs), suffix);
    return id;
}

std::string currentTimestamp() {
    struct timeval tv;
    gettimeofday(&tv, nullptr);

    const time_t seconds = tv.tv_sec;
    struct tm utc;
    gmtime_r(&seconds, &utc);

    char date[24];
    strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char timestamp[32];
    snprintf(timestamp, sizeof(timestamp), "%s.%03dZ", date, static_cast<int>(tv.tv_usec / 1000));
    return timestamp;
}
