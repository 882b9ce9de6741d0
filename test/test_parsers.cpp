#include "OmixParsers.h"
#include "OmixProtocol.h"

#include <gtest/gtest.h>

#include <vector>

namespace {
    const uint8_t BEAN_TYPE[] = {
        0x00, 0x68, 0xE5, 0xCF, 0x8B, 0x01, 0x00, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x04, 0x01, 0x01,
    };

    const uint8_t MOISTURE_DENSITY[] = {
        0x00, 0x68, 0xE5, 0xCF, 0x8B, 0x01, 0x00, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x02, 0x04, 0x00,
        0x00, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0xC8, 0x40, 0x00, 0x00, 0x38, 0x41, 0x00, 0x80,
        0x22, 0x44, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x3F, 0x00, 0x00, 0xC8, 0x42,
    };

    const uint8_t WATER_ACTIVITY[] = {
        0x00, 0x68, 0xE5, 0xCF, 0x8B, 0x01, 0x00, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x02, 0x03, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x3F, 0x00, 0x00, 0xC8, 0x41, 0x00, 0x00, 0x20, 0x40,
    };

    const uint8_t ENVIRONMENT[] = {
        0x00, 0x68, 0xE5, 0xCF, 0x8B, 0x01, 0x00, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xC8, 0x41, 0x3A, 0x00, 0x00, 0x00, 0x00, 0x50, 0x7D, 0x44, 0xF4, 0xFF, 0xFF, 0xFF,
    };
}

TEST(OmixParsers, ReadsLittleEndianFields) {
    const uint8_t bytes[] = {0xF4, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x6A, 0x42};

    EXPECT_EQ(readInt32LE(bytes, 0), -12);
    EXPECT_FLOAT_EQ(readFloatLE(bytes, 4), 58.5f);
    EXPECT_EQ(readUint64LE(BEAN_TYPE, 0), 1700000000000ULL);
}

TEST(OmixParsers, BeanType) {
    const BeanTypeResult result = parseBeanType(BEAN_TYPE);

    EXPECT_EQ(result.timestamp, 1700000000000ULL);
    EXPECT_EQ(result.historyId, 42);
    EXPECT_EQ(result.beanType, 4);
    EXPECT_TRUE(result.detectWaterActivity);
    EXPECT_TRUE(result.detectEnvironment);
}

TEST(OmixParsers, MoistureDensity) {
    const MoistureDensityResult result = parseMoistureDensity(MOISTURE_DENSITY);

    EXPECT_EQ(result.historyId, 42);
    EXPECT_EQ(result.dataVersion, 2);
    EXPECT_EQ(result.beanType, 4);
    EXPECT_EQ(result.screenSizeGrade, 16);
    EXPECT_FLOAT_EQ(result.screenSizeDiameter, 6.25f);
    EXPECT_FLOAT_EQ(result.moisture, 11.5f);
    EXPECT_FLOAT_EQ(result.estimatedDensity, 650.0f);
    EXPECT_FLOAT_EQ(result.bulkDensity, 0.5f);
    EXPECT_FLOAT_EQ(result.weight, 100.0f);
}

TEST(OmixParsers, WaterActivity) {
    const WaterActivityResult result = parseWaterActivity(WATER_ACTIVITY);

    EXPECT_EQ(result.dataVersion, 2);
    EXPECT_EQ(result.beanType, 3);
    EXPECT_TRUE(result.success);
    EXPECT_FLOAT_EQ(result.waterActivity, 0.5f);
    EXPECT_FLOAT_EQ(result.mirrorTemperature, 25.0f);
    EXPECT_FLOAT_EQ(result.beanTemperature, 2.5f);
}

TEST(OmixParsers, WaterActivityFailureFlag) {
    std::vector<uint8_t> payload(WATER_ACTIVITY, WATER_ACTIVITY + sizeof(WATER_ACTIVITY));
    payload[16] = 0x00;

    EXPECT_FALSE(parseWaterActivity(payload.data()).success);
}

TEST(OmixParsers, Agtron) {
    std::vector<uint8_t> payload(AGTRON_PAYLOAD_LENGTH, 0);
    payload[12] = 1;
    payload[13] = 2;
    payload[14] = 0xEE;   // reserved
    payload[15] = 4;
    payload[16] = 0x00;   // 58.5f
    payload[17] = 0x00;
    payload[18] = 0x6A;
    payload[19] = 0x42;
    payload[20] = 0x00;   // 16.0f
    payload[21] = 0x00;
    payload[22] = 0x80;
    payload[23] = 0x41;
    payload[80] = ROAST_STANDARD_SCAA;
    payload[AGTRON_BAR_CHART_OFFSET] = 7;
    payload[AGTRON_BAR_CHART_OFFSET + 30] = 9;
    payload[AGTRON_PIE_CHART_OFFSET] = 25;
    payload[AGTRON_PIE_CHART_OFFSET + 7] = 3;

    const AgtronResult result = parseAgtron(payload.data());

    EXPECT_EQ(result.dataVersion, 1);
    EXPECT_EQ(result.agtronRange, 2);
    EXPECT_EQ(result.beanType, 4);
    EXPECT_FLOAT_EQ(result.agtronMean, 58.5f);
    EXPECT_FLOAT_EQ(result.variance, 16.0f);
    EXPECT_EQ(result.roastStandard, ROAST_STANDARD_SCAA);
    EXPECT_EQ(result.barChart31[0], 7);
    EXPECT_EQ(result.barChart31[30], 9);
    EXPECT_EQ(result.barChart31[15], 0);
    EXPECT_EQ(result.pieChart8[0], 25);
    EXPECT_EQ(result.pieChart8[7], 3);
}

TEST(OmixParsers, Environment) {
    const EnvironmentResult result = parseEnvironment(ENVIRONMENT);

    EXPECT_EQ(result.historyId, 42);
    EXPECT_FLOAT_EQ(result.temperature, 25.0f);
    EXPECT_EQ(result.humidity, 58);
    EXPECT_FLOAT_EQ(result.pressure, 1013.25f);
    EXPECT_EQ(result.altitude, -12);
}

TEST(OmixParsers, WaterActivityStart) {
    const uint8_t payload[] = {0x01};
    EXPECT_EQ(parseWaterActivityStart(payload).startStatus, 1);
}

TEST(OmixParsers, Battery) {
    const uint8_t payload[] = {CHARGING_IN_PROGRESS, 80, CHARGING_FULL, 100};
    const BatteryStatus status = parseBattery(payload);

    EXPECT_EQ(status.mainCharging, CHARGING_IN_PROGRESS);
    EXPECT_EQ(status.mainBattery, 80);
    EXPECT_EQ(status.baseCharging, CHARGING_FULL);
    EXPECT_EQ(status.baseBattery, 100);

    EXPECT_STREQ(chargingStatusName(status.mainCharging), "charging");
    EXPECT_STREQ(chargingStatusName(CHARGING_NOT_CHARGING), "not charging");
    EXPECT_STREQ(chargingStatusName(status.baseCharging), "fully charged");
    EXPECT_STREQ(chargingStatusName(CHARGING_ERROR), "error");
}

TEST(OmixParsers, DeviceStringDropsNulBytes) {
    const uint8_t payload[] = {'O', 'M', 'X', 0x00, '1', '2', '3', 0x00};
    EXPECT_EQ(parseDeviceString(payload, sizeof(payload)), "OMX123");
    EXPECT_EQ(parseDeviceString(payload, 0), "");
}
