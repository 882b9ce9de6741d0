#include "OmixArduinoBLE.h"
#include "mocks/fake_ble_platform.h"
#include "mocks/fake_uploader.h"
#include "test_packets.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

class OmixArduinoBLETest : public ::testing::Test {
    protected:
        void SetUp() override {
            platform.services = FakeBlePlatform::omixServices();

            omix.onMeasurementComplete([this](const OmixMeasurement& measurement) {
                completed.push_back(measurement);
            });
            omix.onSessionChange([this](const OmixSessionPhase phase, const OmixSessionOutcome outcome) {
                sessionChanges.emplace_back(phase, outcome);
            });
            omix.onDeviceInfo([this](const OmixDeviceInfo&) { deviceInfoUpdates++; });
            omix.onDisconnect([this]() { disconnects++; });
            omix.onError([this](const std::string& message) { errors.push_back(message); });

            ASSERT_TRUE(omix.begin());
        }

        void runRoastedMeasurement() {
            platform.notify(startAckPacket(MEAS_RESPONSE_STARTED));
            platform.notify(beanTypePacket(4, false));
            platform.notify(moisturePacket(11.5f, 650.0f));
            platform.notify(environmentPacket(24.0f));
            platform.notify(agtronPacket(58.5f));
            omix.loop();
        }

        FakeBlePlatform platform;
        FakeUploader uploader;

        std::vector<OmixMeasurement> completed;
        std::vector<std::pair<OmixSessionPhase, OmixSessionOutcome>> sessionChanges;
        std::vector<std::string> errors;
        int deviceInfoUpdates = 0;
        int disconnects = 0;

        // Declared last: its destructor disconnects and may still fire the callbacks above
        OmixArduinoBLE omix{platform, uploader, false};
};

TEST_F(OmixArduinoBLETest, MeasureAndSave) {
    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure(OmixCoffeeType::Roasted));

    ASSERT_EQ(platform.writes.size(), 1u);
    EXPECT_EQ(platform.writes[0].data, (std::vector<uint8_t>{0xDF, 0xDF, 0x03, 0x01, 0x01, 0x04, 0xC7}));
    EXPECT_TRUE(omix.isMeasuring());
    EXPECT_EQ(omix.connectionState(), OmixConnectionState::Measuring);

    runRoastedMeasurement();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].deviceIdentifier, "aa");
    EXPECT_EQ(completed[0].data.coffeeType, OmixCoffeeType::Roasted);
    EXPECT_FLOAT_EQ(*completed[0].data.temperature, 24.0f);
    EXPECT_EQ(omix.session().phase, OmixSessionPhase::Complete);
    EXPECT_EQ(omix.connectionState(), OmixConnectionState::Connected);
    ASSERT_TRUE(omix.result().has_value());

    const std::string id = omix.result()->id;
    ASSERT_TRUE(omix.saveMeasurement(OmixLinkType::Inventory, "inv-1"));

    ASSERT_EQ(uploader.stored.size(), 1u);
    EXPECT_EQ(uploader.stored[0].id, id);
    EXPECT_EQ(uploader.stored[0].link.type, OmixLinkType::Inventory);
    EXPECT_EQ(uploader.stored[0].link.targetId, "inv-1");
    EXPECT_FALSE(omix.result().has_value());
    ASSERT_EQ(omix.history().size(), 1u);
    EXPECT_TRUE(omix.history()[0].isSynced());

    ASSERT_EQ(sessionChanges.size(), 2u);
    EXPECT_EQ(sessionChanges[0].first, OmixSessionPhase::Measuring);
    EXPECT_EQ(sessionChanges[1].second, OmixSessionOutcome::Completed);
}

TEST_F(OmixArduinoBLETest, MeasureRequiresConnection) {
    EXPECT_FALSE(omix.measure());
    EXPECT_EQ(omix.lastError(), "No DiFluid device connected");
    EXPECT_FALSE(omix.isMeasuring());
}

TEST_F(OmixArduinoBLETest, OneMeasurementAtATime) {
    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure());

    EXPECT_FALSE(omix.measure());
    EXPECT_EQ(omix.lastError(), "A measurement is already in progress");
    EXPECT_EQ(platform.writes.size(), 1u);
}

TEST_F(OmixArduinoBLETest, FailedWriteEndsSession) {
    ASSERT_TRUE(omix.connect("aa"));
    platform.writeResults = {false, false};

    EXPECT_FALSE(omix.measure(OmixCoffeeType::Green));
    EXPECT_EQ(omix.lastError(), "BLE write failed: GATT write rejected");
    EXPECT_FALSE(omix.isMeasuring());
    EXPECT_EQ(omix.session().outcome, OmixSessionOutcome::Failed);
    EXPECT_EQ(omix.connectionState(), OmixConnectionState::Connected);
}

TEST_F(OmixArduinoBLETest, BusyDeviceLeavesNothingToSave) {
    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure());

    platform.notify(startAckPacket(MEAS_RESPONSE_STARTED));
    platform.notify(startAckPacket(MEAS_RESPONSE_BUSY));
    omix.loop();

    EXPECT_TRUE(completed.empty());
    EXPECT_EQ(omix.session().outcome, OmixSessionOutcome::Busy);
    EXPECT_FALSE(omix.saveMeasurement());
    EXPECT_EQ(omix.lastError(), "No completed measurement to save");
    EXPECT_TRUE(uploader.stored.empty());
}

TEST_F(OmixArduinoBLETest, RunStartedOnDevice) {
    ASSERT_TRUE(omix.connect("aa"));

    runRoastedMeasurement();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].data.coffeeType, OmixCoffeeType::Auto);
    EXPECT_EQ(completed[0].deviceIdentifier, "aa");
    EXPECT_TRUE(platform.writes.empty());
}

TEST_F(OmixArduinoBLETest, DeviceInfo) {
    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.requestDeviceInfo());

    ASSERT_EQ(platform.writes.size(), 4u);
    EXPECT_EQ(platform.writes[0].data, buildGetSerialNumber());
    EXPECT_EQ(platform.writes[3].data, buildGetBattery());

    platform.notify({0xDF, 0xDF, 0x05, 0x09, 0x08, 'O', 'M', 'X', 0x00, '1', '2', '3', 0x00, 0x5E});
    platform.notify({0xDF, 0xDF, 0x05, 0x1D, 0x04, 0x02, 0x50, 0x03, 0x64, 0x9D});
    omix.loop();

    EXPECT_EQ(deviceInfoUpdates, 2);
    EXPECT_EQ(omix.deviceInfo().serialNumber, "OMX123");
    ASSERT_TRUE(omix.deviceInfo().battery.has_value());
    EXPECT_EQ(omix.deviceInfo().battery->mainBattery, 80);
    EXPECT_FALSE(omix.isMeasuring());
}

TEST_F(OmixArduinoBLETest, LinkLossAbandonsMeasurement) {
    ASSERT_TRUE(omix.connect("aa"));
    platform.notify({0xDF, 0xDF, 0x05, 0x1D, 0x04, 0x02, 0x50, 0x03, 0x64, 0x9D});
    omix.loop();
    ASSERT_TRUE(omix.measure());
    platform.notify(moisturePacket(11.5f, 650.0f));
    omix.loop();

    platform.dropLink();
    omix.loop();

    EXPECT_EQ(disconnects, 1);
    EXPECT_FALSE(omix.isConnected());
    EXPECT_FALSE(omix.isMeasuring());
    EXPECT_EQ(omix.session().outcome, OmixSessionOutcome::Disconnected);
    EXPECT_FALSE(omix.deviceInfo().battery.has_value());
    EXPECT_TRUE(completed.empty());
}

TEST_F(OmixArduinoBLETest, OfflineSaveIsSyncedLater) {
    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure(OmixCoffeeType::Roasted));
    runRoastedMeasurement();
    const std::string id = omix.result()->id;

    uploader.storeResult = false;
    EXPECT_FALSE(omix.saveMeasurement());
    EXPECT_EQ(omix.pendingCount(), 1u);
    EXPECT_EQ(omix.lastError(), "Upload failed, measurement queued (1 pending)");

    EXPECT_TRUE(omix.linkMeasurement(id, OmixLinkType::Roast, "roast-9"));
    EXPECT_TRUE(uploader.links.empty());

    ASSERT_TRUE(omix.syncPending());
    ASSERT_EQ(uploader.batches.size(), 1u);
    EXPECT_EQ(uploader.batches[0][0].link.targetId, "roast-9");
    EXPECT_EQ(omix.pendingCount(), 0u);
    EXPECT_TRUE(omix.history()[0].isSynced());
}

TEST_F(OmixArduinoBLETest, ClearCurrentStopsMeasuring) {
    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure());

    omix.clearCurrent();

    EXPECT_FALSE(omix.isMeasuring());
    EXPECT_EQ(omix.connectionState(), OmixConnectionState::Connected);
    EXPECT_FALSE(omix.result().has_value());
}

TEST_F(OmixArduinoBLETest, AutoConnectAndDisconnect) {
    platform.savedDeviceId = "aa";
    ASSERT_TRUE(omix.autoConnect());
    EXPECT_TRUE(omix.isScanning());

    OmixAdvertisement mine;
    mine.id = "aa";
    mine.name = "Omix 0001";
    mine.rssi = -55;
    platform.advertise(mine);
    omix.loop();

    ASSERT_TRUE(omix.isConnected());
    EXPECT_NE(omix.connectionInfo().find("Device: Omix 0001 (aa)"), std::string::npos);

    omix.disconnect();
    EXPECT_EQ(disconnects, 1);
    EXPECT_FALSE(omix.isConnected());
}

TEST_F(OmixArduinoBLETest, ScanErrorsReachErrorCallback) {
    platform.permissionGranted = false;

    EXPECT_FALSE(omix.startScan());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], omix.lastError());
}

TEST_F(OmixArduinoBLETest, ScanReportsDevices) {
    std::vector<std::string> names;
    ASSERT_TRUE(omix.startScan([&names](const OmixScannedDevice& device) { names.push_back(device.name); }));

    OmixAdvertisement device;
    device.id = "c1";
    device.name = "Omix Plus 0002";
    platform.advertise(device);
    omix.loop();

    EXPECT_EQ(names, (std::vector<std::string>{"Omix Plus 0002"}));
    EXPECT_EQ(omix.scanResults().size(), 1u);

    omix.stopScan();
    EXPECT_FALSE(omix.isScanning());
}

TEST_F(OmixArduinoBLETest, SaveFromCompletionCallback) {
    std::string savedId;
    omix.onMeasurementComplete([this, &savedId](const OmixMeasurement& measurement) {
        EXPECT_TRUE(omix.saveMeasurement());
        savedId = measurement.id;
    });

    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure(OmixCoffeeType::Roasted));
    runRoastedMeasurement();

    ASSERT_EQ(uploader.stored.size(), 1u);
    EXPECT_EQ(uploader.stored[0].id, savedId);
    EXPECT_FALSE(omix.result().has_value());
    EXPECT_EQ(sessionChanges.back().first, OmixSessionPhase::Complete);
    EXPECT_EQ(omix.connectionState(), OmixConnectionState::Connected);
}

TEST_F(OmixArduinoBLETest, NewRunFromCompletionCallback) {
    int runs = 0;
    omix.onMeasurementComplete([this, &runs](const OmixMeasurement&) {
        runs++;
        EXPECT_TRUE(omix.saveMeasurement());
        EXPECT_TRUE(omix.measure(OmixCoffeeType::Roasted));
    });

    ASSERT_TRUE(omix.connect("aa"));
    ASSERT_TRUE(omix.measure(OmixCoffeeType::Roasted));
    runRoastedMeasurement();

    EXPECT_EQ(runs, 1);
    EXPECT_EQ(uploader.stored.size(), 1u);
    EXPECT_EQ(platform.writes.size(), 2u);
    EXPECT_TRUE(omix.isMeasuring());
    EXPECT_EQ(omix.connectionState(), OmixConnectionState::Measuring);
    ASSERT_FALSE(sessionChanges.empty());
    EXPECT_EQ(sessionChanges.back().first, OmixSessionPhase::Measuring);
}
