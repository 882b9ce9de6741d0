#include "OmixDeviceInfo.h"
#include "OmixEventChannel.h"
#include "OmixNotificationRouter.h"
#include "test_packets.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(OmixNotificationRouter, StartAcknowledgements) {
    const auto started = routeNotification(std::vector<uint8_t>{0xDF, 0xDF, 0x03, 0x01, 0x01, 0x01, 0xC4});
    ASSERT_TRUE(started.has_value());
    EXPECT_TRUE(std::holds_alternative<MeasurementStartedEvent>(*started));
    EXPECT_STREQ(eventName(*started), "measurement_started");

    const auto busy = routeNotification(std::vector<uint8_t>{0xDF, 0xDF, 0x03, 0x01, 0x01, 0x02, 0xC5});
    ASSERT_TRUE(busy.has_value());
    EXPECT_TRUE(std::holds_alternative<MeasurementBusyEvent>(*busy));

    const auto failed = routeNotification(startAckPacket(MEAS_RESPONSE_FAILED));
    ASSERT_TRUE(failed.has_value());
    ASSERT_TRUE(std::holds_alternative<MeasurementFailedEvent>(*failed));
    EXPECT_EQ(std::get<MeasurementFailedEvent>(*failed).status, MEAS_RESPONSE_FAILED);
}

TEST(OmixNotificationRouter, DetectionResults) {
    const auto moisture = routeNotification(moisturePacket(11.5f, 650.0f));
    ASSERT_TRUE(moisture.has_value());
    ASSERT_TRUE(std::holds_alternative<MoistureDensityEvent>(*moisture));
    EXPECT_FLOAT_EQ(std::get<MoistureDensityEvent>(*moisture).data.moisture, 11.5f);
    EXPECT_STREQ(eventName(*moisture), "moisture_density");

    const auto agtron = routeNotification(agtronPacket(58.5f));
    ASSERT_TRUE(agtron.has_value());
    ASSERT_TRUE(std::holds_alternative<AgtronEvent>(*agtron));
    EXPECT_FLOAT_EQ(std::get<AgtronEvent>(*agtron).data.agtronMean, 58.5f);
    EXPECT_EQ(std::get<AgtronEvent>(*agtron).data.pieChart8[2], 12);

    const auto start = routeNotification(std::vector<uint8_t>{0xDF, 0xDF, 0x03, 0x07, 0x01, 0x01, 0xCA});
    ASSERT_TRUE(start.has_value());
    ASSERT_TRUE(std::holds_alternative<WaterActivityStartEvent>(*start));
    EXPECT_EQ(std::get<WaterActivityStartEvent>(*start).startStatus, 1);

    EXPECT_TRUE(std::holds_alternative<BeanTypeEvent>(*routeNotification(beanTypePacket(4, true))));
    EXPECT_TRUE(std::holds_alternative<WaterActivityEvent>(*routeNotification(waterActivityPacket(true, 0.5f))));
    EXPECT_TRUE(std::holds_alternative<EnvironmentEvent>(*routeNotification(environmentPacket(25.0f))));
}

TEST(OmixNotificationRouter, DeviceInfoReplies) {
    const auto serial = routeNotification(
        std::vector<uint8_t>{0xDF, 0xDF, 0x05, 0x09, 0x08, 'O', 'M', 'X', 0x00, '1', '2', '3', 0x00, 0x5E});
    ASSERT_TRUE(serial.has_value());
    ASSERT_TRUE(std::holds_alternative<SerialNumberEvent>(*serial));
    EXPECT_EQ(std::get<SerialNumberEvent>(*serial).value, "OMX123");

    const auto battery =
        routeNotification(std::vector<uint8_t>{0xDF, 0xDF, 0x05, 0x1D, 0x04, 0x02, 0x50, 0x03, 0x64, 0x9D});
    ASSERT_TRUE(battery.has_value());
    ASSERT_TRUE(std::holds_alternative<BatteryEvent>(*battery));
    EXPECT_EQ(std::get<BatteryEvent>(*battery).data.mainBattery, 80);
    EXPECT_EQ(std::get<BatteryEvent>(*battery).data.baseCharging, CHARGING_FULL);

    const uint8_t version[] = {'V', '0', '2', '1'};
    const auto firmware = routeNotification(buildPacket(FUNC_DEVICE_INFO, CMD_GET_VERSION, version, sizeof(version)));
    ASSERT_TRUE(firmware.has_value());
    EXPECT_EQ(std::get<FirmwareVersionEvent>(*firmware).value, "V021");
}

TEST(OmixNotificationRouter, MalformedBuffersAreDropped) {
    EXPECT_FALSE(routeNotification(std::vector<uint8_t>{0xDF, 0xDF, 0x03, 0x01, 0x01, 0x01, 0xC5}).has_value());
    EXPECT_FALSE(routeNotification(std::vector<uint8_t>{0xDF, 0xDF}).has_value());
    EXPECT_FALSE(routeNotification(nullptr, 0).has_value());
}

TEST(OmixNotificationRouter, UnknownCommandsAreReported) {
    const auto unknown = routeNotification(std::vector<uint8_t>{0xDF, 0xDF, 0x09, 0x01, 0x00, 0xC8});
    ASSERT_TRUE(unknown.has_value());
    ASSERT_TRUE(std::holds_alternative<UnknownEvent>(*unknown));
    EXPECT_EQ(std::get<UnknownEvent>(*unknown).func, 0x09);
    EXPECT_EQ(std::get<UnknownEvent>(*unknown).cmd, 0x01);
    EXPECT_STREQ(eventName(*unknown), "unknown");
}

TEST(OmixNotificationRouter, ShortPayloadIsUnknown) {
    const std::vector<uint8_t> truncated(MOISTURE_DENSITY_PAYLOAD_LENGTH - 1, 0);
    const auto event = routeNotification(detectionPacket(CMD_MOISTURE_DENSITY, truncated));

    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(std::holds_alternative<UnknownEvent>(*event));
    EXPECT_EQ(std::get<UnknownEvent>(*event).cmd, CMD_MOISTURE_DENSITY);

    const auto battery = routeNotification(buildPacket(FUNC_DEVICE_INFO, CMD_GET_BATTERY, std::vector<uint8_t>{1, 2}));
    ASSERT_TRUE(battery.has_value());
    EXPECT_TRUE(std::holds_alternative<UnknownEvent>(*battery));
}

TEST(OmixEventChannel, FansOutAndUnsubscribes) {
    OmixEventChannel channel;
    int first = 0;
    int second = 0;

    const size_t a = channel.subscribe([&first](const OmixEvent&) { first++; });
    channel.subscribe([&second](const OmixEvent&) { second++; });
    EXPECT_EQ(channel.listenerCount(), 2u);

    channel.publish(OmixEvent{MeasurementStartedEvent{}});
    channel.unsubscribe(a);
    channel.publish(OmixEvent{MeasurementBusyEvent{}});

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);
    EXPECT_EQ(channel.listenerCount(), 1u);
}

TEST(OmixEventChannel, ListenerMayUnsubscribeItself) {
    OmixEventChannel channel;
    int calls = 0;
    size_t id = 0;

    id = channel.subscribe([&](const OmixEvent&) {
        calls++;
        channel.unsubscribe(id);
    });

    channel.publish(OmixEvent{MeasurementStartedEvent{}});
    channel.publish(OmixEvent{MeasurementStartedEvent{}});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(channel.listenerCount(), 0u);
}

TEST(OmixDeviceInfo, FoldsDeviceInfoReplies) {
    OmixDeviceInfo info;

    EXPECT_TRUE(updateDeviceInfo(info, OmixEvent{SerialNumberEvent{"OMX123"}}));
    EXPECT_TRUE(updateDeviceInfo(info, OmixEvent{DeviceModelEvent{"Omix Plus"}}));
    EXPECT_TRUE(updateDeviceInfo(info, OmixEvent{BatteryEvent{BatteryStatus{CHARGING_NOT_CHARGING, 55, 0, 0}}}));
    EXPECT_FALSE(updateDeviceInfo(info, OmixEvent{MeasurementStartedEvent{}}));

    EXPECT_EQ(info.serialNumber, "OMX123");
    EXPECT_EQ(info.model, "Omix Plus");
    EXPECT_TRUE(info.firmwareVersion.empty());
    ASSERT_TRUE(info.battery.has_value());
    EXPECT_EQ(info.battery->mainBattery, 55);
}
