/*
  OmixBlePlatform.h - Transport interface the connection manager drives.

  OmixNimBLEPlatform implements it on ESP32. Scan results, notifications and
  disconnects may be delivered from the BLE host task; every other call is
  made from the Arduino loop task.
*/
#pragma once

#include <functional>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

enum class OmixAdapterState {
    Unknown,
    Resetting,
    Unsupported,
    Unauthorized,
    PoweredOff,
    PoweredOn
};

struct OmixAdvertisement {
    std::string id;     // BLE address on ESP32
    std::string name;
    int rssi = 0;
    std::vector<std::string> serviceUuids;
};

struct OmixCharacteristicInfo {
    std::string uuid;
    bool read = false;
    bool writeWithResponse = false;
    bool writeWithoutResponse = false;
    bool notify = false;
    bool indicate = false;
};

struct OmixServiceInfo {
    std::string uuid;
    std::vector<OmixCharacteristicInfo> characteristics;
};

class OmixBlePlatform {
    public:
        using ScanCallback = std::function<void(const OmixAdvertisement& advertisement)>;
        using NotifyCallback = std::function<void(const uint8_t* data, size_t length)>;
        using DisconnectCallback = std::function<void(const std::string& id, int reason)>;

        virtual ~OmixBlePlatform() = default;

        virtual bool begin() = 0;
        virtual void end() = 0;

        // Runtime permission prompt where the platform has one; ESP32 always grants.
        virtual bool requestPermissions() = 0;
        virtual OmixAdapterState adapterState() = 0;

        // Peripherals already connected to this host that expose serviceUuid
        virtual std::vector<OmixAdvertisement> connectedPeripherals(const std::string& serviceUuid) = 0;

        virtual bool startScan(ScanCallback onResult) = 0;
        virtual void stopScan() = 0;

        virtual bool connect(const std::string& id, uint16_t mtu, uint32_t timeoutMs) = 0;
        virtual bool discoverServices(std::vector<OmixServiceInfo>& services) = 0;
        virtual bool subscribe(const std::string& service, const std::string& characteristic,
                               NotifyCallback onNotify) = 0;
        virtual bool unsubscribe(const std::string& service, const std::string& characteristic) = 0;
        virtual bool write(const std::string& service, const std::string& characteristic,
                           const uint8_t* data, size_t length, bool withResponse) = 0;

        // Replaces the previous listener; called once per connection.
        virtual void setDisconnectListener(DisconnectCallback onDisconnect) = 0;
        virtual void disconnect() = 0;
        [[nodiscard]] virtual bool isConnected() const = 0;
        virtual int rssi() = 0;

        virtual uint32_t nowMs() = 0;
        virtual void delayMs(uint32_t ms) = 0;

        // Last connected device, kept across reboots for autoConnect()
        virtual bool loadLastDeviceId(std::string& id) = 0;
        virtual bool saveLastDeviceId(const std::string& id) = 0;

        [[nodiscard]] virtual const std::string& lastError() const = 0;
};
