/*
  OmixNimBLEPlatform.h - OmixBlePlatform on top of NimBLE-Arduino 2.x (ESP32).
*/
#pragma once

#include "OmixBlePlatform.h"
#include "OmixPeerAddresses.h"

#include <Arduino.h>
#include <NimBLEAdvertisedDevice.h>
#include <NimBLEClient.h>
#include <NimBLEDevice.h>
#include <NimBLEUtils.h>

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

class OmixNimBLEPlatform;

class OmixScanCallbacks : public NimBLEScanCallbacks {
    public:
        explicit OmixScanCallbacks(OmixNimBLEPlatform& owner) : _owner(owner) {}

        void onResult(const NimBLEAdvertisedDevice* advertisedDevice) override;
        void onScanEnd(const NimBLEScanResults& scanResults, int reason) override;

    private:
        OmixNimBLEPlatform& _owner;
};

class OmixClientCallbacks : public NimBLEClientCallbacks {
    public:
        explicit OmixClientCallbacks(OmixNimBLEPlatform& owner) : _owner(owner) {}

        void onConnect(NimBLEClient* pClient) override;
        void onDisconnect(NimBLEClient* pClient, int reason) override;

    private:
        OmixNimBLEPlatform& _owner;
};

class OmixNimBLEPlatform : public OmixBlePlatform {
    public:
        OmixNimBLEPlatform();
        ~OmixNimBLEPlatform() override;

        bool begin() override;
        void end() override;

        bool requestPermissions() override;
        OmixAdapterState adapterState() override;
        std::vector<OmixAdvertisement> connectedPeripherals(const std::string& serviceUuid) override;

        bool startScan(ScanCallback onResult) override;
        void stopScan() override;

        bool connect(const std::string& id, uint16_t mtu, uint32_t timeoutMs) override;
        bool discoverServices(std::vector<OmixServiceInfo>& services) override;
        bool subscribe(const std::string& service, const std::string& characteristic,
                       NotifyCallback onNotify) override;
        bool unsubscribe(const std::string& service, const std::string& characteristic) override;
        bool write(const std::string& service, const std::string& characteristic,
                   const uint8_t* data, size_t length, bool withResponse) override;

        void setDisconnectListener(DisconnectCallback onDisconnect) override;
        void disconnect() override;
        [[nodiscard]] bool isConnected() const override;
        int rssi() override;

        uint32_t nowMs() override;
        void delayMs(uint32_t ms) override;

        bool loadLastDeviceId(std::string& id) override;
        bool saveLastDeviceId(const std::string& id) override;

        [[nodiscard]] const std::string& lastError() const override {
            return _lastError;
        }

    private:
        friend class OmixScanCallbacks;
        friend class OmixClientCallbacks;

        void handleAdvertisement(const NimBLEAdvertisedDevice* advertisedDevice);
        void handleDisconnect(NimBLEClient* pClient, int reason);
        NimBLERemoteCharacteristic* findCharacteristic(const std::string& service, const std::string& characteristic);
        void setError(const std::string& context);

        bool _initialized;
        std::string _lastError;

        NimBLEScan* _pBLEScan;
        NimBLEClient* _pClient;
        OmixScanCallbacks _scanCallbacks;
        OmixClientCallbacks _clientCallbacks;

        // Touched from the NimBLE host task
        std::mutex _mutex;
        ScanCallback _onScanResult;
        DisconnectCallback _onDisconnect;
        OmixPeerAddresses<NimBLEAddress> _addresses;

        std::map<std::pair<std::string, std::string>, NimBLERemoteCharacteristic*> _characteristics;
};
