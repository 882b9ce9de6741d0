/*
  OmixConnectionManager.h - Owns the single connection to an Omix analyser.

  Scanning, GATT resolution, the notification subscription and command
  writes all go through here. Callbacks arriving from the BLE host task are
  queued and only acted on from loop().
*/
#pragma once

#include "OmixBlePlatform.h"
#include "OmixDeviceMatch.h"
#include "OmixEventChannel.h"

#include <functional>
#include <mutex>
#include <set>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

enum class OmixConnectionState {
    Disconnected,
    Scanning,
    Connecting,
    Connected,
    Measuring
};

const char* connectionStateName(OmixConnectionState state);

struct OmixScannedDevice {
    std::string id;
    std::string name;
    int rssi;
};

class OmixConnectionManager {
    public:
        using DeviceFoundCallback = std::function<void(const OmixScannedDevice& device)>;
        using MessageCallback = std::function<void(const std::string& message)>;
        using DisconnectCallback = std::function<void()>;

        OmixConnectionManager(OmixBlePlatform& platform, OmixEventChannel& channel);
        ~OmixConnectionManager();

        OmixConnectionManager(const OmixConnectionManager&) = delete;
        OmixConnectionManager& operator=(const OmixConnectionManager&) = delete;

        bool begin();
        void end();

        // Drains queued BLE callbacks and runs the scan timers. Call from loop().
        void loop();

        /**
         * Checks permission and adapter state, reports already-connected
         * peripherals, then scans. Each matching device is reported once.
         * Returns false (and calls onError) when scanning could not start.
         */
        bool startScan(DeviceFoundCallback onFound, MessageCallback onError = nullptr,
                       MessageCallback onDiagnostic = nullptr);
        void stopScan();

        /**
         * Scans for the last connected device and connects to it once seen.
         * Gives up after OMIX_AUTO_CONNECT_WINDOW_MS.
         */
        bool autoConnect(DisconnectCallback onDisconnect = nullptr, MessageCallback onError = nullptr);

        // Blocking connect; tears down any previous connection first.
        bool connect(const std::string& id, DisconnectCallback onDisconnect = nullptr);
        void disconnect();

        bool writeCommand(const uint8_t* data, size_t length);
        bool writeCommand(const std::vector<uint8_t>& packet) {
            return writeCommand(packet.data(), packet.size());
        }

        // Connected <-> Measuring
        void setMeasuring(bool measuring);

        [[nodiscard]] OmixConnectionState state() const {
            return _state;
        }
        [[nodiscard]] bool isConnected() const {
            return _state == OmixConnectionState::Connected || _state == OmixConnectionState::Measuring;
        }
        [[nodiscard]] bool isScanning() const {
            return _state == OmixConnectionState::Scanning;
        }
        [[nodiscard]] const std::string& connectedDeviceId() const {
            return _deviceId;
        }
        [[nodiscard]] const std::string& connectedDeviceName() const {
            return _deviceName;
        }
        [[nodiscard]] const OmixResolvedTransport& transport() const {
            return _transport;
        }
        [[nodiscard]] const std::vector<OmixScannedDevice>& scanResults() const {
            return _candidates;
        }
        [[nodiscard]] const std::string& lastError() const {
            return _lastError;
        }

        std::string connectionInfo() const;
        std::string enumerateDevice();

    private:
        struct InboxItem {
            enum Kind { ADVERTISEMENT, NOTIFICATION, LINK_LOST } kind;
            uint32_t generation;
            OmixAdvertisement advertisement;
            std::vector<uint8_t> data;
            int reason;
        };

        void push(InboxItem item);
        void handleAdvertisement(const OmixAdvertisement& advertisement);
        void handleNotification(const std::vector<uint8_t>& data) const;
        void handleLinkLost(int reason);
        void reportCandidate(const std::string& id, const std::string& name, int rssi);
        void reportScanError(const std::string& message);
        void checkScanTimers();
        std::string scanSummary() const;

        bool waitForAdapter();
        void abortConnection(const std::string& message);
        void clearConnection();
        void fail(const std::string& message);

        OmixBlePlatform& _platform;
        OmixEventChannel& _channel;
        bool _begun;

        OmixConnectionState _state;
        std::string _lastError;

        std::mutex _inboxMutex;
        std::vector<InboxItem> _inbox;

        // Scan bookkeeping
        uint32_t _scanGeneration;
        uint32_t _scanStartedMs;
        bool _diagnosticReported;
        std::set<std::string> _seenIds;
        std::vector<std::string> _nameSamples;
        std::vector<OmixScannedDevice> _candidates;
        DeviceFoundCallback _onDeviceFound;
        MessageCallback _onScanError;
        MessageCallback _onDiagnostic;

        // Auto-connect
        std::string _autoConnectId;
        bool _autoConnectPending;
        DisconnectCallback _autoConnectOnDisconnect;

        // Active connection
        uint32_t _connectionGeneration;
        std::string _deviceId;
        std::string _deviceName;
        OmixResolvedTransport _transport;
        std::vector<OmixServiceInfo> _services;
        bool _subscribed;
        DisconnectCallback _onDisconnect;
};
