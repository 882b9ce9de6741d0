/*
  OmixArduinoBLE.h - Library for connecting to a DiFluid Omix
  coffee analyser over BLE and uploading its measurements.

  One measurement reports bean type, moisture and density, environment,
  Agtron roast colour and, when the bean calls for it, water activity.

  Known Bugs:
    * Measurement timestamps need the system clock set (SNTP) beforehand
*/
#pragma once

#include "src/OmixBlePlatform.h"
#include "src/OmixCommands.h"
#include "src/OmixConfig.h"
#include "src/OmixConnectionManager.h"
#include "src/OmixDeviceInfo.h"
#include "src/OmixEventChannel.h"
#include "src/OmixMeasurement.h"
#include "src/OmixMeasurementSession.h"
#include "src/OmixSyncQueue.h"

#ifdef ARDUINO
#include "src/OmixNimBLEPlatform.h"
#endif

#include <functional>
#include <optional>
#include <stddef.h>
#include <string>
#include <utility>
#include <vector>

class OmixArduinoBLE {
    public:
        using DeviceFoundCallback = OmixConnectionManager::DeviceFoundCallback;
        using MessageCallback = OmixConnectionManager::MessageCallback;
        using MeasurementCallback = std::function<void(const OmixMeasurement& measurement)>;
        using SessionCallback = std::function<void(OmixSessionPhase phase, OmixSessionOutcome outcome)>;
        using DeviceInfoCallback = std::function<void(const OmixDeviceInfo& info)>;
        using DisconnectCallback = std::function<void()>;

        OmixArduinoBLE(OmixBlePlatform& platform, OmixMeasurementUploader& uploader, bool debug);
        ~OmixArduinoBLE();

        bool begin();
        void end();
        void loop();

        bool startScan(DeviceFoundCallback onFound = nullptr);
        void stopScan();
        bool autoConnect();
        bool connect(const std::string& id);
        void disconnect();

        bool measure(OmixCoffeeType coffeeType = OmixCoffeeType::Auto);
        bool requestDeviceInfo();

        /**
         * Stores the completed measurement, optionally linked to an inventory
         * item or roast. Returns false if nothing was complete or the upload
         * failed; a failed upload is queued for syncPending().
         */
        bool saveMeasurement(OmixLinkType linkType = OmixLinkType::None, const std::string& targetId = "");
        bool syncPending();
        bool linkMeasurement(const std::string& measurementId, OmixLinkType linkType, const std::string& targetId);
        void clearCurrent();

        void onMeasurementComplete(MeasurementCallback callback) {
            _onMeasurementComplete = std::move(callback);
        }
        void onSessionChange(SessionCallback callback) {
            _onSessionChange = std::move(callback);
        }
        void onDeviceInfo(DeviceInfoCallback callback) {
            _onDeviceInfo = std::move(callback);
        }
        void onDisconnect(DisconnectCallback callback) {
            _onDisconnect = std::move(callback);
        }
        void onError(MessageCallback callback) {
            _onError = std::move(callback);
        }
        void onDiagnostic(MessageCallback callback) {
            _onDiagnostic = std::move(callback);
        }

        [[nodiscard]] bool isConnected() const;
        [[nodiscard]] bool isScanning() const;
        [[nodiscard]] bool isMeasuring() const;
        [[nodiscard]] OmixConnectionState connectionState() const;
        [[nodiscard]] const OmixDeviceInfo& deviceInfo() const;
        [[nodiscard]] const OmixSessionState& session() const;
        [[nodiscard]] const std::optional<OmixMeasurement>& result() const;
        [[nodiscard]] const std::vector<OmixScannedDevice>& scanResults() const;
        [[nodiscard]] const std::vector<OmixMeasurement>& history() const;
        [[nodiscard]] size_t pendingCount() const;
        [[nodiscard]] const std::string& lastError() const;
        std::string connectionInfo() const;
        std::string enumerateDevice();

    private:
        void handleEvent(const OmixEvent& event);
        void handleSessionChange(OmixSessionPhase phase, OmixSessionOutcome outcome);
        void handleLinkLost();
        void fail(const std::string& message);

        std::string _lastError;

        OmixEventChannel _channel;
        OmixConnectionManager _manager;
        OmixMeasurementSession _session;
        OmixSyncQueue _syncQueue;
        OmixDeviceInfo _deviceInfo;
        size_t _infoSubscription;

        MeasurementCallback _onMeasurementComplete;
        SessionCallback _onSessionChange;
        DeviceInfoCallback _onDeviceInfo;
        DisconnectCallback _onDisconnect;
        MessageCallback _onError;
        MessageCallback _onDiagnostic;
};
