/*
  OmixArduinoBLE.cpp - Library for connecting to a DiFluid Omix
  coffee analyser over BLE and uploading its measurements.
*/
#include "OmixArduinoBLE.h"
#include "OmixLog.h"

OmixArduinoBLE::OmixArduinoBLE(OmixBlePlatform& platform, OmixMeasurementUploader& uploader, const bool debug)
    : _manager(platform, _channel),
      _session(_channel),
      _syncQueue(uploader) {
    omixSetDebug(debug);

    _infoSubscription = _channel.subscribe([this](const OmixEvent& event) {
        handleEvent(event);
    });

    _session.onPhaseChange([this](const OmixSessionPhase phase, const OmixSessionOutcome outcome) {
        handleSessionChange(phase, outcome);
    });

    _session.onComplete([this](const OmixMeasurement& measurement) {
        if (_onMeasurementComplete) _onMeasurementComplete(measurement);
    });
}

OmixArduinoBLE::~OmixArduinoBLE() {
    _channel.unsubscribe(_infoSubscription);
    end();
}

bool OmixArduinoBLE::begin() {
    OMIX_LOGI("OmixArduinoBLE %s starting", LIBRARY_VERSION);

    if (!_manager.begin()) {
        fail(_manager.lastError());
        return false;
    }

    return true;
}

void OmixArduinoBLE::end() {
    _manager.end();
}

void OmixArduinoBLE::loop() {
    _manager.loop();
}

/* Connection */

bool OmixArduinoBLE::startScan(DeviceFoundCallback onFound) {
    const bool started = _manager.startScan(
        std::move(onFound),
        [this](const std::string& message) {
            _lastError = message;
            if (_onError) _onError(message);
        },
        [this](const std::string& message) {
            if (_onDiagnostic) _onDiagnostic(message);
        });

    if (!started) {
        _lastError = _manager.lastError();
    }

    return started;
}

void OmixArduinoBLE::stopScan() {
    _manager.stopScan();
}

bool OmixArduinoBLE::autoConnect() {
    const bool started = _manager.autoConnect(
        [this]() {
            handleLinkLost();
        },
        [this](const std::string& message) {
            _lastError = message;
            if (_onError) _onError(message);
        });

    if (!started) {
        _lastError = _manager.lastError();
    }

    return started;
}

bool OmixArduinoBLE::connect(const std::string& id) {
    if (!_manager.connect(id, [this]() { handleLinkLost(); })) {
        fail(_manager.lastError());
        return false;
    }

    return true;
}

void OmixArduinoBLE::disconnect() {
    _manager.disconnect();
}

void OmixArduinoBLE::handleLinkLost() {
    if (_session.isMeasuring()) {
        _session.abandon(OmixSessionOutcome::Disconnected);
    }

    _deviceInfo = OmixDeviceInfo();

    if (_onDisconnect) _onDisconnect();
}

/* Measurement */

bool OmixArduinoBLE::measure(const OmixCoffeeType coffeeType) {
    if (!_manager.isConnected()) {
        fail("No DiFluid device connected");
        return false;
    }

    if (_session.isMeasuring()) {
        fail("A measurement is already in progress");
        return false;
    }

    _session.setDeviceIdentifier(_manager.connectedDeviceId());
    _session.start(coffeeType);

    if (!_manager.writeCommand(buildStartMeasurement(coffeeType))) {
        _session.abandon(OmixSessionOutcome::Failed);
        fail(_manager.lastError());
        return false;
    }

    return true;
}

bool OmixArduinoBLE::requestDeviceInfo() {
    if (!_manager.isConnected()) {
        fail("No DiFluid device connected");
        return false;
    }

    const std::vector<uint8_t> commands[] = {
        buildGetSerialNumber(),
        buildGetFirmwareVersion(),
        buildGetModel(),
        buildGetBattery(),
    };

    for (const auto& command : commands) {
        if (!_manager.writeCommand(command)) {
            fail(_manager.lastError());
            return false;
        }
    }

    return true;
}

bool OmixArduinoBLE::saveMeasurement(const OmixLinkType linkType, const std::string& targetId) {
    const std::optional<OmixMeasurement>& completed = _session.result();

    if (!completed) {
        fail("No completed measurement to save");
        return false;
    }

    OmixMeasurement record = *completed;
    if (linkType != OmixLinkType::None && !targetId.empty()) {
        record.link.type = linkType;
        record.link.targetId = targetId;
    }

    _session.clear();

    if (!_syncQueue.save(std::move(record))) {
        _lastError = _syncQueue.lastError();
        return false;
    }

    return true;
}

bool OmixArduinoBLE::syncPending() {
    if (!_syncQueue.syncPending()) {
        _lastError = _syncQueue.lastError();
        return false;
    }

    return true;
}

bool OmixArduinoBLE::linkMeasurement(const std::string& measurementId, const OmixLinkType linkType,
                                     const std::string& targetId) {
    if (!_syncQueue.linkMeasurement(measurementId, linkType, targetId)) {
        _lastError = _syncQueue.lastError();
        return false;
    }

    return true;
}

void OmixArduinoBLE::clearCurrent() {
    if (_session.isMeasuring()) {
        _manager.setMeasuring(false);
    }
    _session.clear();
}

void OmixArduinoBLE::handleEvent(const OmixEvent& event) {
    if (updateDeviceInfo(_deviceInfo, event)) {
        if (_onDeviceInfo) _onDeviceInfo(_deviceInfo);
        return;
    }

    if (const auto* unknown = std::get_if<UnknownEvent>(&event)) {
        OMIX_LOGD("Unhandled packet func 0x%02x cmd 0x%02x", unknown->func, unknown->cmd);
    }
}

void OmixArduinoBLE::handleSessionChange(const OmixSessionPhase phase, const OmixSessionOutcome outcome) {
    if (phase == OmixSessionPhase::Measuring) {
        _session.setDeviceIdentifier(_manager.connectedDeviceId());
    }

    _manager.setMeasuring(_session.isMeasuring());

    if (_onSessionChange) _onSessionChange(phase, outcome);
}

/* Accessors */

bool OmixArduinoBLE::isConnected() const {
    return _manager.isConnected();
}

bool OmixArduinoBLE::isScanning() const {
    return _manager.isScanning();
}

bool OmixArduinoBLE::isMeasuring() const {
    return _session.isMeasuring();
}

OmixConnectionState OmixArduinoBLE::connectionState() const {
    return _manager.state();
}

const OmixDeviceInfo& OmixArduinoBLE::deviceInfo() const {
    return _deviceInfo;
}

const OmixSessionState& OmixArduinoBLE::session() const {
    return _session.state();
}

const std::optional<OmixMeasurement>& OmixArduinoBLE::result() const {
    return _session.result();
}

const std::vector<OmixScannedDevice>& OmixArduinoBLE::scanResults() const {
    return _manager.scanResults();
}

const std::vector<OmixMeasurement>& OmixArduinoBLE::history() const {
    return _syncQueue.history();
}

size_t OmixArduinoBLE::pendingCount() const {
    return _syncQueue.pendingCount();
}

const std::string& OmixArduinoBLE::lastError() const {
    return _lastError;
}

std::string OmixArduinoBLE::connectionInfo() const {
    return _manager.connectionInfo();
}

std::string OmixArduinoBLE::enumerateDevice() {
    return _manager.enumerateDevice();
}

void OmixArduinoBLE::fail(const std::string& message) {
    _lastError = message;
    OMIX_LOGW("%s", message.c_str());
}
