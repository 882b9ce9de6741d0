/*
  OmixConnectionManager.cpp - Owns the single connection to an Omix analyser.
*/
#include "OmixConnectionManager.h"
#include "OmixConfig.h"
#include "OmixLog.h"
#include "OmixNotificationRouter.h"

#include <algorithm>
#include <utility>

const char* connectionStateName(const OmixConnectionState state) {
    switch (state) {
        case OmixConnectionState::Disconnected: return "DISCONNECTED";
        case OmixConnectionState::Scanning:     return "SCANNING";
        case OmixConnectionState::Connecting:   return "CONNECTING";
        case OmixConnectionState::Connected:    return "CONNECTED";
        case OmixConnectionState::Measuring:    return "MEASURING";
        default:                                return "UNKNOWN";
    }
}

OmixConnectionManager::OmixConnectionManager(OmixBlePlatform& platform, OmixEventChannel& channel)
    : _platform(platform),
      _channel(channel),
      _begun(false),
      _state(OmixConnectionState::Disconnected),
      _scanGeneration(0),
      _scanStartedMs(0),
      _diagnosticReported(false),
      _autoConnectPending(false),
      _connectionGeneration(0),
      _subscribed(false) {
}

OmixConnectionManager::~OmixConnectionManager() {
    end();
}

bool OmixConnectionManager::begin() {
    if (_begun) {
        return true;
    }

    if (!_platform.begin()) {
        fail("BLE initialisation failed: " + _platform.lastError());
        return false;
    }

    _begun = true;
    OMIX_LOGD("Connection manager started");
    return true;
}

void OmixConnectionManager::end() {
    if (!_begun) {
        return;
    }

    stopScan();
    disconnect();
    _platform.setDisconnectListener(nullptr);
    _platform.end();

    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        _inbox.clear();
    }

    _begun = false;
    OMIX_LOGD("Connection manager stopped");
}

void OmixConnectionManager::push(InboxItem item) {
    std::lock_guard<std::mutex> lock(_inboxMutex);
    _inbox.push_back(std::move(item));
}

void OmixConnectionManager::loop() {
    std::vector<InboxItem> items;
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        items.swap(_inbox);
    }

    for (const auto& item : items) {
        switch (item.kind) {
            case InboxItem::ADVERTISEMENT:
                if (item.generation == _scanGeneration && isScanning()) {
                    handleAdvertisement(item.advertisement);
                }
                break;

            case InboxItem::NOTIFICATION:
                if (item.generation == _connectionGeneration && isConnected()) {
                    handleNotification(item.data);
                }
                break;

            case InboxItem::LINK_LOST:
                if (item.generation == _connectionGeneration && isConnected()) {
                    handleLinkLost(item.reason);
                }
                break;
        }
    }

    if (_autoConnectPending) {
        _autoConnectPending = false;
        const std::string id = _autoConnectId;
        const MessageCallback onError = _onScanError;

        OMIX_LOGI("Saved device %s found, connecting...", id.c_str());

        if (!connect(id, std::move(_autoConnectOnDisconnect))) {
            if (onError) onError(_lastError);
        }
    }

    checkScanTimers();
}

/* Scanning */

bool OmixConnectionManager::waitForAdapter() {
    const uint32_t start = _platform.nowMs();

    while (true) {
        switch (_platform.adapterState()) {
            case OmixAdapterState::PoweredOn:
                return true;
            case OmixAdapterState::Unsupported:
                fail("This device does not support Bluetooth Low Energy.");
                return false;
            case OmixAdapterState::Unauthorized:
                fail("Bluetooth permission not granted. Please enable Bluetooth access for this app in Settings.");
                return false;
            case OmixAdapterState::PoweredOff:
                fail("Bluetooth is turned off. Please enable Bluetooth in Settings.");
                return false;
            case OmixAdapterState::Unknown:
            case OmixAdapterState::Resetting:
                break;
        }

        if (_platform.nowMs() - start >= OMIX_ADAPTER_TIMEOUT_MS) {
            fail("Bluetooth did not become ready in time. Please check Bluetooth is enabled.");
            return false;
        }

        _platform.delayMs(100);
    }
}

bool OmixConnectionManager::startScan(DeviceFoundCallback onFound, MessageCallback onError,
                                      MessageCallback onDiagnostic) {
    if (!_begun) {
        fail("BLE not started, call begin() first");
        if (onError) onError(_lastError);
        return false;
    }

    if (isConnected() || _state == OmixConnectionState::Connecting) {
        fail("Already connected to " + _deviceId + ", disconnect before scanning");
        if (onError) onError(_lastError);
        return false;
    }

    if (isScanning()) {
        stopScan();
    }

    if (!_platform.requestPermissions()) {
        fail("Bluetooth permission not granted. Please enable Bluetooth access for this app in Settings.");
        if (onError) onError(_lastError);
        return false;
    }

    if (!waitForAdapter()) {
        if (onError) onError(_lastError);
        return false;
    }

    _onDeviceFound = std::move(onFound);
    _onScanError = std::move(onError);
    _onDiagnostic = std::move(onDiagnostic);
    _seenIds.clear();
    _nameSamples.clear();
    _candidates.clear();
    _diagnosticReported = false;

    const uint32_t generation = ++_scanGeneration;
    _state = OmixConnectionState::Scanning;
    _scanStartedMs = _platform.nowMs();

    if (_onDiagnostic) _onDiagnostic("BLE powered on, starting scan...");

    // Another app may already hold the link; those never advertise
    for (const char* serviceUuid : {SUUID_OMIX_SDK, SUUID_OMIX_APP}) {
        const std::vector<OmixAdvertisement> connected = _platform.connectedPeripherals(serviceUuid);
        OMIX_LOGD("Found %u already-connected peripheral(s) with %s", static_cast<unsigned>(connected.size()),
                  serviceUuid);

        for (const auto& peripheral : connected) {
            reportCandidate(peripheral.id, peripheral.name, peripheral.rssi != 0 ? peripheral.rssi : OMIX_RSSI_CONNECTED);
        }
    }

    const bool started = _platform.startScan([this, generation](const OmixAdvertisement& advertisement) {
        InboxItem item{InboxItem::ADVERTISEMENT, generation, advertisement, {}, 0};
        push(std::move(item));
    });

    if (!started) {
        _state = OmixConnectionState::Disconnected;
        _scanGeneration++;
        reportScanError("Failed to start BLE scan: " + _platform.lastError());
        return false;
    }

    OMIX_LOGI("Scanning for DiFluid devices...");
    return true;
}

void OmixConnectionManager::stopScan() {
    if (!isScanning()) {
        return;
    }

    _platform.stopScan();
    _scanGeneration++;
    _state = OmixConnectionState::Disconnected;
    _autoConnectId.clear();
    _autoConnectPending = false;
    OMIX_LOGD("Scan stopped, %u candidate(s)", static_cast<unsigned>(_candidates.size()));
}

void OmixConnectionManager::handleAdvertisement(const OmixAdvertisement& advertisement) {
    _seenIds.insert(advertisement.id);

    if (!advertisement.name.empty() && _nameSamples.size() < OMIX_SCAN_NAME_SAMPLES &&
        std::find(_nameSamples.begin(), _nameSamples.end(), advertisement.name) == _nameSamples.end()) {
        _nameSamples.push_back(advertisement.name);
    }

    if (!isOmixAdvertisement(advertisement)) {
        return;
    }

    reportCandidate(advertisement.id, advertisement.name,
                    advertisement.rssi != 0 ? advertisement.rssi : OMIX_RSSI_UNKNOWN);
}

void OmixConnectionManager::reportCandidate(const std::string& id, const std::string& name, const int rssi) {
    for (const auto& candidate : _candidates) {
        if (candidate.id == id) {
            return;
        }
    }

    OmixScannedDevice device{id, name.empty() ? OMIX_DEFAULT_DEVICE_NAME : name, rssi};
    _candidates.push_back(device);

    OMIX_LOGI("DiFluid device found: %s (%s) RSSI %d", device.name.c_str(), device.id.c_str(), device.rssi);

    if (!_autoConnectId.empty() && device.id == _autoConnectId) {
        _autoConnectPending = true;
    }

    if (_onDeviceFound) {
        _onDeviceFound(device);
    }
}

void OmixConnectionManager::reportScanError(const std::string& message) {
    fail(message);
    if (_onScanError) _onScanError(message);
}

std::string OmixConnectionManager::scanSummary() const {
    std::string names;
    for (const auto& name : _nameSamples) {
        if (!names.empty()) names += ", ";
        names += name;
    }

    return "Scan active: " + std::to_string(_seenIds.size()) + " total device(s), " +
           std::to_string(_candidates.size()) + " DiFluid match(es). Named devices nearby: " +
           (names.empty() ? std::string("(none)") : names);
}

void OmixConnectionManager::checkScanTimers() {
    if (!isScanning()) {
        return;
    }

    const uint32_t elapsed = _platform.nowMs() - _scanStartedMs;

    if (!_diagnosticReported && elapsed >= OMIX_SCAN_DIAGNOSTIC_MS) {
        _diagnosticReported = true;

        if (_candidates.empty()) {
            const std::string summary = scanSummary();
            OMIX_LOGW("%s", summary.c_str());
            if (_onDiagnostic) _onDiagnostic(summary);
        }
    }

    if (!_autoConnectId.empty() && elapsed >= OMIX_AUTO_CONNECT_WINDOW_MS) {
        const std::string id = _autoConnectId;
        stopScan();
        reportScanError("Saved DiFluid device " + id + " not found nearby");
    }
}

bool OmixConnectionManager::autoConnect(DisconnectCallback onDisconnect, MessageCallback onError) {
    std::string savedId;

    if (!_platform.loadLastDeviceId(savedId) || savedId.empty()) {
        fail("No saved DiFluid device to reconnect to");
        if (onError) onError(_lastError);
        return false;
    }

    OMIX_LOGI("Auto-connecting to saved device %s", savedId.c_str());

    // The callback and error sink are stored by startScan(); the id must be
    // set afterwards since startScan() may stop a previous scan.
    if (!startScan(nullptr, std::move(onError))) {
        return false;
    }

    _autoConnectId = savedId;
    _autoConnectOnDisconnect = std::move(onDisconnect);

    for (const auto& candidate : _candidates) {
        if (candidate.id == savedId) {
            _autoConnectPending = true;
        }
    }

    return true;
}

/* Connection */

bool OmixConnectionManager::connect(const std::string& id, DisconnectCallback onDisconnect) {
    if (!_begun) {
        fail("BLE not started, call begin() first");
        return false;
    }

    if (id.empty()) {
        fail("No device identifier given");
        return false;
    }

    std::string name = OMIX_DEFAULT_DEVICE_NAME;
    for (const auto& candidate : _candidates) {
        if (candidate.id == id) {
            name = candidate.name;
        }
    }

    stopScan();
    disconnect();
    _candidates.clear();

    _state = OmixConnectionState::Connecting;
    OMIX_LOGI("Connecting to %s (%s)...", name.c_str(), id.c_str());

    if (!_platform.connect(id, OMIX_REQUESTED_MTU, OMIX_CONNECT_TIMEOUT_MS)) {
        _state = OmixConnectionState::Disconnected;
        fail("Failed to connect to " + id + ": " + _platform.lastError());
        return false;
    }

    std::vector<OmixServiceInfo> services;
    if (!_platform.discoverServices(services)) {
        abortConnection("Service discovery failed: " + _platform.lastError());
        return false;
    }

    OMIX_LOGD("All services (%u): %s", static_cast<unsigned>(services.size()), describeServices(services).c_str());
    for (const auto& service : services) {
        OMIX_LOGD("  svc %s: %s", service.uuid.c_str(),
                  service.characteristics.empty() ? "(no chars)"
                                                  : describeCharacteristics(service.characteristics).c_str());
    }

    OmixResolvedTransport transport;
    std::string error;
    if (!resolveTransport(services, transport, error)) {
        abortConnection(error);
        return false;
    }

    const uint32_t generation = ++_connectionGeneration;

    _platform.setDisconnectListener([this, generation](const std::string&, const int reason) {
        InboxItem item{InboxItem::LINK_LOST, generation, {}, {}, reason};
        push(std::move(item));
    });

    OMIX_LOGD("Subscribing to notifications on char %s", transport.notifyCharacteristicUuid.c_str());

    // Only the notify characteristic; the device routes replies by this subscription
    const bool subscribed = _platform.subscribe(
        transport.serviceUuid, transport.notifyCharacteristicUuid,
        [this, generation](const uint8_t* data, const size_t length) {
            InboxItem item{InboxItem::NOTIFICATION, generation, {}, std::vector<uint8_t>(data, data + length), 0};
            push(std::move(item));
        });

    if (!subscribed) {
        abortConnection("Failed to subscribe to " + transport.notifyCharacteristicUuid + ": " +
                        _platform.lastError());
        return false;
    }

    _deviceId = id;
    _deviceName = name;
    _transport = transport;
    _services = std::move(services);
    _subscribed = true;
    _onDisconnect = std::move(onDisconnect);
    _state = OmixConnectionState::Connected;

    if (!_platform.saveLastDeviceId(id)) {
        OMIX_LOGW("Could not persist last device: %s", _platform.lastError().c_str());
    }

    OMIX_LOGI("Connected to %s, write %s, notify %s", _deviceName.c_str(),
              _transport.writeCharacteristicUuid.c_str(), _transport.notifyCharacteristicUuid.c_str());
    return true;
}

void OmixConnectionManager::abortConnection(const std::string& message) {
    // Events from the half-open link must not reach the new state
    _connectionGeneration++;
    _platform.disconnect();
    clearConnection();
    fail(message);
}

void OmixConnectionManager::clearConnection() {
    _deviceId.clear();
    _deviceName.clear();
    _transport = OmixResolvedTransport();
    _services.clear();
    _subscribed = false;
    _state = OmixConnectionState::Disconnected;
}

void OmixConnectionManager::disconnect() {
    if (!isConnected()) {
        return;
    }

    OMIX_LOGI("Disconnecting from %s", _deviceName.c_str());
    _connectionGeneration++;

    if (_subscribed && !_platform.unsubscribe(_transport.serviceUuid, _transport.notifyCharacteristicUuid)) {
        OMIX_LOGD("Unsubscribe failed: %s", _platform.lastError().c_str());
    }

    _platform.disconnect();
    clearConnection();

    DisconnectCallback callback = std::move(_onDisconnect);
    _onDisconnect = nullptr;
    if (callback) callback();
}

void OmixConnectionManager::handleLinkLost(const int reason) {
    OMIX_LOGW("%s disconnected, reason: %d", _deviceName.c_str(), reason);
    _connectionGeneration++;
    clearConnection();

    DisconnectCallback callback = std::move(_onDisconnect);
    _onDisconnect = nullptr;
    if (callback) callback();
}

void OmixConnectionManager::handleNotification(const std::vector<uint8_t>& data) const {
    omixLogBytes("Notify RX", data.data(), data.size());

    const std::optional<OmixEvent> event = routeNotification(data);
    if (!event) {
        OMIX_LOGD("Dropped malformed notification");
        return;
    }

    OMIX_LOGD("Parsed event: %s", eventName(*event));
    _channel.publish(*event);
}

/* Commands */

bool OmixConnectionManager::writeCommand(const uint8_t* data, const size_t length) {
    if (!isConnected()) {
        fail("No DiFluid device connected");
        return false;
    }

    omixLogBytes("Write TX", data, length);
    OMIX_LOGD("  service=%s, char=%s", _transport.serviceUuid.c_str(), _transport.writeCharacteristicUuid.c_str());

    const OmixWriteStrategy strategy;
    std::string error;

    const bool written = strategy.run(
        [this, data, length](const OmixWriteMode mode, std::string& message) {
            if (_platform.write(_transport.serviceUuid, _transport.writeCharacteristicUuid, data, length,
                                mode == OmixWriteMode::WithResponse)) {
                return true;
            }
            message = _platform.lastError();
            return false;
        },
        error);

    if (!written) {
        fail(error);
    }

    return written;
}

void OmixConnectionManager::setMeasuring(const bool measuring) {
    if (!isConnected()) {
        return;
    }

    _state = measuring ? OmixConnectionState::Measuring : OmixConnectionState::Connected;
}

/* Diagnostics */

std::string OmixConnectionManager::connectionInfo() const {
    if (!isConnected()) {
        return "Not connected";
    }

    return "Device: " + (_deviceName.empty() ? _deviceId : _deviceName) + " (" + _deviceId + ")\n" +
           "Service: " + _transport.serviceUuid + "\n" +
           "Write char: " + _transport.writeCharacteristicUuid + "\n" +
           "Notify char: " + _transport.notifyCharacteristicUuid + "\n" +
           "Subscribed: " + (_subscribed ? "yes" : "no") + "\n" +
           "RSSI: " + std::to_string(_platform.rssi()) + " dBm\n" +
           "State: " + connectionStateName(_state);
}

std::string OmixConnectionManager::enumerateDevice() {
    if (!isConnected()) {
        return "Not connected";
    }

    std::vector<OmixServiceInfo> services;
    if (_platform.discoverServices(services)) {
        _services = services;
    }
    else {
        OMIX_LOGW("Rediscovery failed, using cached services: %s", _platform.lastError().c_str());
    }

    std::string result = "Total services: " + std::to_string(_services.size());

    for (const auto& service : _services) {
        result += "\nSVC " + service.uuid + ":";

        if (service.characteristics.empty()) {
            result += "\n  (no characteristics)";
            continue;
        }

        for (const auto& characteristic : service.characteristics) {
            result += "\n  " + describeCharacteristic(characteristic);
        }
    }

    OMIX_LOGD("%s", result.c_str());
    return result;
}

void OmixConnectionManager::fail(const std::string& message) {
    _lastError = message;
    OMIX_LOGE("%s", message.c_str());
}
