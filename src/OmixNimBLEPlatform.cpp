/*
  OmixNimBLEPlatform.cpp - OmixBlePlatform on top of NimBLE-Arduino 2.x (ESP32).
*/
#include "OmixNimBLEPlatform.h"
#include "OmixConfig.h"
#include "OmixLog.h"

#include <Preferences.h>

// Callback implementations
void OmixScanCallbacks::onResult(const NimBLEAdvertisedDevice* advertisedDevice) {
    _owner.handleAdvertisement(advertisedDevice);
}

void OmixScanCallbacks::onScanEnd(const NimBLEScanResults& scanResults, const int reason) {
    OMIX_LOGD("Scan ended, reason: %d, %d result(s)", reason, scanResults.getCount());
}

void OmixClientCallbacks::onConnect(NimBLEClient* pClient) {
    OMIX_LOGD("Client connected to %s", pClient->getPeerAddress().toString().c_str());
}

void OmixClientCallbacks::onDisconnect(NimBLEClient* pClient, const int reason) {
    _owner.handleDisconnect(pClient, reason);
}

OmixNimBLEPlatform::OmixNimBLEPlatform()
    : _initialized(false),
      _pBLEScan(nullptr),
      _pClient(nullptr),
      _scanCallbacks(*this),
      _clientCallbacks(*this) {
}

OmixNimBLEPlatform::~OmixNimBLEPlatform() {
    end();
}

bool OmixNimBLEPlatform::begin() {
    if (_initialized) {
        return true;
    }

    OMIX_LOGD("Initializing NimBLE...");

    if (!NimBLEDevice::init("")) {
        setError("NimBLE init failed");
        return false;
    }

    // Maximum power for connection reliability
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);
    NimBLEDevice::setMTU(OMIX_REQUESTED_MTU);

    _pBLEScan = NimBLEDevice::getScan();

    if (!_pBLEScan) {
        setError("Failed to get BLE scan object");
        return false;
    }

    // Results are forwarded as they arrive; keeping them would only leak memory
    _pBLEScan->setScanCallbacks(&_scanCallbacks, false);
    _pBLEScan->setActiveScan(true);
    _pBLEScan->setInterval(500);
    _pBLEScan->setWindow(100);
    _pBLEScan->setMaxResults(0);
    _pBLEScan->setDuplicateFilter(false);

    _initialized = true;
    return true;
}

void OmixNimBLEPlatform::end() {
    if (!_initialized) {
        return;
    }

    stopScan();
    disconnect();

    if (_pClient) {
        NimBLEDevice::deleteClient(_pClient);
        _pClient = nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _onScanResult = nullptr;
        _onDisconnect = nullptr;
        _addresses.clear();
    }

    _pBLEScan = nullptr;
    NimBLEDevice::deinit(true);
    _initialized = false;
}

bool OmixNimBLEPlatform::requestPermissions() {
    // No runtime permission model on ESP32
    return true;
}

OmixAdapterState OmixNimBLEPlatform::adapterState() {
    if (!_initialized) {
        return OmixAdapterState::Unknown;
    }

    return NimBLEDevice::isInitialized() ? OmixAdapterState::PoweredOn : OmixAdapterState::Resetting;
}

std::vector<OmixAdvertisement> OmixNimBLEPlatform::connectedPeripherals(const std::string& serviceUuid) {
    std::vector<OmixAdvertisement> result;

    if (!_initialized) {
        return result;
    }

    const NimBLEUUID uuid(serviceUuid);

    for (NimBLEClient* client : NimBLEDevice::getConnectedClients()) {
        if (!client || !client->getService(uuid)) {
            continue;
        }

        OmixAdvertisement peripheral;
        peripheral.id = client->getPeerAddress().toString();
        peripheral.rssi = client->getRssi();
        peripheral.serviceUuids.push_back(serviceUuid);

        {
            std::lock_guard<std::mutex> lock(_mutex);
            _addresses.put(peripheral.id, client->getPeerAddress());
        }

        result.push_back(std::move(peripheral));
    }

    return result;
}

bool OmixNimBLEPlatform::startScan(ScanCallback onResult) {
    if (!_initialized || !_pBLEScan) {
        setError("BLE not initialized");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _onScanResult = std::move(onResult);
    }

    if (_pBLEScan->isScanning()) {
        _pBLEScan->stop();
    }
    _pBLEScan->clearResults();

    // 0 = scan until stopped
    if (!_pBLEScan->start(0)) {
        setError("NimBLE scan start failed");
        return false;
    }

    OMIX_LOGD("Starting BLE scan...");
    return true;
}

void OmixNimBLEPlatform::stopScan() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _onScanResult = nullptr;
    }

    if (_pBLEScan && _pBLEScan->isScanning()) {
        _pBLEScan->stop();
        _pBLEScan->clearResults();
    }
}

void OmixNimBLEPlatform::handleAdvertisement(const NimBLEAdvertisedDevice* advertisedDevice) {
    OmixAdvertisement advertisement;
    advertisement.id = advertisedDevice->getAddress().toString();
    advertisement.name = advertisedDevice->getName();
    advertisement.rssi = advertisedDevice->getRSSI();

    for (uint8_t i = 0; i < advertisedDevice->getServiceUUIDCount(); i++) {
        advertisement.serviceUuids.push_back(advertisedDevice->getServiceUUID(i).toString());
    }

    ScanCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _addresses.remember(advertisement, advertisedDevice->getAddress());
        callback = _onScanResult;
    }

    if (callback) {
        callback(advertisement);
    }
}

bool OmixNimBLEPlatform::connect(const std::string& id, const uint16_t mtu, const uint32_t timeoutMs) {
    if (!_initialized) {
        setError("BLE not initialized");
        return false;
    }

    NimBLEAddress address(id, BLE_ADDR_PUBLIC);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_addresses.find(id, address)) {
            OMIX_LOGD("No scanned address for %s, assuming public", id.c_str());
        }
    }

    // Ensure scan is fully stopped before attempting connection
    if (_pBLEScan && _pBLEScan->isScanning()) {
        _pBLEScan->stop();
        delay(100);
    }

    if (!_pClient) {
        _pClient = NimBLEDevice::createClient();

        if (!_pClient) {
            setError("Failed to create client");
            return false;
        }

        _pClient->setClientCallbacks(&_clientCallbacks, false);
    }
    else if (_pClient->isConnected()) {
        _pClient->disconnect();
        delay(100);
    }

    _characteristics.clear();

    NimBLEDevice::setMTU(mtu);

    // Relaxed connection parameters for better compatibility
    _pClient->setConnectionParams(
        24,    // min interval
        40,    // max interval
        0,     // latency
        500,   // supervision timeout
        16,    // scan interval
        16     // scan window
    );
    _pClient->setConnectTimeout(timeoutMs);

    OMIX_LOGD("Attempting connection to: %s (type %u)", address.toString().c_str(),
              static_cast<unsigned>(address.getType()));

    if (!_pClient->connect(address, true, false, true)) {
        setError(NimBLEUtils::returnCodeToString(_pClient->getLastError()));
        return false;
    }

    OMIX_LOGD("Connected, MTU %u", static_cast<unsigned>(_pClient->getMTU()));
    return true;
}

bool OmixNimBLEPlatform::discoverServices(std::vector<OmixServiceInfo>& services) {
    if (!isConnected()) {
        setError("Not connected");
        return false;
    }

    services.clear();
    _characteristics.clear();

    const std::vector<NimBLERemoteService*>& remoteServices = _pClient->getServices(true);

    if (remoteServices.empty()) {
        setError("No services found");
        return false;
    }

    for (NimBLERemoteService* svc : remoteServices) {
        if (!svc) {
            continue;
        }

        OmixServiceInfo service;
        service.uuid = svc->getUUID().toString();

        const std::vector<NimBLERemoteCharacteristic*>& chars = svc->getCharacteristics(true);

        for (NimBLERemoteCharacteristic* chr : chars) {
            OmixCharacteristicInfo characteristic;
            characteristic.uuid = chr->getUUID().toString();
            characteristic.read = chr->canRead();
            characteristic.writeWithResponse = chr->canWrite();
            characteristic.writeWithoutResponse = chr->canWriteNoResponse();
            characteristic.notify = chr->canNotify();
            characteristic.indicate = chr->canIndicate();

            _characteristics[std::make_pair(service.uuid, characteristic.uuid)] = chr;
            service.characteristics.push_back(std::move(characteristic));
        }

        services.push_back(std::move(service));
    }

    return true;
}

NimBLERemoteCharacteristic* OmixNimBLEPlatform::findCharacteristic(const std::string& service,
                                                                   const std::string& characteristic) {
    const auto it = _characteristics.find(std::make_pair(service, characteristic));
    return it != _characteristics.end() ? it->second : nullptr;
}

bool OmixNimBLEPlatform::subscribe(const std::string& service, const std::string& characteristic,
                                   NotifyCallback onNotify) {
    NimBLERemoteCharacteristic* chr = findCharacteristic(service, characteristic);

    if (!chr) {
        setError("Characteristic " + characteristic + " not found");
        return false;
    }

    const auto notifyCb = [onNotify](NimBLERemoteCharacteristic* pChar, uint8_t* pData, size_t length,
                                     bool isNotify) {
        if (onNotify) {
            onNotify(pData, length);
        }
    };

    // Indications only when the characteristic cannot notify
    if (!chr->subscribe(chr->canNotify(), notifyCb, true)) {
        setError(NimBLEUtils::returnCodeToString(_pClient->getLastError()));
        return false;
    }

    return true;
}

bool OmixNimBLEPlatform::unsubscribe(const std::string& service, const std::string& characteristic) {
    NimBLERemoteCharacteristic* chr = findCharacteristic(service, characteristic);

    if (!chr) {
        setError("Characteristic " + characteristic + " not found");
        return false;
    }

    if (!isConnected()) {
        setError("Not connected");
        return false;
    }

    if (!chr->unsubscribe(true)) {
        setError(NimBLEUtils::returnCodeToString(_pClient->getLastError()));
        return false;
    }

    return true;
}

bool OmixNimBLEPlatform::write(const std::string& service, const std::string& characteristic,
                               const uint8_t* data, const size_t length, const bool withResponse) {
    NimBLERemoteCharacteristic* chr = findCharacteristic(service, characteristic);

    if (!chr || !isConnected()) {
        setError("Characteristic " + characteristic + " not available");
        return false;
    }

    if (!chr->writeValue(data, length, withResponse)) {
        setError(NimBLEUtils::returnCodeToString(_pClient->getLastError()));
        return false;
    }

    return true;
}

void OmixNimBLEPlatform::setDisconnectListener(DisconnectCallback onDisconnect) {
    std::lock_guard<std::mutex> lock(_mutex);
    _onDisconnect = std::move(onDisconnect);
}

void OmixNimBLEPlatform::handleDisconnect(NimBLEClient* pClient, const int reason) {
    OMIX_LOGD("Client disconnected, reason: %d", reason);

    DisconnectCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _onDisconnect;
    }

    if (callback) {
        callback(pClient->getPeerAddress().toString(), reason);
    }
}

void OmixNimBLEPlatform::disconnect() {
    _characteristics.clear();

    if (_pClient && _pClient->isConnected()) {
        _pClient->disconnect();
        // Give time for proper disconnect
        delay(100);
    }
}

bool OmixNimBLEPlatform::isConnected() const {
    return _pClient && _pClient->isConnected();
}

int OmixNimBLEPlatform::rssi() {
    return isConnected() ? _pClient->getRssi() : OMIX_RSSI_UNKNOWN;
}

uint32_t OmixNimBLEPlatform::nowMs() {
    return millis();
}

void OmixNimBLEPlatform::delayMs(const uint32_t ms) {
    delay(ms);
}

bool OmixNimBLEPlatform::loadLastDeviceId(std::string& id) {
    Preferences prefs;

    // Read-write so the namespace exists after a fresh flash
    if (!prefs.begin(OMIX_NVS_NAMESPACE, false)) {
        setError("NVS namespace unavailable");
        return false;
    }

    const String saved = prefs.getString(OMIX_NVS_LAST_DEVICE, "");
    prefs.end();

    id = saved.c_str();
    return !id.empty();
}

bool OmixNimBLEPlatform::saveLastDeviceId(const std::string& id) {
    Preferences prefs;

    if (!prefs.begin(OMIX_NVS_NAMESPACE, false)) {
        setError("NVS namespace unavailable");
        return false;
    }

    const size_t written = prefs.putString(OMIX_NVS_LAST_DEVICE, id.c_str());
    prefs.end();

    if (written == 0 && !id.empty()) {
        setError("NVS write failed");
        return false;
    }

    OMIX_LOGD("Saved last device %s to NVS", id.c_str());
    return true;
}

void OmixNimBLEPlatform::setError(const std::string& context) {
    _lastError = context;
    OMIX_LOGD("NimBLE: %s", context.c_str());
}
