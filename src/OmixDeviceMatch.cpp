/*
  OmixDeviceMatch.cpp - Omix identification, GATT resolution and write fallback.
*/
#include "OmixDeviceMatch.h"
#include "OmixConfig.h"
#include "OmixLog.h"

#include <cctype>
#include <stdio.h>

namespace {
    std::string normalizeUuid(const std::string& uuid) {
        std::string lower;
        lower.reserve(uuid.size());

        for (const char c : uuid) {
            lower.push_back(static_cast<char>(tolower(static_cast<unsigned char>(c))));
        }

        if (lower.rfind("0x", 0) == 0) {
            lower.erase(0, 2);
        }

        return lower;
    }

    bool isWritable(const OmixCharacteristicInfo& characteristic) {
        return characteristic.writeWithResponse || characteristic.writeWithoutResponse;
    }

    bool isNotifiable(const OmixCharacteristicInfo& characteristic) {
        return characteristic.notify || characteristic.indicate;
    }

    const OmixServiceInfo* findService(const std::vector<OmixServiceInfo>& services, const uint16_t shortUuid) {
        for (const auto& service : services) {
            if (uuidMatchesShort(service.uuid, shortUuid)) {
                return &service;
            }
        }
        return nullptr;
    }

    const char* writeModeName(const OmixWriteMode mode) {
        return mode == OmixWriteMode::WithResponse ? "with response" : "without response";
    }
}

bool uuidMatchesShort(const std::string& uuid, const uint16_t shortUuid) {
    const std::string lower = normalizeUuid(uuid);

    char shortForm[5];
    snprintf(shortForm, sizeof(shortForm), "%04x", shortUuid);

    if (lower.size() == 4) {
        return lower == shortForm;
    }

    // 128-bit Bluetooth base UUID: 0000xxxx-0000-1000-8000-00805f9b34fb
    return lower.size() >= 8 && lower.compare(0, 4, "0000") == 0 && lower.compare(4, 4, shortForm) == 0;
}

bool isOmixService(const std::string& uuid) {
    return uuidMatchesShort(uuid, SHORT_OMIX_SDK) || uuidMatchesShort(uuid, SHORT_OMIX_APP);
}

bool isOmixAdvertisement(const OmixAdvertisement& advertisement) {
    for (const auto& uuid : advertisement.serviceUuids) {
        if (isOmixService(uuid)) {
            return true;
        }
    }

    const std::string& name = advertisement.name;
    return name.find(NAME_OMIX) != std::string::npos || name.find(NAME_DIFLUID) != std::string::npos;
}

std::string describeCharacteristic(const OmixCharacteristicInfo& characteristic) {
    std::string flags;
    const auto add = [&flags](const char* flag) {
        if (!flags.empty()) flags += "+";
        flags += flag;
    };

    if (characteristic.writeWithResponse)    add("W");
    if (characteristic.writeWithoutResponse) add("WNR");
    if (characteristic.notify)               add("N");
    if (characteristic.indicate)             add("I");
    if (characteristic.read)                 add("R");

    return characteristic.uuid + "[" + flags + "]";
}

std::string describeCharacteristics(const std::vector<OmixCharacteristicInfo>& characteristics) {
    std::string result;

    for (const auto& characteristic : characteristics) {
        if (!result.empty()) result += ", ";
        result += describeCharacteristic(characteristic);
    }

    return result;
}

std::string describeServices(const std::vector<OmixServiceInfo>& services) {
    std::string result;

    for (const auto& service : services) {
        if (!result.empty()) result += ", ";
        result += service.uuid;
    }

    return result;
}

bool resolveTransport(const std::vector<OmixServiceInfo>& services, OmixResolvedTransport& transport,
                      std::string& error) {
    const OmixServiceInfo* service = findService(services, SHORT_OMIX_SDK);
    if (!service) {
        service = findService(services, SHORT_OMIX_APP);
    }

    if (!service) {
        error = "No DiFluid service found on device. Available services: " + describeServices(services);
        return false;
    }

    OMIX_LOGD("Resolved service: %s", service->uuid.c_str());

    std::string writeUuid;
    std::string notifyUuid;

    // The data characteristic usually carries both roles
    for (const auto& characteristic : service->characteristics) {
        if (uuidMatchesShort(characteristic.uuid, SHORT_OMIX_DATA)) {
            if (isWritable(characteristic)) writeUuid = characteristic.uuid;
            if (isNotifiable(characteristic)) notifyUuid = characteristic.uuid;
            break;
        }
    }

    if (writeUuid.empty()) {
        for (const auto& characteristic : service->characteristics) {
            if (isWritable(characteristic)) {
                writeUuid = characteristic.uuid;
                break;
            }
        }
    }

    if (notifyUuid.empty()) {
        for (const auto& characteristic : service->characteristics) {
            if (isNotifiable(characteristic)) {
                notifyUuid = characteristic.uuid;
                break;
            }
        }
    }

    const std::string summary = describeCharacteristics(service->characteristics);

    if (writeUuid.empty()) {
        error = "No writable characteristic found on service " + service->uuid + ". Characteristics: " + summary;
        return false;
    }

    if (notifyUuid.empty()) {
        error = "No notifiable characteristic found on service " + service->uuid + ". Characteristics: " + summary;
        return false;
    }

    transport.serviceUuid = service->uuid;
    transport.writeCharacteristicUuid = writeUuid;
    transport.notifyCharacteristicUuid = notifyUuid;
    return true;
}

bool OmixWriteStrategy::run(const Attempt& attempt, std::string& error) const {
    std::string message;

    for (const OmixWriteMode mode : modes) {
        message.clear();

        if (attempt(mode, message)) {
            OMIX_LOGD("Write OK (%s)", writeModeName(mode));
            return true;
        }

        OMIX_LOGD("Write %s failed: %s", writeModeName(mode), message.c_str());
    }

    error = "BLE write failed: " + message;
    return false;
}
