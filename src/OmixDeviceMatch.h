/*
  OmixDeviceMatch.h - Omix identification, GATT resolution and write fallback.
*/
#pragma once

#include "OmixBlePlatform.h"

#include <functional>
#include <stdint.h>
#include <string>
#include <vector>

struct OmixResolvedTransport {
    std::string serviceUuid;
    std::string writeCharacteristicUuid;
    std::string notifyCharacteristicUuid;
};

enum class OmixWriteMode {
    WithResponse,
    WithoutResponse
};

// Accepts "00e2", "0x00E2" and "000000e2-0000-1000-8000-00805f9b34fb"
[[nodiscard]] bool uuidMatchesShort(const std::string& uuid, uint16_t shortUuid);

[[nodiscard]] bool isOmixService(const std::string& uuid);
[[nodiscard]] bool isOmixAdvertisement(const OmixAdvertisement& advertisement);

// "uuid[W+WNR+N+I+R], ..." summary used in errors and debug output
std::string describeCharacteristic(const OmixCharacteristicInfo& characteristic);
std::string describeCharacteristics(const std::vector<OmixCharacteristicInfo>& characteristics);
std::string describeServices(const std::vector<OmixServiceInfo>& services);

/**
 * Picks the SDK service (falling back to the app service), then the write
 * and notify characteristics on it. On failure error names everything found.
 */
[[nodiscard]] bool resolveTransport(const std::vector<OmixServiceInfo>& services,
                                    OmixResolvedTransport& transport, std::string& error);

/**
 * The ordered write attempts: with response first, then once without.
 */
struct OmixWriteStrategy {
    OmixWriteMode modes[2] = {OmixWriteMode::WithResponse, OmixWriteMode::WithoutResponse};

    // attempt returns true on success and fills message on failure
    using Attempt = std::function<bool(OmixWriteMode mode, std::string& message)>;

    [[nodiscard]] bool run(const Attempt& attempt, std::string& error) const;
};
