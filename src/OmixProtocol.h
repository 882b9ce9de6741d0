/*
  OmixProtocol.h - DiFluid Omix packet framing.

  Wire format (protocol v1.1):
    [0xDF, 0xDF, func, cmd, len, payload[len], checksum]
  checksum is the sum of every preceding byte, lower 8 bits.
*/
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>

#define OMIX_HEADER_BYTE          0xDF
#define OMIX_MIN_PACKET_LENGTH    6
#define OMIX_PAYLOAD_OFFSET       5
#define OMIX_MAX_PAYLOAD_LENGTH   255

// Function codes
#define FUNC_DETECTION            0x03
#define FUNC_DEVICE_INFO          0x05

// Detection commands (FUNC_DETECTION)
#define CMD_START_MEAS            0x01
#define CMD_BEAN_TYPE             0x02
#define CMD_MOISTURE_DENSITY      0x03
#define CMD_WATER_ACTIVITY        0x04
#define CMD_AGTRON                0x05
#define CMD_ENV_DATA              0x06
#define CMD_WATER_ACTIVITY_START  0x07

// Device info commands (FUNC_DEVICE_INFO)
#define CMD_GET_SN                0x09
#define CMD_GET_VERSION           0x0B
#define CMD_GET_MODEL             0x0C
#define CMD_GET_BATTERY           0x1D

// Start measurement response status
#define MEAS_RESPONSE_FAILED      0x00
#define MEAS_RESPONSE_STARTED     0x01
#define MEAS_RESPONSE_BUSY        0x02

// Agtron roast standard
#define ROAST_STANDARD_COMMON     0
#define ROAST_STANDARD_SCAA       1

struct OmixPacket {
    uint8_t func = 0;
    uint8_t cmd = 0;
    std::vector<uint8_t> payload;
};

uint8_t calculateChecksum(const uint8_t* data, size_t length);

/**
 * Build a command packet. Returns an empty vector when length exceeds
 * OMIX_MAX_PAYLOAD_LENGTH.
 */
std::vector<uint8_t> buildPacket(uint8_t func, uint8_t cmd, const uint8_t* data = nullptr, size_t length = 0);

inline std::vector<uint8_t> buildPacket(const uint8_t func, const uint8_t cmd, const std::vector<uint8_t>& data) {
    return buildPacket(func, cmd, data.data(), data.size());
}

/**
 * Check header, declared length and checksum. Never reads past length.
 * Bytes after the checksum are ignored.
 */
[[nodiscard]] bool validatePacket(const uint8_t* data, size_t length);

inline bool validatePacket(const std::vector<uint8_t>& data) {
    return validatePacket(data.data(), data.size());
}

/**
 * Slice func, cmd and payload out of a packet that passed validatePacket().
 */
OmixPacket extractPayload(const uint8_t* data, size_t length);

inline OmixPacket extractPayload(const std::vector<uint8_t>& data) {
    return extractPayload(data.data(), data.size());
}
