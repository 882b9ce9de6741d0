/*
  OmixProtocol.cpp - DiFluid Omix packet framing.
*/
#include "OmixProtocol.h"

uint8_t calculateChecksum(const uint8_t* data, const size_t length) {
    uint8_t sum = 0;

    for (size_t i = 0; i < length; i++) {
        sum += data[i];
    }

    return sum;
}

std::vector<uint8_t> buildPacket(const uint8_t func, const uint8_t cmd, const uint8_t* data, const size_t length) {
    std::vector<uint8_t> packet;

    if (length > OMIX_MAX_PAYLOAD_LENGTH) {
        return packet;
    }

    packet.reserve(OMIX_MIN_PACKET_LENGTH + length);

    packet.push_back(OMIX_HEADER_BYTE);
    packet.push_back(OMIX_HEADER_BYTE);
    packet.push_back(func);
    packet.push_back(cmd);
    packet.push_back(static_cast<uint8_t>(length));

    if (data && length > 0) {
        packet.insert(packet.end(), data, data + length);
    }

    packet.push_back(calculateChecksum(packet.data(), packet.size()));
    return packet;
}

bool validatePacket(const uint8_t* data, const size_t length) {
    if (!data || length < OMIX_MIN_PACKET_LENGTH) {
        return false;
    }

    if (data[0] != OMIX_HEADER_BYTE || data[1] != OMIX_HEADER_BYTE) {
        return false;
    }

    const size_t payloadLength = data[4];
    const size_t checksumIndex = OMIX_PAYLOAD_OFFSET + payloadLength;

    if (length < checksumIndex + 1) {
        return false;
    }

    return calculateChecksum(data, checksumIndex) == data[checksumIndex];
}

OmixPacket extractPayload(const uint8_t* data, const size_t length) {
    OmixPacket packet;
    packet.func = data[2];
    packet.cmd = data[3];

    const size_t payloadLength = data[4];
    const uint8_t* begin = data + OMIX_PAYLOAD_OFFSET;

    if (OMIX_PAYLOAD_OFFSET + payloadLength <= length) {
        packet.payload.assign(begin, begin + payloadLength);
    }

    return packet;
}
