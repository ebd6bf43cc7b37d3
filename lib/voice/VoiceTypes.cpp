/**
 * @file VoiceTypes.cpp
 * @brief Voice packet parsing
 */

#include "VoiceTypes.h"

namespace Tapir { namespace Voice {

bool VoiceDataPacket::parse(const Bytes& payload, VoiceDataPacket& packet) {
    if (payload.size() < Stream::PACKET_HEADER_SIZE) {
        return false;
    }

    const uint8_t* data = payload.data();

    // Sequence is big-endian, timestamp little-endian
    packet.sequence = static_cast<uint16_t>((data[0] << 8) | data[1]);
    packet.timestamp = static_cast<uint32_t>(data[2]) |
                       (static_cast<uint32_t>(data[3]) << 8) |
                       (static_cast<uint32_t>(data[4]) << 16) |
                       (static_cast<uint32_t>(data[5]) << 24);
    packet.coded = payload.mid(Stream::PACKET_HEADER_SIZE);
    return true;
}

}} // namespace Tapir::Voice
