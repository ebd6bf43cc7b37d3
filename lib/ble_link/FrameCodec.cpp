/**
 * @file FrameCodec.cpp
 * @brief Tapir link frame encoder/decoder implementation
 */

#include "FrameCodec.h"
#include "Log.h"

#include <cstdio>
#include <cstring>

namespace Tapir { namespace BLE {

FrameCodec::FrameCodec(size_t max_chunk_size, uint8_t category)
    : _max_chunk_size(Fragment::MAX_CHUNK_SIZE), _category(category) {
    setMaxChunkSize(max_chunk_size);
}

void FrameCodec::setMTU(uint16_t mtu) {
    size_t chunk = maxChunkForMTU(mtu < MTU::MINIMUM ? MTU::MINIMUM : mtu);
    setMaxChunkSize(chunk);

    char buf[64];
    snprintf(buf, sizeof(buf), "FrameCodec: MTU %u, chunk size %zu", mtu, _max_chunk_size);
    TRACE(buf);
}

void FrameCodec::setMaxChunkSize(size_t max_chunk_size) {
    if (max_chunk_size == 0) {
        WARNING("FrameCodec: Chunk size of zero ignored, keeping " + std::to_string(_max_chunk_size));
        return;
    }
    _max_chunk_size = (max_chunk_size < Fragment::MAX_CHUNK_SIZE) ? max_chunk_size
                                                                  : Fragment::MAX_CHUNK_SIZE;
}

size_t FrameCodec::calculateFrameCount(size_t payload_size) const {
    if (payload_size <= _max_chunk_size) return 1;
    return (payload_size + _max_chunk_size - 1) / _max_chunk_size;
}

std::vector<Bytes> FrameCodec::encode(const Bytes& payload) const {
    std::vector<Bytes> frames;

    if (payload.size() > Fragment::MAX_PAYLOAD_SIZE) {
        char buf[80];
        snprintf(buf, sizeof(buf), "FrameCodec: Payload too large to encode: %zu > %zu",
                 payload.size(), Fragment::MAX_PAYLOAD_SIZE);
        ERROR(buf);
        return frames;
    }

    uint16_t total_length = static_cast<uint16_t>(payload.size());

    if (payload.size() <= _max_chunk_size) {
        frames.push_back(createFrame(_category, Fragment::COMPLETE, total_length, payload));
        return frames;
    }

    size_t frame_count = calculateFrameCount(payload.size());
    frames.reserve(frame_count);

    size_t offset = 0;
    for (size_t i = 0; i < frame_count; i++) {
        size_t remaining = payload.size() - offset;
        size_t chunk_size = (remaining < _max_chunk_size) ? remaining : _max_chunk_size;

        Fragment::Flag flag;
        if (i == 0) {
            flag = Fragment::FIRST;
        } else if (i == frame_count - 1) {
            flag = Fragment::LAST;
        } else {
            flag = Fragment::CONTINUE;
        }

        frames.push_back(createFrame(_category, flag, total_length, payload.mid(offset, chunk_size)));
        offset += chunk_size;
    }

    {
        char buf[80];
        snprintf(buf, sizeof(buf), "FrameCodec: Encoded %zu bytes into %zu frames",
                 payload.size(), frames.size());
        TRACE(buf);
    }

    return frames;
}

Bytes FrameCodec::createFrame(uint8_t category, Fragment::Flag flag,
                              uint16_t total_length, const Bytes& chunk) {
    bool with_length = (flag == Fragment::COMPLETE || flag == Fragment::FIRST);
    size_t header_size = with_length ? Fragment::COMPLETE_HEADER_SIZE : Fragment::SHORT_HEADER_SIZE;
    size_t frame_size = header_size + chunk.size();

    Bytes frame(frame_size);
    uint8_t* ptr = frame.writable(frame_size);
    frame.resize(frame_size);

    ptr[0] = category;
    ptr[1] = static_cast<uint8_t>(flag);

    // Total length (little-endian)
    if (with_length) {
        ptr[2] = static_cast<uint8_t>(total_length & 0xFF);
        ptr[3] = static_cast<uint8_t>((total_length >> 8) & 0xFF);
    }

    if (chunk.size() > 0) {
        memcpy(ptr + header_size, chunk.data(), chunk.size());
    }

    return frame;
}

bool FrameCodec::decode(const Bytes& raw, Frame& frame) {
    if (raw.size() < Fragment::SHORT_HEADER_SIZE) {
        TRACE("FrameCodec: Frame shorter than header");
        return false;
    }

    const uint8_t* ptr = raw.data();

    uint8_t flag_byte = ptr[1];
    if (flag_byte > Fragment::LAST) {
        TRACE("FrameCodec: Unknown fragment flag " + std::to_string(flag_byte));
        return false;
    }

    frame.category = ptr[0];
    frame.flag = static_cast<Fragment::Flag>(flag_byte);

    if (frame.hasLength()) {
        if (raw.size() < Fragment::COMPLETE_HEADER_SIZE) {
            TRACE("FrameCodec: Frame missing total length");
            return false;
        }
        frame.total_length = static_cast<uint16_t>(ptr[2]) |
                             (static_cast<uint16_t>(ptr[3]) << 8);
        frame.chunk = raw.mid(Fragment::COMPLETE_HEADER_SIZE);

        if (frame.flag == Fragment::COMPLETE && frame.chunk.size() != frame.total_length) {
            char buf[80];
            snprintf(buf, sizeof(buf), "FrameCodec: Complete frame length mismatch, declared %u got %zu",
                     frame.total_length, frame.chunk.size());
            TRACE(buf);
            return false;
        }
    } else {
        frame.total_length = 0;
        frame.chunk = raw.mid(Fragment::SHORT_HEADER_SIZE);
    }

    return true;
}

const char* FrameCodec::flagToString(Fragment::Flag flag) {
    switch (flag) {
        case Fragment::COMPLETE: return "COMPLETE";
        case Fragment::FIRST:    return "FIRST";
        case Fragment::CONTINUE: return "CONTINUE";
        case Fragment::LAST:     return "LAST";
        default:                 return "UNKNOWN";
    }
}

}} // namespace Tapir::BLE
