/**
 * @file FrameCodec.h
 * @brief Tapir link frame encoder/decoder
 *
 * Splits outgoing application payloads into transport-sized frames and
 * parses received frames. This class has no BLE dependencies and can be
 * used for testing on native builds.
 *
 * Frame Header Format (little-endian length):
 *   Complete/First: [category:1][flag:1][totalLen:2][chunk...]
 *   Continue/Last:  [category:1][flag:1][chunk...]
 *
 * Chunking is greedy left-to-right. Only the First frame declares the total
 * length; the reassembler relies on it to detect completion.
 */
#pragma once

#include "LinkTypes.h"
#include "Bytes.h"

#include <vector>
#include <cstdint>

namespace Tapir { namespace BLE {

/**
 * @brief A single decoded transport frame
 */
struct Frame {
    uint8_t category = Fragment::CATEGORY;
    Fragment::Flag flag = Fragment::COMPLETE;
    uint16_t total_length = 0;      // Only meaningful on COMPLETE/FIRST
    Bytes chunk;

    bool hasLength() const {
        return flag == Fragment::COMPLETE || flag == Fragment::FIRST;
    }
};

class FrameCodec {
public:
    /**
     * @brief Construct a codec with a maximum chunk size
     * @param max_chunk_size Bytes of payload per frame (default: protocol maximum)
     * @param category Protocol identifier byte written into every frame
     */
    explicit FrameCodec(size_t max_chunk_size = Fragment::MAX_CHUNK_SIZE,
                        uint8_t category = Fragment::CATEGORY);

    /**
     * @brief Derive the chunk size from a negotiated MTU
     *
     * Call this when the MTU is renegotiated with the peer.
     */
    void setMTU(uint16_t mtu);

    void setMaxChunkSize(size_t max_chunk_size);
    size_t getMaxChunkSize() const { return _max_chunk_size; }

    uint8_t getCategory() const { return _category; }

    /**
     * @brief Number of frames a payload of the given size encodes to
     */
    size_t calculateFrameCount(size_t payload_size) const;

    /**
     * @brief Encode a payload into raw frames ready to write
     *
     * @param payload The complete application message
     * @return Frames in write order; empty if the payload cannot be encoded
     *
     * A payload of at most max_chunk_size bytes (including an empty one)
     * produces a single COMPLETE frame. Larger payloads produce FIRST,
     * zero or more CONTINUE, and LAST.
     */
    std::vector<Bytes> encode(const Bytes& payload) const;

    /**
     * @brief Build one raw frame
     *
     * The length field is written only for COMPLETE and FIRST frames.
     */
    static Bytes createFrame(uint8_t category, Fragment::Flag flag,
                             uint16_t total_length, const Bytes& chunk);

    /**
     * @brief Parse a raw frame
     *
     * @param raw The received bytes
     * @param frame Output: parsed frame
     * @return false for a malformed frame (too short for its header,
     *         unknown flag, or a COMPLETE frame whose length disagrees
     *         with its body)
     */
    static bool decode(const Bytes& raw, Frame& frame);

    /**
     * @brief Convert a fragment flag to string for logging
     */
    static const char* flagToString(Fragment::Flag flag);

private:
    size_t _max_chunk_size;
    uint8_t _category;
};

}} // namespace Tapir::BLE
