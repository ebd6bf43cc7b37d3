/**
 * @file FrameReassembler.h
 * @brief Tapir link frame reassembler
 *
 * Reassembles incoming frames into complete application messages. The
 * protocol never interleaves fragmented messages, so at most one
 * reassembly buffer is open at a time. This class has no BLE dependencies
 * and can be used for testing on native builds.
 *
 * Out-of-sequence flags are handled by resetting and continuing:
 *   - FIRST while a buffer is open discards the partial message and starts over
 *   - COMPLETE while a buffer is open discards the partial message and is delivered
 *   - CONTINUE/LAST with no open buffer are dropped
 *   - overflow past the declared length, or a LAST that leaves the buffer
 *     short of it, drops the buffer
 * Every drop is logged and counted; none of them raise.
 */
#pragma once

#include "LinkTypes.h"
#include "FrameCodec.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <functional>
#include <memory>
#include <string>
#include <cstdint>

namespace Tapir { namespace BLE {

class FrameReassembler {
public:
    /**
     * @brief Callback for successfully reassembled messages
     * @param message The complete message bytes ([type][payload...])
     */
    using ReassemblyCallback = std::function<void(const Bytes& message)>;

    /**
     * @brief Callback for dropped frames or discarded partial messages
     * @param reason Description of the failure
     */
    using DropCallback = std::function<void(const std::string& reason)>;

    struct Stats {
        uint32_t frames_received = 0;
        uint32_t messages_completed = 0;
        uint32_t malformed_frames = 0;
        uint32_t dropped_frames = 0;        // Stray, foreign category, or overflowing frames
        uint32_t discarded_partials = 0;    // Open buffers abandoned by reset or mismatch
        uint32_t timeouts = 0;
    };

public:
    explicit FrameReassembler(uint8_t category = Fragment::CATEGORY);

    void setReassemblyCallback(ReassemblyCallback callback);
    void setDropCallback(DropCallback callback);

    /**
     * @brief Set the reassembly timeout
     * @param timeout_seconds Seconds to wait before discarding an open buffer
     */
    void setTimeout(double timeout_seconds);

    /**
     * @brief Decode and process a raw frame
     *
     * @param raw The received frame with header
     * @return false if the frame was malformed, was dropped, or forced a
     *         partial message to be discarded
     *
     * When a message is fully reassembled, the reassembly callback is invoked.
     */
    bool processFrame(const Bytes& raw);

    /**
     * @brief Feed one decoded frame
     *
     * @param frame The decoded frame
     * @param message Output: the complete message when one became available
     * @return true if a complete message was produced
     */
    bool reassemble(const Frame& frame, Bytes& message);

    /**
     * @brief Discard an open buffer older than the timeout
     *
     * Should be called periodically from the link loop().
     */
    void checkTimeouts();

    bool hasPending() const { return static_cast<bool>(_pending); }
    size_t pendingBytes() const { return _pending ? _pending->buffer.size() : 0; }
    size_t expectedLength() const { return _pending ? _pending->total_length : 0; }

    /**
     * @brief Drop any open buffer (e.g. on disconnect)
     */
    void clear();

    const Stats& stats() const { return _stats; }

private:
    /**
     * @brief State for the single open (incomplete) message
     */
    struct PendingMessage {
        Bytes buffer;
        uint16_t total_length = 0;
        double started_at = 0.0;
    };

    void startPending(const Frame& frame);
    void discardPending(const std::string& reason);
    void dropFrame(const std::string& reason);

    std::unique_ptr<PendingMessage> _pending;
    uint8_t _category;
    double _timeout_seconds = Timing::REASSEMBLY_TIMEOUT;
    Stats _stats;

    ReassemblyCallback _reassembly_callback = nullptr;
    DropCallback _drop_callback = nullptr;
};

}} // namespace Tapir::BLE
