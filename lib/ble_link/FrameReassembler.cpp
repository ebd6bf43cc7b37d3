/**
 * @file FrameReassembler.cpp
 * @brief Tapir link frame reassembler implementation
 */

#include "FrameReassembler.h"
#include "Log.h"

#include <cstdio>

namespace Tapir { namespace BLE {

FrameReassembler::FrameReassembler(uint8_t category) : _category(category) {
}

void FrameReassembler::setReassemblyCallback(ReassemblyCallback callback) {
    _reassembly_callback = callback;
}

void FrameReassembler::setDropCallback(DropCallback callback) {
    _drop_callback = callback;
}

void FrameReassembler::setTimeout(double timeout_seconds) {
    _timeout_seconds = timeout_seconds;
}

bool FrameReassembler::processFrame(const Bytes& raw) {
    _stats.frames_received++;

    Frame frame;
    if (!FrameCodec::decode(raw, frame)) {
        _stats.malformed_frames++;
        WARNING("FrameReassembler: Malformed frame (" + std::to_string(raw.size()) + " bytes), dropping");
        if (_drop_callback) {
            _drop_callback("Malformed frame");
        }
        return false;
    }

    Bytes message;
    uint32_t rejected_before = _stats.dropped_frames + _stats.discarded_partials;
    bool complete = reassemble(frame, message);

    if (complete && _reassembly_callback) {
        _reassembly_callback(message);
    }

    return complete || (_stats.dropped_frames + _stats.discarded_partials) == rejected_before;
}

bool FrameReassembler::reassemble(const Frame& frame, Bytes& message) {
    if (frame.category != _category) {
        char buf[64];
        snprintf(buf, sizeof(buf), "FrameReassembler: Foreign category 0x%02X", frame.category);
        dropFrame(buf);
        return false;
    }

    switch (frame.flag) {
        case Fragment::COMPLETE: {
            if (_pending) {
                discardPending("Complete frame arrived mid-reassembly");
            }
            message = frame.chunk;
            _stats.messages_completed++;
            TRACE("FrameReassembler: Complete message, " + std::to_string(message.size()) + " bytes");
            return true;
        }

        case Fragment::FIRST: {
            if (_pending) {
                discardPending("First frame arrived mid-reassembly");
            }
            if (frame.chunk.size() > frame.total_length) {
                dropFrame("First frame exceeds declared length");
                return false;
            }
            startPending(frame);
            return false;
        }

        case Fragment::CONTINUE:
        case Fragment::LAST: {
            if (!_pending) {
                dropFrame(std::string(FrameCodec::flagToString(frame.flag)) + " frame without First");
                return false;
            }

            PendingMessage& pending = *_pending;
            if (pending.buffer.size() + frame.chunk.size() > pending.total_length) {
                char buf[96];
                snprintf(buf, sizeof(buf), "Overflow, %zu + %zu exceeds declared %u",
                         pending.buffer.size(), frame.chunk.size(), pending.total_length);
                discardPending(buf);
                dropFrame("Overflowing frame");
                return false;
            }

            pending.buffer.append(frame.chunk);

            if (frame.flag == Fragment::CONTINUE) {
                char buf[64];
                snprintf(buf, sizeof(buf), "FrameReassembler: Received %zu/%u bytes",
                         pending.buffer.size(), pending.total_length);
                TRACE(buf);
                return false;
            }

            if (pending.buffer.size() != pending.total_length) {
                char buf[80];
                snprintf(buf, sizeof(buf), "Length mismatch, declared %u got %zu",
                         pending.total_length, pending.buffer.size());
                discardPending(buf);
                return false;
            }

            // Remove from pending before handing out (callback might feed new data)
            message = pending.buffer;
            _pending.reset();
            _stats.messages_completed++;

            TRACE("FrameReassembler: Completed reassembly, " + std::to_string(message.size()) + " bytes");
            return true;
        }

        default:
            dropFrame("Unknown flag");
            return false;
    }
}

void FrameReassembler::checkTimeouts() {
    if (!_pending) {
        return;
    }

    double age = RNS::Utilities::OS::time() - _pending->started_at;
    if (age > _timeout_seconds) {
        _stats.timeouts++;
        char buf[80];
        snprintf(buf, sizeof(buf), "Reassembly timeout, received %zu/%u bytes",
                 _pending->buffer.size(), _pending->total_length);
        discardPending(buf);
    }
}

void FrameReassembler::clear() {
    if (_pending) {
        TRACE("FrameReassembler: Clearing pending reassembly");
        _pending.reset();
    }
}

void FrameReassembler::startPending(const Frame& frame) {
    double now = RNS::Utilities::OS::time();

    _pending.reset(new PendingMessage());
    _pending->total_length = frame.total_length;
    _pending->buffer.reserve(frame.total_length);
    _pending->buffer.append(frame.chunk);
    _pending->started_at = now;

    char buf[64];
    snprintf(buf, sizeof(buf), "FrameReassembler: Starting reassembly of %u bytes", frame.total_length);
    TRACE(buf);
}

void FrameReassembler::discardPending(const std::string& reason) {
    _stats.discarded_partials++;
    WARNING("FrameReassembler: Discarding partial message: " + reason);
    _pending.reset();
    if (_drop_callback) {
        _drop_callback(reason);
    }
}

void FrameReassembler::dropFrame(const std::string& reason) {
    _stats.dropped_frames++;
    WARNING("FrameReassembler: Dropping frame: " + reason);
    if (_drop_callback) {
        _drop_callback(reason);
    }
}

}} // namespace Tapir::BLE
