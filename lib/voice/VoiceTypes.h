/**
 * @file VoiceTypes.h
 * @brief Push-to-talk session types and constants
 */
#pragma once

#include "Bytes.h"

#include <string>
#include <vector>
#include <cstdint>

namespace Tapir { namespace Voice {

using RNS::Bytes;

//=============================================================================
// Stream constants
//=============================================================================

namespace Stream {
    static constexpr uint32_t SAMPLE_RATE = 16000;
    static constexpr uint32_t FRAME_DURATION_MS = 20;
    static constexpr size_t SAMPLES_PER_FRAME = 320;       // 20 ms at 16 kHz
    static constexpr size_t PACKET_HEADER_SIZE = 6;        // seq(2, BE) + timestamp(4, LE)
    static constexpr uint32_t SEQUENCE_MODULO = 65536;
}

//=============================================================================
// State
//=============================================================================

enum class VoiceState : uint8_t {
    IDLE,
    LISTENING,
    PROCESSING,
    SPEAKING
};

inline const char* stateToString(VoiceState state) {
    switch (state) {
        case VoiceState::IDLE:       return "idle";
        case VoiceState::LISTENING:  return "listening";
        case VoiceState::PROCESSING: return "processing";
        case VoiceState::SPEAKING:   return "speaking";
        default:                     return "unknown";
    }
}

//=============================================================================
// Session model
//=============================================================================

/**
 * @brief One VOICE_DATA payload: [seqHi][seqLo][timestamp LE 4][coded audio...]
 */
struct VoiceDataPacket {
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
    Bytes coded;

    /**
     * @return false if the payload is shorter than the packet header
     */
    static bool parse(const Bytes& payload, VoiceDataPacket& packet);
};

/**
 * @brief One push-to-talk recording
 */
struct VoiceSession {
    double start_time = 0;
    double end_time = 0;
    std::vector<VoiceDataPacket> packets;
    uint16_t expected_sequence = 0;
    uint32_t sequence_gaps = 0;
    uint32_t late_packets = 0;
    uint32_t decode_failures = 0;
    size_t total_bytes = 0;
    std::vector<int16_t> samples;
    bool ended = false;

    size_t packetCount() const { return packets.size(); }
};

/**
 * @brief Summary of the last finished recording
 */
struct VoiceClipInfo {
    double timestamp = 0;
    double duration = 0;
    uint32_t packet_count = 0;
    size_t total_bytes = 0;
    uint32_t sequence_gaps = 0;
    uint32_t sample_rate = Stream::SAMPLE_RATE;
};

/**
 * @brief Figures for a live display while recording
 */
struct LiveStats {
    uint32_t packet_count = 0;
    size_t total_bytes = 0;
    uint32_t sequence_gaps = 0;
    uint32_t late_packets = 0;
    double elapsed = 0;
};

struct VoiceResult {
    std::string transcript;
    std::string response;
};

struct VoiceStatus {
    VoiceState state = VoiceState::IDLE;
    bool has_session = false;
    uint32_t packet_count = 0;
    bool has_result = false;
    VoiceResult last_result;
    bool has_clip_info = false;
    VoiceClipInfo last_clip_info;
    bool has_clip_for_playback = false;
};

//=============================================================================
// Events
//=============================================================================

enum class VoiceEventType : uint8_t {
    START,
    DATA,
    END,
    RESULT,
    ERROR,
    CANCELLED
};

inline const char* eventTypeToString(VoiceEventType type) {
    switch (type) {
        case VoiceEventType::START:     return "start";
        case VoiceEventType::DATA:      return "data";
        case VoiceEventType::END:       return "end";
        case VoiceEventType::RESULT:    return "result";
        case VoiceEventType::ERROR:     return "error";
        case VoiceEventType::CANCELLED: return "cancelled";
        default:                        return "unknown";
    }
}

struct VoiceEvent {
    VoiceEventType type = VoiceEventType::START;
    uint16_t sequence = 0;      // DATA
    Bytes data;                 // DATA: coded audio
    std::string text;           // RESULT: transcript, ERROR: description
};

}} // namespace Tapir::Voice
