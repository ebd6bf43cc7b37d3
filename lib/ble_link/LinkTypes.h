/**
 * @file LinkTypes.h
 * @brief Tapir link protocol types, constants, and common structures
 *
 * This file defines the core types used throughout the Tapir link layer.
 * It includes the GATT service/characteristic UUIDs, framing constants,
 * the application message catalogue, and the enumerations and callback
 * types shared by the codec, the write queue, the connection state machine
 * and the platform implementations.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <functional>
#include <memory>
#include <string>
#include <cstdint>
#include <cstring>

namespace Tapir { namespace BLE {

using RNS::Bytes;

//=============================================================================
// GATT Service and Characteristic UUIDs
//=============================================================================

namespace UUID {
    // Tapir link service
    static constexpr const char* SERVICE = "00000000-0000-0000-6473-5f696c666973";

    // Configuration characteristic (reserved)
    static constexpr const char* CONFIG_CHAR = "00000000-0000-0100-6473-5f696c666973";

    // Data characteristic (write + notify) carrying framed messages both ways
    static constexpr const char* DATA_CHAR = "00000000-0000-0200-6473-5f696c666973";
}

//=============================================================================
// MTU Constants
//=============================================================================

namespace MTU {
    static constexpr uint16_t REQUESTED = 517;      // Request maximum MTU (BLE 5.0)
    static constexpr uint16_t MINIMUM = 23;         // BLE 4.0 minimum MTU, floor after disconnect
    static constexpr uint16_t ATT_OVERHEAD = 3;     // ATT protocol header overhead
}

//=============================================================================
// Timing Constants
//=============================================================================

namespace Timing {
    static constexpr uint32_t SCAN_TIMEOUT_MS = 10000;        // Discovery stops automatically
    static constexpr uint32_t CONNECT_TIMEOUT_MS = 10000;     // Link establishment
    static constexpr uint32_t WRITE_TIMEOUT_MS = 5000;        // Max wait in the write backlog
    static constexpr double REASSEMBLY_TIMEOUT = 10.0;        // Seconds to complete reassembly
}

//=============================================================================
// Frame Header Constants
//=============================================================================

namespace Fragment {
    static constexpr uint8_t CATEGORY = 0x1F;               // Protocol identifier byte
    static constexpr size_t COMPLETE_HEADER_SIZE = 4;       // [cat][flag][len lo][len hi]
    static constexpr size_t SHORT_HEADER_SIZE = 2;          // [cat][flag]
    static constexpr size_t MAX_CHUNK_SIZE = 506;           // 506 + 4 = 510 < 512
    static constexpr size_t MAX_PAYLOAD_SIZE = 0xFFFF;      // 2-byte total length field

    enum Flag : uint8_t {
        COMPLETE = 0x00,    // Self-contained message
        FIRST    = 0x01,    // First fragment, carries total length
        CONTINUE = 0x02,    // Middle fragment
        LAST     = 0x03     // Final fragment
    };
}

//=============================================================================
// Application Message Catalogue
//=============================================================================

/**
 * @brief Application message type (first byte of every reassembled message)
 */
enum class MessageType : uint8_t {
    // Device -> host
    KEYPRESS          = 0x10,
    SENSOR            = 0x11,
    ACK               = 0x12,

    // Host -> device
    LED               = 0x20,
    CONFIG            = 0x21,
    REQUEST           = 0x22,

    // Diagnostics
    ECHO              = 0x30,
    DISCARD           = 0x31,

    // Terminal display
    FULL_SCREEN       = 0x40,
    CLEAR_SCREEN      = 0x41,
    FULL_SCREEN_ATTRS = 0x42,
    CURSOR_POS        = 0x43,
    PARTIAL_UPDATE    = 0x44,

    // Voice and audio
    VOICE_START       = 0x60,
    VOICE_DATA        = 0x61,
    VOICE_END         = 0x62,
    AUDIO_HEADPHONES  = 0x63,
    HAPTIC            = 0x64
};

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Platform type for factory selection
 */
enum class PlatformType {
    NONE,
    SIMULATED           // In-process Tapir device
};

/**
 * @brief Connection state machine states
 */
enum class ConnectionState : uint8_t {
    DISCONNECTED,
    SCANNING,
    CONNECTING,
    CONNECTED,           // Link up, channel setup in progress
    READY                // MTU negotiated and notifications subscribed
};

/**
 * @brief Operation result codes
 */
enum class OperationResult : uint8_t {
    SUCCESS,
    TIMEOUT,
    DISCONNECTED,
    NOT_CONNECTED,
    NOT_FOUND,
    NOT_SUPPORTED,
    INVALID_ARGUMENT,
    BUSY,
    CANCELLED,
    INSUFFICIENT_AUTH,
    ERROR
};

//=============================================================================
// Data Structures
//=============================================================================

/**
 * @brief Scan result from discovery
 */
struct ScanResult {
    std::string id;                 // Platform peer identifier (address or UUID)
    std::string name;
    std::string local_name;
    int8_t rssi = 0;
    bool has_rssi = false;
    bool connectable = true;

    int8_t effectiveRssi() const { return has_rssi ? rssi : -100; }
};

/**
 * @brief Link configuration
 *
 * Defaults equal the protocol constants.
 */
struct LinkConfig {
    std::string name_filter = "TAPIR";      // Case-insensitive, name or local name
    uint32_t scan_timeout_ms = Timing::SCAN_TIMEOUT_MS;
    uint32_t connect_timeout_ms = Timing::CONNECT_TIMEOUT_MS;
    uint32_t write_timeout_ms = Timing::WRITE_TIMEOUT_MS;
    uint16_t requested_mtu = MTU::REQUESTED;
    uint8_t category = Fragment::CATEGORY;
    double reassembly_timeout = Timing::REASSEMBLY_TIMEOUT;
    bool write_with_response = true;
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    using OnScanResult = std::function<void(const ScanResult& result)>;
    using OnDataReceived = std::function<void(const Bytes& data)>;
    using OnDisconnected = std::function<void(int reason)>;
    using OnCompletion = std::function<void(OperationResult result)>;
}

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Largest frame chunk that fits one write at a given MTU
 *
 * Leaves room for the ATT header and the full 4-byte frame header, capped
 * at the protocol maximum.
 */
inline size_t maxChunkForMTU(uint16_t mtu) {
    size_t overhead = MTU::ATT_OVERHEAD + Fragment::COMPLETE_HEADER_SIZE;
    if (mtu <= overhead) return 0;
    size_t chunk = mtu - overhead;
    return (chunk < Fragment::MAX_CHUNK_SIZE) ? chunk : Fragment::MAX_CHUNK_SIZE;
}

/**
 * @brief Check that a type byte belongs to the message catalogue
 */
inline bool isKnownMessageType(uint8_t value) {
    switch (static_cast<MessageType>(value)) {
        case MessageType::KEYPRESS:
        case MessageType::SENSOR:
        case MessageType::ACK:
        case MessageType::LED:
        case MessageType::CONFIG:
        case MessageType::REQUEST:
        case MessageType::ECHO:
        case MessageType::DISCARD:
        case MessageType::FULL_SCREEN:
        case MessageType::CLEAR_SCREEN:
        case MessageType::FULL_SCREEN_ATTRS:
        case MessageType::CURSOR_POS:
        case MessageType::PARTIAL_UPDATE:
        case MessageType::VOICE_START:
        case MessageType::VOICE_DATA:
        case MessageType::VOICE_END:
        case MessageType::AUDIO_HEADPHONES:
        case MessageType::HAPTIC:
            return true;
    }
    return false;
}

inline const char* messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::KEYPRESS:          return "KEYPRESS";
        case MessageType::SENSOR:            return "SENSOR";
        case MessageType::ACK:               return "ACK";
        case MessageType::LED:               return "LED";
        case MessageType::CONFIG:            return "CONFIG";
        case MessageType::REQUEST:           return "REQUEST";
        case MessageType::ECHO:              return "ECHO";
        case MessageType::DISCARD:           return "DISCARD";
        case MessageType::FULL_SCREEN:       return "FULL_SCREEN";
        case MessageType::CLEAR_SCREEN:      return "CLEAR_SCREEN";
        case MessageType::FULL_SCREEN_ATTRS: return "FULL_SCREEN_ATTRS";
        case MessageType::CURSOR_POS:        return "CURSOR_POS";
        case MessageType::PARTIAL_UPDATE:    return "PARTIAL_UPDATE";
        case MessageType::VOICE_START:       return "VOICE_START";
        case MessageType::VOICE_DATA:        return "VOICE_DATA";
        case MessageType::VOICE_END:         return "VOICE_END";
        case MessageType::AUDIO_HEADPHONES:  return "AUDIO_HEADPHONES";
        case MessageType::HAPTIC:            return "HAPTIC";
    }
    return "UNKNOWN";
}

/**
 * @brief Convert ConnectionState to string for logging
 */
inline const char* stateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::SCANNING:     return "SCANNING";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::READY:        return "READY";
        default:                            return "UNKNOWN";
    }
}

/**
 * @brief Convert OperationResult to string for logging and status text
 */
inline const char* resultToString(OperationResult result) {
    switch (result) {
        case OperationResult::SUCCESS:           return "SUCCESS";
        case OperationResult::TIMEOUT:           return "TIMEOUT";
        case OperationResult::DISCONNECTED:      return "DISCONNECTED";
        case OperationResult::NOT_CONNECTED:     return "NOT_CONNECTED";
        case OperationResult::NOT_FOUND:         return "NOT_FOUND";
        case OperationResult::NOT_SUPPORTED:     return "NOT_SUPPORTED";
        case OperationResult::INVALID_ARGUMENT:  return "INVALID_ARGUMENT";
        case OperationResult::BUSY:              return "BUSY";
        case OperationResult::CANCELLED:         return "CANCELLED";
        case OperationResult::INSUFFICIENT_AUTH: return "INSUFFICIENT_AUTH";
        case OperationResult::ERROR:             return "ERROR";
        default:                                 return "UNKNOWN";
    }
}

}} // namespace Tapir::BLE
