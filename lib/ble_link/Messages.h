/**
 * @file Messages.h
 * @brief Application message model with builders and parsers
 *
 * A message is the unit the framing layer reassembles: one type byte
 * followed by a type-specific payload.
 */
#pragma once

#include "LinkTypes.h"
#include "Bytes.h"

#include <string>
#include <cstdint>

namespace Tapir { namespace BLE {

/**
 * @brief A fully reassembled application message
 */
struct Message {
    MessageType type = MessageType::ECHO;
    Bytes payload;

    Message() = default;
    Message(MessageType message_type, const Bytes& message_payload)
        : type(message_type), payload(message_payload) {}

    /**
     * @brief Split raw message bytes into type and payload
     * @return false if the input is empty
     */
    static bool parse(const Bytes& raw, Message& message);

    /**
     * @brief Serialize to [type][payload...]
     */
    Bytes serialize() const;

    uint8_t typeByte() const { return static_cast<uint8_t>(type); }
};

//=============================================================================
// Payload vocabularies
//=============================================================================

namespace Haptic {
    enum Pattern : uint8_t {
        TAP          = 0x01,
        DOUBLE       = 0x02,
        BUZZ         = 0x03,
        NOTIFICATION = 0x04,
        RING         = 0x05,
        ALARM        = 0x06
    };

    const char* patternToString(Pattern pattern);
    bool patternFromString(const std::string& name, Pattern& pattern);
}

enum class KeyEvent : uint8_t {
    DOWN = 0x01,
    UP   = 0x02
};

struct KeyPress {
    uint8_t key_index = 0;
    KeyEvent event = KeyEvent::DOWN;
};

//=============================================================================
// Builders and parsers
//=============================================================================

namespace Messages {

    /**
     * @brief Set one key LED: [key, r, g, b]
     */
    Message led(uint8_t key_index, uint8_t r, uint8_t g, uint8_t b);

    /**
     * @brief Replace the terminal screen: [cols, rows, data...]
     */
    Message terminalScreen(uint8_t cols, uint8_t rows, const Bytes& data);

    Message clearScreen();

    Message echo(const std::string& text);
    Message echo(const Bytes& data);

    /**
     * @brief Throughput test payload of N bytes with pattern (i & 0xFF)
     */
    Message discard(size_t size);

    Message haptic(Haptic::Pattern pattern);

    Message request(const Bytes& data);

    /**
     * @brief Parse KEYPRESS [keyIndex, event]
     * @return false if the payload is short or the event is unknown
     */
    bool parseKeyPress(const Message& message, KeyPress& key);

    /**
     * @brief Parse AUDIO_HEADPHONES [connected]
     */
    bool parseHeadphones(const Message& message, bool& connected);

} // namespace Messages

}} // namespace Tapir::BLE
