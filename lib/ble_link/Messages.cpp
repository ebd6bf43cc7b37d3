/**
 * @file Messages.cpp
 * @brief Application message builders and parsers
 */

#include "Messages.h"
#include "Log.h"

#include <cctype>

namespace Tapir { namespace BLE {

bool Message::parse(const Bytes& raw, Message& message) {
    if (raw.size() == 0) {
        return false;
    }
    message.type = static_cast<MessageType>(raw.data()[0]);
    message.payload = raw.mid(1);
    return true;
}

Bytes Message::serialize() const {
    Bytes raw(1 + payload.size());
    raw.append(typeByte());
    raw.append(payload);
    return raw;
}

//=============================================================================
// Haptic
//=============================================================================

namespace Haptic {

static const struct {
    Pattern pattern;
    const char* name;
} PATTERN_NAMES[] = {
    { TAP,          "tap" },
    { DOUBLE,       "double" },
    { BUZZ,         "buzz" },
    { NOTIFICATION, "notification" },
    { RING,         "ring" },
    { ALARM,        "alarm" },
};

const char* patternToString(Pattern pattern) {
    for (const auto& entry : PATTERN_NAMES) {
        if (entry.pattern == pattern) return entry.name;
    }
    return "unknown";
}

bool patternFromString(const std::string& name, Pattern& pattern) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    for (const auto& entry : PATTERN_NAMES) {
        if (lower == entry.name) {
            pattern = entry.pattern;
            return true;
        }
    }
    return false;
}

} // namespace Haptic

//=============================================================================
// Builders
//=============================================================================

namespace Messages {

Message led(uint8_t key_index, uint8_t r, uint8_t g, uint8_t b) {
    Bytes payload(4);
    payload.append(key_index);
    payload.append(r);
    payload.append(g);
    payload.append(b);
    return Message(MessageType::LED, payload);
}

Message terminalScreen(uint8_t cols, uint8_t rows, const Bytes& data) {
    Bytes payload(2 + data.size());
    payload.append(cols);
    payload.append(rows);
    payload.append(data);
    return Message(MessageType::FULL_SCREEN, payload);
}

Message clearScreen() {
    return Message(MessageType::CLEAR_SCREEN, Bytes());
}

Message echo(const std::string& text) {
    return Message(MessageType::ECHO, Bytes(text));
}

Message echo(const Bytes& data) {
    return Message(MessageType::ECHO, data);
}

Message discard(size_t size) {
    Bytes payload(size);
    for (size_t i = 0; i < size; i++) {
        payload.append(static_cast<uint8_t>(i & 0xFF));
    }
    return Message(MessageType::DISCARD, payload);
}

Message haptic(Haptic::Pattern pattern) {
    Bytes payload(1);
    payload.append(static_cast<uint8_t>(pattern));
    return Message(MessageType::HAPTIC, payload);
}

Message request(const Bytes& data) {
    return Message(MessageType::REQUEST, data);
}

//=============================================================================
// Parsers
//=============================================================================

bool parseKeyPress(const Message& message, KeyPress& key) {
    if (message.type != MessageType::KEYPRESS || message.payload.size() < 2) {
        return false;
    }
    const uint8_t* ptr = message.payload.data();
    if (ptr[1] != static_cast<uint8_t>(KeyEvent::DOWN) &&
        ptr[1] != static_cast<uint8_t>(KeyEvent::UP)) {
        WARNING("Messages: Unknown key event " + std::to_string(ptr[1]));
        return false;
    }
    key.key_index = ptr[0];
    key.event = static_cast<KeyEvent>(ptr[1]);
    return true;
}

bool parseHeadphones(const Message& message, bool& connected) {
    if (message.type != MessageType::AUDIO_HEADPHONES || message.payload.size() < 1) {
        return false;
    }
    connected = message.payload.data()[0] != 0;
    return true;
}

} // namespace Messages

}} // namespace Tapir::BLE
