/**
 * @file AudioTypes.h
 * @brief Audio output vocabulary shared by the voice pipeline and the router
 */
#pragma once

#include <string>
#include <cstdint>

namespace Tapir { namespace Audio {

/**
 * @brief What a sound is for; decides where it plays when no headphones are in
 */
enum class AudioContext : uint8_t {
    AI,
    NOTIFICATION,
    CALL,
    MUSIC,
    SYSTEM
};

enum class AudioOutput : uint8_t {
    PHONE_SPEAKER,
    PHONE_WIRED,
    TAPIR_SPEAKER,
    TAPIR_WIRED,
    BLUETOOTH_HEADPHONES
};

enum class RingerMode : uint8_t {
    SILENT,
    VIBRATE,
    NORMAL
};

/**
 * @brief Plays synthesized speech somewhere appropriate for the context
 */
class ISpeechOutput {
public:
    virtual ~ISpeechOutput() = default;

    /**
     * @brief Speak text; returns once playback has been handed off
     * @return false if nothing could be played
     */
    virtual bool speak(const std::string& text, AudioContext context) = 0;

    /**
     * @brief Halt any playback in progress
     */
    virtual void stop() = 0;
};

inline const char* contextToString(AudioContext context) {
    switch (context) {
        case AudioContext::AI:           return "ai";
        case AudioContext::NOTIFICATION: return "notification";
        case AudioContext::CALL:         return "call";
        case AudioContext::MUSIC:        return "music";
        case AudioContext::SYSTEM:       return "system";
        default:                         return "unknown";
    }
}

inline const char* outputToString(AudioOutput output) {
    switch (output) {
        case AudioOutput::PHONE_SPEAKER:        return "phone_speaker";
        case AudioOutput::PHONE_WIRED:          return "phone_wired";
        case AudioOutput::TAPIR_SPEAKER:        return "tapir_speaker";
        case AudioOutput::TAPIR_WIRED:          return "tapir_wired";
        case AudioOutput::BLUETOOTH_HEADPHONES: return "bluetooth_headphones";
        default:                                return "unknown";
    }
}

inline const char* ringerModeToString(RingerMode mode) {
    switch (mode) {
        case RingerMode::SILENT:  return "silent";
        case RingerMode::VIBRATE: return "vibrate";
        case RingerMode::NORMAL:  return "normal";
        default:                  return "unknown";
    }
}

}} // namespace Tapir::Audio
