/**
 * @file AudioRouter.cpp
 * @brief Audio output selection
 */

#include "AudioRouter.h"
#include "Log.h"

namespace Tapir { namespace Audio {

void AudioRouter::setSynthesizer(ISpeechSynthesizer* synthesizer) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _synthesizer = synthesizer;
}

void AudioRouter::setHapticSender(HapticSender sender) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _haptic_sender = sender;
}

//=============================================================================
// Device state
//=============================================================================

void AudioRouter::setTapirConnected(bool connected) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _tapir_connected = connected;
    if (!connected) {
        _tapir_wired = false;
    }
    DEBUG(std::string("AudioRouter: Tapir ") + (connected ? "connected" : "disconnected"));
}

void AudioRouter::setTapirWiredHeadphones(bool connected) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _tapir_wired = connected;
    DEBUG(std::string("AudioRouter: Tapir headphones ") + (connected ? "in" : "out"));
}

void AudioRouter::setPhoneWiredHeadphones(bool connected) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _phone_wired = connected;
}

void AudioRouter::setBluetoothHeadphones(bool connected) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _bluetooth = connected;
}

void AudioRouter::setScreenOn(bool on) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _screen_on = on;
}

void AudioRouter::setRingerMode(RingerMode mode) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _ringer_mode = mode;
}

bool AudioRouter::isTapirConnected() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _tapir_connected;
}

bool AudioRouter::hasTapirWiredHeadphones() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _tapir_wired;
}

RingerMode AudioRouter::getRingerMode() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _ringer_mode;
}

//=============================================================================
// Routing
//=============================================================================

AudioOutput AudioRouter::getRoute(AudioContext context) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_phone_wired) {
        return AudioOutput::PHONE_WIRED;
    }
    if (_tapir_wired && _tapir_connected) {
        return AudioOutput::TAPIR_WIRED;
    }
    if (_bluetooth) {
        return AudioOutput::BLUETOOTH_HEADPHONES;
    }

    switch (context) {
        case AudioContext::AI:
        case AudioContext::NOTIFICATION:
        case AudioContext::CALL:
            return _tapir_connected ? AudioOutput::TAPIR_SPEAKER : AudioOutput::PHONE_SPEAKER;
        case AudioContext::MUSIC:
        case AudioContext::SYSTEM:
        default:
            if (_screen_on) {
                return AudioOutput::PHONE_SPEAKER;
            }
            return _tapir_connected ? AudioOutput::TAPIR_SPEAKER : AudioOutput::PHONE_SPEAKER;
    }
}

AudioRouter::AlertDecision AudioRouter::alertNotification() {
    AlertDecision decision;
    HapticSender sender;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        switch (_ringer_mode) {
            case RingerMode::SILENT:
                break;
            case RingerMode::VIBRATE:
                decision.vibrate = true;
                break;
            case RingerMode::NORMAL:
            default:
                decision.play_sound = true;
                decision.vibrate = true;
                break;
        }
        if (decision.vibrate && _tapir_connected) {
            sender = _haptic_sender;
        }
    }

    if (sender) {
        sender(BLE::Haptic::NOTIFICATION);
    }

    DEBUG(std::string("AudioRouter: Notification alert (") + ringerModeToString(getRingerMode()) +
          "): sound=" + (decision.play_sound ? "yes" : "no") +
          " vibrate=" + (decision.vibrate ? "yes" : "no"));
    return decision;
}

bool AudioRouter::speak(const std::string& text, AudioContext context) {
    AudioOutput output = getRoute(context);
    ISpeechSynthesizer* synthesizer;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        synthesizer = _synthesizer;
    }

    if (!synthesizer) {
        WARNING("AudioRouter: No synthesizer, cannot speak");
        return false;
    }

    DEBUG(std::string("AudioRouter: Speaking (") + contextToString(context) + ") on " + outputToString(output));
    return synthesizer->synthesize(text, output);
}

void AudioRouter::stop() {
    ISpeechSynthesizer* synthesizer;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        synthesizer = _synthesizer;
    }
    if (synthesizer) {
        synthesizer->stop();
    }
}

bool AudioRouter::intercept(const BLE::Message& message) {
    if (message.type != BLE::MessageType::AUDIO_HEADPHONES) {
        return false;
    }

    bool connected = false;
    if (!BLE::Messages::parseHeadphones(message, connected)) {
        WARNING("AudioRouter: Malformed headphone message");
        return true;
    }
    setTapirWiredHeadphones(connected);
    return true;
}

}} // namespace Tapir::Audio
