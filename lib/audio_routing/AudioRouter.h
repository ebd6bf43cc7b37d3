/**
 * @file AudioRouter.h
 * @brief Picks where sound plays and forwards speech to a synthesizer
 *
 * Output priority:
 *   1. phone wired headphones
 *   2. Tapir wired headphones (only while the Tapir is connected)
 *   3. Bluetooth headphones other than the Tapir
 *   4. context rule:
 *        AI, NOTIFICATION, CALL -> Tapir speaker if connected, else phone speaker
 *        MUSIC, SYSTEM          -> phone speaker while the screen is on,
 *                                  otherwise Tapir speaker if connected
 *
 * Tapir headphone state arrives as AUDIO_HEADPHONES messages, so the router
 * registers with the message dispatcher as an interceptor for that type.
 */
#pragma once

#include "AudioTypes.h"
#include "MessageDispatcher.h"
#include "Messages.h"

#include <functional>
#include <mutex>
#include <string>

namespace Tapir { namespace Audio {

/**
 * @brief Text-to-speech engine the router delegates to
 */
class ISpeechSynthesizer {
public:
    virtual ~ISpeechSynthesizer() = default;

    virtual bool synthesize(const std::string& text, AudioOutput output) = 0;
    virtual void stop() = 0;
};

class AudioRouter : public ISpeechOutput, public BLE::IMessageInterceptor {
public:
    /**
     * @brief Sends a haptic pattern to the Tapir
     */
    using HapticSender = std::function<void(BLE::Haptic::Pattern pattern)>;

    struct AlertDecision {
        bool play_sound = false;
        bool vibrate = false;
    };

public:
    AudioRouter() = default;
    virtual ~AudioRouter() = default;

    void setSynthesizer(ISpeechSynthesizer* synthesizer);
    void setHapticSender(HapticSender sender);

    //=========================================================================
    // Device state
    //=========================================================================

    /**
     * @brief Tapir link up/down; going down also clears Tapir headphones
     */
    void setTapirConnected(bool connected);
    void setTapirWiredHeadphones(bool connected);
    void setPhoneWiredHeadphones(bool connected);
    void setBluetoothHeadphones(bool connected);
    void setScreenOn(bool on);
    void setRingerMode(RingerMode mode);

    bool isTapirConnected() const;
    bool hasTapirWiredHeadphones() const;
    RingerMode getRingerMode() const;

    //=========================================================================
    // Routing
    //=========================================================================

    AudioOutput getRoute(AudioContext context) const;

    /**
     * @brief Decide how to alert for a notification and send the haptic
     */
    AlertDecision alertNotification();

    // ISpeechOutput
    virtual bool speak(const std::string& text, AudioContext context) override;
    virtual void stop() override;

    // IMessageInterceptor
    virtual bool intercept(const BLE::Message& message) override;

private:
    ISpeechSynthesizer* _synthesizer = nullptr;
    HapticSender _haptic_sender = nullptr;

    bool _tapir_connected = false;
    bool _tapir_wired = false;
    bool _phone_wired = false;
    bool _bluetooth = false;
    bool _screen_on = true;
    RingerMode _ringer_mode = RingerMode::NORMAL;

    mutable std::recursive_mutex _mutex;
};

}} // namespace Tapir::Audio
