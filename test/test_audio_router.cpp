/**
 * @file test_audio_router.cpp
 * @brief Output selection and notification alerts
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "AudioRouter.h"

#include <vector>

using namespace Tapir;
using namespace Tapir::Audio;
using ::testing::Return;

namespace {

class MockSynthesizer : public ISpeechSynthesizer {
public:
    MOCK_METHOD2(synthesize, bool(const std::string& text, AudioOutput output));
    MOCK_METHOD0(stop, void());
};

BLE::Message headphones(uint8_t state) {
    Bytes payload(1);
    payload.append(state);
    return BLE::Message(BLE::MessageType::AUDIO_HEADPHONES, payload);
}

} // namespace

TEST(AudioRouter, PhoneSpeakerWhenNothingConnected) {
    AudioRouter router;
    EXPECT_EQ(AudioOutput::PHONE_SPEAKER, router.getRoute(AudioContext::AI));
    EXPECT_EQ(AudioOutput::PHONE_SPEAKER, router.getRoute(AudioContext::MUSIC));
}

TEST(AudioRouter, TapirSpeakerForVoiceContexts) {
    AudioRouter router;
    router.setTapirConnected(true);
    EXPECT_EQ(AudioOutput::TAPIR_SPEAKER, router.getRoute(AudioContext::AI));
    EXPECT_EQ(AudioOutput::TAPIR_SPEAKER, router.getRoute(AudioContext::NOTIFICATION));
    EXPECT_EQ(AudioOutput::TAPIR_SPEAKER, router.getRoute(AudioContext::CALL));
}

TEST(AudioRouter, MediaFollowsScreen) {
    AudioRouter router;
    router.setTapirConnected(true);
    EXPECT_EQ(AudioOutput::PHONE_SPEAKER, router.getRoute(AudioContext::MUSIC));

    router.setScreenOn(false);
    EXPECT_EQ(AudioOutput::TAPIR_SPEAKER, router.getRoute(AudioContext::MUSIC));
    EXPECT_EQ(AudioOutput::TAPIR_SPEAKER, router.getRoute(AudioContext::SYSTEM));

    router.setTapirConnected(false);
    EXPECT_EQ(AudioOutput::PHONE_SPEAKER, router.getRoute(AudioContext::SYSTEM));
}

TEST(AudioRouter, HeadphonePriority) {
    AudioRouter router;
    router.setTapirConnected(true);
    router.setBluetoothHeadphones(true);
    EXPECT_EQ(AudioOutput::BLUETOOTH_HEADPHONES, router.getRoute(AudioContext::AI));

    router.setTapirWiredHeadphones(true);
    EXPECT_EQ(AudioOutput::TAPIR_WIRED, router.getRoute(AudioContext::AI));

    router.setPhoneWiredHeadphones(true);
    EXPECT_EQ(AudioOutput::PHONE_WIRED, router.getRoute(AudioContext::MUSIC));
}

TEST(AudioRouter, TapirHeadphonesNeedConnectedTapir) {
    AudioRouter router;
    router.setTapirConnected(true);
    router.setTapirWiredHeadphones(true);
    EXPECT_EQ(AudioOutput::TAPIR_WIRED, router.getRoute(AudioContext::AI));

    router.setTapirConnected(false);
    EXPECT_FALSE(router.hasTapirWiredHeadphones());
    EXPECT_EQ(AudioOutput::PHONE_SPEAKER, router.getRoute(AudioContext::AI));

    // Reconnecting does not bring the old headphone state back
    router.setTapirConnected(true);
    EXPECT_EQ(AudioOutput::TAPIR_SPEAKER, router.getRoute(AudioContext::AI));
}

TEST(AudioRouter, HeadphoneMessagesAreClaimed) {
    AudioRouter router;
    router.setTapirConnected(true);

    EXPECT_TRUE(router.intercept(headphones(1)));
    EXPECT_TRUE(router.hasTapirWiredHeadphones());

    EXPECT_TRUE(router.intercept(headphones(0)));
    EXPECT_FALSE(router.hasTapirWiredHeadphones());

    // Malformed, still consumed
    EXPECT_TRUE(router.intercept(BLE::Message(BLE::MessageType::AUDIO_HEADPHONES, Bytes())));
    EXPECT_FALSE(router.intercept(BLE::Message(BLE::MessageType::ECHO, Bytes("x"))));
}

TEST(AudioRouter, NotificationAlertFollowsRingerMode) {
    AudioRouter router;
    std::vector<BLE::Haptic::Pattern> sent;
    router.setHapticSender([&](BLE::Haptic::Pattern pattern) { sent.push_back(pattern); });
    router.setTapirConnected(true);

    AudioRouter::AlertDecision normal = router.alertNotification();
    EXPECT_TRUE(normal.play_sound);
    EXPECT_TRUE(normal.vibrate);

    router.setRingerMode(RingerMode::VIBRATE);
    AudioRouter::AlertDecision vibrate = router.alertNotification();
    EXPECT_FALSE(vibrate.play_sound);
    EXPECT_TRUE(vibrate.vibrate);

    router.setRingerMode(RingerMode::SILENT);
    AudioRouter::AlertDecision silent = router.alertNotification();
    EXPECT_FALSE(silent.play_sound);
    EXPECT_FALSE(silent.vibrate);

    ASSERT_EQ(2u, sent.size());
    EXPECT_EQ(BLE::Haptic::NOTIFICATION, sent[0]);
}

TEST(AudioRouter, NoHapticWithoutTapir) {
    AudioRouter router;
    int sent = 0;
    router.setHapticSender([&](BLE::Haptic::Pattern) { sent++; });

    EXPECT_TRUE(router.alertNotification().vibrate);
    EXPECT_EQ(0, sent);
}

TEST(AudioRouter, SpeakUsesRoutedOutput) {
    AudioRouter router;
    MockSynthesizer synthesizer;
    router.setSynthesizer(&synthesizer);
    router.setTapirConnected(true);

    EXPECT_CALL(synthesizer, synthesize("hello", AudioOutput::TAPIR_SPEAKER)).WillOnce(Return(true));
    EXPECT_TRUE(router.speak("hello", AudioContext::AI));

    EXPECT_CALL(synthesizer, stop()).Times(1);
    router.stop();
}

TEST(AudioRouter, SpeakWithoutSynthesizerFails) {
    AudioRouter router;
    EXPECT_FALSE(router.speak("hello", AudioContext::AI));
    router.stop();
}
