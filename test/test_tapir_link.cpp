/**
 * @file test_tapir_link.cpp
 * @brief Whole link stack against the simulated device
 */

#include <gtest/gtest.h>

#include "TapirLink.h"
#include "platforms/SimulatedPlatform.h"
#include "VoicePipeline.h"
#include "AudioRouter.h"

#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace Tapir;
using namespace Tapir::BLE;

namespace {

class TapirLinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = std::make_shared<SimulatedPlatform>();
        link.dispatcher().setHandler([this](const Message& message) {
            handled.push_back(message);
        });
        ASSERT_TRUE(link.start(device));
    }

    void TearDown() override {
        link.stop();
    }

    // Enough iterations to drain anything the device has queued
    void pump(int iterations = 50) {
        for (int i = 0; i < iterations; i++) {
            link.loop();
        }
    }

    void connectToDevice() {
        ASSERT_TRUE(link.startScan());
        pump(1);
        std::vector<ScanResult> results = link.connection().scanResults();
        ASSERT_FALSE(results.empty());
        ASSERT_EQ(OperationResult::SUCCESS, link.connect(results.front().id));
    }

    std::shared_ptr<SimulatedPlatform> device;
    TapirLink link;
    std::vector<Message> handled;
};

} // namespace

TEST_F(TapirLinkTest, ScanFindsOnlyTapirDevices) {
    ScanResult speaker;
    speaker.id = "SPK-1";
    speaker.name = "Kitchen Speaker";
    speaker.rssi = -30;
    speaker.has_rssi = true;
    device->addNeighbour(speaker);

    ASSERT_TRUE(link.startScan());
    pump(1);

    std::vector<ScanResult> results = link.connection().scanResults();
    ASSERT_EQ(1u, results.size());
    EXPECT_EQ("SIM-TAPIR-0001", results[0].id);
    EXPECT_EQ("Tapir-Sim", results[0].name);
}

TEST_F(TapirLinkTest, ConnectNegotiatesMtu) {
    connectToDevice();
    EXPECT_TRUE(link.isReady());
    EXPECT_EQ(247, link.connection().session().negotiated_mtu);
    EXPECT_EQ(240u, link.writeQueue().getMaxChunkSize());
    EXPECT_EQ("Ready (MTU: 247)", link.statusText());
    EXPECT_EQ("SIM-TAPIR-0001", link.getLastPeerId());
}

TEST_F(TapirLinkTest, SendBeforeReadyIsRejected) {
    EXPECT_EQ(OperationResult::NOT_CONNECTED, link.sendEcho("early").get());
    EXPECT_TRUE(device->writtenFrames().empty());
}

TEST_F(TapirLinkTest, EchoRoundTrip) {
    connectToDevice();
    ASSERT_EQ(OperationResult::SUCCESS, link.sendEcho("hello tapir").get());
    pump();

    ASSERT_EQ(1u, handled.size());
    EXPECT_EQ(MessageType::ECHO, handled[0].type);
    EXPECT_EQ("hello tapir", handled[0].payload.toString());
}

TEST_F(TapirLinkTest, RequestIsAcknowledged) {
    connectToDevice();
    ASSERT_EQ(OperationResult::SUCCESS, link.send(Messages::request(Bytes("status"))).get());
    pump();

    ASSERT_EQ(1u, handled.size());
    EXPECT_EQ(MessageType::ACK, handled[0].type);
    EXPECT_EQ("status", handled[0].payload.toString());
}

TEST_F(TapirLinkTest, LargeEchoIsFragmentedBothWays) {
    connectToDevice();
    std::string text(1000, 'x');
    ASSERT_EQ(OperationResult::SUCCESS, link.sendEcho(text).get());
    EXPECT_EQ(5u, device->writtenFrames().size());
    pump();

    ASSERT_EQ(1u, handled.size());
    EXPECT_EQ(text, handled[0].payload.toString());
    EXPECT_EQ(1u, link.reassembler().stats().messages_completed);
}

TEST_F(TapirLinkTest, CommandsUpdateDeviceState) {
    connectToDevice();
    ASSERT_EQ(OperationResult::SUCCESS, link.sendLED(2, 10, 20, 30).get());
    ASSERT_EQ(OperationResult::SUCCESS, link.sendTerminal(4, 1, Bytes("tpir")).get());
    ASSERT_EQ(OperationResult::SUCCESS, link.sendHaptic(Haptic::BUZZ).get());
    ASSERT_EQ(OperationResult::SUCCESS, link.sendDiscard(700).get());

    SimulatedPlatform::DeviceState state = device->deviceState();
    EXPECT_EQ(10, state.leds[2][0]);
    EXPECT_EQ(20, state.leds[2][1]);
    EXPECT_EQ(30, state.leds[2][2]);
    EXPECT_EQ(4, state.screen_cols);
    EXPECT_EQ("tpir", state.screen.toString());
    ASSERT_EQ(1u, state.haptics.size());
    EXPECT_EQ(Haptic::BUZZ, state.haptics[0]);
    EXPECT_EQ(700u, state.discarded_bytes);
    EXPECT_EQ(4u, state.messages_received);

    ASSERT_EQ(OperationResult::SUCCESS, link.clearTerminal().get());
    EXPECT_EQ(0u, device->deviceState().screen.size());
}

TEST_F(TapirLinkTest, KeyPressesReachHandler) {
    connectToDevice();
    device->pressKey(7, KeyEvent::DOWN);
    device->pressKey(7, KeyEvent::UP);
    pump();

    ASSERT_EQ(2u, handled.size());
    KeyPress key;
    ASSERT_TRUE(Messages::parseKeyPress(handled[1], key));
    EXPECT_EQ(7, key.key_index);
    EXPECT_EQ(KeyEvent::UP, key.event);
}

TEST_F(TapirLinkTest, PushToTalkReachesVoicePipeline) {
    Voice::VoicePipeline voice;
    link.dispatcher().addInterceptor(&voice);
    connectToDevice();

    std::set<uint16_t> dropped = {3};
    EXPECT_EQ(9u, device->simulatePushToTalk(10, dropped));
    pump();

    Voice::VoiceSession session;
    ASSERT_TRUE(voice.lastSession(session));
    EXPECT_EQ(9u, session.packetCount());
    EXPECT_EQ(1u, session.sequence_gaps);
    EXPECT_EQ(10, session.expected_sequence);
    EXPECT_EQ(9u * Voice::Stream::SAMPLES_PER_FRAME, session.samples.size());
    EXPECT_EQ(Voice::VoiceState::IDLE, voice.state());

    // Voice traffic never reaches the generic handler
    EXPECT_TRUE(handled.empty());
    link.dispatcher().removeInterceptor(&voice);
}

TEST_F(TapirLinkTest, LongPushToTalkIsNotTruncated) {
    Voice::VoicePipeline voice;
    link.dispatcher().addInterceptor(&voice);
    connectToDevice();

    EXPECT_EQ(250u, device->simulatePushToTalk(250));
    pump(100);

    Voice::VoiceSession session;
    ASSERT_TRUE(voice.lastSession(session));
    EXPECT_EQ(250u, session.packetCount());
    EXPECT_EQ(0u, session.sequence_gaps);
    link.dispatcher().removeInterceptor(&voice);
}

TEST_F(TapirLinkTest, HeadphoneStateReachesRouter) {
    Audio::AudioRouter router;
    router.setTapirConnected(true);
    link.dispatcher().addInterceptor(&router);
    connectToDevice();

    device->setHeadphonesConnected(true);
    pump();
    EXPECT_TRUE(router.hasTapirWiredHeadphones());
    EXPECT_EQ(Audio::AudioOutput::TAPIR_WIRED, router.getRoute(Audio::AudioContext::AI));
    link.dispatcher().removeInterceptor(&router);
}

TEST_F(TapirLinkTest, LinkLossResetsLink) {
    connectToDevice();

    device->dropLink(8);
    EXPECT_FALSE(link.isReady());
    EXPECT_EQ("Disconnected (Link lost (reason 8))", link.statusText());
    EXPECT_EQ(16u, link.writeQueue().getMaxChunkSize());
    EXPECT_EQ(OperationResult::NOT_CONNECTED, link.sendEcho("gone").get());
}

TEST_F(TapirLinkTest, AutoConnectUsesLastPeer) {
    link.setLastPeerId("SIM-TAPIR-0001");
    EXPECT_TRUE(link.autoConnect());
    EXPECT_TRUE(link.isReady());

    link.disconnect();
    link.setAutoConnect(false);
    EXPECT_FALSE(link.autoConnect());

    link.setAutoConnect(true);
    link.setLastPeerId("");
    EXPECT_FALSE(link.autoConnect());
}

TEST_F(TapirLinkTest, UnknownPeerFailsCleanly) {
    EXPECT_EQ(OperationResult::NOT_FOUND, link.connect("NOT-A-TAPIR"));
    EXPECT_EQ("", link.getLastPeerId());
    EXPECT_EQ(ConnectionState::DISCONNECTED, link.connection().state());
}

TEST_F(TapirLinkTest, StopShutsDownPlatform) {
    connectToDevice();
    link.stop();
    EXPECT_FALSE(link.isRunning());
    EXPECT_FALSE(device->isConnected());
}

TEST(TapirLinkShutdown, StopWithWritesInFlight) {
    for (int round = 0; round < 20; round++) {
        TapirLink link;
        // The link holds the only reference to the platform
        ASSERT_TRUE(link.start(std::make_shared<SimulatedPlatform>()));
        ASSERT_TRUE(link.startScan());
        link.loop();
        std::vector<ScanResult> results = link.connection().scanResults();
        ASSERT_FALSE(results.empty());
        ASSERT_EQ(OperationResult::SUCCESS, link.connect(results.front().id));

        std::vector<std::future<OperationResult>> writes;
        for (int i = 0; i < 50; i++) {
            writes.push_back(link.sendDiscard(2000));
        }
        link.stop();
        EXPECT_FALSE(link.isRunning());

        for (std::future<OperationResult>& write : writes) {
            ASSERT_EQ(std::future_status::ready, write.wait_for(std::chrono::seconds(5)));
        }
    }
}
