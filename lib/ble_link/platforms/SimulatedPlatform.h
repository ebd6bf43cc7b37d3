/**
 * @file SimulatedPlatform.h
 * @brief In-process Tapir device implementing the link platform HAL
 *
 * Behaves like a Tapir peripheral at the GATT level so the whole host stack
 * (connection state machine, write queue, reassembly, dispatch, voice) can
 * run without radio hardware:
 *   - advertises the configured device (plus optional neighbours) while scanning
 *   - grants min(requested, device limit) as the MTU
 *   - reassembles written frames and reacts: ECHO is echoed back, REQUEST is
 *     answered with ACK, LED/screen/haptic commands update device state
 *   - injects key presses, headphone changes, push-to-talk streams and
 *     unsolicited link loss on request
 *
 * Notifications are queued and delivered from loop(), at most
 * NOTIFICATIONS_PER_LOOP per call, like a BLE stack callback deferred to the
 * main loop.
 */
#pragma once

#include "../LinkPlatform.h"
#include "../FrameCodec.h"
#include "../FrameReassembler.h"
#include "../Messages.h"
#include "Bytes.h"

#include <array>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace Tapir { namespace BLE {

class SimulatedPlatform : public ILinkPlatform {
public:
    static constexpr size_t KEY_COUNT = 12;
    static constexpr uint32_t SAMPLE_RATE = 16000;
    static constexpr size_t SAMPLES_PER_FRAME = 320;       // 20 ms
    static constexpr double TONE_HZ = 440.0;
    static constexpr size_t NOTIFICATIONS_PER_LOOP = 64;   // Per connection event

    /**
     * @brief How the simulated peripheral advertises and behaves
     */
    struct DeviceProfile {
        std::string id = "SIM-TAPIR-0001";
        std::string name = "Tapir-Sim";
        int8_t rssi = -48;
        uint16_t max_mtu = 247;
        bool has_channel = true;
        bool accept_connection = true;
        bool accept_priority = true;
        bool accept_subscription = true;
    };

    /**
     * @brief Observable device-side state
     */
    struct DeviceState {
        std::array<std::array<uint8_t, 3>, KEY_COUNT> leds;
        uint8_t screen_cols = 0;
        uint8_t screen_rows = 0;
        Bytes screen;
        std::vector<uint8_t> haptics;
        size_t discarded_bytes = 0;
        uint32_t messages_received = 0;
        bool headphones = false;

        DeviceState() {
            for (auto& led : leds) led.fill(0);
        }
    };

public:
    SimulatedPlatform();
    explicit SimulatedPlatform(const DeviceProfile& profile);
    virtual ~SimulatedPlatform();

    //=========================================================================
    // ILinkPlatform
    //=========================================================================

    virtual bool initialize(const LinkConfig& config) override;
    virtual void loop() override;
    virtual void shutdown() override;
    virtual bool isRunning() const override;

    virtual bool startScan(Callbacks::OnScanResult callback) override;
    virtual void stopScan() override;
    virtual bool isScanning() const override;

    virtual OperationResult connect(const std::string& peer_id, uint32_t timeout_ms) override;
    virtual OperationResult discoverChannel(const std::string& service_uuid,
                                            const std::string& char_uuid) override;
    virtual OperationResult negotiateMTU(uint16_t requested, uint16_t& granted) override;
    virtual OperationResult requestConnectionPriority() override;
    virtual OperationResult subscribeNotifications(Callbacks::OnDataReceived callback) override;
    virtual OperationResult write(const Bytes& data, bool response = true) override;
    virtual void disconnect() override;
    virtual bool isConnected() const override;
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) override;

    virtual PlatformType getPlatformType() const override { return PlatformType::SIMULATED; }
    virtual std::string getPlatformName() const override { return "Simulated"; }

    //=========================================================================
    // Device-side control
    //=========================================================================

    /**
     * @brief Advertise an additional (non-Tapir) device during scans
     */
    void addNeighbour(const ScanResult& result);

    void setProfile(const DeviceProfile& profile);
    const DeviceProfile& profile() const { return _profile; }

    /**
     * @brief Queue a KEYPRESS notification
     */
    bool pressKey(uint8_t key_index, KeyEvent event);

    /**
     * @brief Queue an AUDIO_HEADPHONES notification
     */
    bool setHeadphonesConnected(bool connected);

    /**
     * @brief Queue a whole push-to-talk stream
     *
     * VOICE_START, one VOICE_DATA per 20 ms PCM16 frame of a sine tone, then
     * VOICE_END. Sequence numbers listed in `dropped` are skipped, as if lost
     * over the air.
     *
     * @return number of VOICE_DATA messages queued
     */
    size_t simulatePushToTalk(size_t frame_count, const std::set<uint16_t>& dropped = std::set<uint16_t>(),
                              uint16_t first_sequence = 0);

    /**
     * @brief Queue an arbitrary device -> host message
     */
    bool sendFromDevice(const Message& message);

    /**
     * @brief Drop the link from the device side (fires the disconnect callback)
     */
    void dropLink(int reason = 0x08);

    DeviceState deviceState() const;
    std::vector<Message> receivedMessages() const;
    std::vector<Bytes> writtenFrames() const;
    size_t pendingNotifications() const;
    uint16_t negotiatedMTU() const;

    /**
     * @brief Build one VOICE_DATA payload ([seqHi][seqLo][ts LE][pcm16 LE])
     */
    static Bytes buildVoicePacket(uint16_t sequence, uint32_t timestamp_ms, uint32_t sample_offset);

private:
    void onDeviceMessage(const Bytes& raw);
    bool queueNotification(const Message& message);
    void resetLink();

    DeviceProfile _profile;
    LinkConfig _config;
    std::vector<ScanResult> _neighbours;

    bool _running = false;
    bool _scanning = false;
    bool _advertised = false;
    bool _connected = false;
    bool _channel_found = false;
    bool _subscribed = false;
    uint16_t _mtu = MTU::MINIMUM;

    FrameCodec _device_codec;
    FrameReassembler _device_reassembler;
    DeviceState _device_state;
    std::vector<Message> _received;
    std::vector<Bytes> _written_frames;
    std::deque<Bytes> _outbox;

    Callbacks::OnScanResult _on_scan_result = nullptr;
    Callbacks::OnDataReceived _on_data = nullptr;
    Callbacks::OnDisconnected _on_disconnected = nullptr;

    mutable std::recursive_mutex _mutex;
};

}} // namespace Tapir::BLE
