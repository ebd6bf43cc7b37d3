/**
 * @file SimulatedPlatform.cpp
 * @brief In-process Tapir device implementation
 */

#include "SimulatedPlatform.h"
#include "Log.h"

#include <cmath>
#include <cstdio>

namespace Tapir { namespace BLE {

static const double TWO_PI = 6.28318530717958647692;

SimulatedPlatform::SimulatedPlatform() : SimulatedPlatform(DeviceProfile()) {
}

SimulatedPlatform::SimulatedPlatform(const DeviceProfile& profile) : _profile(profile) {
    _device_codec.setMTU(MTU::MINIMUM);
    _device_reassembler.setReassemblyCallback([this](const Bytes& raw) {
        onDeviceMessage(raw);
    });
}

SimulatedPlatform::~SimulatedPlatform() {
    shutdown();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool SimulatedPlatform::initialize(const LinkConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _config = config;
    _running = true;
    INFO("SimulatedPlatform: Initialized, device " + _profile.name + " (" + _profile.id + ")");
    return true;
}

void SimulatedPlatform::loop() {
    std::vector<ScanResult> advertisements;
    std::vector<Bytes> notifications;
    Callbacks::OnScanResult on_scan = nullptr;
    Callbacks::OnDataReceived on_data = nullptr;

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (!_running) {
            return;
        }

        // One advertising burst per scan
        if (_scanning && !_advertised) {
            _advertised = true;
            for (const ScanResult& neighbour : _neighbours) {
                advertisements.push_back(neighbour);
            }
            ScanResult self;
            self.id = _profile.id;
            self.name = _profile.name;
            self.local_name = _profile.name;
            self.rssi = _profile.rssi;
            self.has_rssi = true;
            advertisements.push_back(self);
            on_scan = _on_scan_result;
        }

        if (_connected && _subscribed) {
            while (!_outbox.empty() && notifications.size() < NOTIFICATIONS_PER_LOOP) {
                notifications.push_back(_outbox.front());
                _outbox.pop_front();
            }
            on_data = _on_data;
        }
        else {
            _outbox.clear();
        }
    }

    // Deliver outside the lock; receivers may write back immediately
    if (on_scan) {
        for (const ScanResult& result : advertisements) {
            on_scan(result);
        }
    }
    if (on_data) {
        for (const Bytes& frame : notifications) {
            on_data(frame);
        }
    }
}

void SimulatedPlatform::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running) {
        return;
    }
    resetLink();
    _scanning = false;
    _running = false;
    DEBUG("SimulatedPlatform: Shut down");
}

bool SimulatedPlatform::isRunning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _running;
}

//=============================================================================
// Scanning
//=============================================================================

bool SimulatedPlatform::startScan(Callbacks::OnScanResult callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running) {
        ERROR("SimulatedPlatform: startScan before initialize");
        return false;
    }
    _on_scan_result = callback;
    _scanning = true;
    _advertised = false;
    return true;
}

void SimulatedPlatform::stopScan() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _scanning = false;
}

bool SimulatedPlatform::isScanning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _scanning;
}

//=============================================================================
// Connection
//=============================================================================

OperationResult SimulatedPlatform::connect(const std::string& peer_id, uint32_t timeout_ms) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running) {
        return OperationResult::ERROR;
    }
    if (peer_id != _profile.id) {
        WARNING("SimulatedPlatform: Unknown peer " + peer_id);
        return OperationResult::NOT_FOUND;
    }
    if (!_profile.accept_connection) {
        WARNING("SimulatedPlatform: Connection attempt timed out after " +
                std::to_string(timeout_ms) + "ms");
        return OperationResult::TIMEOUT;
    }
    _connected = true;
    _mtu = MTU::MINIMUM;
    _device_codec.setMTU(_mtu);
    DEBUG("SimulatedPlatform: Link up with " + peer_id);
    return OperationResult::SUCCESS;
}

OperationResult SimulatedPlatform::discoverChannel(const std::string& service_uuid,
                                                   const std::string& char_uuid) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_connected) {
        return OperationResult::NOT_CONNECTED;
    }
    if (!_profile.has_channel || service_uuid != UUID::SERVICE || char_uuid != UUID::DATA_CHAR) {
        return OperationResult::NOT_FOUND;
    }
    _channel_found = true;
    return OperationResult::SUCCESS;
}

OperationResult SimulatedPlatform::negotiateMTU(uint16_t requested, uint16_t& granted) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_connected) {
        return OperationResult::NOT_CONNECTED;
    }
    _mtu = (requested < _profile.max_mtu) ? requested : _profile.max_mtu;
    if (_mtu < MTU::MINIMUM) {
        _mtu = MTU::MINIMUM;
    }
    _device_codec.setMTU(_mtu);
    granted = _mtu;

    char buf[64];
    snprintf(buf, sizeof(buf), "SimulatedPlatform: MTU requested %u, granted %u", requested, granted);
    DEBUG(buf);
    return OperationResult::SUCCESS;
}

OperationResult SimulatedPlatform::requestConnectionPriority() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_connected) {
        return OperationResult::NOT_CONNECTED;
    }
    return _profile.accept_priority ? OperationResult::SUCCESS : OperationResult::NOT_SUPPORTED;
}

OperationResult SimulatedPlatform::subscribeNotifications(Callbacks::OnDataReceived callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_connected || !_channel_found) {
        return OperationResult::NOT_CONNECTED;
    }
    if (!_profile.accept_subscription) {
        return OperationResult::INSUFFICIENT_AUTH;
    }
    _on_data = callback;
    _subscribed = true;
    return OperationResult::SUCCESS;
}

OperationResult SimulatedPlatform::write(const Bytes& data, bool response) {
    (void)response;
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_connected) {
        return OperationResult::NOT_CONNECTED;
    }
    if (!_channel_found) {
        return OperationResult::NOT_FOUND;
    }
    if (data.size() + MTU::ATT_OVERHEAD > _mtu) {
        char buf[80];
        snprintf(buf, sizeof(buf), "SimulatedPlatform: Write of %zu bytes exceeds MTU %u",
                 data.size(), _mtu);
        ERROR(buf);
        return OperationResult::INVALID_ARGUMENT;
    }

    _written_frames.push_back(data);
    _device_reassembler.processFrame(data);
    return OperationResult::SUCCESS;
}

void SimulatedPlatform::disconnect() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_connected) {
        DEBUG("SimulatedPlatform: Host disconnected");
    }
    resetLink();
}

bool SimulatedPlatform::isConnected() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _connected;
}

void SimulatedPlatform::setOnDisconnected(Callbacks::OnDisconnected callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_disconnected = callback;
}

void SimulatedPlatform::resetLink() {
    _connected = false;
    _channel_found = false;
    _subscribed = false;
    _on_data = nullptr;
    _mtu = MTU::MINIMUM;
    _outbox.clear();
    _device_reassembler.clear();
}

//=============================================================================
// Device side
//=============================================================================

void SimulatedPlatform::addNeighbour(const ScanResult& result) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _neighbours.push_back(result);
}

void SimulatedPlatform::setProfile(const DeviceProfile& profile) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _profile = profile;
}

void SimulatedPlatform::onDeviceMessage(const Bytes& raw) {
    Message message;
    if (!Message::parse(raw, message)) {
        WARNING("SimulatedPlatform: Empty message from host");
        return;
    }

    _received.push_back(message);
    _device_state.messages_received++;

    const Bytes& payload = message.payload;
    switch (message.type) {
        case MessageType::ECHO:
            queueNotification(Message(MessageType::ECHO, payload));
            break;

        case MessageType::REQUEST:
            queueNotification(Message(MessageType::ACK, payload));
            break;

        case MessageType::LED:
            if (payload.size() >= 4 && payload.data()[0] < KEY_COUNT) {
                std::array<uint8_t, 3>& led = _device_state.leds[payload.data()[0]];
                led[0] = payload.data()[1];
                led[1] = payload.data()[2];
                led[2] = payload.data()[3];
            }
            break;

        case MessageType::FULL_SCREEN:
            if (payload.size() >= 2) {
                _device_state.screen_cols = payload.data()[0];
                _device_state.screen_rows = payload.data()[1];
                _device_state.screen = payload.mid(2);
            }
            break;

        case MessageType::CLEAR_SCREEN:
            _device_state.screen.clear();
            break;

        case MessageType::DISCARD:
            _device_state.discarded_bytes += payload.size();
            break;

        case MessageType::HAPTIC:
            if (payload.size() >= 1) {
                _device_state.haptics.push_back(payload.data()[0]);
            }
            break;

        default:
            TRACE(std::string("SimulatedPlatform: Ignoring ") + messageTypeToString(message.type));
            break;
    }
}

bool SimulatedPlatform::queueNotification(const Message& message) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_connected || !_subscribed) {
        WARNING("SimulatedPlatform: Host not subscribed, dropping " +
                std::string(messageTypeToString(message.type)));
        return false;
    }
    std::vector<Bytes> frames = _device_codec.encode(message.serialize());
    if (frames.empty()) {
        return false;
    }
    for (const Bytes& frame : frames) {
        _outbox.push_back(frame);
    }
    return true;
}

bool SimulatedPlatform::sendFromDevice(const Message& message) {
    return queueNotification(message);
}

bool SimulatedPlatform::pressKey(uint8_t key_index, KeyEvent event) {
    Bytes payload(2);
    payload.append(key_index);
    payload.append(static_cast<uint8_t>(event));
    return queueNotification(Message(MessageType::KEYPRESS, payload));
}

bool SimulatedPlatform::setHeadphonesConnected(bool connected) {
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _device_state.headphones = connected;
    }
    Bytes payload(1);
    payload.append(static_cast<uint8_t>(connected ? 1 : 0));
    return queueNotification(Message(MessageType::AUDIO_HEADPHONES, payload));
}

size_t SimulatedPlatform::simulatePushToTalk(size_t frame_count, const std::set<uint16_t>& dropped,
                                             uint16_t first_sequence) {
    if (!queueNotification(Message(MessageType::VOICE_START, Bytes()))) {
        return 0;
    }

    size_t sent = 0;
    for (size_t i = 0; i < frame_count; i++) {
        uint16_t sequence = static_cast<uint16_t>((first_sequence + i) & 0xFFFF);
        if (dropped.count(sequence)) {
            continue;
        }
        uint32_t timestamp_ms = static_cast<uint32_t>(i * 20);
        uint32_t sample_offset = static_cast<uint32_t>(i * SAMPLES_PER_FRAME);
        if (queueNotification(Message(MessageType::VOICE_DATA,
                                      buildVoicePacket(sequence, timestamp_ms, sample_offset)))) {
            sent++;
        }
    }

    queueNotification(Message(MessageType::VOICE_END, Bytes()));

    char buf[80];
    snprintf(buf, sizeof(buf), "SimulatedPlatform: Queued push-to-talk, %zu/%zu frames",
             sent, frame_count);
    DEBUG(buf);
    return sent;
}

void SimulatedPlatform::dropLink(int reason) {
    Callbacks::OnDisconnected callback = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (!_connected) {
            return;
        }
        resetLink();
        callback = _on_disconnected;
    }
    WARNING("SimulatedPlatform: Device dropped the link, reason " + std::to_string(reason));
    if (callback) {
        callback(reason);
    }
}

Bytes SimulatedPlatform::buildVoicePacket(uint16_t sequence, uint32_t timestamp_ms, uint32_t sample_offset) {
    Bytes packet(6 + SAMPLES_PER_FRAME * 2);

    // Sequence (big-endian)
    packet.append(static_cast<uint8_t>((sequence >> 8) & 0xFF));
    packet.append(static_cast<uint8_t>(sequence & 0xFF));

    // Capture timestamp (little-endian)
    packet.append(static_cast<uint8_t>(timestamp_ms & 0xFF));
    packet.append(static_cast<uint8_t>((timestamp_ms >> 8) & 0xFF));
    packet.append(static_cast<uint8_t>((timestamp_ms >> 16) & 0xFF));
    packet.append(static_cast<uint8_t>((timestamp_ms >> 24) & 0xFF));

    for (size_t i = 0; i < SAMPLES_PER_FRAME; i++) {
        double t = static_cast<double>(sample_offset + i) / SAMPLE_RATE;
        int16_t sample = static_cast<int16_t>(8000.0 * std::sin(TWO_PI * TONE_HZ * t));
        uint16_t bits = static_cast<uint16_t>(sample);
        packet.append(static_cast<uint8_t>(bits & 0xFF));
        packet.append(static_cast<uint8_t>((bits >> 8) & 0xFF));
    }

    return packet;
}

//=============================================================================
// Inspection
//=============================================================================

SimulatedPlatform::DeviceState SimulatedPlatform::deviceState() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _device_state;
}

std::vector<Message> SimulatedPlatform::receivedMessages() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _received;
}

std::vector<Bytes> SimulatedPlatform::writtenFrames() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _written_frames;
}

size_t SimulatedPlatform::pendingNotifications() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _outbox.size();
}

uint16_t SimulatedPlatform::negotiatedMTU() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _mtu;
}

}} // namespace Tapir::BLE
