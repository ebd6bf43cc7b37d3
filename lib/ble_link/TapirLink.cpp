/**
 * @file TapirLink.cpp
 * @brief Host-side link implementation
 */

#include "TapirLink.h"
#include "Log.h"
#include "Utilities/OS.h"

namespace Tapir { namespace BLE {

namespace {

std::future<OperationResult> resolved(OperationResult result) {
    std::promise<OperationResult> promise;
    promise.set_value(result);
    return promise.get_future();
}

} // namespace

TapirLink::TapirLink(const LinkConfig& config)
    : _config(config),
      _reassembler(config.category),
      _write_queue([this](const Bytes& frame) { return writeFrame(frame); }, config.category) {
    _connection.setConfig(_config);
    _reassembler.setTimeout(_config.reassembly_timeout);
    _write_queue.setTimeout(_config.write_timeout_ms);
}

TapirLink::~TapirLink() {
    stop();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool TapirLink::start(ILinkPlatform::Ptr platform) {
    if (_platform && _platform->isRunning()) {
        return true;
    }
    if (!platform) {
        ERROR("TapirLink: No platform");
        return false;
    }
    if (!platform->initialize(_config)) {
        ERROR("TapirLink: Failed to initialize " + platform->getPlatformName() + " platform");
        return false;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _platform = platform;
    }
    _connection.setPlatform(_platform);
    setupCallbacks();
    _last_maintenance = RNS::Utilities::OS::time();

    INFO("TapirLink: Started on " + _platform->getPlatformName() + " platform");
    return true;
}

void TapirLink::stop() {
    if (!_platform) {
        return;
    }

    _connection.disconnect();
    _write_queue.clear(OperationResult::CANCELLED);
    _connection.setPlatform(nullptr);
    _platform->shutdown();

    // The write queue worker may still hold its own reference
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _platform.reset();
        _pending_data.clear();
    }
    _reassembler.clear();

    INFO("TapirLink: Stopped");
}

void TapirLink::setupCallbacks() {
    _connection.setOnDataReceived([this](const Bytes& data) {
        onDataReceived(data);
    });
    _connection.setOnReady([this](const ConnectionSession& session) {
        onReady(session);
    });
    _connection.setOnDisconnected([this](const std::string& reason) {
        onDisconnected(reason);
    });
    _reassembler.setReassemblyCallback([this](const Bytes& message) {
        _dispatcher.dispatch(message);
    });
}

void TapirLink::loop() {
    if (!_platform || !_platform->isRunning()) {
        return;
    }

    // Platform events (scan results, notifications)
    _platform->loop();

    // Process pending notifications (deferred from callback)
    std::vector<Bytes> pending;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        pending.swap(_pending_data);
    }
    for (const Bytes& data : pending) {
        _reassembler.processFrame(data);
    }

    // Scan deadline
    _connection.loop();

    double now = RNS::Utilities::OS::time();
    if (now - _last_maintenance >= MAINTENANCE_INTERVAL) {
        performMaintenance();
        _last_maintenance = now;
    }
}

void TapirLink::performMaintenance() {
    _reassembler.checkTimeouts();
}

//=============================================================================
// Connection
//=============================================================================

OperationResult TapirLink::connect(const std::string& peer_id) {
    OperationResult result = _connection.connect(peer_id);
    if (result == OperationResult::SUCCESS) {
        _last_peer_id = peer_id;
    }
    return result;
}

bool TapirLink::autoConnect() {
    if (!_auto_connect) {
        return false;
    }
    if (_last_peer_id.empty()) {
        DEBUG("TapirLink: No previous device to reconnect to");
        return false;
    }

    INFO("TapirLink: Auto-connecting to " + _last_peer_id);
    OperationResult result = connect(_last_peer_id);
    if (result != OperationResult::SUCCESS) {
        WARNING("TapirLink: Auto-connect failed: " + std::string(resultToString(result)));
        return false;
    }
    return true;
}

void TapirLink::onDataReceived(const Bytes& data) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_pending_data.size() >= MAX_PENDING_DATA) {
        WARNING("TapirLink: Pending data queue full, dropping notification");
        return;
    }
    _pending_data.push_back(data);
}

void TapirLink::onReady(const ConnectionSession& session) {
    _write_queue.setMTU(session.negotiated_mtu);
    _reassembler.clear();
    _last_peer_id = session.peer_id;
    DEBUG("TapirLink: Frame chunk size now " + std::to_string(_write_queue.getMaxChunkSize()));
}

void TapirLink::onDisconnected(const std::string& reason) {
    DEBUG("TapirLink: Link down: " + reason);
    _write_queue.clear(OperationResult::DISCONNECTED);
    _write_queue.setMTU(MTU::MINIMUM);
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _pending_data.clear();
    }
    _reassembler.clear();
}

//=============================================================================
// Sending
//=============================================================================

OperationResult TapirLink::writeFrame(const Bytes& frame) {
    // Called on the write queue worker thread
    ILinkPlatform::Ptr platform;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        platform = _platform;
    }
    if (!platform || !_connection.isReady()) {
        return OperationResult::NOT_CONNECTED;
    }
    return platform->write(frame, _config.write_with_response);
}

std::future<OperationResult> TapirLink::send(const Message& message) {
    if (!_connection.isReady()) {
        WARNING(std::string("TapirLink: Cannot send ") + messageTypeToString(message.type) +
                ", link not ready");
        return resolved(OperationResult::NOT_CONNECTED);
    }
    return _write_queue.enqueue(message.serialize());
}

std::future<OperationResult> TapirLink::send(MessageType type, const Bytes& payload) {
    return send(Message(type, payload));
}

std::future<OperationResult> TapirLink::sendLED(uint8_t key_index, uint8_t r, uint8_t g, uint8_t b) {
    return send(Messages::led(key_index, r, g, b));
}

std::future<OperationResult> TapirLink::sendTerminal(uint8_t cols, uint8_t rows, const Bytes& data) {
    return send(Messages::terminalScreen(cols, rows, data));
}

std::future<OperationResult> TapirLink::clearTerminal() {
    return send(Messages::clearScreen());
}

std::future<OperationResult> TapirLink::sendEcho(const std::string& text) {
    return send(Messages::echo(text));
}

std::future<OperationResult> TapirLink::sendDiscard(size_t size) {
    return send(Messages::discard(size));
}

std::future<OperationResult> TapirLink::sendHaptic(Haptic::Pattern pattern) {
    return send(Messages::haptic(pattern));
}

}} // namespace Tapir::BLE
