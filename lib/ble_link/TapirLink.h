/**
 * @file TapirLink.h
 * @brief Host-side link to a Tapir device
 *
 * Composition root for the link layer: owns the platform, the connection
 * state machine, the reassembler, the write queue and the dispatcher, and
 * wires them together:
 *
 *   notifications -> (deferred to loop) -> FrameReassembler -> MessageDispatcher
 *   send*() -> WriteQueue -> FrameCodec -> platform write
 *
 * Usage:
 *   TapirLink link;
 *   link.start(LinkPlatformFactory::create(PlatformType::SIMULATED));
 *   link.dispatcher().addInterceptor(&voice);
 *   link.startScan();
 *   while (...) link.loop();
 *   link.connect(link.connection().scanResults().front().id);
 *   link.sendEcho("hello").get();
 */
#pragma once

#include "LinkTypes.h"
#include "LinkPlatform.h"
#include "ConnectionManager.h"
#include "FrameReassembler.h"
#include "WriteQueue.h"
#include "MessageDispatcher.h"
#include "Messages.h"
#include "Bytes.h"

#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace Tapir { namespace BLE {

class TapirLink {
public:
    static constexpr double MAINTENANCE_INTERVAL = 1.0;     // Seconds between maintenance
    static constexpr size_t MAX_PENDING_DATA = 256;

public:
    explicit TapirLink(const LinkConfig& config = LinkConfig());
    ~TapirLink();

    TapirLink(const TapirLink&) = delete;
    TapirLink& operator=(const TapirLink&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Initialize the platform and hook up callbacks
     */
    bool start(ILinkPlatform::Ptr platform);

    void stop();

    /**
     * @brief Drive platform events, inbound data and maintenance
     */
    void loop();

    bool isRunning() const { return _platform && _platform->isRunning(); }

    //=========================================================================
    // Connection
    //=========================================================================

    bool startScan() { return _connection.startScan(); }
    void stopScan() { _connection.stopScan(); }

    /**
     * @brief Connect to a peer; remembered as the last peer on success
     */
    OperationResult connect(const std::string& peer_id);

    /**
     * @brief Single attempt to reconnect to the last known peer
     * @return false if auto-connect is disabled, no peer is known, or the attempt failed
     */
    bool autoConnect();

    void disconnect() { _connection.disconnect(); }

    void setAutoConnect(bool enabled) { _auto_connect = enabled; }
    bool getAutoConnect() const { return _auto_connect; }
    void setLastPeerId(const std::string& peer_id) { _last_peer_id = peer_id; }
    const std::string& getLastPeerId() const { return _last_peer_id; }

    bool isReady() const { return _connection.isReady(); }
    std::string statusText() const { return _connection.statusText(); }

    //=========================================================================
    // Sending (only from READY)
    //=========================================================================

    std::future<OperationResult> send(const Message& message);
    std::future<OperationResult> send(MessageType type, const Bytes& payload);

    std::future<OperationResult> sendLED(uint8_t key_index, uint8_t r, uint8_t g, uint8_t b);
    std::future<OperationResult> sendTerminal(uint8_t cols, uint8_t rows, const Bytes& data);
    std::future<OperationResult> clearTerminal();
    std::future<OperationResult> sendEcho(const std::string& text);
    std::future<OperationResult> sendDiscard(size_t size);
    std::future<OperationResult> sendHaptic(Haptic::Pattern pattern);

    //=========================================================================
    // Components
    //=========================================================================

    ConnectionManager& connection() { return _connection; }
    const ConnectionManager& connection() const { return _connection; }
    MessageDispatcher& dispatcher() { return _dispatcher; }
    WriteQueue& writeQueue() { return _write_queue; }
    const FrameReassembler& reassembler() const { return _reassembler; }
    ILinkPlatform::Ptr platform() const { return _platform; }

private:
    void setupCallbacks();
    void onDataReceived(const Bytes& data);
    void onReady(const ConnectionSession& session);
    void onDisconnected(const std::string& reason);
    OperationResult writeFrame(const Bytes& frame);
    void performMaintenance();

    LinkConfig _config;
    ILinkPlatform::Ptr _platform;

    ConnectionManager _connection;
    FrameReassembler _reassembler;
    MessageDispatcher _dispatcher;
    WriteQueue _write_queue;

    bool _auto_connect = true;
    std::string _last_peer_id;
    double _last_maintenance = 0;

    // Inbound notifications (deferred from platform callback to loop)
    std::vector<Bytes> _pending_data;

    // Thread safety for callbacks from the platform
    mutable std::recursive_mutex _mutex;
};

}} // namespace Tapir::BLE
