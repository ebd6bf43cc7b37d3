/**
 * @file ConnectionManager.h
 * @brief Connection lifecycle state machine
 *
 * Owns the link lifecycle: scan -> connect -> channel discovery -> MTU
 * negotiation -> notification subscription -> ready -> disconnect. The
 * ConnectionSession it owns is only mutated through its transition
 * functions; everyone else gets read-only snapshots.
 *
 * Event / state table (anything not listed as a transition is a no-op):
 *
 *   event              DISCONNECTED  SCANNING      CONNECTING  CONNECTED     READY
 *   startScan          SCANNING      no-op(false)  no-op(false) no-op(false) no-op(false)
 *   stopScan           no-op         DISCONNECTED  no-op       no-op         no-op
 *   scan deadline      no-op         DISCONNECTED  no-op       no-op         no-op
 *   connect(peer)      CONNECTING    CONNECTING    BUSY        drop+connect  drop+connect
 *   disconnect()       no-op         DISCONNECTED  DISCONNECTED DISCONNECTED DISCONNECTED
 *   transport lost     no-op         no-op         DISCONNECTED DISCONNECTED DISCONNECTED
 *
 * A connect step failure (link timeout, channel not found, MTU negotiation,
 * subscription) records the reason and reverts to DISCONNECTED. A failed
 * connection priority request is logged and tolerated. Nothing is retried
 * here; reconnect policy belongs to the caller.
 */
#pragma once

#include "LinkTypes.h"
#include "LinkPlatform.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Tapir { namespace BLE {

/**
 * @brief Snapshot of the current (or last) connection
 */
struct ConnectionSession {
    ConnectionState state = ConnectionState::DISCONNECTED;
    uint16_t negotiated_mtu = MTU::MINIMUM;
    std::string peer_id;
    std::string peer_name;
    std::string last_error;         // Most recent failure, kept across disconnects
    double connected_at = 0;
};

class ConnectionManager {
public:
    using OnStateChanged = std::function<void(ConnectionState from, ConnectionState to)>;
    using OnReady = std::function<void(const ConnectionSession& session)>;
    using OnDisconnected = std::function<void(const std::string& reason)>;
    using OnScanComplete = std::function<void(const std::vector<ScanResult>& results)>;

public:
    explicit ConnectionManager(ILinkPlatform::Ptr platform = nullptr);
    ~ConnectionManager();

    /**
     * @brief Attach the transport (hooks its disconnect callback)
     */
    void setPlatform(ILinkPlatform::Ptr platform);

    void setConfig(const LinkConfig& config);
    const LinkConfig& getConfig() const { return _config; }

    //=========================================================================
    // Callbacks
    //=========================================================================

    void setOnStateChanged(OnStateChanged callback) { _on_state_changed = callback; }
    void setOnReady(OnReady callback) { _on_ready = callback; }
    void setOnDisconnected(OnDisconnected callback) { _on_disconnected = callback; }
    void setOnScanResult(Callbacks::OnScanResult callback) { _on_scan_result = callback; }
    void setOnScanComplete(OnScanComplete callback) { _on_scan_complete = callback; }

    /**
     * @brief Sink for raw notifications once subscribed
     *
     * Must be set before connect().
     */
    void setOnDataReceived(Callbacks::OnDataReceived callback) { _on_data = callback; }

    //=========================================================================
    // Operations
    //=========================================================================

    /**
     * @brief Begin discovery (DISCONNECTED -> SCANNING)
     *
     * Results passing the name filter are cached and forwarded to the scan
     * result callback. Discovery ends after the scan timeout; that is not
     * an error.
     *
     * @return false if not DISCONNECTED or the platform refused
     */
    bool startScan();

    /**
     * @brief End discovery early (SCANNING -> DISCONNECTED)
     */
    void stopScan();

    /**
     * @brief Connect and bring the link to READY
     *
     * Blocks until the whole negotiation sequence completes or fails.
     *
     * @param peer_id Identifier from a scan result (or a remembered peer)
     * @return SUCCESS when READY; BUSY if a connect is already in flight;
     *         otherwise the failing step's result
     */
    OperationResult connect(const std::string& peer_id);

    /**
     * @brief Explicit disconnect from any state
     */
    void disconnect();

    /**
     * @brief Periodic processing (scan deadline)
     */
    void loop();

    /**
     * @brief Unsolicited link loss reported by the transport
     */
    void handleTransportDisconnect(int reason);

    //=========================================================================
    // Status
    //=========================================================================

    ConnectionState state() const;
    bool isReady() const { return state() == ConnectionState::READY; }
    ConnectionSession session() const;

    /**
     * @brief Human-readable status for display
     */
    std::string statusText() const;

    /**
     * @brief Cached scan results, strongest signal first
     */
    std::vector<ScanResult> scanResults() const;

    /**
     * @brief Check a scan result against the configured name filter
     */
    bool matchesFilter(const ScanResult& result) const;

private:
    /**
     * @brief Compare-and-set state transition
     * @return false (and no change) if the current state is not `expected`
     */
    bool transition(ConnectionState expected, ConnectionState new_state);

    /**
     * @brief Force DISCONNECTED, resetting the session
     * @return previous state
     */
    ConnectionState resetSession(const std::string& error);

    OperationResult failConnect(const std::string& reason, OperationResult result);
    void onScanResult(const ScanResult& result);
    void finishScan(const char* why);
    void notifyStateChanged(ConnectionState from, ConnectionState to);

    ILinkPlatform::Ptr _platform;
    LinkConfig _config;

    ConnectionSession _session;
    std::map<std::string, ScanResult> _scan_cache;
    double _scan_deadline = 0;
    mutable std::recursive_mutex _mutex;

    OnStateChanged _on_state_changed = nullptr;
    OnReady _on_ready = nullptr;
    OnDisconnected _on_disconnected = nullptr;
    Callbacks::OnScanResult _on_scan_result = nullptr;
    OnScanComplete _on_scan_complete = nullptr;
    Callbacks::OnDataReceived _on_data = nullptr;
};

}} // namespace Tapir::BLE
