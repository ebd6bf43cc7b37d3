/**
 * @file ConnectionManager.cpp
 * @brief Connection lifecycle state machine implementation
 */

#include "ConnectionManager.h"
#include "Log.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace Tapir { namespace BLE {

namespace {

std::string toUpper(const std::string& value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(toupper(c)); });
    return result;
}

} // namespace

ConnectionManager::ConnectionManager(ILinkPlatform::Ptr platform) {
    setPlatform(platform);
}

ConnectionManager::~ConnectionManager() {
    if (_platform) {
        _platform->setOnDisconnected(nullptr);
    }
}

void ConnectionManager::setPlatform(ILinkPlatform::Ptr platform) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_platform) {
        _platform->setOnDisconnected(nullptr);
    }
    _platform = platform;
    if (_platform) {
        _platform->setOnDisconnected([this](int reason) {
            handleTransportDisconnect(reason);
        });
    }
}

void ConnectionManager::setConfig(const LinkConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _config = config;
}

//=============================================================================
// State transitions
//=============================================================================

bool ConnectionManager::transition(ConnectionState expected, ConnectionState new_state) {
    bool ok = false;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_session.state == expected) {
            _session.state = new_state;
            ok = true;
        }
    }
    if (ok) {
        DEBUG("ConnectionManager: State: " + std::string(stateToString(expected)) +
              " -> " + std::string(stateToString(new_state)));
        notifyStateChanged(expected, new_state);
    }
    return ok;
}

ConnectionState ConnectionManager::resetSession(const std::string& error) {
    ConnectionState previous;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        previous = _session.state;
        _session.state = ConnectionState::DISCONNECTED;
        _session.negotiated_mtu = MTU::MINIMUM;
        _session.peer_id.clear();
        _session.peer_name.clear();
        _session.connected_at = 0;
        if (!error.empty()) {
            _session.last_error = error;
        }
    }
    if (previous != ConnectionState::DISCONNECTED) {
        DEBUG("ConnectionManager: State: " + std::string(stateToString(previous)) +
              " -> DISCONNECTED");
        notifyStateChanged(previous, ConnectionState::DISCONNECTED);
    }
    return previous;
}

void ConnectionManager::notifyStateChanged(ConnectionState from, ConnectionState to) {
    if (_on_state_changed) {
        _on_state_changed(from, to);
    }
}

//=============================================================================
// Scanning
//=============================================================================

bool ConnectionManager::startScan() {
    if (!_platform) {
        ERROR("ConnectionManager: No platform");
        return false;
    }

    if (!transition(ConnectionState::DISCONNECTED, ConnectionState::SCANNING)) {
        WARNING("ConnectionManager: Cannot scan while " + std::string(stateToString(state())));
        return false;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _scan_cache.clear();
        _scan_deadline = RNS::Utilities::OS::time() + _config.scan_timeout_ms / 1000.0;
    }

    bool started = _platform->startScan([this](const ScanResult& result) {
        onScanResult(result);
    });

    if (!started) {
        ERROR("ConnectionManager: Platform failed to start scan");
        {
            std::lock_guard<std::recursive_mutex> lock(_mutex);
            _session.last_error = "Scan failed to start";
        }
        transition(ConnectionState::SCANNING, ConnectionState::DISCONNECTED);
        return false;
    }

    INFO("ConnectionManager: Scanning for " + _config.name_filter + " devices (" +
         std::to_string(_config.scan_timeout_ms) + "ms)");
    return true;
}

void ConnectionManager::stopScan() {
    finishScan("stopped");
}

void ConnectionManager::finishScan(const char* why) {
    if (!transition(ConnectionState::SCANNING, ConnectionState::DISCONNECTED)) {
        return;
    }
    if (_platform) {
        _platform->stopScan();
    }

    std::vector<ScanResult> results = scanResults();
    DEBUG("ConnectionManager: Scan " + std::string(why) + ", " +
          std::to_string(results.size()) + " device(s) found");

    if (_on_scan_complete) {
        _on_scan_complete(results);
    }
}

void ConnectionManager::onScanResult(const ScanResult& result) {
    if (state() != ConnectionState::SCANNING) {
        return;
    }
    if (!matchesFilter(result)) {
        TRACE("ConnectionManager: Ignoring " + result.id + " (" + result.name + ")");
        return;
    }

    bool is_new;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        is_new = _scan_cache.find(result.id) == _scan_cache.end();
        _scan_cache[result.id] = result;
    }

    if (is_new) {
        char buf[128];
        snprintf(buf, sizeof(buf), "ConnectionManager: Found %s (%s) rssi %d",
                 result.name.c_str(), result.id.c_str(), result.effectiveRssi());
        DEBUG(buf);
    }

    if (_on_scan_result) {
        _on_scan_result(result);
    }
}

bool ConnectionManager::matchesFilter(const ScanResult& result) const {
    if (_config.name_filter.empty()) {
        return true;
    }
    std::string needle = toUpper(_config.name_filter);
    return toUpper(result.name).find(needle) != std::string::npos ||
           toUpper(result.local_name).find(needle) != std::string::npos;
}

std::vector<ScanResult> ConnectionManager::scanResults() const {
    std::vector<ScanResult> results;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        results.reserve(_scan_cache.size());
        for (const auto& entry : _scan_cache) {
            results.push_back(entry.second);
        }
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const ScanResult& a, const ScanResult& b) {
                         return a.effectiveRssi() > b.effectiveRssi();
                     });
    return results;
}

//=============================================================================
// Connection
//=============================================================================

OperationResult ConnectionManager::connect(const std::string& peer_id) {
    if (!_platform) {
        ERROR("ConnectionManager: No platform");
        return OperationResult::NOT_SUPPORTED;
    }
    if (peer_id.empty()) {
        return OperationResult::INVALID_ARGUMENT;
    }

    ConnectionState current = state();
    if (current == ConnectionState::CONNECTING) {
        WARNING("ConnectionManager: Connect already in progress");
        return OperationResult::BUSY;
    }
    if (current == ConnectionState::CONNECTED || current == ConnectionState::READY) {
        DEBUG("ConnectionManager: Dropping current link before connecting");
        disconnect();
    }

    // Scanning -> Connecting stops discovery first
    if (state() == ConnectionState::SCANNING) {
        _platform->stopScan();
        if (!transition(ConnectionState::SCANNING, ConnectionState::CONNECTING)) {
            return OperationResult::BUSY;
        }
    } else if (!transition(ConnectionState::DISCONNECTED, ConnectionState::CONNECTING)) {
        return OperationResult::BUSY;
    }

    uint32_t timeout_ms;
    uint16_t requested_mtu;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _session.peer_id = peer_id;
        auto cached = _scan_cache.find(peer_id);
        _session.peer_name = (cached != _scan_cache.end()) ? cached->second.name : std::string();
        _session.last_error.clear();
        timeout_ms = _config.connect_timeout_ms;
        requested_mtu = _config.requested_mtu;
    }

    INFO("ConnectionManager: Connecting to " + peer_id + "...");

    // Link establishment
    OperationResult result = _platform->connect(peer_id, timeout_ms);
    if (result != OperationResult::SUCCESS) {
        return failConnect(std::string("Connection failed: ") + resultToString(result), result);
    }
    if (!transition(ConnectionState::CONNECTING, ConnectionState::CONNECTED)) {
        _platform->disconnect();
        return failConnect("Connection cancelled", OperationResult::CANCELLED);
    }

    // Channel discovery
    result = _platform->discoverChannel(UUID::SERVICE, UUID::DATA_CHAR);
    if (result != OperationResult::SUCCESS) {
        _platform->disconnect();
        if (result == OperationResult::NOT_FOUND) {
            return failConnect("Data characteristic not found", result);
        }
        return failConnect(std::string("Service discovery failed: ") + resultToString(result), result);
    }

    // Payload size negotiation; the peer may grant less than requested
    uint16_t granted = MTU::MINIMUM;
    result = _platform->negotiateMTU(requested_mtu, granted);
    if (result != OperationResult::SUCCESS) {
        _platform->disconnect();
        return failConnect(std::string("MTU negotiation failed: ") + resultToString(result), result);
    }
    if (granted < MTU::MINIMUM) {
        granted = MTU::MINIMUM;
    }

    result = _platform->requestConnectionPriority();
    if (result != OperationResult::SUCCESS) {
        WARNING("ConnectionManager: Connection priority request failed: " +
                std::string(resultToString(result)));
    }

    // Notification subscription
    Callbacks::OnDataReceived on_data = _on_data;
    result = _platform->subscribeNotifications([on_data](const Bytes& data) {
        if (on_data) {
            on_data(data);
        }
    });
    if (result != OperationResult::SUCCESS) {
        _platform->disconnect();
        return failConnect(std::string("Notification subscription failed: ") + resultToString(result),
                           result);
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _session.negotiated_mtu = granted;
        _session.connected_at = RNS::Utilities::OS::time();
    }
    if (!transition(ConnectionState::CONNECTED, ConnectionState::READY)) {
        _platform->disconnect();
        return failConnect("Connection cancelled", OperationResult::CANCELLED);
    }

    ConnectionSession snapshot = session();
    INFO("ConnectionManager: Ready, peer " + snapshot.peer_id + ", MTU " +
         std::to_string(snapshot.negotiated_mtu));

    if (_on_ready) {
        _on_ready(snapshot);
    }
    return OperationResult::SUCCESS;
}

OperationResult ConnectionManager::failConnect(const std::string& reason, OperationResult result) {
    ERROR("ConnectionManager: " + reason);
    resetSession(reason);
    return result;
}

void ConnectionManager::disconnect() {
    ConnectionState current = state();
    if (current == ConnectionState::DISCONNECTED) {
        return;
    }
    if (current == ConnectionState::SCANNING) {
        stopScan();
        return;
    }

    INFO("ConnectionManager: Disconnecting");

    // State first, so a disconnect event echoed by the stack is a no-op
    resetSession(std::string());
    if (_platform) {
        _platform->disconnect();
    }

    if (_on_disconnected) {
        _on_disconnected("Disconnected by host");
    }
}

void ConnectionManager::handleTransportDisconnect(int reason) {
    ConnectionState current = state();
    if (current == ConnectionState::DISCONNECTED || current == ConnectionState::SCANNING) {
        return;
    }

    std::string why = "Link lost (reason " + std::to_string(reason) + ")";
    WARNING("ConnectionManager: " + why);
    resetSession(why);

    if (_on_disconnected) {
        _on_disconnected(why);
    }
}

void ConnectionManager::loop() {
    if (state() != ConnectionState::SCANNING) {
        return;
    }
    double deadline;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        deadline = _scan_deadline;
    }
    if (RNS::Utilities::OS::time() >= deadline) {
        finishScan("timed out");
    }
}

//=============================================================================
// Status
//=============================================================================

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _session.state;
}

ConnectionSession ConnectionManager::session() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _session;
}

std::string ConnectionManager::statusText() const {
    ConnectionSession snapshot = session();
    switch (snapshot.state) {
        case ConnectionState::DISCONNECTED:
            if (!snapshot.last_error.empty()) {
                return "Disconnected (" + snapshot.last_error + ")";
            }
            return "Disconnected";
        case ConnectionState::SCANNING:
            return "Scanning...";
        case ConnectionState::CONNECTING:
            return "Connecting...";
        case ConnectionState::CONNECTED:
            return "Connected";
        case ConnectionState::READY:
            return "Ready (MTU: " + std::to_string(snapshot.negotiated_mtu) + ")";
        default:
            return "Unknown";
    }
}

}} // namespace Tapir::BLE
