/**
 * @file FakePlatform.h
 * @brief Scripted link platform for unit tests
 *
 * Every step of connection setup returns a configurable result, writes are
 * recorded, and scan results, notifications and link loss are injected by
 * the test.
 */
#pragma once

#include "LinkPlatform.h"

#include <mutex>
#include <string>
#include <vector>

namespace Tapir { namespace Test {

using BLE::Bytes;
using BLE::OperationResult;

class FakePlatform : public BLE::ILinkPlatform {
public:
    // Scripted results
    bool scan_starts = true;
    OperationResult connect_result = OperationResult::SUCCESS;
    OperationResult discover_result = OperationResult::SUCCESS;
    OperationResult mtu_result = OperationResult::SUCCESS;
    uint16_t granted_mtu = 185;
    OperationResult priority_result = OperationResult::SUCCESS;
    OperationResult subscribe_result = OperationResult::SUCCESS;
    OperationResult write_result = OperationResult::SUCCESS;

    // Observations
    std::vector<std::string> calls;
    std::vector<Bytes> writes;
    uint16_t requested_mtu = 0;
    uint32_t connect_timeout_ms = 0;
    std::string connected_peer;

    virtual bool initialize(const BLE::LinkConfig&) override {
        _running = true;
        record("initialize");
        return true;
    }
    virtual void loop() override {}
    virtual void shutdown() override {
        _running = false;
        record("shutdown");
    }
    virtual bool isRunning() const override { return _running; }

    virtual bool startScan(BLE::Callbacks::OnScanResult callback) override {
        record("startScan");
        if (!scan_starts) return false;
        _on_scan = callback;
        _scanning = true;
        return true;
    }
    virtual void stopScan() override {
        record("stopScan");
        _scanning = false;
    }
    virtual bool isScanning() const override { return _scanning; }

    virtual OperationResult connect(const std::string& peer_id, uint32_t timeout_ms) override {
        record("connect");
        connect_timeout_ms = timeout_ms;
        if (connect_result == OperationResult::SUCCESS) {
            connected_peer = peer_id;
            _connected = true;
        }
        return connect_result;
    }
    virtual OperationResult discoverChannel(const std::string&, const std::string&) override {
        record("discoverChannel");
        return discover_result;
    }
    virtual OperationResult negotiateMTU(uint16_t requested, uint16_t& granted) override {
        record("negotiateMTU");
        requested_mtu = requested;
        if (mtu_result == OperationResult::SUCCESS) {
            granted = granted_mtu;
        }
        return mtu_result;
    }
    virtual OperationResult requestConnectionPriority() override {
        record("requestConnectionPriority");
        return priority_result;
    }
    virtual OperationResult subscribeNotifications(BLE::Callbacks::OnDataReceived callback) override {
        record("subscribeNotifications");
        if (subscribe_result == OperationResult::SUCCESS) {
            _on_data = callback;
        }
        return subscribe_result;
    }
    virtual OperationResult write(const Bytes& data, bool) override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (write_result == OperationResult::SUCCESS) {
            writes.push_back(data);
        }
        return write_result;
    }
    virtual void disconnect() override {
        record("disconnect");
        _connected = false;
    }
    virtual bool isConnected() const override { return _connected; }
    virtual void setOnDisconnected(BLE::Callbacks::OnDisconnected callback) override {
        _on_disconnected = callback;
    }

    virtual BLE::PlatformType getPlatformType() const override { return BLE::PlatformType::NONE; }
    virtual std::string getPlatformName() const override { return "Fake"; }

    //=========================================================================
    // Injection
    //=========================================================================

    void advertise(const std::string& id, const std::string& name, int8_t rssi, bool has_rssi = true) {
        BLE::ScanResult result;
        result.id = id;
        result.name = name;
        result.rssi = rssi;
        result.has_rssi = has_rssi;
        if (_on_scan) _on_scan(result);
    }

    void notify(const Bytes& data) {
        if (_on_data) _on_data(data);
    }

    void dropLink(int reason) {
        _connected = false;
        if (_on_disconnected) _on_disconnected(reason);
    }

    bool hasDisconnectHook() const { return static_cast<bool>(_on_disconnected); }

    std::vector<Bytes> writtenFrames() {
        std::lock_guard<std::mutex> lock(_mutex);
        return writes;
    }

    size_t count(const std::string& call) const {
        size_t n = 0;
        for (const std::string& c : calls) {
            if (c == call) n++;
        }
        return n;
    }

private:
    void record(const std::string& call) { calls.push_back(call); }

    bool _running = false;
    bool _scanning = false;
    bool _connected = false;
    BLE::Callbacks::OnScanResult _on_scan;
    BLE::Callbacks::OnDataReceived _on_data;
    BLE::Callbacks::OnDisconnected _on_disconnected;
    std::mutex _mutex;
};

}} // namespace Tapir::Test
