/**
 * @file LinkPlatform.h
 * @brief Transport Hardware Abstraction Layer (HAL) interface
 *
 * Provides a platform-agnostic interface for the host side of the Tapir
 * link. Platform-specific implementations (a host BLE stack, the in-process
 * simulator) implement this interface so the connection state machine and
 * the write queue work unchanged across transports.
 *
 * The HAL abstracts:
 * - Stack initialization and lifecycle
 * - Scanning
 * - Connection establishment and channel discovery
 * - MTU negotiation and connection priority
 * - Notification subscription and characteristic writes
 *
 * Connection-setup calls block until the step completes or fails and
 * report the outcome as an OperationResult.
 */
#pragma once

#include "LinkTypes.h"
#include "Bytes.h"

#include <memory>
#include <string>

namespace Tapir { namespace BLE {

/**
 * @brief Abstract link platform interface
 */
class ILinkPlatform {
public:
    using Ptr = std::shared_ptr<ILinkPlatform>;

    virtual ~ILinkPlatform() = default;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Initialize the stack with configuration
     * @return true if initialization successful
     */
    virtual bool initialize(const LinkConfig& config) = 0;

    /**
     * @brief Main loop processing - must be called periodically
     *
     * Delivers scan results and notifications.
     */
    virtual void loop() = 0;

    /**
     * @brief Shutdown and cleanup the stack
     */
    virtual void shutdown() = 0;

    virtual bool isRunning() const = 0;

    //=========================================================================
    // Scanning
    //=========================================================================

    /**
     * @brief Start discovery
     *
     * @param callback Invoked for each advertisement seen
     * @return true if scan started successfully
     */
    virtual bool startScan(Callbacks::OnScanResult callback) = 0;

    virtual void stopScan() = 0;

    virtual bool isScanning() const = 0;

    //=========================================================================
    // Connection
    //=========================================================================

    /**
     * @brief Establish a link to a peer
     *
     * @param peer_id Identifier from a scan result
     * @param timeout_ms Connection timeout in milliseconds
     * @return SUCCESS, TIMEOUT, NOT_FOUND or ERROR
     */
    virtual OperationResult connect(const std::string& peer_id, uint32_t timeout_ms) = 0;

    /**
     * @brief Locate the application channel on the connected peer
     *
     * @return NOT_FOUND if the service or characteristic is absent
     */
    virtual OperationResult discoverChannel(const std::string& service_uuid,
                                            const std::string& char_uuid) = 0;

    /**
     * @brief Request an MTU and read back what was granted
     *
     * @param requested Requested MTU
     * @param granted Output: MTU actually in effect (may be less than requested)
     */
    virtual OperationResult negotiateMTU(uint16_t requested, uint16_t& granted) = 0;

    /**
     * @brief Request a high-priority (low latency) connection interval
     */
    virtual OperationResult requestConnectionPriority() = 0;

    /**
     * @brief Subscribe to notifications on the application channel
     *
     * @param callback Invoked with each raw notification (possibly from
     *        another thread)
     */
    virtual OperationResult subscribeNotifications(Callbacks::OnDataReceived callback) = 0;

    /**
     * @brief Write one raw frame to the application channel
     *
     * @param data Frame bytes
     * @param response true for write with response
     */
    virtual OperationResult write(const Bytes& data, bool response = true) = 0;

    /**
     * @brief Tear down the link (no-op when not connected)
     */
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Set callback for unsolicited link loss
     */
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) = 0;

    //=========================================================================
    // Platform Info
    //=========================================================================

    virtual PlatformType getPlatformType() const = 0;

    virtual std::string getPlatformName() const = 0;
};

/**
 * @brief Factory for creating link platform implementations
 */
class LinkPlatformFactory {
public:
    /**
     * @brief Create specific platform
     *
     * @param type Platform type to create
     * @return Shared pointer to platform instance, or nullptr if not available
     */
    static ILinkPlatform::Ptr create(PlatformType type);

    /**
     * @brief Create a platform by configuration name ("simulated")
     */
    static ILinkPlatform::Ptr create(const std::string& name);

    static PlatformType typeFromName(const std::string& name);
};

}} // namespace Tapir::BLE
