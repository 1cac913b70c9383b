/**
 * @file ProxyTransport.h
 * @brief Bluetooth proxy transport interface
 *
 * Provides a transport-agnostic interface to one network Bluetooth proxy.
 * The ESPHome native API client implements it for real proxies; tests
 * substitute a stub.
 *
 * The interface abstracts:
 * - Link lifecycle (connect, authenticate, keepalive, close)
 * - Advertisement feed subscription
 * - Device connection management
 * - GATT operations (service enumeration, write, notify)
 * - Notification and device-disconnect delivery
 *
 * All operations are asynchronous. Each completes exactly once through its
 * callback, either from loop() or, if it cannot be started, immediately.
 */
#pragma once

#include "APITypes.h"
#include "Bytes.h"

#include <memory>
#include <string>

namespace BLEBridge { namespace ESPHome {

/**
 * @brief Abstract Bluetooth proxy transport
 */
class IProxyTransport {
public:
    using Ptr = std::shared_ptr<IProxyTransport>;

    virtual ~IProxyTransport() = default;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Open the link and authenticate
     *
     * @param timeout Seconds allowed for connect plus handshake
     * @param on_ready Called once with SUCCESS when requests are accepted,
     *                 or with the failure reason
     * @return true if the attempt was started
     */
    virtual bool start(double timeout, Callbacks::OnResult on_ready) = 0;

    /**
     * @brief Close the link
     *
     * Fails every pending request with DISCONNECTED and reports each
     * connected device through the device-disconnected callback.
     */
    virtual void stop() = 0;

    /**
     * @brief Main loop processing - must be called periodically
     *
     * Reads from the link, dispatches responses and checks request timeouts.
     */
    virtual void loop() = 0;

    virtual bool isReady() const = 0;

    /**
     * @brief Check if the link has reached its terminal state
     *
     * A closed transport is never reused; the owner drops it and creates a
     * new one for the next attempt.
     */
    virtual bool isClosed() const = 0;

    virtual std::string toString() const = 0;

    //=========================================================================
    // Advertisements
    //=========================================================================

    /**
     * @brief Receive advertisements relayed by the proxy
     *
     * May be called before the link is ready; the subscription is sent
     * once the handshake completes.
     */
    virtual void subscribeAdvertisements(Callbacks::OnAdvertisement callback) = 0;

    //=========================================================================
    // Device Connections
    //=========================================================================

    virtual void connectDevice(uint64_t address, uint32_t address_type, double timeout,
                               Callbacks::OnResult callback) = 0;

    virtual void disconnectDevice(uint64_t address, Callbacks::OnResult callback) = 0;

    //=========================================================================
    // GATT Operations
    //=========================================================================

    virtual void getServices(uint64_t address, double timeout, Callbacks::OnServices callback) = 0;

    /**
     * @brief Write to a characteristic
     *
     * @param response true to wait for the proxy's write confirmation
     */
    virtual void writeCharacteristic(uint64_t address, uint16_t handle, const RNS::Bytes& data,
                                     bool response, double timeout, Callbacks::OnResult callback) = 0;

    virtual void setNotify(uint64_t address, uint16_t handle, bool enable, double timeout,
                           Callbacks::OnResult callback) = 0;

    //=========================================================================
    // Event Callbacks (one registration point per transport)
    //=========================================================================

    virtual void setNotificationCallback(Callbacks::OnNotification callback) = 0;
    virtual void setDeviceDisconnectedCallback(Callbacks::OnDeviceDisconnected callback) = 0;
};

/**
 * @brief Factory for ESPHome native API transports
 */
class ProxyTransportFactory {
public:
    /**
     * @brief Create a native API client for one proxy
     *
     * @param name Proxy name, used in log messages
     * @param host IPv4 address or host name
     * @param port API port (usually 6053)
     * @param password API password, empty when the proxy has none
     */
    static IProxyTransport::Ptr create(const std::string& name, const std::string& host,
                                       uint16_t port, const std::string& password);
};

}} // namespace BLEBridge::ESPHome
