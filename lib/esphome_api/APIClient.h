#pragma once

#include "ProxyTransport.h"
#include "PendingRequests.h"
#include "Bytes.h"

#include <netinet/in.h>

#include <stdint.h>
#include <set>
#include <string>

namespace BLEBridge { namespace ESPHome {

/**
 * APIClient - ESPHome native API client for one Bluetooth proxy.
 *
 * Speaks the plaintext native API over a non-blocking TCP socket driven
 * from loop(). Only the Bluetooth proxy subset of the API is implemented.
 *
 * Features:
 * - Non-blocking connect with a deadline covering the handshake
 * - Hello/Connect/DeviceInfo handshake, password authentication
 * - Ping keepalive and GetTime replies
 * - Request/response matching with per-request timeouts
 * - Device connection tracking, so link loss is reported per device
 *
 * Usage:
 *   IProxyTransport::Ptr proxy = ProxyTransportFactory::create("kitchen", "192.168.1.40", 6053, "");
 *   proxy->start(30.0, [](OperationResult result, const std::string& detail) { ... });
 *   while (running) { proxy->loop(); }
 */
class APIClient : public IProxyTransport {

public:
    // TCP keepalive parameters
    static const int TCP_KEEPIDLE_SEC = 5;
    static const int TCP_KEEPINTVL_SEC = 2;
    static const int TCP_KEEPCNT_PROBES = 6;

public:
    APIClient(const std::string& name, const std::string& host, uint16_t port,
              const std::string& password);
    virtual ~APIClient();

    // IProxyTransport overrides
    virtual bool start(double timeout, Callbacks::OnResult on_ready) override;
    virtual void stop() override;
    virtual void loop() override;
    virtual bool isReady() const override { return _state == LinkState::READY; }
    virtual bool isClosed() const override { return _state == LinkState::CLOSED; }

    virtual void subscribeAdvertisements(Callbacks::OnAdvertisement callback) override;

    virtual void connectDevice(uint64_t address, uint32_t address_type, double timeout,
                               Callbacks::OnResult callback) override;
    virtual void disconnectDevice(uint64_t address, Callbacks::OnResult callback) override;

    virtual void getServices(uint64_t address, double timeout, Callbacks::OnServices callback) override;
    virtual void writeCharacteristic(uint64_t address, uint16_t handle, const RNS::Bytes& data,
                                     bool response, double timeout, Callbacks::OnResult callback) override;
    virtual void setNotify(uint64_t address, uint16_t handle, bool enable, double timeout,
                           Callbacks::OnResult callback) override;

    virtual void setNotificationCallback(Callbacks::OnNotification callback) override {
        _on_notification = callback;
    }
    virtual void setDeviceDisconnectedCallback(Callbacks::OnDeviceDisconnected callback) override {
        _on_device_disconnected = callback;
    }

    virtual inline std::string toString() const override {
        return "APIClient[" + _name + "/" + _host + ":" + std::to_string(_port) + "]";
    }

    LinkState state() const { return _state; }
    const DeviceInfo& deviceInfo() const { return _device_info; }
    size_t connectedDeviceCount() const { return _connected_devices.size(); }

private:
    // Connection management
    bool openSocket();
    void configure_socket();
    void checkConnectProgress();
    void closeSocket();
    void close(OperationResult result, const std::string& reason);

    // Handshake
    void sendHandshake();
    void becomeReady();
    uint32_t connectRequestType() const;

    // Frame processing
    void process_incoming();
    void extract_and_process_frames();
    void handleMessage(uint32_t type, const RNS::Bytes& payload);
    void handleConnectionEvent(const DeviceConnectionEvent& event);
    void handleAdvertisements(uint32_t type, const RNS::Bytes& payload);

    // Transmit path
    bool sendMessage(uint32_t type, const RNS::Bytes& payload);
    bool flushOutgoing();

    // Target proxy
    std::string _name;
    std::string _host;
    uint16_t _port;
    std::string _password;

    // Link state
    LinkState _state = LinkState::IDLE;
    int _socket = -1;
    in_addr_t _target_address = INADDR_NONE;
    double _deadline = 0;
    double _last_rx = 0;
    double _last_ping = 0;

    HelloInfo _hello;
    DeviceInfo _device_info;
    bool _advertisements_subscribed = false;

    // Callbacks
    Callbacks::OnResult _on_ready;
    Callbacks::OnAdvertisement _on_advertisement;
    Callbacks::OnNotification _on_notification;
    Callbacks::OnDeviceDisconnected _on_device_disconnected;

    PendingRequests _pending;
    std::set<uint64_t> _connected_devices;

    // Frame buffer for partial frame reassembly
    RNS::Bytes _frame_buffer;

    // Bytes accepted by sendMessage() but not yet taken by the socket
    RNS::Bytes _tx_buffer;
};

}} // namespace BLEBridge::ESPHome
