/**
 * @file ClientHandler.h
 * @brief Per-connection router of the client message protocol
 *
 * One handler exists per WebSocket connection. It decodes inbound
 * messages, drives the SessionManager for its client id and forwards
 * session events (notifications, device loss) from its SessionChannel to
 * the socket. A malformed message produces an error event and the
 * connection stays open. Closing the handler always tears down the
 * client's session.
 *
 * Handlers must be owned by a std::shared_ptr; completion callbacks hold
 * a weak reference and are ignored once the handler is gone or closed.
 */
#pragma once

#include "ClientMessages.h"
#include "DeviceTracker.h"
#include "ProxyRegistry.h"
#include "SessionManager.h"
#include "ProfileStore.h"
#include "DeviceProber.h"

#include <stdint.h>
#include <functional>
#include <memory>
#include <string>

namespace BLEBridge {

/**
 * @brief Components a client handler works with
 */
struct BridgeServices {
    DeviceTracker& tracker;
    ProxyRegistry& registry;
    SessionManager& sessions;
    DeviceProber& prober;
    IProfileStore* profiles;    // may be nullptr
};

class ClientHandler : public std::enable_shared_from_this<ClientHandler> {
public:
    using Ptr = std::shared_ptr<ClientHandler>;

    /**
     * @brief Sends one text frame to the client
     * @return false if the connection can no longer be written
     */
    using SendFunction = std::function<bool(const std::string& text)>;

    static constexpr const char* READY_MESSAGE = "ESPHome BLE Proxy ready";

    ClientHandler(BridgeServices services, SendFunction send);
    ClientHandler(BridgeServices services, SendFunction send, const std::string& client_id);

    /**
     * @brief Announce readiness to the client
     */
    void open();

    /**
     * @brief Handle one inbound text frame
     */
    void handleText(const std::string& text);

    /**
     * @brief Forward queued session events - call periodically
     */
    void loop();

    /**
     * @brief Stop handling and release the client's session
     */
    void close();

    bool isRunning() const { return _running; }
    const std::string& clientId() const { return _client_id; }
    SessionChannel::Ptr channel() const { return _channel; }

    /**
     * @brief Random RFC 4122 version 4 identifier
     */
    static std::string generateClientId();

private:
    void dispatch(const ClientMessage& message);
    void handleConnect(const ClientMessage& message);
    void handleDisconnect();
    void handleWrite(const ClientMessage& message);
    void handleSubscribe(const ClientMessage& message);
    void handleUnsubscribe(const ClientMessage& message);

    void startSession(uint64_t generation, const std::string& mac_address, const std::string& proxy_name,
                      const std::string& service_uuid, const std::string& notify_uuid,
                      const std::string& write_uuid, const std::string& device_name);
    bool current(uint64_t generation) const { return _running && generation == _connect_generation; }

    bool send(const nlohmann::json& message);
    void sendError(const std::string& error, const nlohmann::json& details = nullptr);
    void sendError(const Outcome& outcome);
    void sendStatus(bool connected, const std::string& message);

    BridgeServices _services;
    SendFunction _send;
    std::string _client_id;
    SessionChannel::Ptr _channel;
    bool _running = false;
    uint64_t _connect_generation = 0;
};

} // namespace BLEBridge
