/**
 * @file ClientHandler.cpp
 * @brief Client message protocol handling
 */

#include "ClientHandler.h"
#include "Base64.h"
#include "BridgeTypes.h"
#include "Log.h"

#include <openssl/rand.h>

#include <stdio.h>
#include <exception>
#include <random>

namespace BLEBridge {

using namespace RNS;
using nlohmann::json;

ClientHandler::ClientHandler(BridgeServices services, SendFunction send)
    : ClientHandler(services, send, generateClientId()) {
}

ClientHandler::ClientHandler(BridgeServices services, SendFunction send, const std::string& client_id)
    : _services(services), _send(send), _client_id(client_id),
      _channel(std::make_shared<SessionChannel>()) {
}

/*static*/ std::string ClientHandler::generateClientId() {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        WARNING("ClientHandler: RAND_bytes failed, using std::random_device for client id");
        std::random_device device;
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(device() & 0xFF);
        }
    }
    bytes[6] = (bytes[6] & 0x0F) | 0x40;   // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80;   // variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

//=============================================================================
// Lifecycle
//=============================================================================

void ClientHandler::open() {
    _running = true;
    INFO("ClientHandler: WebSocket client connected: " + _client_id);
    sendStatus(false, READY_MESSAGE);
}

void ClientHandler::close() {
    if (!_running && _channel->isClosed()) {
        return;
    }
    _running = false;
    ++_connect_generation;
    _channel->close();

    INFO("ClientHandler: Client disconnected: " + _client_id);

    if (_services.sessions.hasSession(_client_id)) {
        _services.sessions.disconnect(_client_id);
    }
}

void ClientHandler::loop() {
    SessionEvent event;
    while (_running && _channel->pop(event)) {
        switch (event.kind) {
            case SessionEvent::Kind::NOTIFICATION:
                send(Messages::notification(event.characteristic_uuid, Base64::encode(event.data)));
                break;
            case SessionEvent::Kind::DISCONNECTED:
                send(Messages::disconnected(event.reason));
                break;
        }
    }
}

//=============================================================================
// Dispatch
//=============================================================================

void ClientHandler::handleText(const std::string& text) {
    if (!_running) {
        return;
    }

    ClientMessage message;
    std::string error;
    switch (decodeClientMessage(text, message, error)) {
        case DecodeStatus::OK:
            break;
        case DecodeStatus::INVALID_JSON:
            sendError("Invalid JSON: " + error);
            return;
        case DecodeStatus::INVALID_FORMAT:
            sendError("Invalid message format: " + error);
            return;
        case DecodeStatus::UNKNOWN_TYPE:
            sendError("Unknown message type: " + error);
            return;
    }

    try {
        dispatch(message);
    }
    catch (std::exception& e) {
        ERROR("ClientHandler: Error handling message: " + std::string(e.what()));
        sendError("Error handling message: " + std::string(e.what()));
    }
}

void ClientHandler::dispatch(const ClientMessage& message) {
    switch (message.type) {
        case ClientMessageType::CONNECT:
            handleConnect(message);
            break;
        case ClientMessageType::DISCONNECT:
            handleDisconnect();
            break;
        case ClientMessageType::WRITE:
            handleWrite(message);
            break;
        case ClientMessageType::SUBSCRIBE:
            handleSubscribe(message);
            break;
        case ClientMessageType::UNSUBSCRIBE:
            handleUnsubscribe(message);
            break;
    }
}

//=============================================================================
// Connect
//=============================================================================

void ClientHandler::handleConnect(const ClientMessage& message) {
    std::string mac_address;
    if (!normalizeMac(message.mac_address, mac_address)) {
        sendError("Invalid MAC address format. Expected format: AA:BB:CC:DD:EE:FF");
        return;
    }

    INFO("ClientHandler: Connect request for device " + mac_address);

    // A newer connect overrides any still in flight
    uint64_t generation = ++_connect_generation;

    std::string service_uuid = message.service_uuid;
    std::string notify_uuid = message.notify_uuid;
    std::string write_uuid = message.write_uuid;
    std::string device_name;

    if (!message.hasAllUuids()) {
        DeviceProfile profile;
        if (_services.profiles && _services.profiles->lookup(mac_address, profile)) {
            DEBUG("ClientHandler: Using stored profile for " + mac_address);
            service_uuid = profile.service_uuid;
            notify_uuid = profile.notify_uuid;
            write_uuid = profile.write_uuid;
            device_name = profile.device_name;
        } else {
            INFO("ClientHandler: UUIDs not provided, discovering via ESPHome...");
            std::weak_ptr<ClientHandler> weak = shared_from_this();
            _services.prober.probe(mac_address,
                [weak, generation, mac_address](const Outcome& outcome, const ProbeResult& result) {
                    Ptr self = weak.lock();
                    if (!self || !self->current(generation)) {
                        return;
                    }
                    if (!outcome.ok()) {
                        WARNING("ClientHandler: UUID discovery failed for " + mac_address + ": " + outcome.message);
                        self->sendError(outcome);
                        return;
                    }
                    self->startSession(generation, mac_address, result.proxy_used, result.service_uuid,
                                       result.notify_uuid, result.write_uuid, result.device_name);
                });
            return;
        }
    }

    std::string proxy_name = _services.tracker.bestProxy(mac_address);
    if (proxy_name.empty()) {
        WARNING("ClientHandler: Connect failed (client error): no proxy has seen " + mac_address);
        sendError(Outcome::clientError("No proxy has seen device " + mac_address +
                                       ". Make sure the device is advertising and in range."));
        return;
    }

    const DiscoveredDevice* device = _services.tracker.get(mac_address);
    if (device_name.empty() && device) {
        device_name = device->name;
    }

    startSession(generation, mac_address, proxy_name, service_uuid, notify_uuid, write_uuid, device_name);
}

void ClientHandler::startSession(uint64_t generation, const std::string& mac_address,
                                 const std::string& proxy_name, const std::string& service_uuid,
                                 const std::string& notify_uuid, const std::string& write_uuid,
                                 const std::string& device_name) {
    ConnectRequest request;
    request.client_id = _client_id;
    request.mac_address = mac_address;
    request.proxy_name = proxy_name;
    request.transport = _services.registry.getTransport(proxy_name);
    request.service_uuid = service_uuid;
    request.notify_uuid = notify_uuid;
    request.write_uuid = write_uuid;
    request.device_name = device_name;
    request.channel = _channel;

    if (!request.transport) {
        ERROR("ClientHandler: Connect failed (proxy error): proxy " + proxy_name + " is not connected");
        sendError(Outcome::infrastructure("Proxy " + proxy_name + " is not connected"));
        return;
    }

    const DiscoveredDevice* device = _services.tracker.get(mac_address);
    if (device) {
        request.address_type = device->address_type;
    }

    std::weak_ptr<ClientHandler> weak = shared_from_this();
    _services.sessions.connect(request,
        [weak, generation, mac_address, proxy_name, service_uuid, notify_uuid, write_uuid, device_name]
        (const Outcome& outcome) {
            Ptr self = weak.lock();
            if (!self || !self->current(generation)) {
                return;
            }
            if (!outcome.ok()) {
                ERROR("ClientHandler: Connect to " + mac_address + " failed: " + outcome.message);
                self->sendError(outcome);
                return;
            }
            self->send(Messages::connected(device_name, mac_address, service_uuid, notify_uuid,
                                           write_uuid, proxy_name));
        });
}

//=============================================================================
// Other requests
//=============================================================================

void ClientHandler::handleDisconnect() {
    // Results of a connect still in flight are no longer wanted
    ++_connect_generation;

    std::weak_ptr<ClientHandler> weak = shared_from_this();
    _services.sessions.disconnect(_client_id, [weak](const Outcome& outcome) {
        Ptr self = weak.lock();
        if (!self || !self->_running) {
            return;
        }
        if (!outcome.ok()) {
            self->sendError("Disconnect failed: " + outcome.message);
            return;
        }
        self->send(Messages::disconnected("User requested disconnect"));
    });
}

void ClientHandler::handleWrite(const ClientMessage& message) {
    Bytes data;
    if (!Base64::decode(message.data, data)) {
        sendError("Invalid message format: field 'data' is not valid base64");
        return;
    }

    std::weak_ptr<ClientHandler> weak = shared_from_this();
    std::string uuid = message.characteristic_uuid;
    size_t length = data.size();
    _services.sessions.write(_client_id, uuid, data, message.with_response,
        [weak, uuid, length](const Outcome& outcome) {
            Ptr self = weak.lock();
            if (!self || !self->_running) {
                return;
            }
            if (!outcome.ok()) {
                self->sendError(outcome);
                return;
            }
            self->sendStatus(true, "Wrote " + std::to_string(length) + " bytes to " + uuid);
        });
}

void ClientHandler::handleSubscribe(const ClientMessage& message) {
    // Notifications are enabled when the session is established
    sendStatus(true, "Subscribed to " + message.characteristic_uuid + " (active on connect)");
}

void ClientHandler::handleUnsubscribe(const ClientMessage& message) {
    sendStatus(true, "Unsubscribe from " + message.characteristic_uuid + " (disconnect to stop notifications)");
}

//=============================================================================
// Outbound
//=============================================================================

bool ClientHandler::send(const json& message) {
    if (!_running) {
        return false;
    }
    if (!_send(message.dump())) {
        ERROR("ClientHandler: Error sending message to client " + _client_id);
        _running = false;
        return false;
    }
    return true;
}

void ClientHandler::sendError(const std::string& error, const json& details) {
    send(Messages::error(error, details));
}

void ClientHandler::sendError(const Outcome& outcome) {
    json details;
    details["category"] = errorCategoryToString(outcome.category);
    sendError(outcome.message, details);
}

void ClientHandler::sendStatus(bool connected, const std::string& message) {
    std::string device_name;
    SessionInfo info;
    if (_services.sessions.getSession(_client_id, info)) {
        device_name = info.device_name;
    }
    send(Messages::status(connected, device_name, message));
}

} // namespace BLEBridge
