/**
 * @file SessionManager.cpp
 * @brief Per-client GATT session lifecycle
 */

#include "SessionManager.h"
#include "Log.h"

namespace BLEBridge {

using namespace RNS;
using ESPHome::IProxyTransport;
using ESPHome::OperationResult;
using ESPHome::GATTService;

SessionManager::SessionManager(double connect_timeout, double operation_timeout)
    : _connect_timeout(connect_timeout), _operation_timeout(operation_timeout) {
}

SessionManager::~SessionManager() {
    for (auto& entry : _sessions) {
        if (entry.second->transport) {
            entry.second->transport->setNotificationCallback(nullptr);
            entry.second->transport->setDeviceDisconnectedCallback(nullptr);
        }
    }
}

Outcome SessionManager::connectFailure(OperationResult result, const std::string& detail) {
    if (result == OperationResult::TIMEOUT) {
        return Outcome::timeout("Connection timeout - device may be out of range or busy");
    }
    return Outcome::infrastructure("Connection failed: " + detail);
}

//=============================================================================
// Connect
//=============================================================================

void SessionManager::connect(const ConnectRequest& request, OnOutcome done) {
    auto existing = _sessions.find(request.client_id);
    if (existing != _sessions.end()) {
        SessionPtr previous = existing->second;
        _sessions.erase(existing);
        teardown(previous);
    }

    if (!request.transport) {
        if (done) done(Outcome::infrastructure("Proxy " + request.proxy_name + " is not connected"));
        return;
    }

    SessionPtr session = std::make_shared<Session>();
    session->info.client_id = request.client_id;
    session->info.mac_address = request.mac_address;
    session->info.proxy_name = request.proxy_name;
    session->info.device_name = request.device_name;
    session->info.service_uuid = request.service_uuid;
    session->info.notify_uuid = request.notify_uuid;
    session->info.write_uuid = request.write_uuid;
    session->info.state = SessionState::CONNECTING;
    session->transport = request.transport;
    session->address = macToUint64(request.mac_address);
    session->channel = request.channel;
    session->attempt = ++_next_attempt;
    _sessions[request.client_id] = session;

    INFO("SessionManager: Connecting to device " + request.mac_address + " via proxy " +
         request.proxy_name + " for client " + request.client_id);

    attachTransport(request.transport);

    std::string client_id = request.client_id;
    uint64_t attempt = session->attempt;
    request.transport->connectDevice(session->address, request.address_type, _connect_timeout,
        [this, client_id, attempt, done](OperationResult result, const std::string& detail) {
            onDeviceConnected(client_id, attempt, done, result, detail);
        });
}

SessionManager::SessionPtr SessionManager::pending(const std::string& client_id, uint64_t attempt) const {
    auto it = _sessions.find(client_id);
    if (it == _sessions.end() || it->second->attempt != attempt ||
        it->second->info.state != SessionState::CONNECTING) {
        return nullptr;
    }
    return it->second;
}

void SessionManager::onDeviceConnected(const std::string& client_id, uint64_t attempt, OnOutcome done,
                                       OperationResult result, const std::string& detail) {
    SessionPtr session = pending(client_id, attempt);
    if (!session) {
        superseded(done);
        return;
    }

    if (result != OperationResult::SUCCESS) {
        ERROR("SessionManager: Failed to connect to device " + session->info.mac_address + ": " +
              ESPHome::resultToString(result) + " " + detail);
        failConnect(session, connectFailure(result, detail), done);
        return;
    }

    INFO("SessionManager: Connected to device " + session->info.mac_address);

    session->transport->getServices(session->address, _connect_timeout,
        [this, client_id, attempt, done](OperationResult result, const std::string& detail,
                                         const std::vector<GATTService>& services) {
            onServices(client_id, attempt, done, result, detail, services);
        });
}

void SessionManager::onServices(const std::string& client_id, uint64_t attempt, OnOutcome done,
                                OperationResult result, const std::string& detail,
                                const std::vector<GATTService>& services) {
    SessionPtr session = pending(client_id, attempt);
    if (!session) {
        superseded(done);
        return;
    }

    if (result != OperationResult::SUCCESS) {
        ERROR("SessionManager: Service discovery failed on " + session->info.mac_address + ": " + detail);
        failConnect(session, connectFailure(result, detail), done);
        return;
    }

    std::string error;
    if (!resolveHandles(services, session->info.notify_uuid, session->info.write_uuid,
                        session->info.notify_handle, session->info.write_handle, error)) {
        WARNING("SessionManager: " + error + " on " + session->info.mac_address);
        failConnect(session, Outcome::clientError(error), done);
        return;
    }

    INFO("SessionManager: Discovered handles: notify=" + std::to_string(session->info.notify_handle) +
         ", write=" + std::to_string(session->info.write_handle));

    if (!session->channel) {
        establish(session, done);
        return;
    }

    INFO("SessionManager: Subscribing to notifications from handle " +
         std::to_string(session->info.notify_handle) + " on " + session->info.mac_address);
    session->transport->setNotify(session->address, session->info.notify_handle, true, _operation_timeout,
        [this, client_id, attempt, done](OperationResult result, const std::string& detail) {
            onNotifyEnabled(client_id, attempt, done, result, detail);
        });
}

void SessionManager::onNotifyEnabled(const std::string& client_id, uint64_t attempt, OnOutcome done,
                                     OperationResult result, const std::string& detail) {
    SessionPtr session = pending(client_id, attempt);
    if (!session) {
        superseded(done);
        return;
    }

    if (result != OperationResult::SUCCESS) {
        ERROR("SessionManager: Failed to subscribe to notifications: " + detail);
        Outcome outcome = (result == OperationResult::TIMEOUT)
            ? connectFailure(result, detail)
            : Outcome::infrastructure("Subscription failed: " + detail);
        failConnect(session, outcome, done);
        return;
    }

    INFO("SessionManager: Subscribed to notifications from handle " + std::to_string(session->info.notify_handle));
    establish(session, done);
}

void SessionManager::establish(const SessionPtr& session, OnOutcome done) {
    session->info.state = SessionState::CONNECTED;
    INFO("SessionManager: Device connection established for client " + session->info.client_id);
    if (done) done(Outcome::success());
}

void SessionManager::failConnect(const SessionPtr& session, const Outcome& outcome, OnOutcome done) {
    auto it = _sessions.find(session->info.client_id);
    if (it != _sessions.end() && it->second == session) {
        _sessions.erase(it);
    }

    // The device may have been reached even though a later step failed
    if (session->transport->isReady()) {
        releaseDevice(session->transport, session->address);
    }

    if (done) done(outcome);
}

void SessionManager::superseded(OnOutcome done) {
    // teardown() of the replaced session already released the device
    DEBUG("SessionManager: Connect attempt superseded");
    if (done) done(Outcome::clientError("Connection attempt superseded by a newer request"));
}

//=============================================================================
// Disconnect
//=============================================================================

void SessionManager::disconnect(const std::string& client_id, OnOutcome done) {
    auto it = _sessions.find(client_id);
    if (it == _sessions.end()) {
        WARNING("SessionManager: No active connection for client " + client_id);
        if (done) done(Outcome::success());
        return;
    }

    SessionPtr session = it->second;
    _sessions.erase(it);
    teardown(session);

    if (done) done(Outcome::success());
}

void SessionManager::teardown(const SessionPtr& session) {
    bool was_connected = (session->info.state == SessionState::CONNECTED);
    session->info.state = SessionState::DISCONNECTING;

    INFO("SessionManager: Disconnecting device " + session->info.mac_address + " for client " +
         session->info.client_id);

    IProxyTransport::Ptr transport = session->transport;
    if (!transport || !transport->isReady()) {
        DEBUG("SessionManager: Proxy link already down, nothing to release");
        return;
    }

    if (was_connected && session->channel && !deviceInUse(transport.get(), session->address)) {
        uint16_t handle = session->info.notify_handle;
        transport->setNotify(session->address, handle, false, _operation_timeout,
            [handle](OperationResult result, const std::string& detail) {
                if (result == OperationResult::SUCCESS) {
                    DEBUG("SessionManager: Unsubscribed from notifications (handle=" + std::to_string(handle) + ")");
                } else {
                    WARNING("SessionManager: Error unsubscribing from notifications: " + detail);
                }
            });
    }

    releaseDevice(transport, session->address);
}

bool SessionManager::deviceInUse(const IProxyTransport* transport, uint64_t address) const {
    for (const auto& entry : _sessions) {
        if (entry.second->transport.get() == transport && entry.second->address == address) {
            return true;
        }
    }
    return false;
}

void SessionManager::releaseDevice(const IProxyTransport::Ptr& transport, uint64_t address) {
    if (deviceInUse(transport.get(), address)) {
        DEBUG("SessionManager: Device " + macFromUint64(address) + " still in use, not disconnecting");
        return;
    }

    std::string mac = macFromUint64(address);
    transport->disconnectDevice(address, [mac](OperationResult result, const std::string& detail) {
        if (result == OperationResult::SUCCESS) {
            INFO("SessionManager: Disconnected from device " + mac);
        } else {
            WARNING("SessionManager: Error disconnecting device " + mac + ": " + detail);
        }
    });
}

void SessionManager::disconnectAll() {
    INFO("SessionManager: Disconnecting " + std::to_string(_sessions.size()) + " active connections...");

    std::vector<std::string> clients;
    for (const auto& entry : _sessions) {
        clients.push_back(entry.first);
    }
    for (const auto& client_id : clients) {
        disconnect(client_id);
    }

    INFO("SessionManager: All connections disconnected");
}

//=============================================================================
// Write
//=============================================================================

void SessionManager::write(const std::string& client_id, const std::string& characteristic_uuid,
                           const Bytes& data, bool with_response, OnOutcome done) {
    auto it = _sessions.find(client_id);
    if (it == _sessions.end() || it->second->info.state != SessionState::CONNECTED) {
        if (done) done(Outcome::clientError("No active connection - connect first"));
        return;
    }

    SessionPtr session = it->second;
    if (!uuidEquals(characteristic_uuid, session->info.write_uuid)) {
        WARNING("SessionManager: Write to non-standard characteristic " + characteristic_uuid +
                " (expected " + session->info.write_uuid + ")");
    }

    DEBUG("SessionManager: Writing " + std::to_string(data.size()) + " bytes to characteristic " +
          characteristic_uuid + " on device " + session->info.mac_address);

    uint16_t handle = session->info.write_handle;
    session->transport->writeCharacteristic(session->address, handle, data, with_response, _operation_timeout,
        [done, handle](OperationResult result, const std::string& detail) {
            if (result == OperationResult::SUCCESS) {
                TRACE("SessionManager: Write completed (handle=" + std::to_string(handle) + ")");
                if (done) done(Outcome::success());
                return;
            }
            ERROR("SessionManager: Write failed: " + std::string(ESPHome::resultToString(result)) + " " + detail);
            if (result == OperationResult::TIMEOUT) {
                if (done) done(Outcome::timeout("Operation timed out - device may be out of range"));
            } else {
                if (done) done(Outcome::infrastructure("Write failed: " + detail));
            }
        });
}

//=============================================================================
// Probe
//=============================================================================

void SessionManager::probe(const std::string& mac_address, const std::string& proxy_name,
                           IProxyTransport::Ptr transport, uint32_t address_type,
                           const std::string& device_name, OnProbe done) {
    if (!transport) {
        if (done) done(Outcome::infrastructure("Proxy " + proxy_name + " is not connected"), ProbeResult());
        return;
    }

    INFO("SessionManager: Using proxy '" + proxy_name + "' to connect to " + mac_address);

    uint64_t address = macToUint64(mac_address);
    std::weak_ptr<IProxyTransport> weak = transport;
    double timeout = _connect_timeout;

    ProbeResult base;
    base.device_name = device_name;
    base.proxy_used = proxy_name;

    transport->connectDevice(address, address_type, timeout,
        [this, weak, address, mac_address, base, timeout, done](OperationResult result, const std::string& detail) {
            IProxyTransport::Ptr transport = weak.lock();
            if (result != OperationResult::SUCCESS || !transport) {
                ERROR("SessionManager: Failed to connect to device " + mac_address + ": " + detail);
                if (transport && transport->isReady()) {
                    releaseDevice(transport, address);
                }
                if (done) done(connectFailure(result, detail), ProbeResult());
                return;
            }

            INFO("SessionManager: Connected to device " + mac_address);

            transport->getServices(address, timeout,
                [this, weak, address, mac_address, base, done](OperationResult result, const std::string& detail,
                                                               const std::vector<GATTService>& services) {
                    // Always disconnect, whatever the enumeration returned
                    IProxyTransport::Ptr transport = weak.lock();
                    if (transport && transport->isReady()) {
                        releaseDevice(transport, address);
                    }

                    if (result != OperationResult::SUCCESS) {
                        ERROR("SessionManager: Service discovery failed on " + mac_address + ": " + detail);
                        if (done) done(connectFailure(result, detail), ProbeResult());
                        return;
                    }

                    DEBUG("SessionManager: Retrieved " + std::to_string(services.size()) + " services from device");

                    ProbeResult probe = base;
                    if (!findSuitableService(services, probe)) {
                        if (done) done(Outcome::clientError("No suitable GATT service found. Expected a service "
                                                            "with both notify and write characteristics."),
                                       ProbeResult());
                        return;
                    }

                    INFO("SessionManager: Successfully retrieved UUIDs from " + mac_address + ": service=" +
                         probe.service_uuid + ", notify=" + probe.notify_uuid + ", write=" + probe.write_uuid);
                    if (done) done(Outcome::success(), probe);
                });
        });
}

//=============================================================================
// GATT helpers
//=============================================================================

/*static*/ bool SessionManager::resolveHandles(const std::vector<GATTService>& services,
                                               const std::string& notify_uuid, const std::string& write_uuid,
                                               uint16_t& notify_handle, uint16_t& write_handle,
                                               std::string& error) {
    bool notify_found = false;
    bool write_found = false;

    for (const auto& service : services) {
        for (const auto& characteristic : service.characteristics) {
            if (uuidEquals(characteristic.uuid, notify_uuid)) {
                notify_handle = characteristic.handle;
                notify_found = true;
                TRACE("SessionManager: Found notify characteristic " + characteristic.uuid + " -> handle " +
                      std::to_string(characteristic.handle));
            }
            if (uuidEquals(characteristic.uuid, write_uuid)) {
                write_handle = characteristic.handle;
                write_found = true;
                TRACE("SessionManager: Found write characteristic " + characteristic.uuid + " -> handle " +
                      std::to_string(characteristic.handle));
            }
        }
    }

    if (!notify_found) {
        error = "Notify characteristic " + notify_uuid + " not found in services";
        return false;
    }
    if (!write_found) {
        error = "Write characteristic " + write_uuid + " not found in services";
        return false;
    }
    return true;
}

/*static*/ bool SessionManager::findSuitableService(const std::vector<GATTService>& services, ProbeResult& result) {
    for (const auto& service : services) {
        const ESPHome::GATTCharacteristic* notify = nullptr;
        const ESPHome::GATTCharacteristic* write = nullptr;

        for (const auto& characteristic : service.characteristics) {
            if (!notify && characteristic.canNotify()) {
                notify = &characteristic;
            }
            if (!write && characteristic.canWrite()) {
                write = &characteristic;
            }
        }

        if (notify && write) {
            result.service_uuid = service.uuid;
            result.notify_uuid = notify->uuid;
            result.write_uuid = write->uuid;
            DEBUG("SessionManager: Found suitable service " + service.uuid + " (notify=" + notify->uuid +
                  ", write=" + write->uuid + ")");
            return true;
        }
    }
    return false;
}

//=============================================================================
// Transport events
//=============================================================================

void SessionManager::attachTransport(const IProxyTransport::Ptr& transport) {
    IProxyTransport* raw = transport.get();
    transport->setNotificationCallback([this, raw](uint64_t address, uint16_t handle, const Bytes& data) {
        onNotification(raw, address, handle, data);
    });
    transport->setDeviceDisconnectedCallback([this, raw](uint64_t address, int32_t reason) {
        onDeviceDisconnected(raw, address, reason);
    });
}

void SessionManager::onNotification(const IProxyTransport* transport, uint64_t address, uint16_t handle,
                                    const Bytes& data) {
    for (auto& entry : _sessions) {
        Session& session = *entry.second;
        if (session.transport.get() != transport || session.address != address ||
            session.info.notify_handle != handle || session.info.state != SessionState::CONNECTED) {
            continue;
        }
        TRACE("SessionManager: Notification received: " + std::to_string(data.size()) + " bytes from handle " +
              std::to_string(handle));
        if (session.channel) {
            session.channel->push(SessionEvent::notification(session.info.notify_uuid, data));
        }
    }
}

void SessionManager::onDeviceDisconnected(const IProxyTransport* transport, uint64_t address, int32_t reason) {
    std::vector<SessionPtr> lost;
    for (auto it = _sessions.begin(); it != _sessions.end();) {
        Session& session = *it->second;
        if (session.transport.get() == transport && session.address == address &&
            session.info.state == SessionState::CONNECTED) {
            lost.push_back(it->second);
            it = _sessions.erase(it);
        } else {
            ++it;
        }
    }

    std::string message = (reason != 0)
        ? "Device disconnected (reason " + std::to_string(reason) + ")"
        : std::string("Connection to device lost");

    for (auto& session : lost) {
        WARNING("SessionManager: " + message + ": " + session->info.mac_address + " for client " +
                session->info.client_id);
        if (session->channel) {
            session->channel->push(SessionEvent::disconnected(message));
        }
    }
}

} // namespace BLEBridge
