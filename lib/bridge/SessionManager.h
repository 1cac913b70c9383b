/**
 * @file SessionManager.h
 * @brief One persistent GATT session per client
 *
 * A session binds a client to one BLE device reached through one proxy
 * transport. Establishing it connects the device, enumerates its GATT
 * services, resolves the notify and write characteristic handles and,
 * when the client wants notifications, enables them. Notifications are
 * matched by (transport, address, handle) and delivered to the client's
 * SessionChannel keyed by characteristic UUID.
 *
 * Session states: absent -> CONNECTING -> CONNECTED -> DISCONNECTING -> absent.
 * A failed connect leaves no session. A connect that is overtaken by a
 * newer connect or a disconnect for the same client completes with a
 * client error.
 *
 * All operations complete through callbacks invoked from the transport's
 * loop(), or immediately when they cannot be started.
 */
#pragma once

#include "BridgeTypes.h"
#include "SessionChannel.h"
#include "ProxyTransport.h"

#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace BLEBridge {

enum class SessionState : uint8_t {
    CONNECTING,
    CONNECTED,
    DISCONNECTING
};

inline const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING:    return "CONNECTING";
        case SessionState::CONNECTED:     return "CONNECTED";
        case SessionState::DISCONNECTING: return "DISCONNECTING";
        default:                          return "UNKNOWN";
    }
}

/**
 * @brief Parameters of a session connect
 */
struct ConnectRequest {
    std::string client_id;
    std::string mac_address;            // Normalized
    std::string proxy_name;
    ESPHome::IProxyTransport::Ptr transport;
    uint32_t address_type = 0;
    std::string service_uuid;
    std::string notify_uuid;
    std::string write_uuid;
    std::string device_name;
    SessionChannel::Ptr channel;        // nullptr: notifications are not enabled
};

/**
 * @brief Read-only view of a session
 */
struct SessionInfo {
    std::string client_id;
    std::string mac_address;
    std::string proxy_name;
    std::string device_name;
    std::string service_uuid;
    std::string notify_uuid;
    std::string write_uuid;
    uint16_t notify_handle = 0;
    uint16_t write_handle = 0;
    SessionState state = SessionState::CONNECTING;
};

/**
 * @brief GATT profile found by a probe
 */
struct ProbeResult {
    std::string service_uuid;
    std::string notify_uuid;
    std::string write_uuid;
    std::string device_name;
    std::string proxy_used;
};

class SessionManager {
public:
    using OnOutcome = std::function<void(const Outcome& outcome)>;
    using OnProbe = std::function<void(const Outcome& outcome, const ProbeResult& result)>;

    /**
     * @param connect_timeout Seconds for device connect and service enumeration
     * @param operation_timeout Seconds for writes and notify changes
     */
    SessionManager(double connect_timeout, double operation_timeout);
    ~SessionManager();

    /**
     * @brief Establish the session of a client, replacing any existing one
     */
    void connect(const ConnectRequest& request, OnOutcome done);

    /**
     * @brief Tear down the session of a client
     *
     * The session is removed immediately; disabling notifications and
     * disconnecting the device are best-effort.
     */
    void disconnect(const std::string& client_id, OnOutcome done = nullptr);

    /**
     * @brief Write to the session's write characteristic
     */
    void write(const std::string& client_id, const std::string& characteristic_uuid,
               const RNS::Bytes& data, bool with_response, OnOutcome done);

    void disconnectAll();

    /**
     * @brief Connect, enumerate services and disconnect, to learn a device's profile
     *
     * Selects the first service holding both a notify characteristic and a
     * write (or write-without-response) characteristic.
     */
    void probe(const std::string& mac_address, const std::string& proxy_name,
               ESPHome::IProxyTransport::Ptr transport, uint32_t address_type,
               const std::string& device_name, OnProbe done);

    bool hasSession(const std::string& client_id) const;
    bool isConnected(const std::string& client_id) const;
    bool getSession(const std::string& client_id, SessionInfo& info) const;
    size_t size() const { return _sessions.size(); }

    /**
     * @brief Find the handles of the notify and write characteristics
     *
     * UUIDs are compared ignoring case and hyphens.
     *
     * @param error Set to the client-facing message on failure
     */
    static bool resolveHandles(const std::vector<ESPHome::GATTService>& services,
                               const std::string& notify_uuid, const std::string& write_uuid,
                               uint16_t& notify_handle, uint16_t& write_handle, std::string& error);

    /**
     * @brief First service with both a notify and a write characteristic
     */
    static bool findSuitableService(const std::vector<ESPHome::GATTService>& services, ProbeResult& result);

private:
    struct Session {
        SessionInfo info;
        ESPHome::IProxyTransport::Ptr transport;
        uint64_t address = 0;
        SessionChannel::Ptr channel;
        uint64_t attempt = 0;
    };
    using SessionPtr = std::shared_ptr<Session>;

    // Connect chain
    SessionPtr pending(const std::string& client_id, uint64_t attempt) const;
    void onDeviceConnected(const std::string& client_id, uint64_t attempt, OnOutcome done,
                           ESPHome::OperationResult result, const std::string& detail);
    void onServices(const std::string& client_id, uint64_t attempt, OnOutcome done,
                    ESPHome::OperationResult result, const std::string& detail,
                    const std::vector<ESPHome::GATTService>& services);
    void onNotifyEnabled(const std::string& client_id, uint64_t attempt, OnOutcome done,
                         ESPHome::OperationResult result, const std::string& detail);
    void establish(const SessionPtr& session, OnOutcome done);
    void failConnect(const SessionPtr& session, const Outcome& outcome, OnOutcome done);
    void superseded(OnOutcome done);

    void teardown(const SessionPtr& session);
    bool deviceInUse(const ESPHome::IProxyTransport* transport, uint64_t address) const;
    void releaseDevice(const ESPHome::IProxyTransport::Ptr& transport, uint64_t address);

    // Transport events
    void attachTransport(const ESPHome::IProxyTransport::Ptr& transport);
    void onNotification(const ESPHome::IProxyTransport* transport, uint64_t address, uint16_t handle,
                        const RNS::Bytes& data);
    void onDeviceDisconnected(const ESPHome::IProxyTransport* transport, uint64_t address, int32_t reason);

    static Outcome connectFailure(ESPHome::OperationResult result, const std::string& detail);

    double _connect_timeout;
    double _operation_timeout;
    uint64_t _next_attempt = 0;

    std::map<std::string, SessionPtr> _sessions;
};

} // namespace BLEBridge
