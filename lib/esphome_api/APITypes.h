/**
 * @file APITypes.h
 * @brief ESPHome native API types, constants, and common structures
 *
 * This file defines the message identifiers, protocol constants, enumerations
 * and data structures shared by the ESPHome proxy transport implementation.
 * Only the subset of the native API used by a Bluetooth proxy client is
 * covered here.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace BLEBridge { namespace ESPHome {

//=============================================================================
// Protocol Version
//=============================================================================

static constexpr uint32_t API_VERSION_MAJOR = 1;
static constexpr uint32_t API_VERSION_MINOR = 10;
static constexpr const char* CLIENT_INFO = "blebridge";

//=============================================================================
// Message Type Identifiers
//=============================================================================

namespace MessageType {
    static constexpr uint32_t HELLO_REQUEST = 1;
    static constexpr uint32_t HELLO_RESPONSE = 2;
    static constexpr uint32_t CONNECT_REQUEST = 3;
    static constexpr uint32_t CONNECT_RESPONSE = 4;
    static constexpr uint32_t DISCONNECT_REQUEST = 5;
    static constexpr uint32_t DISCONNECT_RESPONSE = 6;
    static constexpr uint32_t PING_REQUEST = 7;
    static constexpr uint32_t PING_RESPONSE = 8;
    static constexpr uint32_t DEVICE_INFO_REQUEST = 9;
    static constexpr uint32_t DEVICE_INFO_RESPONSE = 10;
    static constexpr uint32_t GET_TIME_REQUEST = 36;
    static constexpr uint32_t GET_TIME_RESPONSE = 37;
    static constexpr uint32_t SUBSCRIBE_BLE_ADVERTISEMENTS = 66;
    static constexpr uint32_t BLE_ADVERTISEMENT_RESPONSE = 67;
    static constexpr uint32_t BLUETOOTH_DEVICE_REQUEST = 68;
    static constexpr uint32_t BLUETOOTH_DEVICE_CONNECTION_RESPONSE = 69;
    static constexpr uint32_t GATT_GET_SERVICES_REQUEST = 70;
    static constexpr uint32_t GATT_GET_SERVICES_RESPONSE = 71;
    static constexpr uint32_t GATT_GET_SERVICES_DONE = 72;
    static constexpr uint32_t GATT_WRITE_REQUEST = 75;
    static constexpr uint32_t GATT_NOTIFY_REQUEST = 78;
    static constexpr uint32_t GATT_NOTIFY_DATA = 79;
    static constexpr uint32_t GATT_ERROR_RESPONSE = 82;
    static constexpr uint32_t GATT_WRITE_RESPONSE = 83;
    static constexpr uint32_t GATT_NOTIFY_RESPONSE = 84;
    static constexpr uint32_t UNSUBSCRIBE_BLE_ADVERTISEMENTS = 87;
    static constexpr uint32_t BLE_RAW_ADVERTISEMENTS_RESPONSE = 93;
}

//=============================================================================
// Bluetooth Device Request Types
//=============================================================================

namespace DeviceRequest {
    static constexpr uint32_t CONNECT = 0;
    static constexpr uint32_t DISCONNECT = 1;
    static constexpr uint32_t CONNECT_V3_WITH_CACHE = 4;
    static constexpr uint32_t CONNECT_V3_WITHOUT_CACHE = 5;
}

//=============================================================================
// Proxy Feature Flags (DeviceInfoResponse.bluetooth_proxy_feature_flags)
//=============================================================================

namespace FeatureFlags {
    static constexpr uint32_t PASSIVE_SCAN = 1 << 0;
    static constexpr uint32_t ACTIVE_CONNECTIONS = 1 << 1;
    static constexpr uint32_t REMOTE_CACHING = 1 << 2;
    static constexpr uint32_t PAIRING = 1 << 3;
    static constexpr uint32_t CACHE_CLEARING = 1 << 4;
    static constexpr uint32_t RAW_ADVERTISEMENTS = 1 << 5;
}

// SubscribeBluetoothLEAdvertisementsRequest.flags
static constexpr uint32_t ADVERTISEMENT_FLAG_RAW = 1;

//=============================================================================
// GATT Characteristic Properties
//=============================================================================

namespace Property {
    static constexpr uint32_t BROADCAST = 0x01;
    static constexpr uint32_t READ = 0x02;
    static constexpr uint32_t WRITE_NO_RESPONSE = 0x04;
    static constexpr uint32_t WRITE = 0x08;
    static constexpr uint32_t NOTIFY = 0x10;
    static constexpr uint32_t INDICATE = 0x20;
}

//=============================================================================
// Protocol Timing Constants
//=============================================================================

namespace Timing {
    static constexpr double KEEPALIVE_INTERVAL = 20.0;        // Seconds between pings
    static constexpr double KEEPALIVE_TIMEOUT = 90.0;         // Seconds of silence before link is dropped
    static constexpr double DEFAULT_OPERATION_TIMEOUT = 10.0; // Seconds for a GATT operation
}

//=============================================================================
// Protocol Limits
//=============================================================================

namespace Limits {
    static constexpr size_t MAX_FRAME_SIZE = 1024 * 1024;     // Largest payload accepted from a proxy
    static constexpr size_t RECV_CHUNK = 4096;                // Bytes read per recv() call
    static constexpr size_t MAX_TX_BUFFER = 256 * 1024;       // Unsent bytes before the link is dropped
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Proxy link state machine states
 */
enum class LinkState : uint8_t {
    IDLE,                // Not started
    CONNECTING,          // TCP connect in progress
    HANDSHAKING,         // Hello/Connect/DeviceInfo exchange
    READY,               // Authenticated, requests accepted
    CLOSED               // Terminal: stopped, failed or lost
};

/**
 * @brief Proxy request result codes
 */
enum class OperationResult : uint8_t {
    SUCCESS,
    TIMEOUT,
    DISCONNECTED,
    NOT_READY,
    REJECTED,
    ERROR
};

/**
 * @brief Request kinds tracked while awaiting a proxy response
 */
enum class RequestType : uint8_t {
    DEVICE_CONNECT,
    DEVICE_DISCONNECT,
    GET_SERVICES,
    WRITE,
    NOTIFY
};

//=============================================================================
// Data Structures
//=============================================================================

struct GATTCharacteristic {
    std::string uuid;                   // Lowercase 8-4-4-4-12 form
    uint16_t handle = 0;
    uint32_t properties = 0;

    bool canNotify() const {
        return (properties & (Property::NOTIFY | Property::INDICATE)) != 0;
    }

    bool canWrite() const {
        return (properties & (Property::WRITE | Property::WRITE_NO_RESPONSE)) != 0;
    }
};

struct GATTService {
    std::string uuid;
    uint16_t handle = 0;
    std::vector<GATTCharacteristic> characteristics;
};

/**
 * @brief One BLE advertisement as relayed by a proxy
 */
struct Advertisement {
    uint64_t address = 0;
    std::string name;
    int32_t rssi = -100;
    uint32_t address_type = 0;
    RNS::Bytes data;                       // Raw AD structures, empty for parsed advertisements
};

struct DeviceConnectionEvent {
    uint64_t address = 0;
    bool connected = false;
    uint32_t mtu = 0;
    int32_t error = 0;
};

struct GATTHandleEvent {
    uint64_t address = 0;
    uint16_t handle = 0;
    int32_t error = 0;
    RNS::Bytes data;
};

struct HelloInfo {
    uint32_t api_major = 0;
    uint32_t api_minor = 0;
    std::string server_info;
    std::string name;
};

struct DeviceInfo {
    std::string name;
    std::string mac_address;
    std::string esphome_version;
    uint32_t legacy_proxy_version = 0;
    uint32_t proxy_feature_flags = 0;
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    using OnResult = std::function<void(OperationResult result, const std::string& detail)>;
    using OnServices = std::function<void(OperationResult result, const std::string& detail,
                                          const std::vector<GATTService>& services)>;
    using OnAdvertisement = std::function<void(const Advertisement& advertisement)>;
    using OnNotification = std::function<void(uint64_t address, uint16_t handle, const RNS::Bytes& data)>;
    using OnDeviceDisconnected = std::function<void(uint64_t address, int32_t reason)>;
}

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Format a 48-bit Bluetooth address as XX:XX:XX:XX:XX:XX
 */
inline std::string addressToString(uint64_t address) {
    char buf[18];
    snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
             static_cast<unsigned>((address >> 40) & 0xFF),
             static_cast<unsigned>((address >> 32) & 0xFF),
             static_cast<unsigned>((address >> 24) & 0xFF),
             static_cast<unsigned>((address >> 16) & 0xFF),
             static_cast<unsigned>((address >> 8) & 0xFF),
             static_cast<unsigned>(address & 0xFF));
    return std::string(buf);
}

inline const char* linkStateToString(LinkState state) {
    switch (state) {
        case LinkState::IDLE:        return "IDLE";
        case LinkState::CONNECTING:  return "CONNECTING";
        case LinkState::HANDSHAKING: return "HANDSHAKING";
        case LinkState::READY:       return "READY";
        case LinkState::CLOSED:      return "CLOSED";
        default:                     return "UNKNOWN";
    }
}

inline const char* resultToString(OperationResult result) {
    switch (result) {
        case OperationResult::SUCCESS:      return "SUCCESS";
        case OperationResult::TIMEOUT:      return "TIMEOUT";
        case OperationResult::DISCONNECTED: return "DISCONNECTED";
        case OperationResult::NOT_READY:    return "NOT_READY";
        case OperationResult::REJECTED:     return "REJECTED";
        case OperationResult::ERROR:        return "ERROR";
        default:                            return "UNKNOWN";
    }
}

inline const char* requestTypeToString(RequestType type) {
    switch (type) {
        case RequestType::DEVICE_CONNECT:    return "DEVICE_CONNECT";
        case RequestType::DEVICE_DISCONNECT: return "DEVICE_DISCONNECT";
        case RequestType::GET_SERVICES:      return "GET_SERVICES";
        case RequestType::WRITE:             return "WRITE";
        case RequestType::NOTIFY:            return "NOTIFY";
        default:                             return "UNKNOWN";
    }
}

}} // namespace BLEBridge::ESPHome
