/**
 * @file ClientMessages.h
 * @brief JSON message protocol spoken with WebSocket clients
 *
 * Client -> server:
 *   {type:"connect", mac_address, service_uuid?, notify_char_uuid?, write_char_uuid?}
 *   {type:"disconnect"}
 *   {type:"write", characteristic_uuid, data (base64), with_response = true}
 *   {type:"subscribe" | "unsubscribe", characteristic_uuid}
 *
 * Server -> client:
 *   connected, disconnected, notification, status, error
 *
 * Inbound text is decoded once into a ClientMessage; absent optional
 * fields decode as empty strings. Optional outbound fields that are empty
 * are sent as null.
 */
#pragma once

#include <nlohmann/json.hpp>

#include <stdint.h>
#include <string>

namespace BLEBridge {

enum class ClientMessageType : uint8_t {
    CONNECT,
    DISCONNECT,
    WRITE,
    SUBSCRIBE,
    UNSUBSCRIBE
};

struct ClientMessage {
    ClientMessageType type = ClientMessageType::DISCONNECT;

    // connect
    std::string mac_address;
    std::string service_uuid;
    std::string notify_uuid;
    std::string write_uuid;

    // write, subscribe, unsubscribe
    std::string characteristic_uuid;

    // write
    std::string data;
    bool with_response = true;

    bool hasAllUuids() const {
        return !service_uuid.empty() && !notify_uuid.empty() && !write_uuid.empty();
    }
};

enum class DecodeStatus : uint8_t {
    OK,
    INVALID_JSON,       // Not parseable
    INVALID_FORMAT,     // Missing or mistyped field
    UNKNOWN_TYPE        // error holds the offending type
};

/**
 * @brief Decode one inbound text frame
 *
 * @param error Description of the failure when the status is not OK
 */
DecodeStatus decodeClientMessage(const std::string& text, ClientMessage& message, std::string& error);

namespace Messages {

nlohmann::json connected(const std::string& device_name, const std::string& device_address,
                         const std::string& service_uuid, const std::string& notify_uuid,
                         const std::string& write_uuid, const std::string& proxy_used);
nlohmann::json disconnected(const std::string& reason);
nlohmann::json notification(const std::string& characteristic_uuid, const std::string& data_base64);
nlohmann::json status(bool connected, const std::string& device_name, const std::string& message);
nlohmann::json error(const std::string& error, const nlohmann::json& details = nullptr);

} // namespace Messages

} // namespace BLEBridge
