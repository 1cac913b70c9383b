/**
 * @file ClientMessages.cpp
 * @brief Client message decoding and event builders
 */

#include "ClientMessages.h"

namespace BLEBridge {

using nlohmann::json;

static json optionalString(const std::string& value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

// Required string field
static bool readString(const json& object, const char* key, std::string& out, std::string& error) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        error = std::string("field '") + key + "' is required";
        return false;
    }
    if (!it->is_string()) {
        error = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Optional string field; null and absent both decode as empty
static bool readOptionalString(const json& object, const char* key, std::string& out, std::string& error) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) {
        error = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

DecodeStatus decodeClientMessage(const std::string& text, ClientMessage& message, std::string& error) {
    json object;
    try {
        object = json::parse(text);
    }
    catch (json::parse_error& e) {
        error = e.what();
        return DecodeStatus::INVALID_JSON;
    }

    if (!object.is_object()) {
        error = "message must be a JSON object";
        return DecodeStatus::INVALID_FORMAT;
    }

    auto type = object.find("type");
    if (type == object.end() || !type->is_string()) {
        error = (type == object.end()) ? std::string("null") : type->dump();
        return DecodeStatus::UNKNOWN_TYPE;
    }

    const std::string name = type->get<std::string>();
    ClientMessage decoded;

    if (name == "connect") {
        decoded.type = ClientMessageType::CONNECT;
        if (!readString(object, "mac_address", decoded.mac_address, error) ||
            !readOptionalString(object, "service_uuid", decoded.service_uuid, error) ||
            !readOptionalString(object, "notify_char_uuid", decoded.notify_uuid, error) ||
            !readOptionalString(object, "write_char_uuid", decoded.write_uuid, error)) {
            return DecodeStatus::INVALID_FORMAT;
        }
    } else if (name == "disconnect") {
        decoded.type = ClientMessageType::DISCONNECT;
    } else if (name == "write") {
        decoded.type = ClientMessageType::WRITE;
        if (!readString(object, "characteristic_uuid", decoded.characteristic_uuid, error) ||
            !readString(object, "data", decoded.data, error)) {
            return DecodeStatus::INVALID_FORMAT;
        }
        auto with_response = object.find("with_response");
        if (with_response != object.end() && !with_response->is_null()) {
            if (!with_response->is_boolean()) {
                error = "field 'with_response' must be a boolean";
                return DecodeStatus::INVALID_FORMAT;
            }
            decoded.with_response = with_response->get<bool>();
        }
    } else if (name == "subscribe" || name == "unsubscribe") {
        decoded.type = (name == "subscribe") ? ClientMessageType::SUBSCRIBE : ClientMessageType::UNSUBSCRIBE;
        if (!readString(object, "characteristic_uuid", decoded.characteristic_uuid, error)) {
            return DecodeStatus::INVALID_FORMAT;
        }
    } else {
        error = name;
        return DecodeStatus::UNKNOWN_TYPE;
    }

    message = decoded;
    return DecodeStatus::OK;
}

namespace Messages {

json connected(const std::string& device_name, const std::string& device_address,
               const std::string& service_uuid, const std::string& notify_uuid,
               const std::string& write_uuid, const std::string& proxy_used) {
    json message;
    message["type"] = "connected";
    message["device_name"] = optionalString(device_name);
    message["device_address"] = device_address;
    message["service_uuid"] = service_uuid;
    message["notify_char_uuid"] = notify_uuid;
    message["write_char_uuid"] = write_uuid;
    message["proxy_used"] = proxy_used;
    return message;
}

json disconnected(const std::string& reason) {
    json message;
    message["type"] = "disconnected";
    message["reason"] = reason;
    return message;
}

json notification(const std::string& characteristic_uuid, const std::string& data_base64) {
    json message;
    message["type"] = "notification";
    message["characteristic_uuid"] = characteristic_uuid;
    message["data"] = data_base64;
    return message;
}

json status(bool connected, const std::string& device_name, const std::string& text) {
    json message;
    message["type"] = "status";
    message["connected"] = connected;
    message["device_name"] = optionalString(device_name);
    message["message"] = text;
    return message;
}

json error(const std::string& text, const json& details) {
    json message;
    message["type"] = "error";
    message["error"] = text;
    message["details"] = details;
    return message;
}

} // namespace Messages

} // namespace BLEBridge
