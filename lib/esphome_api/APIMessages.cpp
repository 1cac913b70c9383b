/**
 * @file APIMessages.cpp
 * @brief ESPHome Bluetooth proxy message codec on the generated protobuf classes
 */

#include "APIMessages.h"
#include "api.pb.h"

#include <cstdio>

namespace BLEBridge { namespace ESPHome { namespace Messages {

using RNS::Bytes;

namespace {

Bytes serialize(const google::protobuf::MessageLite& message) {
    std::string wire;
    if (!message.SerializeToString(&wire)) {
        ERROR("APIMessages: Failed to serialize " + message.GetTypeName());
        return Bytes();
    }
    return Bytes(reinterpret_cast<const uint8_t*>(wire.data()), wire.size());
}

bool parse(google::protobuf::MessageLite& message, const Bytes& payload) {
    return message.ParseFromArray(payload.data(), static_cast<int>(payload.size()));
}

Bytes toBytes(const std::string& value) {
    return Bytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

std::string toString(const Bytes& value) {
    return std::string(reinterpret_cast<const char*>(value.data()), value.size());
}

template <typename Repeated>
std::string uuidFromFields(const Repeated& words, uint32_t short_uuid) {
    if (words.size() >= 2) {
        return uuidFromWords(words.Get(0), words.Get(1));
    }
    if (short_uuid != 0) {
        return uuidFromShort(short_uuid);
    }
    return std::string();
}

} // namespace

//=============================================================================
// Requests
//=============================================================================

Bytes encodeHelloRequest(const std::string& client_info) {
    esphome_api::HelloRequest request;
    request.set_client_info(client_info);
    request.set_api_version_major(API_VERSION_MAJOR);
    request.set_api_version_minor(API_VERSION_MINOR);
    return serialize(request);
}

Bytes encodeConnectRequest(const std::string& password) {
    esphome_api::ConnectRequest request;
    request.set_password(password);
    return serialize(request);
}

Bytes encodeGetTimeResponse(uint32_t epoch_seconds) {
    esphome_api::GetTimeResponse response;
    response.set_epoch_seconds(epoch_seconds);
    return serialize(response);
}

Bytes encodeSubscribeAdvertisements(uint32_t flags) {
    esphome_api::SubscribeBluetoothLEAdvertisementsRequest request;
    request.set_flags(flags);
    return serialize(request);
}

Bytes encodeDeviceRequest(uint64_t address, uint32_t request_type,
                          bool has_address_type, uint32_t address_type) {
    esphome_api::BluetoothDeviceRequest request;
    request.set_address(address);
    request.set_request_type(static_cast<esphome_api::BluetoothDeviceRequestType>(request_type));
    if (has_address_type) {
        request.set_has_address_type(true);
        request.set_address_type(address_type);
    }
    return serialize(request);
}

Bytes encodeGetServicesRequest(uint64_t address) {
    esphome_api::BluetoothGATTGetServicesRequest request;
    request.set_address(address);
    return serialize(request);
}

Bytes encodeWriteRequest(uint64_t address, uint16_t handle, bool response, const Bytes& data) {
    esphome_api::BluetoothGATTWriteRequest request;
    request.set_address(address);
    request.set_handle(handle);
    request.set_response(response);
    request.set_data(toString(data));
    return serialize(request);
}

Bytes encodeNotifyRequest(uint64_t address, uint16_t handle, bool enable) {
    esphome_api::BluetoothGATTNotifyRequest request;
    request.set_address(address);
    request.set_handle(handle);
    request.set_enable(enable);
    return serialize(request);
}

//=============================================================================
// Helpers
//=============================================================================

std::string uuidFromWords(uint64_t high, uint64_t low) {
    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%04x%08x",
             static_cast<unsigned>(high >> 32),
             static_cast<unsigned>((high >> 16) & 0xFFFF),
             static_cast<unsigned>(high & 0xFFFF),
             static_cast<unsigned>(low >> 48),
             static_cast<unsigned>((low >> 32) & 0xFFFF),
             static_cast<unsigned>(low & 0xFFFFFFFF));
    return std::string(buf);
}

std::string uuidFromShort(uint32_t short_uuid) {
    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-0000-1000-8000-00805f9b34fb", short_uuid);
    return std::string(buf);
}

std::string parseLocalName(const Bytes& ad_data) {
    std::string short_name;
    size_t pos = 0;
    while (pos < ad_data.size()) {
        uint8_t length = ad_data.data()[pos];
        if (length == 0) {
            break;
        }
        if (pos + 1 + length > ad_data.size()) {
            break;  // truncated structure
        }
        uint8_t ad_type = ad_data.data()[pos + 1];
        const char* value = reinterpret_cast<const char*>(ad_data.data() + pos + 2);
        size_t value_len = length - 1;
        if (ad_type == 0x09) {
            return std::string(value, value_len);
        }
        if (ad_type == 0x08 && short_name.empty()) {
            short_name.assign(value, value_len);
        }
        pos += 1 + length;
    }
    return short_name;
}

//=============================================================================
// Responses and events
//=============================================================================

bool decodeHelloResponse(const Bytes& payload, HelloInfo& out) {
    esphome_api::HelloResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    out.api_major = response.api_version_major();
    out.api_minor = response.api_version_minor();
    out.server_info = response.server_info();
    out.name = response.name();
    return true;
}

bool decodeConnectResponse(const Bytes& payload, bool& invalid_password) {
    esphome_api::ConnectResponse response;
    invalid_password = false;
    if (!parse(response, payload)) {
        return false;
    }
    invalid_password = response.invalid_password();
    return true;
}

bool decodeDeviceInfoResponse(const Bytes& payload, DeviceInfo& out) {
    esphome_api::DeviceInfoResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    out.name = response.name();
    out.mac_address = response.mac_address();
    out.esphome_version = response.esphome_version();
    out.legacy_proxy_version = response.legacy_bluetooth_proxy_version();
    out.proxy_feature_flags = response.bluetooth_proxy_feature_flags();
    return true;
}

bool decodeAdvertisement(const Bytes& payload, Advertisement& out) {
    esphome_api::BluetoothLEAdvertisementResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    // service uuids/data and manufacturer data are not tracked
    out.address = response.address();
    out.name = response.name();
    out.rssi = response.rssi();
    out.address_type = response.address_type();
    return true;
}

bool decodeRawAdvertisements(const Bytes& payload, std::vector<Advertisement>& out) {
    esphome_api::BluetoothLERawAdvertisementsResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    for (const auto& raw : response.advertisements()) {
        Advertisement advertisement;
        advertisement.address = raw.address();
        advertisement.rssi = raw.rssi();
        advertisement.address_type = raw.address_type();
        advertisement.data = toBytes(raw.data());
        advertisement.name = parseLocalName(advertisement.data);
        out.push_back(advertisement);
    }
    return true;
}

bool decodeConnectionResponse(const Bytes& payload, DeviceConnectionEvent& out) {
    esphome_api::BluetoothDeviceConnectionResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    out.address = response.address();
    out.connected = response.connected();
    out.mtu = response.mtu();
    out.error = response.error();
    return true;
}

bool decodeServicesResponse(const Bytes& payload, uint64_t& address, std::vector<GATTService>& out) {
    esphome_api::BluetoothGATTGetServicesResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    address = response.address();
    for (const auto& entry : response.services()) {
        GATTService service;
        service.uuid = uuidFromFields(entry.uuid(), entry.short_uuid());
        service.handle = static_cast<uint16_t>(entry.handle());
        for (const auto& chr : entry.characteristics()) {
            GATTCharacteristic characteristic;
            characteristic.uuid = uuidFromFields(chr.uuid(), chr.short_uuid());
            characteristic.handle = static_cast<uint16_t>(chr.handle());
            characteristic.properties = chr.properties();
            service.characteristics.push_back(characteristic);
        }
        out.push_back(service);
    }
    return true;
}

bool decodeServicesDone(const Bytes& payload, uint64_t& address) {
    esphome_api::BluetoothGATTGetServicesDoneResponse response;
    if (!parse(response, payload)) {
        return false;
    }
    address = response.address();
    return true;
}

bool decodeHandleEvent(const Bytes& payload, uint32_t message_type, GATTHandleEvent& out) {
    switch (message_type) {
        case MessageType::GATT_NOTIFY_DATA: {
            esphome_api::BluetoothGATTNotifyDataResponse response;
            if (!parse(response, payload)) {
                return false;
            }
            out.address = response.address();
            out.handle = static_cast<uint16_t>(response.handle());
            out.data = toBytes(response.data());
            return true;
        }
        case MessageType::GATT_ERROR_RESPONSE: {
            esphome_api::BluetoothGATTErrorResponse response;
            if (!parse(response, payload)) {
                return false;
            }
            out.address = response.address();
            out.handle = static_cast<uint16_t>(response.handle());
            out.error = response.error();
            return true;
        }
        case MessageType::GATT_WRITE_RESPONSE: {
            esphome_api::BluetoothGATTWriteResponse response;
            if (!parse(response, payload)) {
                return false;
            }
            out.address = response.address();
            out.handle = static_cast<uint16_t>(response.handle());
            return true;
        }
        case MessageType::GATT_NOTIFY_RESPONSE: {
            esphome_api::BluetoothGATTNotifyResponse response;
            if (!parse(response, payload)) {
                return false;
            }
            out.address = response.address();
            out.handle = static_cast<uint16_t>(response.handle());
            return true;
        }
        default:
            return false;
    }
}

}}} // namespace BLEBridge::ESPHome::Messages
