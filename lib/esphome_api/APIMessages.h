/**
 * @file APIMessages.h
 * @brief Encoders and decoders for the ESPHome Bluetooth proxy message subset
 *
 * Encoders return the protobuf payload only; APIFrame adds the framing.
 * Decoders return false when the payload is not well-formed protobuf.
 */
#pragma once

#include "APITypes.h"
#include "Bytes.h"

#include <string>
#include <vector>
#include <cstdint>

namespace BLEBridge { namespace ESPHome { namespace Messages {

//=============================================================================
// Requests (client -> proxy)
//=============================================================================

RNS::Bytes encodeHelloRequest(const std::string& client_info);
RNS::Bytes encodeConnectRequest(const std::string& password);
RNS::Bytes encodeGetTimeResponse(uint32_t epoch_seconds);
RNS::Bytes encodeSubscribeAdvertisements(uint32_t flags);
RNS::Bytes encodeDeviceRequest(uint64_t address, uint32_t request_type,
                               bool has_address_type, uint32_t address_type);
RNS::Bytes encodeGetServicesRequest(uint64_t address);
RNS::Bytes encodeWriteRequest(uint64_t address, uint16_t handle, bool response,
                              const RNS::Bytes& data);
RNS::Bytes encodeNotifyRequest(uint64_t address, uint16_t handle, bool enable);

//=============================================================================
// Responses and events (proxy -> client)
//=============================================================================

bool decodeHelloResponse(const RNS::Bytes& payload, HelloInfo& out);
bool decodeConnectResponse(const RNS::Bytes& payload, bool& invalid_password);
bool decodeDeviceInfoResponse(const RNS::Bytes& payload, DeviceInfo& out);
bool decodeAdvertisement(const RNS::Bytes& payload, Advertisement& out);
bool decodeRawAdvertisements(const RNS::Bytes& payload, std::vector<Advertisement>& out);
bool decodeConnectionResponse(const RNS::Bytes& payload, DeviceConnectionEvent& out);
bool decodeServicesResponse(const RNS::Bytes& payload, uint64_t& address,
                            std::vector<GATTService>& out);
bool decodeServicesDone(const RNS::Bytes& payload, uint64_t& address);

/**
 * @brief Decode any of the address/handle shaped GATT messages
 *
 * Covers GATTWriteResponse, GATTNotifyResponse (address, handle),
 * GATTNotifyData (address, handle, data) and GATTErrorResponse
 * (address, handle, error).
 */
bool decodeHandleEvent(const RNS::Bytes& payload, uint32_t message_type, GATTHandleEvent& out);

//=============================================================================
// Helpers
//=============================================================================

/**
 * @brief Format a 128-bit UUID carried as two uint64 words (high, low)
 * @return Lowercase 8-4-4-4-12 string
 */
std::string uuidFromWords(uint64_t high, uint64_t low);

/**
 * @brief Expand a 16/32-bit UUID against the Bluetooth base UUID
 */
std::string uuidFromShort(uint32_t short_uuid);

/**
 * @brief Extract the local name (AD types 0x09, then 0x08) from raw AD structures
 * @return Name, or empty string when none is present
 */
std::string parseLocalName(const RNS::Bytes& ad_data);

}}} // namespace BLEBridge::ESPHome::Messages
