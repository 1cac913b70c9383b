/**
 * @file Base64.h
 * @brief Standard base64 for GATT payloads on the client WebSocket
 */

#pragma once

#include "Bytes.h"

#include <string>

namespace BLEBridge { namespace Base64 {

std::string encode(const RNS::Bytes& data);

/**
 * @brief Decode standard (padded) base64
 *
 * Input must be a multiple of four characters from the standard alphabet,
 * with '=' allowed only as a final run of one or two.
 *
 * @return false on malformed input; out is left unchanged
 */
bool decode(const std::string& text, RNS::Bytes& out);

}} // namespace BLEBridge::Base64
