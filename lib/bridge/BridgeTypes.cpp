/**
 * @file BridgeTypes.cpp
 * @brief MAC address and UUID normalization
 */

#include "BridgeTypes.h"

#include <ctype.h>
#include <stdio.h>

namespace BLEBridge {

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool normalizeMac(const std::string& in, std::string& out) {
    // 6 octets, 5 separators
    if (in.size() != 17) {
        return false;
    }

    std::string result;
    result.reserve(17);
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (i % 3 == 2) {
            if (c != ':' && c != '-') {
                return false;
            }
            result += ':';
        } else {
            if (hexValue(c) < 0) {
                return false;
            }
            result += static_cast<char>(toupper(static_cast<unsigned char>(c)));
        }
    }

    out = result;
    return true;
}

uint64_t macToUint64(const std::string& mac) {
    uint64_t address = 0;
    for (char c : mac) {
        int value = hexValue(c);
        if (value >= 0) {
            address = (address << 4) | static_cast<uint64_t>(value);
        }
    }
    return address & 0xFFFFFFFFFFFFULL;
}

std::string macFromUint64(uint64_t address) {
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

std::string normalizeUuid(const std::string& uuid) {
    std::string result;
    result.reserve(uuid.size());
    for (char c : uuid) {
        if (c == '-') {
            continue;
        }
        result += static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

bool uuidEquals(const std::string& a, const std::string& b) {
    return normalizeUuid(a) == normalizeUuid(b);
}

} // namespace BLEBridge
