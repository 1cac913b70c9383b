/**
 * @file BridgeTypes.h
 * @brief Result type and address helpers shared by the bridge components
 */
#pragma once

#include <stdint.h>
#include <string>

namespace BLEBridge {

/**
 * @brief Failure classes surfaced to clients
 *
 * CLIENT errors are caused by the request (unknown device, malformed
 * message, no session). INFRASTRUCTURE errors come from proxies and
 * devices. TIMEOUT is kept apart because it usually means the device
 * moved out of range.
 */
enum class ErrorCategory : uint8_t {
    NONE,
    CLIENT,
    INFRASTRUCTURE,
    TIMEOUT
};

inline const char* errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::CLIENT:         return "client";
        case ErrorCategory::INFRASTRUCTURE: return "infrastructure";
        case ErrorCategory::TIMEOUT:        return "timeout";
        default:                            return "unknown";
    }
}

/**
 * @brief Completion value of a session or protocol level operation
 */
struct Outcome {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;

    bool ok() const { return category == ErrorCategory::NONE; }

    static Outcome success(const std::string& message = std::string()) {
        return Outcome{ErrorCategory::NONE, message};
    }
    static Outcome clientError(const std::string& message) {
        return Outcome{ErrorCategory::CLIENT, message};
    }
    static Outcome infrastructure(const std::string& message) {
        return Outcome{ErrorCategory::INFRASTRUCTURE, message};
    }
    static Outcome timeout(const std::string& message) {
        return Outcome{ErrorCategory::TIMEOUT, message};
    }
};

/**
 * @brief Normalize a MAC address to AA:BB:CC:DD:EE:FF
 *
 * Accepts ':' or '-' separators in any letter case.
 *
 * @param in Address as received
 * @param out Normalized address, set only on success
 * @return false if the input is not exactly six hex octets
 */
bool normalizeMac(const std::string& in, std::string& out);

/**
 * @brief Convert a normalized MAC to the 48-bit integer form used by proxies
 */
uint64_t macToUint64(const std::string& mac);
std::string macFromUint64(uint64_t address);

/**
 * @brief Canonical UUID form for comparison: upper case, hyphens removed
 */
std::string normalizeUuid(const std::string& uuid);
bool uuidEquals(const std::string& a, const std::string& b);

} // namespace BLEBridge
