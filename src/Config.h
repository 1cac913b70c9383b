// Copyright (c) 2024 microReticulum contributors
// SPDX-License-Identifier: MIT

#ifndef BLEBRIDGE_CONFIG_H
#define BLEBRIDGE_CONFIG_H

#include <cstdint>

namespace BLEBridge {

/**
 * Compile-time defaults
 *
 * Every value can be overridden at startup from the environment or the
 * .env file (see Settings.h).
 */

namespace Listen {
    constexpr const char* HOST = "0.0.0.0";
    constexpr uint16_t PORT = 8000;
    constexpr const char* API_PREFIX = "/api/v1/esphome";
    constexpr const char* WS_SUFFIX = "/ws";
}

namespace ESPHomeApi {
    constexpr uint16_t API_PORT = 6053;             // ESPHome native API
    constexpr bool MDNS_ENABLED = true;
    constexpr const char* SERVICE_TYPE = "_esphomelib._tcp.local.";
    constexpr double CONNECTION_TIMEOUT = 30.0;     // seconds, proxy link and device connect
    constexpr double OPERATION_TIMEOUT = 10.0;      // seconds, GATT write
}

namespace Discovery {
    constexpr double DEVICE_EXPIRY = 30.0;          // seconds without an advertisement
    constexpr double CACHE_WINDOW = 2.0;            // seconds, advertisement dedup window
    constexpr double LOOP_INTERVAL = 5.0;           // seconds between proxy connect passes
    constexpr double CLEANUP_INTERVAL = 10.0;       // seconds between stale sweeps
    constexpr const char* NAME_FILTER = "sfp";      // empty admits every device
}

namespace Logging {
    constexpr const char* LEVEL = "info";
    constexpr uint32_t MAX_LOG_SIZE = 10 * 1024 * 1024;    // bytes before rotation
    constexpr uint32_t FLUSH_AFTER_LINES = 10;
}

namespace App {
    constexpr const char* ENV_FILE = ".env";
    constexpr uint32_t LOOP_SLEEP_US = 5000;        // main loop idle sleep
}

} // namespace BLEBridge

#endif // BLEBRIDGE_CONFIG_H
