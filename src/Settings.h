#pragma once

#include "Config.h"
#include "ProfileStore.h"

#include <stdint.h>
#include <map>
#include <string>

namespace BLEBridge {

/**
 * Application settings
 *
 * Loaded once at startup: compile-time defaults from Config.h, then the
 * KEY=VALUE file named by BLEBRIDGE_ENV_FILE (default ".env"), then the
 * process environment. Later sources win.
 */
struct AppSettings {
    // Listener
    std::string listen_host;
    uint16_t listen_port;
    std::string api_prefix;

    // Logging
    std::string log_level;
    std::string log_file;       // empty = stderr only

    // Proxies
    bool mdns_enabled;
    std::string proxy_host;     // static proxy, optional
    uint16_t proxy_port;
    std::string proxy_name;
    std::string proxy_password;
    double connection_timeout;  // seconds
    double operation_timeout;   // seconds

    // Discovery
    double device_expiry;
    double cache_window;
    double discovery_interval;
    double cleanup_interval;
    std::string name_filter;

    // Default device profile
    std::string sfp_service_uuid;
    std::string sfp_notify_uuid;
    std::string sfp_write_uuid;

    AppSettings() :
        listen_host(Listen::HOST),
        listen_port(Listen::PORT),
        api_prefix(Listen::API_PREFIX),
        log_level(Logging::LEVEL),
        mdns_enabled(ESPHomeApi::MDNS_ENABLED),
        proxy_port(ESPHomeApi::API_PORT),
        connection_timeout(ESPHomeApi::CONNECTION_TIMEOUT),
        operation_timeout(ESPHomeApi::OPERATION_TIMEOUT),
        device_expiry(Discovery::DEVICE_EXPIRY),
        cache_window(Discovery::CACHE_WINDOW),
        discovery_interval(Discovery::LOOP_INTERVAL),
        cleanup_interval(Discovery::CLEANUP_INTERVAL),
        name_filter(Discovery::NAME_FILTER) {}

    std::string wsPath() const { return api_prefix + Listen::WS_SUFFIX; }

    /**
     * @brief Profile formed by the three SFP_* keys (incomplete when any is unset)
     */
    DeviceProfile defaultProfile() const;
};

class SettingsLoader {
public:
    using Values = std::map<std::string, std::string>;

    /**
     * @brief Load settings from the env file and the environment
     *
     * Invalid values are logged and the default is kept.
     */
    static AppSettings load();

    /**
     * @brief Apply KEY=VALUE pairs over existing settings
     * @return Number of values rejected
     */
    static int apply(const Values& values, AppSettings& settings);

    /**
     * @brief Parse KEY=VALUE lines, ignoring blanks and # comments
     */
    static Values parseEnvFile(const std::string& content);

    static bool readEnvFile(const std::string& path, Values& values);
};

} // namespace BLEBridge
