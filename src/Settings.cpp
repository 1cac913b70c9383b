#include "Settings.h"

#include <Log.h>

#include <ctype.h>
#include <stdlib.h>

#include <exception>
#include <fstream>
#include <sstream>

namespace BLEBridge {

namespace {

const char* const KNOWN_KEYS[] = {
    "LISTEN_HOST", "LISTEN_PORT", "API_PREFIX", "LOG_LEVEL", "LOG_FILE",
    "ESPHOME_MDNS_ENABLED", "ESPHOME_CONNECTION_TIMEOUT", "ESPHOME_OPERATION_TIMEOUT",
    "ESPHOME_PROXY_HOST", "ESPHOME_PROXY_PORT", "ESPHOME_PROXY_NAME", "ESPHOME_PROXY_PASSWORD",
    "ESPHOME_DEVICE_EXPIRY", "ESPHOME_CACHE_WINDOW", "ESPHOME_DISCOVERY_LOOP_INTERVAL",
    "ESPHOME_CLEANUP_LOOP_INTERVAL", "DEVICE_NAME_FILTER",
    "SFP_SERVICE_UUID", "SFP_NOTIFY_CHAR_UUID", "SFP_WRITE_CHAR_UUID",
};

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::string();
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string upper(const std::string& value) {
    std::string result = value;
    for (auto& c : result) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

bool parseBool(const std::string& value, bool& out) {
    std::string v = upper(value);
    if (v == "1" || v == "TRUE" || v == "YES" || v == "ON") {
        out = true;
        return true;
    }
    if (v == "0" || v == "FALSE" || v == "NO" || v == "OFF") {
        out = false;
        return true;
    }
    return false;
}

bool parsePort(const std::string& value, uint16_t& out) {
    try {
        size_t used = 0;
        int port = std::stoi(value, &used);
        if (used != value.size() || port < 0 || port > 65535) {
            return false;
        }
        out = static_cast<uint16_t>(port);
        return true;
    }
    catch (std::exception&) {
        return false;
    }
}

bool parseSeconds(const std::string& value, double& out) {
    try {
        size_t used = 0;
        double seconds = std::stod(value, &used);
        if (used != value.size() || seconds < 0.0) {
            return false;
        }
        out = seconds;
        return true;
    }
    catch (std::exception&) {
        return false;
    }
}

} // namespace

DeviceProfile AppSettings::defaultProfile() const {
    DeviceProfile profile;
    profile.service_uuid = sfp_service_uuid;
    profile.notify_uuid = sfp_notify_uuid;
    profile.write_uuid = sfp_write_uuid;
    return profile;
}

/*static*/ SettingsLoader::Values SettingsLoader::parseEnvFile(const std::string& content) {
    Values values;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }
        size_t equals = line.find('=');
        if (equals == std::string::npos || equals == 0) {
            continue;
        }
        std::string key = upper(trim(line.substr(0, equals)));
        std::string value = trim(line.substr(equals + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return values;
}

/*static*/ bool SettingsLoader::readEnvFile(const std::string& path, Values& values) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    Values parsed = parseEnvFile(content.str());
    for (const auto& entry : parsed) {
        values[entry.first] = entry.second;
    }
    return true;
}

/*static*/ int SettingsLoader::apply(const Values& values, AppSettings& settings) {
    int rejected = 0;
    auto reject = [&rejected](const std::string& key, const std::string& value) {
        WARNING("Settings: Ignoring invalid " + key + "=" + value);
        ++rejected;
    };

    for (const auto& entry : values) {
        const std::string& key = entry.first;
        const std::string& value = entry.second;

        if (key == "LISTEN_HOST") {
            settings.listen_host = value;
        } else if (key == "LISTEN_PORT") {
            if (!parsePort(value, settings.listen_port)) reject(key, value);
        } else if (key == "API_PREFIX") {
            std::string prefix = value;
            while (!prefix.empty() && prefix.back() == '/') {
                prefix.pop_back();
            }
            if (!prefix.empty() && prefix.front() != '/') {
                prefix = "/" + prefix;
            }
            settings.api_prefix = prefix;
        } else if (key == "LOG_LEVEL") {
            settings.log_level = value;
        } else if (key == "LOG_FILE") {
            settings.log_file = value;
        } else if (key == "ESPHOME_MDNS_ENABLED") {
            if (!parseBool(value, settings.mdns_enabled)) reject(key, value);
        } else if (key == "ESPHOME_CONNECTION_TIMEOUT") {
            if (!parseSeconds(value, settings.connection_timeout)) reject(key, value);
        } else if (key == "ESPHOME_OPERATION_TIMEOUT") {
            if (!parseSeconds(value, settings.operation_timeout)) reject(key, value);
        } else if (key == "ESPHOME_PROXY_HOST") {
            settings.proxy_host = value;
        } else if (key == "ESPHOME_PROXY_PORT") {
            if (!parsePort(value, settings.proxy_port)) reject(key, value);
        } else if (key == "ESPHOME_PROXY_NAME") {
            settings.proxy_name = value;
        } else if (key == "ESPHOME_PROXY_PASSWORD") {
            settings.proxy_password = value;
        } else if (key == "ESPHOME_DEVICE_EXPIRY") {
            if (!parseSeconds(value, settings.device_expiry)) reject(key, value);
        } else if (key == "ESPHOME_CACHE_WINDOW") {
            if (!parseSeconds(value, settings.cache_window)) reject(key, value);
        } else if (key == "ESPHOME_DISCOVERY_LOOP_INTERVAL") {
            if (!parseSeconds(value, settings.discovery_interval)) reject(key, value);
        } else if (key == "ESPHOME_CLEANUP_LOOP_INTERVAL") {
            if (!parseSeconds(value, settings.cleanup_interval)) reject(key, value);
        } else if (key == "DEVICE_NAME_FILTER") {
            settings.name_filter = value;
        } else if (key == "SFP_SERVICE_UUID") {
            settings.sfp_service_uuid = value;
        } else if (key == "SFP_NOTIFY_CHAR_UUID") {
            settings.sfp_notify_uuid = value;
        } else if (key == "SFP_WRITE_CHAR_UUID") {
            settings.sfp_write_uuid = value;
        }
    }
    return rejected;
}

/*static*/ AppSettings SettingsLoader::load() {
    AppSettings settings;
    Values values;

    const char* env_file = getenv("BLEBRIDGE_ENV_FILE");
    std::string path = (env_file && *env_file) ? env_file : App::ENV_FILE;
    if (readEnvFile(path, values)) {
        DEBUG("Settings: Loaded " + path);
    }

    for (const char* key : KNOWN_KEYS) {
        const char* value = getenv(key);
        if (value) {
            values[key] = value;
        }
    }

    apply(values, settings);
    return settings;
}

} // namespace BLEBridge
