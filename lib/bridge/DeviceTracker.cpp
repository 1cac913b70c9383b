/**
 * @file DeviceTracker.cpp
 * @brief BLE device catalog implementation
 */

#include "DeviceTracker.h"
#include "BridgeTypes.h"
#include "Log.h"

#include <ctype.h>

namespace BLEBridge {

using namespace RNS;

DeviceTracker::DeviceTracker(double expiry) : _expiry(expiry) {
}

std::string DeviceTracker::normalize(const std::string& mac) {
    std::string normalized;
    if (normalizeMac(mac, normalized)) {
        return normalized;
    }
    // Not a well-formed MAC; keep a case-folded key so lookups stay consistent
    for (char c : mac) {
        normalized += (c == '-') ? ':' : static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return normalized;
}

//=============================================================================
// Updates
//=============================================================================

void DeviceTracker::update(const std::string& mac, const std::string& name, int32_t rssi,
                           const std::string& proxy_name, const Bytes& ad_data,
                           uint32_t address_type) {
    update(mac, name, rssi, proxy_name, ad_data, address_type, Utilities::OS::time());
}

void DeviceTracker::update(const std::string& mac, const std::string& name, int32_t rssi,
                           const std::string& proxy_name, const Bytes& ad_data,
                           uint32_t address_type, double now) {
    std::string key = normalize(mac);

    _rssi_by_proxy[key][proxy_name] = rssi;

    std::string best_proxy;
    int32_t best_rssi = rssi;
    selectBest(key, best_proxy, best_rssi);

    auto it = _devices.find(key);
    if (it != _devices.end()) {
        DiscoveredDevice& device = it->second;
        device.rssi = best_rssi;
        device.best_proxy = best_proxy;
        device.last_seen = now;
        device.address_type = address_type;
        if (device.name.empty() && !name.empty()) {
            device.name = name;
        }
        TRACE("DeviceTracker: Updated " + name + " (" + key + ") RSSI " +
              std::to_string(best_rssi) + " via " + best_proxy);
        return;
    }

    DiscoveredDevice device;
    device.mac_address = key;
    device.name = name;
    device.rssi = best_rssi;
    device.best_proxy = best_proxy;
    device.last_seen = now;
    device.address_type = address_type;
    device.advertisement_data = ad_data;
    _devices[key] = device;

    INFO("DeviceTracker: Discovered new device " + name + " (" + key + ") RSSI " +
         std::to_string(best_rssi) + " via " + best_proxy);
}

bool DeviceTracker::selectBest(const std::string& mac, std::string& proxy_name, int32_t& rssi) const {
    auto it = _rssi_by_proxy.find(mac);
    if (it == _rssi_by_proxy.end() || it->second.empty()) {
        return false;
    }

    // Strictly greater: on a tie the earlier (smaller) name is kept
    bool found = false;
    for (const auto& entry : it->second) {
        if (!found || entry.second > rssi) {
            proxy_name = entry.first;
            rssi = entry.second;
            found = true;
        }
    }
    return found;
}

//=============================================================================
// Queries
//=============================================================================

std::vector<DiscoveredDevice> DeviceTracker::list(bool include_stale) const {
    return list(include_stale, Utilities::OS::time());
}

std::vector<DiscoveredDevice> DeviceTracker::list(bool include_stale, double now) const {
    std::vector<DiscoveredDevice> result;
    result.reserve(_devices.size());
    for (const auto& entry : _devices) {
        if (include_stale || now - entry.second.last_seen <= _expiry) {
            result.push_back(entry.second);
        }
    }
    return result;
}

const DiscoveredDevice* DeviceTracker::get(const std::string& mac) const {
    auto it = _devices.find(normalize(mac));
    if (it == _devices.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string DeviceTracker::bestProxy(const std::string& mac) const {
    std::string key = normalize(mac);
    std::string proxy_name;
    int32_t rssi = 0;
    if (!selectBest(key, proxy_name, rssi)) {
        WARNING("DeviceTracker: No proxy has seen device " + key);
        return std::string();
    }
    DEBUG("DeviceTracker: Selected proxy '" + proxy_name + "' for device " + key +
          " (RSSI: " + std::to_string(rssi) + ")");
    return proxy_name;
}

bool DeviceTracker::proxyRssi(const std::string& mac, const std::string& proxy_name, int32_t& rssi) const {
    auto it = _rssi_by_proxy.find(normalize(mac));
    if (it == _rssi_by_proxy.end()) {
        return false;
    }
    auto proxy = it->second.find(proxy_name);
    if (proxy == it->second.end()) {
        return false;
    }
    rssi = proxy->second;
    return true;
}

//=============================================================================
// Maintenance
//=============================================================================

size_t DeviceTracker::evictStale() {
    return evictStale(Utilities::OS::time());
}

size_t DeviceTracker::evictStale(double now) {
    size_t removed = 0;
    for (auto it = _devices.begin(); it != _devices.end();) {
        if (now - it->second.last_seen > _expiry) {
            DEBUG("DeviceTracker: Removing stale device " + it->first);
            _rssi_by_proxy.erase(it->first);
            it = _devices.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        INFO("DeviceTracker: Cleaned up " + std::to_string(removed) + " stale devices");
    }
    return removed;
}

void DeviceTracker::clear() {
    _devices.clear();
    _rssi_by_proxy.clear();
    INFO("DeviceTracker: Cleared all device tracking data");
}

} // namespace BLEBridge
