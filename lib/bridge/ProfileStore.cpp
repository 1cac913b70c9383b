/**
 * @file ProfileStore.cpp
 * @brief Cache of known device GATT profiles with a configured fallback
 */

#include "ProfileStore.h"
#include "Log.h"

namespace BLEBridge {

ProfileCache::ProfileCache(const DeviceProfile& fallback) : _fallback(fallback) {
    if (_fallback.complete()) {
        INFO("ProfileCache: Default profile service=" + _fallback.service_uuid + ", notify=" +
             _fallback.notify_uuid + ", write=" + _fallback.write_uuid);
    }
}

bool ProfileCache::lookup(const std::string& mac_address, DeviceProfile& profile) const {
    auto it = _profiles.find(mac_address);
    if (it != _profiles.end()) {
        profile = it->second;
        return true;
    }
    if (_fallback.complete()) {
        profile = _fallback;
        profile.mac_address = mac_address;
        return true;
    }
    return false;
}

void ProfileCache::remember(const DeviceProfile& profile) {
    if (profile.mac_address.empty() || !profile.complete()) {
        return;
    }
    _profiles[profile.mac_address] = profile;
    DEBUG("ProfileCache: Remembered profile for " + profile.mac_address);
}

} // namespace BLEBridge
