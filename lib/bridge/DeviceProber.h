/**
 * @file DeviceProber.h
 * @brief Learns the GATT profile of a device through its best proxy
 *
 * Selects the proxy reporting the strongest signal for the device, runs a
 * SessionManager probe on it and remembers the result in the profile
 * store. Used by the WebSocket connect path when UUIDs are missing and by
 * the HTTP connect endpoint.
 */
#pragma once

#include "DeviceTracker.h"
#include "ProxyRegistry.h"
#include "SessionManager.h"
#include "ProfileStore.h"

#include <string>

namespace BLEBridge {

class DeviceProber {
public:
    /**
     * @param profiles Profile store, may be nullptr
     */
    DeviceProber(DeviceTracker& tracker, ProxyRegistry& registry, SessionManager& sessions,
                 IProfileStore* profiles);

    /**
     * @param mac_address Normalized MAC
     */
    void probe(const std::string& mac_address, SessionManager::OnProbe done);

private:
    DeviceTracker& _tracker;
    ProxyRegistry& _registry;
    SessionManager& _sessions;
    IProfileStore* _profiles;
};

} // namespace BLEBridge
