/**
 * @file DeviceProber.cpp
 * @brief GATT profile probing through the best proxy
 */

#include "DeviceProber.h"
#include "Log.h"

namespace BLEBridge {

DeviceProber::DeviceProber(DeviceTracker& tracker, ProxyRegistry& registry, SessionManager& sessions,
                           IProfileStore* profiles)
    : _tracker(tracker), _registry(registry), _sessions(sessions), _profiles(profiles) {
}

void DeviceProber::probe(const std::string& mac_address, SessionManager::OnProbe done) {
    INFO("DeviceProber: Connecting to device " + mac_address + " to retrieve UUIDs...");

    std::string proxy_name = _tracker.bestProxy(mac_address);
    if (proxy_name.empty()) {
        if (done) done(Outcome::clientError("No proxy has seen device " + mac_address + ". Make sure the "
                                            "device is advertising and in range of an ESPHome proxy."),
                       ProbeResult());
        return;
    }

    ESPHome::IProxyTransport::Ptr transport = _registry.getTransport(proxy_name);
    if (!transport) {
        if (done) done(Outcome::infrastructure("Proxy " + proxy_name + " is not connected"), ProbeResult());
        return;
    }

    std::string device_name;
    uint32_t address_type = 0;
    const DiscoveredDevice* device = _tracker.get(mac_address);
    if (device) {
        device_name = device->name;
        address_type = device->address_type;
    }

    IProfileStore* profiles = _profiles;
    _sessions.probe(mac_address, proxy_name, transport, address_type, device_name,
        [profiles, mac_address, done](const Outcome& outcome, const ProbeResult& result) {
            if (outcome.ok() && profiles) {
                DeviceProfile profile;
                profile.mac_address = mac_address;
                profile.service_uuid = result.service_uuid;
                profile.notify_uuid = result.notify_uuid;
                profile.write_uuid = result.write_uuid;
                profile.device_name = result.device_name;
                profiles->remember(profile);
            }
            if (done) done(outcome, result);
        });
}

} // namespace BLEBridge
