/**
 * @file DeviceTracker.h
 * @brief Deduplicated, RSSI-ranked catalog of BLE devices seen by proxies
 *
 * Every proxy reports the advertisements it hears. The tracker keeps the
 * last RSSI per (device, proxy) pair and exposes one DiscoveredDevice per
 * MAC whose rssi and best_proxy are the maximum over all reporting proxies.
 *
 * Among proxies reporting the same maximum RSSI, the lexicographically
 * smallest proxy name wins, so the choice never depends on arrival order.
 */
#pragma once

#include "Bytes.h"
#include "Utilities/OS.h"

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

namespace BLEBridge {

/**
 * @brief One BLE device as seen by the proxy network
 */
struct DiscoveredDevice {
    std::string mac_address;        // AA:BB:CC:DD:EE:FF
    std::string name;               // Advertised local name, may be empty
    int32_t rssi = -100;            // Best RSSI across proxies
    std::string best_proxy;         // Proxy reporting that RSSI
    double last_seen = 0.0;
    uint32_t address_type = 0;      // BLE address type (0=public, 1=random)
    RNS::Bytes advertisement_data;  // Raw AD structures from the first sighting
};

class DeviceTracker {
public:
    /**
     * @param expiry Seconds after which a device that has not been seen is stale
     */
    explicit DeviceTracker(double expiry);

    /**
     * @brief Record a sighting of a device by one proxy
     *
     * @param mac Device MAC (normalized to upper case, ':' separators)
     * @param name Advertised name; fills in a missing name on known devices
     * @param rssi Signal strength reported by this proxy
     * @param proxy_name Reporting proxy
     * @param ad_data Raw advertisement data, kept for new devices
     * @param address_type BLE address type needed to connect later
     */
    void update(const std::string& mac, const std::string& name, int32_t rssi,
                const std::string& proxy_name, const RNS::Bytes& ad_data = RNS::Bytes(),
                uint32_t address_type = 0);
    void update(const std::string& mac, const std::string& name, int32_t rssi,
                const std::string& proxy_name, const RNS::Bytes& ad_data,
                uint32_t address_type, double now);

    /**
     * @brief All devices, optionally including those past the expiry window
     */
    std::vector<DiscoveredDevice> list(bool include_stale = false) const;
    std::vector<DiscoveredDevice> list(bool include_stale, double now) const;

    /**
     * @brief Look up one device
     * @return Pointer valid until the next mutation, or nullptr
     */
    const DiscoveredDevice* get(const std::string& mac) const;

    /**
     * @brief Proxy currently reporting the strongest signal for a device
     * @return Proxy name, or empty string if the device has never been seen
     */
    std::string bestProxy(const std::string& mac) const;

    /**
     * @brief Last RSSI one proxy reported for a device
     * @return false if that proxy has not reported the device
     */
    bool proxyRssi(const std::string& mac, const std::string& proxy_name, int32_t& rssi) const;

    /**
     * @brief Remove devices not seen within the expiry window
     *
     * The per-proxy RSSI table of an evicted device is removed with it.
     *
     * @return Number of devices removed
     */
    size_t evictStale();
    size_t evictStale(double now);

    size_t size() const { return _devices.size(); }
    double expiry() const { return _expiry; }
    void clear();

private:
    static std::string normalize(const std::string& mac);
    bool selectBest(const std::string& mac, std::string& proxy_name, int32_t& rssi) const;

    double _expiry;
    std::map<std::string, DiscoveredDevice> _devices;
    // mac -> (proxy name -> last rssi); ordered so ties resolve by name
    std::map<std::string, std::map<std::string, int32_t>> _rssi_by_proxy;
};

} // namespace BLEBridge
