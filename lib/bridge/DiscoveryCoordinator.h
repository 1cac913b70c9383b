/**
 * @file DiscoveryCoordinator.h
 * @brief Drives proxy discovery, proxy connection and catalog cleanup
 *
 * Two timer-driven cycles run from loop():
 * - Connect: every discovery interval, start a transport to every
 *   registered proxy that has none.
 * - Cleanup: every cleanup interval, evict stale devices and prune the
 *   advertisement dedup cache.
 *
 * A failure in one cycle is logged and the cycle runs again on schedule.
 */
#pragma once

#include "ProxyRegistry.h"
#include "DeviceTracker.h"
#include "AdvertisementRouter.h"
#include "ServiceBrowser.h"

#include <stdint.h>
#include <string>

namespace BLEBridge {

struct DiscoveryConfig {
    double discovery_interval = 5.0;
    double cleanup_interval = 10.0;

    bool mdns_enabled = true;
    std::string service_type = "_esphomelib._tcp.local.";

    // Static proxy, registered when both host and name are set
    std::string static_host;
    uint16_t static_port = 6053;
    std::string static_name;
};

struct DiscoveryStatus {
    bool enabled = false;
    size_t proxies_discovered = 0;
    size_t devices_discovered = 0;
};

class DiscoveryCoordinator {
public:
    /**
     * @param browser mDNS browser, may be nullptr when discovery is static only
     */
    DiscoveryCoordinator(ProxyRegistry& registry, DeviceTracker& tracker, AdvertisementRouter& router,
                         MDNS::IServiceBrowser* browser, const DiscoveryConfig& config);

    /**
     * @brief Register the static proxy, start mDNS and arm both cycles
     * @return false if already running
     */
    bool start();
    bool start(double now);

    /**
     * @brief Disarm both cycles, stop mDNS and disconnect every proxy
     */
    void stop();

    /**
     * @brief Main loop processing - must be called periodically
     */
    void loop();
    void loop(double now);

    bool isRunning() const { return _running; }
    DiscoveryStatus status() const;

    /**
     * @brief Run one connect cycle now
     * @return Number of connection attempts started
     */
    size_t connectPending();

    /**
     * @brief Run one cleanup cycle now
     * @return Number of devices evicted
     */
    size_t cleanup(double now);

    // mDNS events
    void onServiceAdded(const std::string& instance, const std::string& address, uint16_t port);
    void onServiceRemoved(const std::string& instance);

private:
    std::string proxyNameFromInstance(const std::string& instance) const;

    ProxyRegistry& _registry;
    DeviceTracker& _tracker;
    AdvertisementRouter& _router;
    MDNS::IServiceBrowser* _browser;
    DiscoveryConfig _config;

    bool _running = false;
    double _next_connect = 0.0;
    double _next_cleanup = 0.0;
};

} // namespace BLEBridge
