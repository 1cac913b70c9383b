/**
 * @file DiscoveryCoordinator.cpp
 * @brief Proxy discovery and maintenance cycles
 */

#include "DiscoveryCoordinator.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <exception>

namespace BLEBridge {

using namespace RNS;

DiscoveryCoordinator::DiscoveryCoordinator(ProxyRegistry& registry, DeviceTracker& tracker,
                                           AdvertisementRouter& router, MDNS::IServiceBrowser* browser,
                                           const DiscoveryConfig& config)
    : _registry(registry), _tracker(tracker), _router(router), _browser(browser), _config(config) {
}

//=============================================================================
// Lifecycle
//=============================================================================

bool DiscoveryCoordinator::start() {
    return start(Utilities::OS::time());
}

bool DiscoveryCoordinator::start(double now) {
    if (_running) {
        WARNING("DiscoveryCoordinator: Service already running");
        return false;
    }

    INFO("DiscoveryCoordinator: Starting ESPHome proxy discovery...");

    // Static proxy for networks where mDNS does not reach us
    if (!_config.static_host.empty() && !_config.static_name.empty()) {
        Proxy proxy;
        proxy.name = _config.static_name;
        proxy.address = _config.static_host;
        proxy.port = _config.static_port;
        proxy.origin = ProxyOrigin::STATIC;
        _registry.registerProxy(proxy);
        INFO("DiscoveryCoordinator: Registered static proxy " + proxy.name + " @ " + proxy.address +
             ":" + std::to_string(proxy.port));
    }

    if (_config.mdns_enabled && _browser) {
        INFO("DiscoveryCoordinator: Starting mDNS discovery for ESPHome proxies (" + _config.service_type + ")");
        bool started = _browser->start(_config.service_type,
            [this](const std::string& instance, const std::string& address, uint16_t port) {
                onServiceAdded(instance, address, port);
            },
            [this](const std::string& instance) {
                onServiceRemoved(instance);
            });
        if (!started) {
            ERROR("DiscoveryCoordinator: mDNS discovery unavailable, only static proxies will be used");
        }
    }

    _running = true;
    _next_connect = now;
    _next_cleanup = now + _config.cleanup_interval;

    INFO("DiscoveryCoordinator: ESPHome proxy discovery started");
    return true;
}

void DiscoveryCoordinator::stop() {
    if (!_running) {
        return;
    }
    INFO("DiscoveryCoordinator: Stopping ESPHome proxy discovery...");

    _running = false;
    DEBUG("DiscoveryCoordinator: Discovery loop cancelled");
    DEBUG("DiscoveryCoordinator: Cleanup loop cancelled");

    if (_browser && _browser->isRunning()) {
        _browser->stop();
    }
    _registry.disconnectAll();

    INFO("DiscoveryCoordinator: ESPHome proxy discovery stopped");
}

//=============================================================================
// Cycles
//=============================================================================

void DiscoveryCoordinator::loop() {
    loop(Utilities::OS::time());
}

void DiscoveryCoordinator::loop(double now) {
    if (!_running) {
        return;
    }

    if (_browser && _browser->isRunning()) {
        _browser->loop();
    }

    if (now >= _next_connect) {
        _next_connect = now + _config.discovery_interval;
        connectPending();
    }

    if (now >= _next_cleanup) {
        _next_cleanup = now + _config.cleanup_interval;
        try {
            cleanup(now);
        }
        catch (std::exception& e) {
            ERROR("DiscoveryCoordinator: Error in cleanup cycle: " + std::string(e.what()));
        }
    }
}

size_t DiscoveryCoordinator::connectPending() {
    size_t started = 0;
    AdvertisementRouter& router = _router;
    ProxyRegistry::AdvertisementSink sink =
        [&router](const std::string& proxy_name, const ESPHome::Advertisement& advertisement) {
            router.ingest(proxy_name, advertisement);
        };

    for (const auto& name : _registry.pendingProxies()) {
        try {
            if (_registry.connectTransport(name, sink)) {
                ++started;
            }
        }
        catch (std::exception& e) {
            ERROR("DiscoveryCoordinator: Failed to connect to proxy " + name + ": " + e.what());
        }
    }
    return started;
}

size_t DiscoveryCoordinator::cleanup(double now) {
    size_t evicted = _tracker.evictStale(now);
    _router.pruneCache(now);
    return evicted;
}

DiscoveryStatus DiscoveryCoordinator::status() const {
    DiscoveryStatus result;
    result.enabled = _running;
    result.proxies_discovered = _registry.size();
    result.devices_discovered = _tracker.list(false).size();
    return result;
}

//=============================================================================
// mDNS events
//=============================================================================

std::string DiscoveryCoordinator::proxyNameFromInstance(const std::string& instance) const {
    std::string suffix = "." + _config.service_type;
    if (instance.size() > suffix.size() &&
        instance.compare(instance.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return instance.substr(0, instance.size() - suffix.size());
    }
    return instance;
}

void DiscoveryCoordinator::onServiceAdded(const std::string& instance, const std::string& address, uint16_t port) {
    Proxy proxy;
    proxy.name = proxyNameFromInstance(instance);
    proxy.address = address;
    proxy.port = port;
    proxy.origin = ProxyOrigin::DISCOVERED;

    INFO("DiscoveryCoordinator: Discovered ESPHome proxy: " + proxy.name + " @ " + address + ":" +
         std::to_string(port));
    _registry.registerProxy(proxy);
}

void DiscoveryCoordinator::onServiceRemoved(const std::string& instance) {
    std::string name = proxyNameFromInstance(instance);
    const Proxy* proxy = _registry.get(name);
    if (!proxy) {
        return;
    }
    if (proxy->origin == ProxyOrigin::STATIC) {
        DEBUG("DiscoveryCoordinator: Ignoring mDNS removal of static proxy " + name);
        return;
    }
    _registry.removeProxy(name);
}

} // namespace BLEBridge
