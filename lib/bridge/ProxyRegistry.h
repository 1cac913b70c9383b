/**
 * @file ProxyRegistry.h
 * @brief Catalog of known Bluetooth proxies and their live transports
 *
 * Proxies enter the catalog from mDNS discovery or static configuration.
 * At most one transport exists per proxy name; while it exists (connecting
 * or ready) further connect attempts for that name are skipped. A transport
 * whose link closes is dropped by loop() and the proxy becomes eligible for
 * the next connect cycle.
 */
#pragma once

#include "ProxyTransport.h"

#include <stdint.h>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace BLEBridge {

enum class ProxyOrigin : uint8_t {
    DISCOVERED,     // From mDNS
    STATIC          // From configuration, never removed by mDNS
};

struct Proxy {
    std::string name;
    std::string address;
    uint16_t port = 6053;
    bool connected = false;
    double last_seen = 0.0;
    ProxyOrigin origin = ProxyOrigin::DISCOVERED;
};

class ProxyRegistry {
public:
    using TransportFactory = std::function<ESPHome::IProxyTransport::Ptr(const Proxy& proxy,
                                                                          const std::string& password)>;
    using AdvertisementSink = std::function<void(const std::string& proxy_name,
                                                 const ESPHome::Advertisement& advertisement)>;

    /**
     * @param factory Creates the transport for a proxy
     * @param password API password sent to every proxy (may be empty)
     * @param connect_timeout Seconds allowed for link connect plus handshake
     */
    ProxyRegistry(TransportFactory factory, const std::string& password, double connect_timeout);

    //=========================================================================
    // Catalog
    //=========================================================================

    /**
     * @brief Insert or refresh a proxy by name
     *
     * A live transport and the connected flag survive an address refresh.
     */
    void registerProxy(const Proxy& proxy);

    /**
     * @brief Remove a proxy, stopping its transport if one exists
     * @return false if the name is unknown
     */
    bool removeProxy(const std::string& name);

    const Proxy* get(const std::string& name) const;
    std::vector<Proxy> listProxies() const;
    std::vector<Proxy> listConnected() const;

    /**
     * @brief Registered proxies with no transport (neither connecting nor connected)
     */
    std::vector<std::string> pendingProxies() const;

    size_t size() const { return _proxies.size(); }

    //=========================================================================
    // Transports
    //=========================================================================

    /**
     * @brief Start a transport to a proxy and subscribe to its advertisements
     *
     * Completion is reported through the proxy's connected flag; failures
     * are logged and leave the proxy eligible for retry.
     *
     * @param sink Receives every advertisement tagged with the proxy name
     * @return true if a new attempt was started
     */
    bool connectTransport(const std::string& name, AdvertisementSink sink);

    /**
     * @brief Transport of a connected proxy
     * @return nullptr unless the proxy's link is ready
     */
    ESPHome::IProxyTransport::Ptr getTransport(const std::string& name) const;

    bool hasTransport(const std::string& name) const;

    /**
     * @brief Pump every transport and drop the ones whose link closed
     */
    void loop();

    /**
     * @brief Stop every transport and clear the catalog
     */
    void disconnectAll();

private:
    void onTransportReady(const std::string& name, ESPHome::IProxyTransport* transport,
                          ESPHome::OperationResult result, const std::string& detail);

    TransportFactory _factory;
    std::string _password;
    double _connect_timeout;

    std::map<std::string, Proxy> _proxies;
    std::map<std::string, ESPHome::IProxyTransport::Ptr> _transports;
};

} // namespace BLEBridge
