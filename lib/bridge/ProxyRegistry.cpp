/**
 * @file ProxyRegistry.cpp
 * @brief Proxy catalog and transport lifecycle
 */

#include "ProxyRegistry.h"
#include "Log.h"
#include "Utilities/OS.h"

namespace BLEBridge {

using namespace RNS;
using ESPHome::IProxyTransport;
using ESPHome::OperationResult;

ProxyRegistry::ProxyRegistry(TransportFactory factory, const std::string& password, double connect_timeout)
    : _factory(factory), _password(password), _connect_timeout(connect_timeout) {
}

//=============================================================================
// Catalog
//=============================================================================

void ProxyRegistry::registerProxy(const Proxy& proxy) {
    auto it = _proxies.find(proxy.name);
    if (it == _proxies.end()) {
        Proxy entry = proxy;
        entry.connected = false;
        entry.last_seen = Utilities::OS::time();
        _proxies[proxy.name] = entry;
        INFO("ProxyRegistry: Registered proxy " + proxy.name + " @ " + proxy.address + ":" +
             std::to_string(proxy.port));
        return;
    }

    Proxy& existing = it->second;
    if (existing.address != proxy.address || existing.port != proxy.port) {
        INFO("ProxyRegistry: Proxy " + proxy.name + " moved to " + proxy.address + ":" +
             std::to_string(proxy.port));
    }
    existing.address = proxy.address;
    existing.port = proxy.port;
    existing.last_seen = Utilities::OS::time();
    if (proxy.origin == ProxyOrigin::STATIC) {
        existing.origin = ProxyOrigin::STATIC;
    }
}

bool ProxyRegistry::removeProxy(const std::string& name) {
    auto it = _proxies.find(name);
    if (it == _proxies.end()) {
        return false;
    }
    _proxies.erase(it);

    auto transport = _transports.find(name);
    if (transport != _transports.end()) {
        IProxyTransport::Ptr removed = transport->second;
        _transports.erase(transport);
        removed->stop();
        INFO("ProxyRegistry: Disconnected from proxy " + name);
    }

    INFO("ProxyRegistry: Proxy removed: " + name);
    return true;
}

const Proxy* ProxyRegistry::get(const std::string& name) const {
    auto it = _proxies.find(name);
    if (it == _proxies.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<Proxy> ProxyRegistry::listProxies() const {
    std::vector<Proxy> result;
    for (const auto& entry : _proxies) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<Proxy> ProxyRegistry::listConnected() const {
    std::vector<Proxy> result;
    for (const auto& entry : _proxies) {
        if (entry.second.connected) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<std::string> ProxyRegistry::pendingProxies() const {
    std::vector<std::string> result;
    for (const auto& entry : _proxies) {
        if (_transports.find(entry.first) == _transports.end()) {
            result.push_back(entry.first);
        }
    }
    return result;
}

//=============================================================================
// Transports
//=============================================================================

bool ProxyRegistry::connectTransport(const std::string& name, AdvertisementSink sink) {
    auto it = _proxies.find(name);
    if (it == _proxies.end()) {
        WARNING("ProxyRegistry: connectTransport for unknown proxy " + name);
        return false;
    }
    if (_transports.find(name) != _transports.end()) {
        TRACE("ProxyRegistry: Transport for " + name + " already exists, skipping");
        return false;
    }

    const Proxy& proxy = it->second;
    INFO("ProxyRegistry: Connecting to proxy " + name + " @ " + proxy.address + ":" +
         std::to_string(proxy.port));

    IProxyTransport::Ptr transport = _factory(proxy, _password);
    if (!transport) {
        ERROR("ProxyRegistry: Could not create transport for " + name);
        return false;
    }

    if (sink) {
        transport->subscribeAdvertisements([name, sink](const ESPHome::Advertisement& advertisement) {
            sink(name, advertisement);
        });
    }

    // Stored before start() so a synchronous completion finds it
    _transports[name] = transport;
    IProxyTransport* raw = transport.get();
    bool started = transport->start(_connect_timeout,
        [this, name, raw](OperationResult result, const std::string& detail) {
            onTransportReady(name, raw, result, detail);
        });

    if (!started) {
        ERROR("ProxyRegistry: Failed to start connection to proxy " + name);
        auto current = _transports.find(name);
        if (current != _transports.end() && current->second.get() == raw) {
            _transports.erase(current);
        }
        auto entry = _proxies.find(name);
        if (entry != _proxies.end()) {
            entry->second.connected = false;
        }
        return false;
    }
    return true;
}

void ProxyRegistry::onTransportReady(const std::string& name, IProxyTransport* transport,
                                     OperationResult result, const std::string& detail) {
    auto current = _transports.find(name);
    if (current == _transports.end() || current->second.get() != transport) {
        return;  // removed or replaced meanwhile
    }

    auto it = _proxies.find(name);
    if (it == _proxies.end()) {
        return;
    }

    if (result == OperationResult::SUCCESS) {
        it->second.connected = true;
        it->second.last_seen = Utilities::OS::time();
        INFO("ProxyRegistry: Connected to proxy " + name + ", subscribed to advertisements");
        return;
    }

    it->second.connected = false;
    if (result == OperationResult::TIMEOUT) {
        ERROR("ProxyRegistry: Timeout connecting to proxy " + name);
    } else {
        ERROR("ProxyRegistry: Connection error for proxy " + name + ": " + detail);
    }
}

IProxyTransport::Ptr ProxyRegistry::getTransport(const std::string& name) const {
    auto it = _transports.find(name);
    if (it == _transports.end() || !it->second->isReady()) {
        return nullptr;
    }
    return it->second;
}

bool ProxyRegistry::hasTransport(const std::string& name) const {
    return _transports.find(name) != _transports.end();
}

void ProxyRegistry::loop() {
    // Transport callbacks may add or remove entries while we iterate
    std::vector<std::pair<std::string, IProxyTransport::Ptr>> transports(_transports.begin(), _transports.end());

    for (auto& entry : transports) {
        entry.second->loop();
    }

    for (auto& entry : transports) {
        if (!entry.second->isClosed()) {
            continue;
        }
        auto current = _transports.find(entry.first);
        if (current == _transports.end() || current->second != entry.second) {
            continue;
        }
        _transports.erase(current);

        auto proxy = _proxies.find(entry.first);
        if (proxy != _proxies.end()) {
            if (proxy->second.connected) {
                WARNING("ProxyRegistry: Lost connection to proxy " + entry.first);
            }
            proxy->second.connected = false;
        }
    }
}

void ProxyRegistry::disconnectAll() {
    INFO("ProxyRegistry: Disconnecting from all proxies...");

    std::map<std::string, IProxyTransport::Ptr> transports;
    transports.swap(_transports);
    for (auto& entry : transports) {
        entry.second->stop();
        INFO("ProxyRegistry: Disconnected from proxy " + entry.first);
    }

    _proxies.clear();
    INFO("ProxyRegistry: All proxies disconnected");
}

} // namespace BLEBridge
