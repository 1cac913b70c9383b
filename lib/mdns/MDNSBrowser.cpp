#include "MDNSBrowser.h"

#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>

#include <Log.h>

#include <ctype.h>

namespace BLEBridge { namespace MDNS {

MDNSBrowser::MDNSBrowser() {
}

MDNSBrowser::~MDNSBrowser() {
    stop();
}

/*static*/ std::string MDNSBrowser::key(const std::string& name) {
    std::string lowered = name;
    for (auto& c : lowered) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    if (!lowered.empty() && lowered.back() != '.') {
        lowered += '.';
    }
    return lowered;
}

/*static*/ bool MDNSBrowser::splitServiceType(const std::string& service_type, std::string& type,
                                               std::string& domain) {
    std::string name = service_type;
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    // "_service._proto" then the domain
    size_t proto = name.find("._tcp");
    if (proto == std::string::npos) {
        proto = name.find("._udp");
    }
    if (proto == std::string::npos || name.empty() || name[0] != '_') {
        return false;
    }
    size_t end = proto + 5;
    type = name.substr(0, end);
    if (end == name.size()) {
        domain = "local";
    } else if (name[end] == '.' && end + 1 < name.size()) {
        domain = name.substr(end + 1);
    } else {
        return false;
    }
    return true;
}

/*static*/ std::string MDNSBrowser::instanceName(const std::string& name, const std::string& type,
                                                 const std::string& domain) {
    return name + "." + type + "." + domain + ".";
}

//=============================================================================
// Lifecycle
//=============================================================================

void MDNSBrowser::attach(const std::string& service_type, OnServiceAdded on_added, OnServiceRemoved on_removed) {
    _service_type = service_type;
    _on_added = on_added;
    _on_removed = on_removed;
    _links.clear();
    _instances.clear();
    _failed = false;
    _running = true;
}

bool MDNSBrowser::start(const std::string& service_type, OnServiceAdded on_added, OnServiceRemoved on_removed) {
    if (_running) {
        stop();
    }

    std::string type;
    std::string domain;
    if (!splitServiceType(service_type, type, domain)) {
        ERROR("MDNSBrowser: Invalid service type " + service_type);
        return false;
    }

    _poll = avahi_simple_poll_new();
    if (_poll == nullptr) {
        ERROR("MDNSBrowser: Failed to create avahi event loop");
        return false;
    }

    int error = 0;
    _client = avahi_client_new(avahi_simple_poll_get(_poll), static_cast<AvahiClientFlags>(0),
                               &MDNSBrowser::clientCallback, this, &error);
    if (_client == nullptr) {
        ERROR("MDNSBrowser: Failed to connect to avahi daemon: " + std::string(avahi_strerror(error)));
        release();
        return false;
    }

    _browser = avahi_service_browser_new(_client, AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, type.c_str(), domain.c_str(),
                                         static_cast<AvahiLookupFlags>(0), &MDNSBrowser::browseCallback, this);
    if (_browser == nullptr) {
        ERROR("MDNSBrowser: Failed to browse " + service_type + ": " +
              std::string(avahi_strerror(avahi_client_errno(_client))));
        release();
        return false;
    }

    attach(service_type, on_added, on_removed);
    INFO("MDNSBrowser: Browsing for " + _service_type);
    return true;
}

void MDNSBrowser::stop() {
    bool was_running = _running;
    _running = false;
    release();
    _links.clear();
    _instances.clear();
    if (was_running) {
        INFO("MDNSBrowser: Stopped");
    }
}

void MDNSBrowser::release() {
    // Freeing the client also frees its browser and any pending resolvers
    if (_client != nullptr) {
        avahi_client_free(_client);
        _client = nullptr;
        _browser = nullptr;
    }
    if (_poll != nullptr) {
        avahi_simple_poll_free(_poll);
        _poll = nullptr;
    }
}

void MDNSBrowser::loop() {
    if (!_running || _poll == nullptr) {
        return;
    }
    if (avahi_simple_poll_iterate(_poll, 0) < 0) {
        ERROR("MDNSBrowser: avahi event loop failed");
        _failed = true;
    }
    if (_failed) {
        stop();
    }
}

//=============================================================================
// Instance table
//=============================================================================

void MDNSBrowser::handleResolved(const std::string& instance, const std::string& address, uint16_t port) {
    if (!_running) {
        return;
    }
    Instance& entry = _instances[key(instance)];
    if (!entry.name.empty() && entry.address == address && entry.port == port) {
        return;
    }
    bool changed = !entry.name.empty();
    entry.name = instance;
    entry.address = address;
    entry.port = port;

    if (changed) {
        INFO("MDNSBrowser: " + instance + " moved to " + address + ":" + std::to_string(port));
    } else {
        DEBUG("MDNSBrowser: Resolved " + instance + " at " + address + ":" + std::to_string(port));
    }
    if (_on_added) {
        _on_added(instance, address, port);
    }
}

void MDNSBrowser::handleRemoved(const std::string& instance) {
    auto it = _instances.find(key(instance));
    if (it == _instances.end()) {
        return;
    }
    std::string name = it->second.name;
    _instances.erase(it);
    DEBUG("MDNSBrowser: Removed " + name);
    if (_on_removed) {
        _on_removed(name);
    }
}

//=============================================================================
// avahi callbacks
//=============================================================================

/*static*/ void MDNSBrowser::clientCallback(AvahiClient* client, AvahiClientState state, void* userdata) {
    MDNSBrowser* self = static_cast<MDNSBrowser*>(userdata);
    if (state == AVAHI_CLIENT_FAILURE) {
        ERROR("MDNSBrowser: avahi client failure: " + std::string(avahi_strerror(avahi_client_errno(client))));
        self->_failed = true;
    }
}

/*static*/ void MDNSBrowser::browseCallback(AvahiServiceBrowser* browser, AvahiIfIndex interface,
                                            AvahiProtocol protocol, AvahiBrowserEvent event, const char* name,
                                            const char* type, const char* domain, AvahiLookupResultFlags flags,
                                            void* userdata) {
    (void)flags;
    MDNSBrowser* self = static_cast<MDNSBrowser*>(userdata);
    if (event == AVAHI_BROWSER_FAILURE) {
        AvahiClient* client = avahi_service_browser_get_client(browser);
        ERROR("MDNSBrowser: Browse failed: " + std::string(avahi_strerror(avahi_client_errno(client))));
        self->_failed = true;
        return;
    }
    self->onBrowse(interface, protocol, event, name, type, domain);
}

void MDNSBrowser::onBrowse(AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event,
                           const char* name, const char* type, const char* domain) {
    switch (event) {
        case AVAHI_BROWSER_NEW: {
            std::string instance = instanceName(name, type, domain);
            _links[key(instance)].insert(Link(interface, protocol));
            TRACE("MDNSBrowser: Found instance " + instance);
            AvahiServiceResolver* resolver = avahi_service_resolver_new(
                _client, interface, protocol, name, type, domain, AVAHI_PROTO_INET,
                static_cast<AvahiLookupFlags>(0), &MDNSBrowser::resolveCallback, this);
            if (resolver == nullptr) {
                WARNING("MDNSBrowser: Failed to resolve " + instance + ": " +
                        std::string(avahi_strerror(avahi_client_errno(_client))));
            }
            break;
        }
        case AVAHI_BROWSER_REMOVE: {
            std::string instance = instanceName(name, type, domain);
            auto it = _links.find(key(instance));
            if (it == _links.end()) {
                break;
            }
            it->second.erase(Link(interface, protocol));
            if (it->second.empty()) {
                _links.erase(it);
                handleRemoved(instance);
            }
            break;
        }
        case AVAHI_BROWSER_ALL_FOR_NOW:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
            TRACE("MDNSBrowser: Initial browse complete");
            break;
        case AVAHI_BROWSER_FAILURE:
            break;
    }
}

/*static*/ void MDNSBrowser::resolveCallback(AvahiServiceResolver* resolver, AvahiIfIndex interface,
                                             AvahiProtocol protocol, AvahiResolverEvent event, const char* name,
                                             const char* type, const char* domain, const char* host_name,
                                             const AvahiAddress* address, uint16_t port, AvahiStringList* txt,
                                             AvahiLookupResultFlags flags, void* userdata) {
    (void)interface;
    (void)protocol;
    (void)txt;
    (void)flags;
    MDNSBrowser* self = static_cast<MDNSBrowser*>(userdata);
    std::string instance = instanceName(name, type, domain);

    if (event == AVAHI_RESOLVER_FOUND && address != nullptr) {
        char text[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(text, sizeof(text), address);
        TRACE("MDNSBrowser: " + instance + " is " + std::string(host_name ? host_name : "?"));
        // Withdrawn while the resolver was running
        if (self->_links.count(key(instance)) > 0) {
            self->handleResolved(instance, text, port);
        }
    } else {
        AvahiClient* client = avahi_service_resolver_get_client(resolver);
        WARNING("MDNSBrowser: Failed to resolve " + instance + ": " +
                std::string(avahi_strerror(avahi_client_errno(client))));
    }
    avahi_service_resolver_free(resolver);
}

}} // namespace BLEBridge::MDNS
