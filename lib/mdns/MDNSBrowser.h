/**
 * @file MDNSBrowser.h
 * @brief DNS-SD service browser on avahi-client
 *
 * Browses one service type through the local avahi daemon and resolves
 * each instance to an IPv4 address and port. An instance is reported once
 * resolved, and reported again if a later resolution returns a different
 * address or port. It is removed when avahi withdraws it from every
 * interface it was seen on.
 *
 * The avahi event loop is an AvahiSimplePoll iterated without blocking
 * from loop(), so all callbacks run on the caller's thread.
 *
 * Usage:
 *   MDNSBrowser browser;
 *   browser.start("_esphomelib._tcp.local.", on_added, on_removed);
 *   // from the main loop
 *   browser.loop();
 */
#pragma once

#include "ServiceBrowser.h"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/simple-watch.h>

#include <stdint.h>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace BLEBridge { namespace MDNS {

class MDNSBrowser : public IServiceBrowser {
public:
    MDNSBrowser();
    virtual ~MDNSBrowser();

    MDNSBrowser(const MDNSBrowser&) = delete;
    MDNSBrowser& operator=(const MDNSBrowser&) = delete;

    virtual bool start(const std::string& service_type, OnServiceAdded on_added,
                       OnServiceRemoved on_removed) override;
    virtual void stop() override;
    virtual void loop() override;
    virtual bool isRunning() const override { return _running; }

    /**
     * @brief Begin tracking without connecting to the daemon (tests)
     */
    void attach(const std::string& service_type, OnServiceAdded on_added, OnServiceRemoved on_removed);

    /**
     * @brief An instance resolved to address:port
     *
     * Reports it unless the same address and port were already reported.
     */
    void handleResolved(const std::string& instance, const std::string& address, uint16_t port);

    /**
     * @brief An instance is gone; silent if it was never reported
     */
    void handleRemoved(const std::string& instance);

    size_t instanceCount() const { return _instances.size(); }

    /**
     * @brief "_esphomelib._tcp.local." -> "_esphomelib._tcp", "local"
     */
    static bool splitServiceType(const std::string& service_type, std::string& type, std::string& domain);

    /**
     * @brief Fully qualified instance name, e.g. "kitchen._esphomelib._tcp.local."
     */
    static std::string instanceName(const std::string& name, const std::string& type, const std::string& domain);

private:
    struct Instance {
        std::string name;
        std::string address;
        uint16_t port = 0;
    };

    using Link = std::pair<AvahiIfIndex, AvahiProtocol>;

    static void clientCallback(AvahiClient* client, AvahiClientState state, void* userdata);
    static void browseCallback(AvahiServiceBrowser* browser, AvahiIfIndex interface, AvahiProtocol protocol,
                               AvahiBrowserEvent event, const char* name, const char* type,
                               const char* domain, AvahiLookupResultFlags flags, void* userdata);
    static void resolveCallback(AvahiServiceResolver* resolver, AvahiIfIndex interface, AvahiProtocol protocol,
                                AvahiResolverEvent event, const char* name, const char* type,
                                const char* domain, const char* host_name, const AvahiAddress* address,
                                uint16_t port, AvahiStringList* txt, AvahiLookupResultFlags flags,
                                void* userdata);

    void onBrowse(AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event,
                  const char* name, const char* type, const char* domain);
    void release();
    static std::string key(const std::string& name);

    bool _running = false;
    bool _failed = false;
    std::string _service_type;
    OnServiceAdded _on_added;
    OnServiceRemoved _on_removed;

    AvahiSimplePoll* _poll = nullptr;
    AvahiClient* _client = nullptr;
    AvahiServiceBrowser* _browser = nullptr;

    std::map<std::string, std::set<Link>> _links;    // key: lowercased instance name
    std::map<std::string, Instance> _instances;     // reported instances, same key
};

}} // namespace BLEBridge::MDNS
