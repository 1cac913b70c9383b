/**
 * @file ServiceBrowser.h
 * @brief DNS-SD service browser interface
 *
 * Reports instances of one service type as they appear on and leave the
 * local network. Instance names are passed fully qualified, e.g.
 * "kitchen-proxy._esphomelib._tcp.local.".
 */
#pragma once

#include <stdint.h>
#include <functional>
#include <memory>
#include <string>

namespace BLEBridge { namespace MDNS {

class IServiceBrowser {
public:
    using Ptr = std::shared_ptr<IServiceBrowser>;
    using OnServiceAdded = std::function<void(const std::string& instance, const std::string& address,
                                              uint16_t port)>;
    using OnServiceRemoved = std::function<void(const std::string& instance)>;

    virtual ~IServiceBrowser() = default;

    /**
     * @brief Begin browsing
     *
     * @param service_type e.g. "_esphomelib._tcp.local."
     * @return false if the browser could not open its socket
     */
    virtual bool start(const std::string& service_type, OnServiceAdded on_added,
                       OnServiceRemoved on_removed) = 0;

    virtual void stop() = 0;

    /**
     * @brief Process received responses and expire records - call periodically
     */
    virtual void loop() = 0;

    virtual bool isRunning() const = 0;
};

}} // namespace BLEBridge::MDNS
