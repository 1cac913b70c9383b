/**
 * @file StubBrowser.h
 * @brief IServiceBrowser that reports whatever the test tells it to
 */
#pragma once

#include "ServiceBrowser.h"

namespace BLEBridge { namespace Test {

class StubBrowser : public MDNS::IServiceBrowser {
public:
    bool start_result = true;
    bool running = false;
    int start_calls = 0;
    int stop_calls = 0;
    int loop_calls = 0;
    std::string service_type;

    virtual bool start(const std::string& type, OnServiceAdded on_added, OnServiceRemoved on_removed) override {
        ++start_calls;
        service_type = type;
        _on_added = on_added;
        _on_removed = on_removed;
        running = start_result;
        return start_result;
    }

    virtual void stop() override {
        ++stop_calls;
        running = false;
    }

    virtual void loop() override { ++loop_calls; }
    virtual bool isRunning() const override { return running; }

    void add(const std::string& instance, const std::string& address, uint16_t port) {
        if (_on_added) {
            _on_added(instance, address, port);
        }
    }

    void remove(const std::string& instance) {
        if (_on_removed) {
            _on_removed(instance);
        }
    }

private:
    OnServiceAdded _on_added;
    OnServiceRemoved _on_removed;
};

}} // namespace BLEBridge::Test
