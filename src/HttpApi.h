#pragma once

#include "WebSocketServer.h"
#include "DiscoveryCoordinator.h"
#include "DeviceTracker.h"
#include "DeviceProber.h"

#include <string>

namespace BLEBridge {

/**
 * REST endpoints under the API prefix
 *
 *   GET  <prefix>/status   proxy and device counts
 *   GET  <prefix>/devices  fresh devices as a JSON array
 *   POST <prefix>/connect  probe a device for its GATT UUIDs
 *
 * Error bodies are {"detail": "..."}.
 */
class HttpApi {
public:
    using Request = WS::HttpRequest;
    using Responder = WS::WebSocketServer::Responder;

    HttpApi(DiscoveryCoordinator& coordinator, DeviceTracker& tracker, DeviceProber& prober);

    void install(WS::WebSocketServer& server, const std::string& prefix);

    void status(const Request& request, Responder respond);
    void devices(const Request& request, Responder respond);
    void connect(const Request& request, Responder respond);

    /**
     * @brief HTTP status for a failed outcome
     */
    static int statusFor(const Outcome& outcome);

private:
    static WS::HttpResponse detail(int status, const std::string& message);

    DiscoveryCoordinator& _coordinator;
    DeviceTracker& _tracker;
    DeviceProber& _prober;
};

} // namespace BLEBridge
