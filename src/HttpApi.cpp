#include "HttpApi.h"
#include "BridgeTypes.h"

#include <Log.h>
#include <nlohmann/json.hpp>

namespace BLEBridge {

using nlohmann::json;

HttpApi::HttpApi(DiscoveryCoordinator& coordinator, DeviceTracker& tracker, DeviceProber& prober)
    : _coordinator(coordinator), _tracker(tracker), _prober(prober) {
}

void HttpApi::install(WS::WebSocketServer& server, const std::string& prefix) {
    server.addRoute("GET", prefix + "/status", [this](const Request& request, Responder respond) {
        status(request, respond);
    });
    server.addRoute("GET", prefix + "/devices", [this](const Request& request, Responder respond) {
        devices(request, respond);
    });
    server.addRoute("POST", prefix + "/connect", [this](const Request& request, Responder respond) {
        connect(request, respond);
    });
}

/*static*/ WS::HttpResponse HttpApi::detail(int status, const std::string& message) {
    json body;
    body["detail"] = message;
    return WS::jsonResponse(status, body.dump());
}

/*static*/ int HttpApi::statusFor(const Outcome& outcome) {
    switch (outcome.category) {
        case ErrorCategory::NONE:
            return 200;
        case ErrorCategory::CLIENT:
            return 404;
        case ErrorCategory::INFRASTRUCTURE:
            return 502;
        case ErrorCategory::TIMEOUT:
            return 504;
    }
    return 500;
}

void HttpApi::status(const Request& request, Responder respond) {
    (void)request;
    DiscoveryStatus current = _coordinator.status();

    json body;
    body["enabled"] = current.enabled;
    body["proxies_discovered"] = current.proxies_discovered;
    body["devices_discovered"] = current.devices_discovered;
    body["mode"] = "esphome";
    respond(WS::jsonResponse(200, body.dump()));
}

void HttpApi::devices(const Request& request, Responder respond) {
    (void)request;
    json body = json::array();
    for (const auto& device : _tracker.list()) {
        json entry;
        entry["mac_address"] = device.mac_address;
        entry["name"] = device.name.empty() ? json(nullptr) : json(device.name);
        entry["rssi"] = device.rssi;
        entry["best_proxy"] = device.best_proxy;
        entry["last_seen"] = device.last_seen;
        body.push_back(entry);
    }
    respond(WS::jsonResponse(200, body.dump()));
}

void HttpApi::connect(const Request& request, Responder respond) {
    json payload;
    try {
        payload = json::parse(request.body());
    }
    catch (json::parse_error& e) {
        respond(detail(400, "Invalid JSON: " + std::string(e.what())));
        return;
    }

    if (!payload.is_object() || !payload.contains("mac_address") || !payload["mac_address"].is_string()) {
        respond(detail(400, "field 'mac_address' is required"));
        return;
    }

    std::string mac_address;
    if (!normalizeMac(payload["mac_address"].get<std::string>(), mac_address)) {
        respond(detail(400, "Invalid MAC address format. Expected format: AA:BB:CC:DD:EE:FF"));
        return;
    }

    _prober.probe(mac_address, [respond, mac_address](const Outcome& outcome, const ProbeResult& result) {
        if (!outcome.ok()) {
            if (outcome.category == ErrorCategory::CLIENT) {
                WARNING("HttpApi: Device connection failed (client error): " + outcome.message);
            } else {
                ERROR("HttpApi: Device connection failed (proxy error): " + outcome.message);
            }
            respond(detail(statusFor(outcome), outcome.message));
            return;
        }

        json body;
        body["service_uuid"] = result.service_uuid;
        body["notify_char_uuid"] = result.notify_uuid;
        body["write_char_uuid"] = result.write_uuid;
        body["device_name"] = result.device_name.empty() ? json(nullptr) : json(result.device_name);
        body["proxy_used"] = result.proxy_used;
        INFO("HttpApi: Retrieved UUIDs for " + mac_address + " via " + result.proxy_used);
        respond(WS::jsonResponse(200, body.dump()));
    });
}

} // namespace BLEBridge
