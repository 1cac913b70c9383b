// BLE Bridge
// Relays BLE devices seen by ESPHome Bluetooth proxies to WebSocket clients

#include <signal.h>
#include <unistd.h>

#include <memory>

// Reticulum utilities
#include <Log.h>
#include <Utilities/OS.h>

// Proxy transport
#include "ProxyTransport.h"

// Discovery
#include "MDNSBrowser.h"
#include "DiscoveryCoordinator.h"

// Bridge
#include "ProxyRegistry.h"
#include "DeviceTracker.h"
#include "AdvertisementRouter.h"
#include "SessionManager.h"
#include "ProfileStore.h"
#include "DeviceProber.h"
#include "ClientHandler.h"

// Client surface
#include "WebSocketServer.h"
#include "ClientSession.h"
#include "HttpApi.h"

// Application
#include "Config.h"
#include "Settings.h"
#include "LogFile.h"

#ifndef BLEBRIDGE_VERSION
#define BLEBRIDGE_VERSION "dev"
#endif
#define BLEBRIDGE_NAME "blebridge"

using namespace RNS;
using namespace BLEBridge;

static volatile sig_atomic_t shutdown_requested = 0;

static void on_signal(int) {
    shutdown_requested = 1;
}

void setup_signals() {
    struct sigaction action;
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

void setup_logging(const AppSettings& settings) {
    LogFile::init(settings.log_file);

    LogLevel level = LOG_INFO;
    if (!LogFile::parseLevel(settings.log_level, level)) {
        WARNING("Unknown LOG_LEVEL '" + settings.log_level + "', using info");
        level = LOG_INFO;
    }
    loglevel(level);
}

void log_settings(const AppSettings& settings) {
    INFO("  Listen: " + settings.listen_host + ":" + std::to_string(settings.listen_port));
    INFO("  WebSocket: " + settings.wsPath());
    INFO("  mDNS discovery: " + std::string(settings.mdns_enabled ? "enabled" : "disabled"));
    if (!settings.proxy_host.empty()) {
        INFO("  Static proxy: " + settings.proxy_name + " @ " + settings.proxy_host + ":" +
             std::to_string(settings.proxy_port));
    }
    INFO("  Device name filter: " + (settings.name_filter.empty() ? std::string("(none)") : settings.name_filter));
    if (settings.defaultProfile().complete()) {
        INFO("  Default device profile: " + settings.sfp_service_uuid);
    }
}

int main() {
    setup_signals();

    AppSettings settings = SettingsLoader::load();
    setup_logging(settings);

    INFO(std::string(BLEBRIDGE_NAME) + " v" + BLEBRIDGE_VERSION);
    log_settings(settings);

    // Sessions outlive the registry so that proxy links are released first
    SessionManager sessions(settings.connection_timeout, settings.operation_timeout);

    ProxyRegistry registry(
        [](const Proxy& proxy, const std::string& password) {
            return ESPHome::ProxyTransportFactory::create(proxy.name, proxy.address, proxy.port, password);
        },
        settings.proxy_password, settings.connection_timeout);

    DeviceTracker tracker(settings.device_expiry);
    AdvertisementRouter router(tracker, settings.cache_window, settings.name_filter);

    MDNS::MDNSBrowser browser;

    DiscoveryConfig discovery;
    discovery.discovery_interval = settings.discovery_interval;
    discovery.cleanup_interval = settings.cleanup_interval;
    discovery.mdns_enabled = settings.mdns_enabled;
    discovery.service_type = ESPHomeApi::SERVICE_TYPE;
    discovery.static_host = settings.proxy_host;
    discovery.static_port = settings.proxy_port;
    discovery.static_name = settings.proxy_name;
    DiscoveryCoordinator coordinator(registry, tracker, router,
                                     settings.mdns_enabled ? &browser : nullptr, discovery);

    ProfileCache profiles(settings.defaultProfile());
    DeviceProber prober(tracker, registry, sessions, &profiles);

    WS::WebSocketServer server(settings.listen_host, settings.listen_port);

    HttpApi api(coordinator, tracker, prober);
    api.install(server, settings.api_prefix);

    server.setWebSocketPath(settings.wsPath(), [&](WS::WebSocketServer::SendText send) -> WS::IWebSocketSession::Ptr {
        BridgeServices services{tracker, registry, sessions, prober, &profiles};
        ClientHandler::Ptr handler = std::make_shared<ClientHandler>(services, send);
        return std::make_shared<ClientSession>(handler);
    });

    if (!server.start()) {
        ERROR("Failed to start listener, exiting");
        LogFile::close();
        return 1;
    }

    coordinator.start();

    INFO("Ready");

    while (!shutdown_requested) {
        registry.loop();
        coordinator.loop();
        server.loop();
        usleep(App::LOOP_SLEEP_US);
    }

    INFO("Shutting down...");

    // Closing sockets closes client handlers, which release their sessions
    server.stop();
    sessions.disconnectAll();
    coordinator.stop();

    INFO("Shutdown complete");
    LogFile::close();
    return 0;
}
