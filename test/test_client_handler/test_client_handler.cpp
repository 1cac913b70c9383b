/**
 * @file test_client_handler.cpp
 * @brief Unit tests for the WebSocket client message protocol
 *
 * Runs a handler against real tracker, registry, session and prober
 * instances wired to a stub proxy transport.
 */

#include <unity.h>
#include "ClientHandler.h"
#include "StubTransport.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace BLEBridge;
using BLEBridge::Test::StubTransport;
using nlohmann::json;

static const char* MAC = "AA:BB:CC:DD:EE:FF";
static const uint64_t ADDRESS = 0xAABBCCDDEEFFULL;
static const char* SERVICE_UUID = "8e60f02e-f699-4865-b83f-f40501752184";
static const char* NOTIFY_UUID = "dc272a22-3f23-4a36-b48b-21f03a1b4ba1";
static const char* WRITE_UUID = "9280f26c-a56f-43ea-b769-d5d732e1ac67";

static DeviceTracker* tracker = nullptr;
static ProxyRegistry* registry = nullptr;
static SessionManager* sessions = nullptr;
static ProfileCache* profiles = nullptr;
static DeviceProber* prober = nullptr;
static StubTransport::Ptr transport;
static ClientHandler::Ptr handler;

static std::vector<json> sent;
static bool send_ok = true;

static ESPHome::IProxyTransport::Ptr createStub(const Proxy& proxy, const std::string&) {
    transport = std::make_shared<StubTransport>(proxy.name);
    transport->services.push_back(StubTransport::sampleService());
    return transport;
}

static bool captureSend(const std::string& text) {
    if (!send_ok) {
        return false;
    }
    sent.push_back(json::parse(text));
    return true;
}

static void buildHandler(const DeviceProfile& fallback = DeviceProfile()) {
    delete prober;
    delete profiles;
    profiles = new ProfileCache(fallback);
    prober = new DeviceProber(*tracker, *registry, *sessions, profiles);
    BridgeServices services{*tracker, *registry, *sessions, *prober, profiles};
    handler = std::make_shared<ClientHandler>(services, captureSend, "client-1");
    handler->open();
    sent.clear();
}

static void seeDevice(const std::string& proxy_name) {
    tracker->update(MAC, "SFP-Wizard", -55, proxy_name, RNS::Bytes(), 1);
}

static std::string connectText(bool with_uuids) {
    json message;
    message["type"] = "connect";
    message["mac_address"] = "aa:bb:cc:dd:ee:ff";
    if (with_uuids) {
        message["service_uuid"] = SERVICE_UUID;
        message["notify_char_uuid"] = NOTIFY_UUID;
        message["write_char_uuid"] = WRITE_UUID;
    }
    return message.dump();
}

static const json& lastSent() {
    return sent.back();
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    sent.clear();
    send_ok = true;
    tracker = new DeviceTracker(30.0);
    registry = new ProxyRegistry(createStub, "", 30.0);
    sessions = new SessionManager(30.0, 10.0);

    Proxy proxy;
    proxy.name = "kitchen";
    proxy.address = "192.168.1.20";
    registry->registerProxy(proxy);
    registry->connectTransport("kitchen", nullptr);

    buildHandler();
}

void tearDown(void) {
    if (handler) {
        handler->close();
    }
    handler.reset();
    delete prober;
    delete profiles;
    delete sessions;
    delete registry;
    delete tracker;
    prober = nullptr;
    profiles = nullptr;
    transport.reset();
}

// =============================================================================
// LIFECYCLE TESTS
// =============================================================================

void test_open_sends_ready_status(void) {
    BridgeServices services{*tracker, *registry, *sessions, *prober, profiles};
    ClientHandler::Ptr fresh = std::make_shared<ClientHandler>(services, captureSend);
    fresh->open();

    TEST_ASSERT_EQUAL_STRING("status", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_FALSE(lastSent()["connected"].get<bool>());
    TEST_ASSERT_TRUE(lastSent()["device_name"].is_null());
    TEST_ASSERT_EQUAL_STRING("ESPHome BLE Proxy ready", lastSent()["message"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_size_t(36, fresh->clientId().size());
    fresh->close();
}

void test_generateClientId_is_uuid4(void) {
    std::string id = ClientHandler::generateClientId();
    TEST_ASSERT_EQUAL_size_t(36, id.size());
    TEST_ASSERT_EQUAL_INT('-', id[8]);
    TEST_ASSERT_EQUAL_INT('4', id[14]);
    TEST_ASSERT_TRUE(id != ClientHandler::generateClientId());
}

void test_close_releases_session_and_ignores_input(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));
    TEST_ASSERT_TRUE(sessions->hasSession("client-1"));

    handler->close();
    TEST_ASSERT_FALSE(sessions->hasSession("client-1"));
    TEST_ASSERT_FALSE(handler->isRunning());

    sent.clear();
    handler->handleText("{\"type\":\"disconnect\"}");
    TEST_ASSERT_EQUAL_size_t(0, sent.size());
}

void test_send_failure_stops_handler(void) {
    send_ok = false;
    handler->handleText("{\"type\":\"subscribe\",\"characteristic_uuid\":\"x\"}");
    TEST_ASSERT_FALSE(handler->isRunning());
}

// =============================================================================
// MALFORMED INPUT TESTS
// =============================================================================

void test_invalid_json_reports_error(void) {
    handler->handleText("{not json");

    TEST_ASSERT_EQUAL_STRING("error", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_TRUE(lastSent()["error"].get<std::string>().find("Invalid JSON: ") == 0);
    TEST_ASSERT_TRUE(handler->isRunning());
}

void test_unknown_type_reports_error(void) {
    handler->handleText("{\"type\":\"reboot\"}");
    TEST_ASSERT_EQUAL_STRING("Unknown message type: reboot", lastSent()["error"].get<std::string>().c_str());
}

void test_missing_field_reports_format_error(void) {
    handler->handleText("{\"type\":\"connect\"}");
    TEST_ASSERT_EQUAL_STRING("Invalid message format: field 'mac_address' is required",
                             lastSent()["error"].get<std::string>().c_str());
}

void test_invalid_mac_reports_error(void) {
    handler->handleText("{\"type\":\"connect\",\"mac_address\":\"AA:BB:CC\"}");
    TEST_ASSERT_EQUAL_STRING("Invalid MAC address format. Expected format: AA:BB:CC:DD:EE:FF",
                             lastSent()["error"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_size_t(0, transport->connects.size());
}

// =============================================================================
// CONNECT TESTS
// =============================================================================

void test_connect_with_uuids(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));

    const json& message = lastSent();
    TEST_ASSERT_EQUAL_STRING("connected", message["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("SFP-Wizard", message["device_name"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING(MAC, message["device_address"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING(WRITE_UUID, message["write_char_uuid"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("kitchen", message["proxy_used"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_UINT32(1, transport->connect_address_types[0]);
    TEST_ASSERT_TRUE(sessions->isConnected("client-1"));
}

void test_connect_unseen_device_is_client_error(void) {
    json request = json::parse(connectText(true));
    request["mac_address"] = "aa-bb-cc-dd-ee-ff";
    handler->handleText(request.dump());

    const json& message = lastSent();
    TEST_ASSERT_EQUAL_STRING("error", message["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("client", message["details"]["category"].get<std::string>().c_str());
    std::string error = message["error"].get<std::string>();
    TEST_ASSERT_TRUE(error.find("No proxy has seen device") == 0);
    TEST_ASSERT_TRUE(error.find(MAC) != std::string::npos);
    TEST_ASSERT_FALSE(sessions->hasSession("client-1"));
    TEST_ASSERT_EQUAL_size_t(0, transport->connects.size());
}

void test_connect_via_disconnected_proxy(void) {
    seeDevice("garage");
    handler->handleText(connectText(true));

    TEST_ASSERT_EQUAL_STRING("Proxy garage is not connected", lastSent()["error"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("infrastructure", lastSent()["details"]["category"].get<std::string>().c_str());
}

void test_connect_timeout_reported(void) {
    seeDevice("kitchen");
    transport->connect_result = ESPHome::OperationResult::TIMEOUT;
    handler->handleText(connectText(true));

    TEST_ASSERT_EQUAL_STRING("timeout", lastSent()["details"]["category"].get<std::string>().c_str());
    TEST_ASSERT_FALSE(sessions->hasSession("client-1"));
}

void test_connect_without_uuids_probes_device(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(false));

    const json& message = lastSent();
    TEST_ASSERT_EQUAL_STRING("connected", message["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING(SERVICE_UUID, message["service_uuid"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING(NOTIFY_UUID, message["notify_char_uuid"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_size_t(2, transport->connects.size());
    TEST_ASSERT_EQUAL_size_t(1, transport->disconnects.size());

    DeviceProfile profile;
    TEST_ASSERT_TRUE(profiles->lookup(MAC, profile));
    TEST_ASSERT_EQUAL_STRING(WRITE_UUID, profile.write_uuid.c_str());
}

void test_connect_without_uuids_uses_stored_profile(void) {
    DeviceProfile fallback;
    fallback.service_uuid = SERVICE_UUID;
    fallback.notify_uuid = NOTIFY_UUID;
    fallback.write_uuid = WRITE_UUID;
    buildHandler(fallback);
    seeDevice("kitchen");

    handler->handleText(connectText(false));
    TEST_ASSERT_EQUAL_STRING("connected", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_size_t(1, transport->connects.size());
}

void test_connect_probe_failure_reported(void) {
    handler->handleText(connectText(false));
    TEST_ASSERT_EQUAL_STRING("error", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("client", lastSent()["details"]["category"].get<std::string>().c_str());
}

void test_newer_connect_discards_older_result(void) {
    seeDevice("kitchen");
    transport->auto_reply = false;
    handler->handleText(connectText(true));
    handler->handleText(connectText(true));

    StubTransport::completeNext(transport->pending_connects, ESPHome::OperationResult::SUCCESS);
    TEST_ASSERT_EQUAL_size_t(0, sent.size());

    StubTransport::completeNext(transport->pending_connects, ESPHome::OperationResult::SUCCESS);
    transport->completeServices(ESPHome::OperationResult::SUCCESS, transport->services);
    StubTransport::completeNext(transport->pending_notifies, ESPHome::OperationResult::SUCCESS);
    TEST_ASSERT_EQUAL_size_t(1, sent.size());
    TEST_ASSERT_EQUAL_STRING("connected", lastSent()["type"].get<std::string>().c_str());
}

// =============================================================================
// SESSION TRAFFIC TESTS
// =============================================================================

void test_write_reports_status(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));

    json message;
    message["type"] = "write";
    message["characteristic_uuid"] = WRITE_UUID;
    message["data"] = "qrs=";
    handler->handleText(message.dump());

    TEST_ASSERT_EQUAL_STRING("status", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_TRUE(lastSent()["connected"].get<bool>());
    TEST_ASSERT_EQUAL_STRING("SFP-Wizard", lastSent()["device_name"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING((std::string("Wrote 2 bytes to ") + WRITE_UUID).c_str(),
                             lastSent()["message"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_HEX8(0xAA, transport->writes[0].data.data()[0]);
    TEST_ASSERT_TRUE(transport->writes[0].response);
}

void test_write_invalid_base64(void) {
    handler->handleText("{\"type\":\"write\",\"characteristic_uuid\":\"x\",\"data\":\"!!\"}");
    TEST_ASSERT_EQUAL_STRING("Invalid message format: field 'data' is not valid base64",
                             lastSent()["error"].get<std::string>().c_str());
}

void test_write_without_session(void) {
    handler->handleText("{\"type\":\"write\",\"characteristic_uuid\":\"x\",\"data\":\"qrs=\"}");
    TEST_ASSERT_EQUAL_STRING("No active connection - connect first", lastSent()["error"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_size_t(0, transport->writes.size());
}

void test_write_echo_returned_as_same_base64(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));

    json message;
    message["type"] = "write";
    message["characteristic_uuid"] = WRITE_UUID;
    message["data"] = "AQIDBP8A";
    handler->handleText(message.dump());

    const uint8_t frame[] = {0x01, 0x02, 0x03, 0x04, 0xFF, 0x00};
    TEST_ASSERT_EQUAL_size_t(1, transport->writes.size());
    TEST_ASSERT_EQUAL_size_t(sizeof(frame), transport->writes[0].data.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(frame, transport->writes[0].data.data(), sizeof(frame));

    transport->emitNotification(ADDRESS, 12, transport->writes[0].data);
    handler->loop();

    TEST_ASSERT_EQUAL_STRING("notification", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING(NOTIFY_UUID, lastSent()["characteristic_uuid"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("AQIDBP8A", lastSent()["data"].get<std::string>().c_str());
}

void test_notification_forwarded_as_base64(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));

    RNS::Bytes data;
    data.append(static_cast<uint8_t>(0xAA));
    data.append(static_cast<uint8_t>(0xBB));
    transport->emitNotification(ADDRESS, 12, data);
    handler->loop();

    TEST_ASSERT_EQUAL_STRING("notification", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING(NOTIFY_UUID, lastSent()["characteristic_uuid"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("qrs=", lastSent()["data"].get<std::string>().c_str());
}

void test_device_loss_forwarded(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));

    transport->emitDeviceDisconnected(ADDRESS, 0);
    handler->loop();

    TEST_ASSERT_EQUAL_STRING("disconnected", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("Connection to device lost", lastSent()["reason"].get<std::string>().c_str());
}

void test_disconnect_acknowledged(void) {
    seeDevice("kitchen");
    handler->handleText(connectText(true));

    handler->handleText("{\"type\":\"disconnect\"}");
    TEST_ASSERT_EQUAL_STRING("disconnected", lastSent()["type"].get<std::string>().c_str());
    TEST_ASSERT_EQUAL_STRING("User requested disconnect", lastSent()["reason"].get<std::string>().c_str());
    TEST_ASSERT_FALSE(sessions->hasSession("client-1"));
}

void test_subscribe_and_unsubscribe_status(void) {
    handler->handleText("{\"type\":\"subscribe\",\"characteristic_uuid\":\"abc\"}");
    TEST_ASSERT_EQUAL_STRING("Subscribed to abc (active on connect)",
                             lastSent()["message"].get<std::string>().c_str());

    handler->handleText("{\"type\":\"unsubscribe\",\"characteristic_uuid\":\"abc\"}");
    TEST_ASSERT_EQUAL_STRING("Unsubscribe from abc (disconnect to stop notifications)",
                             lastSent()["message"].get<std::string>().c_str());
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Lifecycle
    RUN_TEST(test_open_sends_ready_status);
    RUN_TEST(test_generateClientId_is_uuid4);
    RUN_TEST(test_close_releases_session_and_ignores_input);
    RUN_TEST(test_send_failure_stops_handler);

    // Malformed input
    RUN_TEST(test_invalid_json_reports_error);
    RUN_TEST(test_unknown_type_reports_error);
    RUN_TEST(test_missing_field_reports_format_error);
    RUN_TEST(test_invalid_mac_reports_error);

    // Connect
    RUN_TEST(test_connect_with_uuids);
    RUN_TEST(test_connect_unseen_device_is_client_error);
    RUN_TEST(test_connect_via_disconnected_proxy);
    RUN_TEST(test_connect_timeout_reported);
    RUN_TEST(test_connect_without_uuids_probes_device);
    RUN_TEST(test_connect_without_uuids_uses_stored_profile);
    RUN_TEST(test_connect_probe_failure_reported);
    RUN_TEST(test_newer_connect_discards_older_result);

    // Session traffic
    RUN_TEST(test_write_reports_status);
    RUN_TEST(test_write_invalid_base64);
    RUN_TEST(test_write_without_session);
    RUN_TEST(test_write_echo_returned_as_same_base64);
    RUN_TEST(test_notification_forwarded_as_base64);
    RUN_TEST(test_device_loss_forwarded);
    RUN_TEST(test_disconnect_acknowledged);
    RUN_TEST(test_subscribe_and_unsubscribe_status);

    return UNITY_END();
}
