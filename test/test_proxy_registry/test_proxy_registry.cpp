/**
 * @file test_proxy_registry.cpp
 * @brief Unit tests for the proxy catalog and transport lifecycle
 */

#include <unity.h>
#include "ProxyRegistry.h"
#include "StubTransport.h"

#include <map>
#include <string>
#include <vector>

using namespace BLEBridge;
using BLEBridge::Test::StubTransport;

static ProxyRegistry* registry = nullptr;
static std::map<std::string, StubTransport::Ptr> created;
static std::string last_password;
static bool auto_ready = true;
static int factory_calls = 0;

struct Sighting {
    std::string proxy;
    uint64_t address;
};
static std::vector<Sighting> sightings;

static ESPHome::IProxyTransport::Ptr createStub(const Proxy& proxy, const std::string& password) {
    ++factory_calls;
    last_password = password;
    StubTransport::Ptr transport = std::make_shared<StubTransport>(proxy.name);
    transport->auto_reply = auto_ready;
    created[proxy.name] = transport;
    return transport;
}

static Proxy makeProxy(const std::string& name, const std::string& address = "192.168.1.50") {
    Proxy proxy;
    proxy.name = name;
    proxy.address = address;
    proxy.port = 6053;
    return proxy;
}

static void recordSighting(const std::string& proxy_name, const ESPHome::Advertisement& advertisement) {
    sightings.push_back(Sighting{proxy_name, advertisement.address});
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    created.clear();
    sightings.clear();
    last_password.clear();
    auto_ready = true;
    factory_calls = 0;
    registry = new ProxyRegistry(createStub, "secret", 30.0);
}

void tearDown(void) {
    delete registry;
    registry = nullptr;
    created.clear();
}

// =============================================================================
// CATALOG TESTS
// =============================================================================

void test_registerProxy_adds_disconnected_entry(void) {
    registry->registerProxy(makeProxy("proxy-a"));

    const Proxy* proxy = registry->get("proxy-a");
    TEST_ASSERT_NOT_NULL(proxy);
    TEST_ASSERT_FALSE(proxy->connected);
    TEST_ASSERT_EQUAL_size_t(1, registry->size());
    TEST_ASSERT_EQUAL_size_t(1, registry->pendingProxies().size());
}

void test_registerProxy_refresh_keeps_transport(void) {
    registry->registerProxy(makeProxy("proxy-a"));
    TEST_ASSERT_TRUE(registry->connectTransport("proxy-a", recordSighting));

    registry->registerProxy(makeProxy("proxy-a", "192.168.1.99"));

    const Proxy* proxy = registry->get("proxy-a");
    TEST_ASSERT_EQUAL_STRING("192.168.1.99", proxy->address.c_str());
    TEST_ASSERT_TRUE(proxy->connected);
    TEST_ASSERT_TRUE(registry->hasTransport("proxy-a"));
    TEST_ASSERT_EQUAL_size_t(1, registry->size());
}

void test_static_origin_is_sticky(void) {
    Proxy configured = makeProxy("proxy-a");
    configured.origin = ProxyOrigin::STATIC;
    registry->registerProxy(configured);
    registry->registerProxy(makeProxy("proxy-a"));

    TEST_ASSERT_EQUAL(ProxyOrigin::STATIC, registry->get("proxy-a")->origin);
}

void test_removeProxy_stops_transport(void) {
    registry->registerProxy(makeProxy("proxy-a"));
    registry->connectTransport("proxy-a", recordSighting);

    TEST_ASSERT_TRUE(registry->removeProxy("proxy-a"));
    TEST_ASSERT_EQUAL_INT(1, created["proxy-a"]->stop_calls);
    TEST_ASSERT_NULL(registry->get("proxy-a"));
    TEST_ASSERT_FALSE(registry->hasTransport("proxy-a"));
    TEST_ASSERT_FALSE(registry->removeProxy("proxy-a"));
}

// =============================================================================
// TRANSPORT TESTS
// =============================================================================

void test_connectTransport_marks_connected(void) {
    registry->registerProxy(makeProxy("proxy-a"));

    TEST_ASSERT_TRUE(registry->connectTransport("proxy-a", recordSighting));
    TEST_ASSERT_TRUE(registry->get("proxy-a")->connected);
    TEST_ASSERT_EQUAL_STRING("secret", last_password.c_str());
    TEST_ASSERT_EQUAL_FLOAT(30.0, created["proxy-a"]->start_timeout);
    TEST_ASSERT_NOT_NULL(registry->getTransport("proxy-a").get());
    TEST_ASSERT_EQUAL_size_t(1, registry->listConnected().size());
    TEST_ASSERT_EQUAL_size_t(0, registry->pendingProxies().size());
}

void test_connectTransport_unknown_proxy(void) {
    TEST_ASSERT_FALSE(registry->connectTransport("proxy-x", recordSighting));
    TEST_ASSERT_EQUAL_INT(0, factory_calls);
}

void test_connectTransport_skips_while_connecting(void) {
    auto_ready = false;
    registry->registerProxy(makeProxy("proxy-a"));

    TEST_ASSERT_TRUE(registry->connectTransport("proxy-a", recordSighting));
    TEST_ASSERT_FALSE(registry->get("proxy-a")->connected);
    TEST_ASSERT_NULL(registry->getTransport("proxy-a").get());

    TEST_ASSERT_FALSE(registry->connectTransport("proxy-a", recordSighting));
    TEST_ASSERT_EQUAL_INT(1, factory_calls);

    created["proxy-a"]->finishStart(ESPHome::OperationResult::SUCCESS);
    TEST_ASSERT_TRUE(registry->get("proxy-a")->connected);
}

void test_failed_start_allows_retry(void) {
    auto_ready = false;
    registry->registerProxy(makeProxy("proxy-a"));
    registry->connectTransport("proxy-a", recordSighting);

    created["proxy-a"]->finishStart(ESPHome::OperationResult::TIMEOUT);
    TEST_ASSERT_FALSE(registry->get("proxy-a")->connected);

    registry->loop();
    TEST_ASSERT_FALSE(registry->hasTransport("proxy-a"));
    TEST_ASSERT_EQUAL_size_t(1, registry->pendingProxies().size());

    auto_ready = true;
    TEST_ASSERT_TRUE(registry->connectTransport("proxy-a", recordSighting));
    TEST_ASSERT_EQUAL_INT(2, factory_calls);
}

void test_advertisements_tagged_with_proxy(void) {
    registry->registerProxy(makeProxy("proxy-a"));
    registry->registerProxy(makeProxy("proxy-b"));
    registry->connectTransport("proxy-a", recordSighting);
    registry->connectTransport("proxy-b", recordSighting);

    ESPHome::Advertisement advertisement;
    advertisement.address = 0x1234;
    created["proxy-b"]->emitAdvertisement(advertisement);

    TEST_ASSERT_EQUAL_size_t(1, sightings.size());
    TEST_ASSERT_EQUAL_STRING("proxy-b", sightings[0].proxy.c_str());
}

void test_loop_drops_closed_transport(void) {
    registry->registerProxy(makeProxy("proxy-a"));
    registry->connectTransport("proxy-a", recordSighting);

    created["proxy-a"]->dropLink();
    registry->loop();

    TEST_ASSERT_EQUAL_INT(1, created["proxy-a"]->loop_calls);
    TEST_ASSERT_FALSE(registry->get("proxy-a")->connected);
    TEST_ASSERT_FALSE(registry->hasTransport("proxy-a"));
    TEST_ASSERT_NOT_NULL(registry->get("proxy-a"));
}

void test_disconnectAll_clears_catalog(void) {
    registry->registerProxy(makeProxy("proxy-a"));
    registry->registerProxy(makeProxy("proxy-b"));
    registry->connectTransport("proxy-a", recordSighting);
    registry->connectTransport("proxy-b", recordSighting);

    registry->disconnectAll();

    TEST_ASSERT_EQUAL_INT(1, created["proxy-a"]->stop_calls);
    TEST_ASSERT_EQUAL_INT(1, created["proxy-b"]->stop_calls);
    TEST_ASSERT_EQUAL_size_t(0, registry->size());
    TEST_ASSERT_EQUAL_size_t(0, registry->listConnected().size());
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Catalog
    RUN_TEST(test_registerProxy_adds_disconnected_entry);
    RUN_TEST(test_registerProxy_refresh_keeps_transport);
    RUN_TEST(test_static_origin_is_sticky);
    RUN_TEST(test_removeProxy_stops_transport);

    // Transports
    RUN_TEST(test_connectTransport_marks_connected);
    RUN_TEST(test_connectTransport_unknown_proxy);
    RUN_TEST(test_connectTransport_skips_while_connecting);
    RUN_TEST(test_failed_start_allows_retry);
    RUN_TEST(test_advertisements_tagged_with_proxy);
    RUN_TEST(test_loop_drops_closed_transport);
    RUN_TEST(test_disconnectAll_clears_catalog);

    return UNITY_END();
}
