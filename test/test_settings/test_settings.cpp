/**
 * @file test_settings.cpp
 * @brief Unit tests for the settings loader
 */

#include <unity.h>
#include "Settings.h"

using namespace BLEBridge;

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {}

void tearDown(void) {}

// =============================================================================
// ENV FILE TESTS
// =============================================================================

void test_parseEnvFile_skips_comments_and_blanks(void) {
    SettingsLoader::Values values = SettingsLoader::parseEnvFile(
        "# proxies\n"
        "\n"
        "ESPHOME_PROXY_HOST=10.0.0.5\n"
        "  export device_name_filter = sfp  \n"
        "ESPHOME_PROXY_NAME=\"living room\"\n"
        "=orphan\n"
        "no_equals_here\n");

    TEST_ASSERT_EQUAL_size_t(3, values.size());
    TEST_ASSERT_EQUAL_STRING("10.0.0.5", values["ESPHOME_PROXY_HOST"].c_str());
    TEST_ASSERT_EQUAL_STRING("sfp", values["DEVICE_NAME_FILTER"].c_str());
    TEST_ASSERT_EQUAL_STRING("living room", values["ESPHOME_PROXY_NAME"].c_str());
}

void test_parseEnvFile_empty_value(void) {
    SettingsLoader::Values values = SettingsLoader::parseEnvFile("DEVICE_NAME_FILTER=\n");
    TEST_ASSERT_EQUAL_size_t(1, values.size());
    TEST_ASSERT_TRUE(values["DEVICE_NAME_FILTER"].empty());
}

// =============================================================================
// APPLY TESTS
// =============================================================================

void test_defaults(void) {
    AppSettings settings;
    TEST_ASSERT_EQUAL_UINT16(8000, settings.listen_port);
    TEST_ASSERT_EQUAL_STRING("/api/v1/esphome/ws", settings.wsPath().c_str());
    TEST_ASSERT_TRUE(settings.mdns_enabled);
    TEST_ASSERT_EQUAL_FLOAT(30.0, settings.device_expiry);
    TEST_ASSERT_EQUAL_FLOAT(2.0, settings.cache_window);
    TEST_ASSERT_EQUAL_STRING("sfp", settings.name_filter.c_str());
}

void test_apply_valid_values(void) {
    AppSettings settings;
    SettingsLoader::Values values;
    values["LISTEN_PORT"] = "9000";
    values["API_PREFIX"] = "bridge/";
    values["ESPHOME_MDNS_ENABLED"] = "off";
    values["ESPHOME_CONNECTION_TIMEOUT"] = "12.5";
    values["ESPHOME_PROXY_PORT"] = "6054";
    values["DEVICE_NAME_FILTER"] = "";

    TEST_ASSERT_EQUAL_INT(0, SettingsLoader::apply(values, settings));
    TEST_ASSERT_EQUAL_UINT16(9000, settings.listen_port);
    TEST_ASSERT_EQUAL_STRING("/bridge/ws", settings.wsPath().c_str());
    TEST_ASSERT_FALSE(settings.mdns_enabled);
    TEST_ASSERT_EQUAL_FLOAT(12.5, settings.connection_timeout);
    TEST_ASSERT_EQUAL_UINT16(6054, settings.proxy_port);
    TEST_ASSERT_TRUE(settings.name_filter.empty());
}

void test_apply_rejects_invalid_and_keeps_default(void) {
    AppSettings settings;
    SettingsLoader::Values values;
    values["LISTEN_PORT"] = "70000";
    values["ESPHOME_MDNS_ENABLED"] = "maybe";
    values["ESPHOME_DEVICE_EXPIRY"] = "-1";
    values["ESPHOME_CACHE_WINDOW"] = "2s";

    TEST_ASSERT_EQUAL_INT(4, SettingsLoader::apply(values, settings));
    TEST_ASSERT_EQUAL_UINT16(8000, settings.listen_port);
    TEST_ASSERT_TRUE(settings.mdns_enabled);
    TEST_ASSERT_EQUAL_FLOAT(30.0, settings.device_expiry);
    TEST_ASSERT_EQUAL_FLOAT(2.0, settings.cache_window);
}

void test_apply_ignores_unknown_keys(void) {
    AppSettings settings;
    SettingsLoader::Values values;
    values["SOMETHING_ELSE"] = "1";
    TEST_ASSERT_EQUAL_INT(0, SettingsLoader::apply(values, settings));
}

void test_default_profile_from_sfp_keys(void) {
    AppSettings settings;
    TEST_ASSERT_FALSE(settings.defaultProfile().complete());

    SettingsLoader::Values values;
    values["SFP_SERVICE_UUID"] = "8e60f02e-f699-4865-b83f-f40501752184";
    values["SFP_NOTIFY_CHAR_UUID"] = "dc272a22-3f23-4a36-b48b-21f03a1b4ba1";
    values["SFP_WRITE_CHAR_UUID"] = "9280f26c-a56f-43ea-b769-d5d732e1ac67";
    SettingsLoader::apply(values, settings);

    DeviceProfile profile = settings.defaultProfile();
    TEST_ASSERT_TRUE(profile.complete());
    TEST_ASSERT_EQUAL_STRING("dc272a22-3f23-4a36-b48b-21f03a1b4ba1", profile.notify_uuid.c_str());
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Env file
    RUN_TEST(test_parseEnvFile_skips_comments_and_blanks);
    RUN_TEST(test_parseEnvFile_empty_value);

    // Apply
    RUN_TEST(test_defaults);
    RUN_TEST(test_apply_valid_values);
    RUN_TEST(test_apply_rejects_invalid_and_keeps_default);
    RUN_TEST(test_apply_ignores_unknown_keys);
    RUN_TEST(test_default_profile_from_sfp_keys);

    return UNITY_END();
}
