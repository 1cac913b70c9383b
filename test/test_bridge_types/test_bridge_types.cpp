/**
 * @file test_bridge_types.cpp
 * @brief Unit tests for address helpers, base64 and the profile cache
 */

#include <unity.h>
#include "BridgeTypes.h"
#include "Base64.h"
#include "ProfileStore.h"

#include <string>

using namespace BLEBridge;
using RNS::Bytes;

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {}

void tearDown(void) {}

// =============================================================================
// MAC ADDRESS TESTS
// =============================================================================

void test_normalizeMac_accepts_case_and_dashes(void) {
    std::string out;
    TEST_ASSERT_TRUE(normalizeMac("aa-bb-cc-dd-ee-0f", out));
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:0F", out.c_str());
}

void test_normalizeMac_rejects_malformed(void) {
    std::string out = "unchanged";
    TEST_ASSERT_FALSE(normalizeMac("AA:BB:CC:DD:EE", out));
    TEST_ASSERT_FALSE(normalizeMac("AA:BB:CC:DD:EE:GG", out));
    TEST_ASSERT_FALSE(normalizeMac("AABBCCDDEEFF00000", out));
    TEST_ASSERT_FALSE(normalizeMac("", out));
    TEST_ASSERT_EQUAL_STRING("unchanged", out.c_str());
}

void test_mac_integer_conversion(void) {
    TEST_ASSERT_TRUE(macToUint64("A4:C1:38:00:00:01") == 0xA4C138000001ULL);
    TEST_ASSERT_EQUAL_STRING("A4:C1:38:00:00:01", macFromUint64(0xA4C138000001ULL).c_str());
}

// =============================================================================
// UUID TESTS
// =============================================================================

void test_uuidEquals_ignores_case_and_hyphens(void) {
    TEST_ASSERT_TRUE(uuidEquals("dc272a22-3f23-4a36-b48b-21f03a1b4ba1", "DC272A223F234A36B48B21F03A1B4BA1"));
    TEST_ASSERT_FALSE(uuidEquals("dc272a22-3f23-4a36-b48b-21f03a1b4ba1", "dc272a22-3f23-4a36-b48b-21f03a1b4ba2"));
    TEST_ASSERT_EQUAL_STRING("ABCD", normalizeUuid("ab-cd").c_str());
}

// =============================================================================
// OUTCOME TESTS
// =============================================================================

void test_outcome_categories(void) {
    TEST_ASSERT_TRUE(Outcome::success().ok());
    TEST_ASSERT_FALSE(Outcome::timeout("slow").ok());
    TEST_ASSERT_EQUAL_STRING("infrastructure", errorCategoryToString(Outcome::infrastructure("x").category));
    TEST_ASSERT_EQUAL_STRING("client", errorCategoryToString(ErrorCategory::CLIENT));
}

// =============================================================================
// BASE64 TESTS
// =============================================================================

void test_base64_encode_padding(void) {
    const uint8_t raw[] = {'f', 'o', 'o', 'b'};
    TEST_ASSERT_EQUAL_STRING("Zm9vYg==", Base64::encode(Bytes(raw, 4)).c_str());
    TEST_ASSERT_EQUAL_STRING("Zm9v", Base64::encode(Bytes(raw, 3)).c_str());
    TEST_ASSERT_EQUAL_STRING("", Base64::encode(Bytes()).c_str());
}

void test_base64_decode_strips_padding(void) {
    Bytes out;
    TEST_ASSERT_TRUE(Base64::decode("Zm9vYg==", out));
    TEST_ASSERT_EQUAL_size_t(4, out.size());
    TEST_ASSERT_EQUAL_HEX8('b', out.data()[3]);

    TEST_ASSERT_TRUE(Base64::decode("Zm9vYmE=", out));
    TEST_ASSERT_EQUAL_size_t(5, out.size());
}

void test_base64_decode_empty(void) {
    Bytes out;
    out.append(static_cast<uint8_t>(1));
    TEST_ASSERT_TRUE(Base64::decode("", out));
    TEST_ASSERT_EQUAL_size_t(0, out.size());
}

void test_base64_decode_rejects_malformed(void) {
    Bytes out;
    TEST_ASSERT_FALSE(Base64::decode("Zm9", out));
    TEST_ASSERT_FALSE(Base64::decode("Zm9*", out));
    TEST_ASSERT_FALSE(Base64::decode("====", out));
    TEST_ASSERT_FALSE(Base64::decode("A===", out));
    TEST_ASSERT_FALSE(Base64::decode("AB=C", out));
    TEST_ASSERT_FALSE(Base64::decode("AQ==AQID", out));
    TEST_ASSERT_FALSE(Base64::decode(" Zm9v   ", out));
    TEST_ASSERT_EQUAL_size_t(0, out.size());
}

void test_base64_decode_accepts_single_and_double_padding(void) {
    Bytes out;
    TEST_ASSERT_TRUE(Base64::decode("AQI=", out));
    TEST_ASSERT_EQUAL_size_t(2, out.size());
    TEST_ASSERT_EQUAL_HEX8(0x01, out.data()[0]);
    TEST_ASSERT_EQUAL_HEX8(0x02, out.data()[1]);
    TEST_ASSERT_TRUE(Base64::decode("AQ==", out));
    TEST_ASSERT_EQUAL_size_t(1, out.size());
    TEST_ASSERT_EQUAL_HEX8(0x01, out.data()[0]);
}

// =============================================================================
// PROFILE CACHE TESTS
// =============================================================================

void test_profile_cache_remembers_complete_profiles(void) {
    ProfileCache cache;
    DeviceProfile profile;
    profile.mac_address = "AA:BB:CC:DD:EE:FF";
    profile.service_uuid = "s";
    profile.notify_uuid = "n";

    cache.remember(profile);
    TEST_ASSERT_EQUAL_size_t(0, cache.size());

    profile.write_uuid = "w";
    cache.remember(profile);
    DeviceProfile found;
    TEST_ASSERT_TRUE(cache.lookup("AA:BB:CC:DD:EE:FF", found));
    TEST_ASSERT_EQUAL_STRING("w", found.write_uuid.c_str());
    TEST_ASSERT_FALSE(cache.lookup("11:22:33:44:55:66", found));
}

void test_profile_cache_fallback(void) {
    DeviceProfile fallback;
    fallback.service_uuid = "s";
    fallback.notify_uuid = "n";
    fallback.write_uuid = "w";
    ProfileCache cache(fallback);

    DeviceProfile found;
    TEST_ASSERT_TRUE(cache.lookup("11:22:33:44:55:66", found));
    TEST_ASSERT_EQUAL_STRING("11:22:33:44:55:66", found.mac_address.c_str());
    TEST_ASSERT_EQUAL_STRING("n", found.notify_uuid.c_str());
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // MAC addresses
    RUN_TEST(test_normalizeMac_accepts_case_and_dashes);
    RUN_TEST(test_normalizeMac_rejects_malformed);
    RUN_TEST(test_mac_integer_conversion);

    // UUIDs and outcomes
    RUN_TEST(test_uuidEquals_ignores_case_and_hyphens);
    RUN_TEST(test_outcome_categories);

    // Base64
    RUN_TEST(test_base64_encode_padding);
    RUN_TEST(test_base64_decode_strips_padding);
    RUN_TEST(test_base64_decode_empty);
    RUN_TEST(test_base64_decode_rejects_malformed);
    RUN_TEST(test_base64_decode_accepts_single_and_double_padding);

    // Profile cache
    RUN_TEST(test_profile_cache_remembers_complete_profiles);
    RUN_TEST(test_profile_cache_fallback);

    return UNITY_END();
}
