#include <unity.h>

#include "softap/ap_bssid.h"
#include "support/softap_fakes.h"

static FixedMacProvider g_provider;

void setUp(void) { g_provider = FixedMacProvider(); }
void tearDown(void) {}

void test_explicit_bssid_wins(void) {
  ApConfig cfg = MakeApConfig("TestAP", ApSecurity::kWpa2Psk, "password1",
                              kApBand2Ghz);
  cfg.has_bssid = true;
  TEST_ASSERT_TRUE(ParseMac("d2:11:19:34:a5:20", cfg.bssid));
  BssidResolution res;
  TEST_ASSERT_TRUE(ResolveApBssid(cfg, true, g_provider, "salt", res));
  TEST_ASSERT_TRUE(res.has_bssid);
  TEST_ASSERT_TRUE(res.bssid == cfg.bssid);
  TEST_ASSERT_EQUAL(0, g_provider.calls);
}

void test_explicit_bssid_wins_without_randomization(void) {
  ApConfig cfg = MakeApConfig("TestAP", ApSecurity::kWpa2Psk, "password1",
                              kApBand2Ghz);
  cfg.has_bssid = true;
  TEST_ASSERT_TRUE(ParseMac("d2:11:19:34:a5:20", cfg.bssid));
  BssidResolution res;
  TEST_ASSERT_TRUE(ResolveApBssid(cfg, false, g_provider, "salt", res));
  TEST_ASSERT_TRUE(res.has_bssid);
  TEST_ASSERT_TRUE(res.bssid == cfg.bssid);
  TEST_ASSERT_EQUAL(0, g_provider.calls);
}

void test_no_randomization_leaves_factory_mac(void) {
  const ApConfig cfg = MakeApConfig("TestAP", ApSecurity::kWpa2Psk,
                                    "password1", kApBand2Ghz);
  BssidResolution res;
  res.has_bssid = true;
  TEST_ASSERT_TRUE(ResolveApBssid(cfg, false, g_provider, "salt", res));
  TEST_ASSERT_FALSE(res.has_bssid);
  TEST_ASSERT_EQUAL(0, g_provider.calls);
}

void test_derivation_is_deterministic(void) {
  const ApConfig cfg = MakeApConfig("TestAP", ApSecurity::kWpa2Psk,
                                    "password1", kApBand2Ghz);
  BssidResolution a;
  BssidResolution b;
  TEST_ASSERT_TRUE(ResolveApBssid(cfg, true, g_provider, "salt", a));
  TEST_ASSERT_TRUE(ResolveApBssid(cfg, true, g_provider, "salt", b));
  TEST_ASSERT_TRUE(a.has_bssid);
  TEST_ASSERT_TRUE(a.bssid == b.bssid);
  TEST_ASSERT_EQUAL_STRING("TestAP", g_provider.last_identity.c_str());
  TEST_ASSERT_EQUAL_STRING("salt", g_provider.last_salt.c_str());
  // Locally administered, unicast.
  TEST_ASSERT_EQUAL_HEX8(0x02, a.bssid.b[0] & 0x03);

  const ApConfig other = MakeApConfig("OtherAP", ApSecurity::kWpa2Psk,
                                      "password1", kApBand2Ghz);
  BssidResolution c;
  TEST_ASSERT_TRUE(ResolveApBssid(other, true, g_provider, "salt", c));
  TEST_ASSERT_TRUE(c.bssid != a.bssid);
}

void test_provider_failure_propagates(void) {
  g_provider.fail = true;
  const ApConfig cfg = MakeApConfig("TestAP", ApSecurity::kWpa2Psk,
                                    "password1", kApBand2Ghz);
  BssidResolution res;
  TEST_ASSERT_FALSE(ResolveApBssid(cfg, true, g_provider, "salt", res));
  TEST_ASSERT_FALSE(res.has_bssid);
}

void test_mac_text_round_trip(void) {
  MacAddr mac;
  TEST_ASSERT_TRUE(ParseMac("D2:11:19:34:a5:20", mac));
  char buf[18];
  FormatMac(mac, buf, sizeof(buf));
  TEST_ASSERT_EQUAL_STRING("d2:11:19:34:a5:20", buf);
  TEST_ASSERT_FALSE(ParseMac("d2-11-19-34-a5-20", mac));
  TEST_ASSERT_FALSE(ParseMac("d2:11:19:34:a5", mac));
  TEST_ASSERT_FALSE(ParseMac("g2:11:19:34:a5:20", mac));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_explicit_bssid_wins);
  RUN_TEST(test_explicit_bssid_wins_without_randomization);
  RUN_TEST(test_no_randomization_leaves_factory_mac);
  RUN_TEST(test_derivation_is_deterministic);
  RUN_TEST(test_provider_failure_propagates);
  RUN_TEST(test_mac_text_round_trip);
  return UNITY_END();
}
