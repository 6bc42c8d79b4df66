#include <unity.h>

#include "softap/ap_band.h"

void setUp(void) {}
void tearDown(void) {}

static void expectBand(uint8_t in, BandPolicy policy, uint8_t want) {
  const BandNormalizeResult r = NormalizeApBand(in, policy);
  TEST_ASSERT_EQUAL_HEX8(want, r.band);
  TEST_ASSERT_EQUAL(in != want, r.changed);
}

void test_restricted_radio_table(void) {
  const BandPolicy p = BandPolicy::kRestrictedRadio;
  expectBand(kApBandAny, p, kApBand5Ghz);
  expectBand(kApBand2Ghz | kApBand6Ghz, p, kApBand2Ghz);
  expectBand(kApBand6Ghz, p, kApBand2Ghz);
  expectBand(kApBand5Ghz, p, kApBand5Ghz);
  expectBand(kApBand2Ghz, p, kApBand2Ghz);
  expectBand(kApBand2Ghz | kApBand5Ghz, p, kApBand5Ghz);
  expectBand(kApBand5Ghz | kApBand6Ghz, p, kApBand5Ghz);
}

void test_concurrent_radio_table(void) {
  const BandPolicy p = BandPolicy::kConcurrentRadio;
  expectBand(kApBand5Ghz, p, kApBand2Ghz | kApBand5Ghz);
  expectBand(kApBandAny, p, kApBandAny);
  expectBand(kApBand2Ghz, p, kApBand2Ghz);
  expectBand(kApBand6Ghz, p, kApBand6Ghz);
  expectBand(kApBand2Ghz | kApBand5Ghz, p, kApBand2Ghz | kApBand5Ghz);
}

void test_idempotent_for_all_masks(void) {
  const BandPolicy policies[] = {BandPolicy::kRestrictedRadio,
                                 BandPolicy::kConcurrentRadio};
  for (BandPolicy p : policies) {
    for (uint8_t band = 0; band <= kApBandAny; ++band) {
      const BandNormalizeResult once = NormalizeApBand(band, p);
      const BandNormalizeResult twice = NormalizeApBand(once.band, p);
      TEST_ASSERT_EQUAL_HEX8(once.band, twice.band);
      TEST_ASSERT_FALSE(twice.changed);
    }
  }
}

void test_flag_selects_policy(void) {
  TEST_ASSERT_TRUE(BandPolicyFor(true) == BandPolicy::kConcurrentRadio);
  TEST_ASSERT_TRUE(BandPolicyFor(false) == BandPolicy::kRestrictedRadio);
  TEST_ASSERT_EQUAL_HEX8(kApBand2Ghz | kApBand5Ghz,
                         NormalizeApBand(kApBand5Ghz, true).band);
  TEST_ASSERT_EQUAL_HEX8(kApBand5Ghz, NormalizeApBand(kApBandAny, false).band);
}

void test_band_change_resets_channel(void) {
  ApConfig cfg;
  cfg.ssid = "ConfiguredAP";
  cfg.band = kApBand5Ghz;
  cfg.channel = 40;
  TEST_ASSERT_TRUE(NormalizeApConfigBand(cfg, BandPolicy::kConcurrentRadio));
  TEST_ASSERT_EQUAL_HEX8(kApBand2Ghz | kApBand5Ghz, cfg.band);
  TEST_ASSERT_EQUAL_UINT16(0, cfg.channel);
}

void test_unchanged_band_keeps_channel(void) {
  ApConfig cfg;
  cfg.ssid = "ConfiguredAP";
  cfg.band = kApBand2Ghz;
  cfg.channel = 6;
  TEST_ASSERT_FALSE(NormalizeApConfigBand(cfg, BandPolicy::kRestrictedRadio));
  TEST_ASSERT_EQUAL_HEX8(kApBand2Ghz, cfg.band);
  TEST_ASSERT_EQUAL_UINT16(6, cfg.channel);
}

void test_valid_band_masks(void) {
  TEST_ASSERT_TRUE(IsValidApBand(kApBand2Ghz));
  TEST_ASSERT_TRUE(IsValidApBand(kApBand2Ghz | kApBand5Ghz));
  TEST_ASSERT_TRUE(IsValidApBand(kApBandAny));
  TEST_ASSERT_FALSE(IsValidApBand(0));
  TEST_ASSERT_FALSE(IsValidApBand(0x08));
  TEST_ASSERT_FALSE(IsValidApBand(kApBand5Ghz | 0x80));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_restricted_radio_table);
  RUN_TEST(test_concurrent_radio_table);
  RUN_TEST(test_idempotent_for_all_masks);
  RUN_TEST(test_flag_selects_policy);
  RUN_TEST(test_band_change_resets_channel);
  RUN_TEST(test_unchanged_band_keeps_channel);
  RUN_TEST(test_valid_band_masks);
  return UNITY_END();
}
