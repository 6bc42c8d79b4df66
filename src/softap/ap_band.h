#pragma once

#include <stdint.h>

#include "softap/ap_config.h"

// Which band rule table applies. Picked once from the device's
// "convert 5 GHz to any" capability.
enum class BandPolicy : uint8_t {
  kRestrictedRadio = 0,  // single radio: ANY -> 5G, non-5G multiband -> 2G
  kConcurrentRadio = 1,  // 2.4+5 concurrent: 5G-only widened to 2G+5G
};

struct BandNormalizeResult {
  uint8_t band = 0;
  bool changed = false;
};

constexpr BandPolicy BandPolicyFor(bool device_converts_5ghz_to_any) {
  return device_converts_5ghz_to_any ? BandPolicy::kConcurrentRadio
                                     : BandPolicy::kRestrictedRadio;
}

// Non-empty and no bits outside kApBandAny.
bool IsValidApBand(uint8_t band);

BandNormalizeResult NormalizeApBand(uint8_t band, BandPolicy policy);
BandNormalizeResult NormalizeApBand(uint8_t band,
                                    bool device_converts_5ghz_to_any);

// Applies NormalizeApBand to cfg.band. A changed band drops any explicit
// channel (channel is only valid for the band it was picked on).
// Returns true if cfg was modified.
bool NormalizeApConfigBand(ApConfig& cfg, BandPolicy policy);
