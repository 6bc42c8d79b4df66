#include "softap/ap_band.h"

#include "config/logging.h"

namespace {

uint8_t RestrictedRadioBand(uint8_t band) {
  // One radio, one band. Anything touching 5 GHz (ANY included) settles on
  // 5 GHz; everything else falls back to 2.4 GHz.
  if ((band & kApBand5Ghz) != 0) return kApBand5Ghz;
  return kApBand2Ghz;
}

uint8_t ConcurrentRadioBand(uint8_t band) {
  if (band == kApBand5Ghz) return kApBand2Ghz | kApBand5Ghz;
  return band;
}

}  // namespace

bool IsValidApBand(uint8_t band) {
  return band != 0 && (band & static_cast<uint8_t>(~kApBandAny)) == 0;
}

BandNormalizeResult NormalizeApBand(uint8_t band, BandPolicy policy) {
  BandNormalizeResult r;
  switch (policy) {
    case BandPolicy::kRestrictedRadio:
      r.band = RestrictedRadioBand(band);
      break;
    case BandPolicy::kConcurrentRadio:
      r.band = ConcurrentRadioBand(band);
      break;
    default:
      r.band = band;
      break;
  }
  r.changed = (r.band != band);
  return r;
}

BandNormalizeResult NormalizeApBand(uint8_t band,
                                    bool device_converts_5ghz_to_any) {
  return NormalizeApBand(band, BandPolicyFor(device_converts_5ghz_to_any));
}

bool NormalizeApConfigBand(ApConfig& cfg, BandPolicy policy) {
  const BandNormalizeResult r = NormalizeApBand(cfg.band, policy);
  if (!r.changed) return false;
  char from[16];
  char to[16];
  LOGW("SoftAP band %s not supported by radio, converting to %s\r\n",
       ApBandLabel(cfg.band, from, sizeof(from)),
       ApBandLabel(r.band, to, sizeof(to)));
  (void)from;
  (void)to;
  cfg.band = r.band;
  cfg.channel = 0;
  return true;
}
