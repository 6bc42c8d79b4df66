#include "softap/ap_bssid.h"

#include "config/logging.h"

bool ResolveApBssid(const ApConfig& candidate,
                    bool mac_randomization_supported,
                    IPersistentMacProvider& provider, const std::string& salt,
                    BssidResolution& out) {
  if (candidate.has_bssid) {
    out.has_bssid = true;
    out.bssid = candidate.bssid;
    return true;
  }
  if (!mac_randomization_supported) {
    out.has_bssid = false;
    out.bssid = MacAddr{};
    return true;
  }
  MacAddr mac;
  if (!provider.derive(candidate.ssid, salt, mac)) {
    LOGE("SoftAP persistent BSSID derivation failed\r\n");
    return false;
  }
  out.has_bssid = true;
  out.bssid = mac;
  return true;
}
