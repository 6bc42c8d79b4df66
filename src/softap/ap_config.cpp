#include "softap/ap_config.h"

#include <cstdio>
#include <cstring>

bool operator==(const MacAddr& a, const MacAddr& b) {
  return memcmp(a.b, b.b, kMacLen) == 0;
}

bool operator!=(const MacAddr& a, const MacAddr& b) { return !(a == b); }

bool operator==(const ApConfig& a, const ApConfig& b) {
  if (a.has_bssid != b.has_bssid) return false;
  if (a.has_bssid && a.bssid != b.bssid) return false;
  return a.ssid == b.ssid && a.security == b.security &&
         a.passphrase == b.passphrase && a.band == b.band &&
         a.channel == b.channel && a.hidden_ssid == b.hidden_ssid &&
         a.max_clients == b.max_clients &&
         a.client_control_by_user == b.client_control_by_user;
}

bool operator!=(const ApConfig& a, const ApConfig& b) { return !(a == b); }

bool IsSaeSecurity(ApSecurity s) {
  return s == ApSecurity::kWpa3Sae || s == ApSecurity::kWpa3SaeTransition;
}

bool SecurityNeedsPassphrase(ApSecurity s) { return s != ApSecurity::kOpen; }

bool IsValidSecurityValue(uint8_t raw) {
  return raw <= static_cast<uint8_t>(ApSecurity::kWpa3SaeTransition);
}

const char* ApSecurityName(ApSecurity s) {
  switch (s) {
    case ApSecurity::kOpen:
      return "OPEN";
    case ApSecurity::kWpa2Psk:
      return "WPA2_PSK";
    case ApSecurity::kWpa3Sae:
      return "WPA3_SAE";
    case ApSecurity::kWpa3SaeTransition:
      return "WPA3_SAE_TRANSITION";
    default:
      return "?";
  }
}

const char* ApBandLabel(uint8_t band, char* out, size_t out_len) {
  if (!out || out_len == 0) return "";
  if (band == kApBandAny) {
    snprintf(out, out_len, "ANY");
    return out;
  }
  out[0] = '\0';
  size_t used = 0;
  struct BandName {
    uint8_t bit;
    const char* name;
  };
  static const BandName kNames[] = {
      {kApBand2Ghz, "2G"}, {kApBand5Ghz, "5G"}, {kApBand6Ghz, "6G"}};
  for (const auto& n : kNames) {
    if ((band & n.bit) == 0) continue;
    const int w = snprintf(out + used, out_len - used, "%s%s",
                           used ? "+" : "", n.name);
    if (w < 0 || static_cast<size_t>(w) >= out_len - used) break;
    used += static_cast<size_t>(w);
  }
  if (used == 0) {
    snprintf(out, out_len, "0x%02X", band);
  }
  return out;
}

void FormatMac(const MacAddr& mac, char* out, size_t out_len) {
  if (!out || out_len == 0) return;
  snprintf(out, out_len, "%02x:%02x:%02x:%02x:%02x:%02x", mac.b[0], mac.b[1],
           mac.b[2], mac.b[3], mac.b[4], mac.b[5]);
}

bool ParseMac(const char* s, MacAddr& out) {
  if (!s || strlen(s) != 17) return false;
  MacAddr tmp;
  for (size_t i = 0; i < kMacLen; ++i) {
    const char* p = s + i * 3;
    if (i > 0 && *(p - 1) != ':') return false;
    uint8_t v = 0;
    for (int k = 0; k < 2; ++k) {
      const char c = p[k];
      uint8_t nib = 0;
      if (c >= '0' && c <= '9') {
        nib = static_cast<uint8_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        nib = static_cast<uint8_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        nib = static_cast<uint8_t>(c - 'A' + 10);
      } else {
        return false;
      }
      v = static_cast<uint8_t>((v << 4) | nib);
    }
    tmp.b[i] = v;
  }
  out = tmp;
  return true;
}
