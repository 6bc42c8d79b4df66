#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "softap/ap_channel_list.h"

// Band bitmask. kApBandAny is a request-time sentinel ("let the normalizer
// pick"), not a fourth band.
constexpr uint8_t kApBand2Ghz = 0x01;
constexpr uint8_t kApBand5Ghz = 0x02;
constexpr uint8_t kApBand6Ghz = 0x04;
constexpr uint8_t kApBandAny = kApBand2Ghz | kApBand5Ghz | kApBand6Ghz;

constexpr size_t kSsidMinLen = 1;
constexpr size_t kSsidMaxLen = 32;
constexpr size_t kPskMinLen = 8;
constexpr size_t kPskMaxLen = 63;

constexpr size_t kMacLen = 6;

// Values are persisted in NVS (ap_sec); do not renumber.
enum class ApSecurity : uint8_t {
  kOpen = 0,
  kWpa2Psk = 1,
  kWpa3Sae = 2,
  kWpa3SaeTransition = 3,
};

struct MacAddr {
  uint8_t b[kMacLen] = {0, 0, 0, 0, 0, 0};
};

struct ApConfig {
  std::string ssid;  // UTF-8 bytes
  bool has_bssid = false;
  MacAddr bssid;
  ApSecurity security = ApSecurity::kOpen;
  std::string passphrase;  // empty = absent
  uint8_t band = kApBand2Ghz;
  uint16_t channel = 0;  // 0 = automatic
  bool hidden_ssid = false;
  uint16_t max_clients = 0;  // 0 = unlimited
  bool client_control_by_user = false;
};

struct ApCapabilities {
  bool convert_5ghz_to_any = false;
  bool sae_supported = false;
  bool mac_randomization_supported = false;
  bool client_force_disconnect_supported = false;
  ChannelAllowlist allowed_2g_channels;
};

struct ApNamingTemplates {
  std::string tether_ssid_prefix;
  std::string lohs_ssid_prefix;
  std::string mac_randomization_salt;
};

bool operator==(const MacAddr& a, const MacAddr& b);
bool operator!=(const MacAddr& a, const MacAddr& b);
bool operator==(const ApConfig& a, const ApConfig& b);
bool operator!=(const ApConfig& a, const ApConfig& b);

bool IsSaeSecurity(ApSecurity s);
bool SecurityNeedsPassphrase(ApSecurity s);
bool IsValidSecurityValue(uint8_t raw);
const char* ApSecurityName(ApSecurity s);
// Short band label for logs ("2G", "5G", "2G+5G", "ANY", ...); writes into
// out and returns it.
const char* ApBandLabel(uint8_t band, char* out, size_t out_len);

// "aa:bb:cc:dd:ee:ff". out_len must be >= 18.
void FormatMac(const MacAddr& mac, char* out, size_t out_len);
bool ParseMac(const char* s, MacAddr& out);
