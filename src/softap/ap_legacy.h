#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "softap/ap_config.h"
#include "softap/ap_ports.h"

// Legacy hotspot record, big-endian:
//   int32 version, str ssid, [v>=2] int32 band, int32 channel,
//   [v>=3] bool hidden, int32 auth, [auth != NONE] str passphrase
// where str is a uint16 byte length followed by UTF-8 bytes.
constexpr int32_t kLegacyApVersionMin = 1;
constexpr int32_t kLegacyApVersionMax = 3;

constexpr int32_t kLegacyBand2Ghz = 0;
constexpr int32_t kLegacyBand5Ghz = 1;
constexpr int32_t kLegacyBandAny = -1;

constexpr int32_t kLegacyAuthNone = 0;
constexpr int32_t kLegacyAuthWpaPsk = 1;
constexpr int32_t kLegacyAuthWpaEap = 2;
constexpr int32_t kLegacyAuthIeee8021x = 3;
constexpr int32_t kLegacyAuthWpa2Psk = 4;

struct LegacyApRecord {
  int32_t version = 0;
  std::string ssid;
  int32_t band = kLegacyBand2Ghz;
  int32_t channel = 0;
  bool hidden = false;
  int32_t auth_type = kLegacyAuthNone;
  std::string passphrase;
};

bool ParseLegacyApRecord(const uint8_t* data, size_t len, LegacyApRecord& out,
                         char* err = nullptr, size_t err_len = 0);

uint8_t LegacyBandToApBand(int32_t legacy_band);

// Maps a parsed record to the current config. Fails on auth types with no
// SoftAP equivalent (EAP) and on records that do not pass ValidateApConfig.
bool ConvertLegacyApRecord(const LegacyApRecord& rec, ApConfig& out,
                           char* err = nullptr, size_t err_len = 0);

// One-shot: read, parse, convert, then delete the source. On any failure
// nothing is written to out and the source is left in place.
bool MigrateLegacyApConfig(ILegacyApSource& source, ApConfig& out);
