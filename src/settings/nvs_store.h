#pragma once

#include <Arduino.h>

#include <string>

#include "softap/ap_config.h"

#ifndef NVS_VERIFY_WRITES
#define NVS_VERIFY_WRITES 0
#endif

class Preferences;

class NvsStore {
 public:
  NvsStore();
  bool begin();

  // false when no config has been saved yet or the stored record is
  // unusable (unknown schema, bad security value, missing SSID).
  bool loadApConfig(ApConfig& out);
  bool saveApConfig(const ApConfig& in);

  bool hasLegacyApBlob();
  bool loadLegacyApBlob(std::string& out);
  bool clearLegacyApBlob();

  bool factoryResetClearAll();

 private:
  bool ready_;
  static constexpr const char* kNamespace = "softap";
  static constexpr uint8_t kApSchemaVersion = 1;
  static constexpr size_t kLegacyBlobMaxLen = 512;
  static constexpr const char* kKeyApVer = "ap_ver";
  static constexpr const char* kKeyApSsid = "ap_ssid";
  static constexpr const char* kKeyApPass = "ap_pass";
  static constexpr const char* kKeyApSec = "ap_sec";
  static constexpr const char* kKeyApBand = "ap_band";
  static constexpr const char* kKeyApChan = "ap_chan";
  static constexpr const char* kKeyApHidden = "ap_hidden";
  static constexpr const char* kKeyApMaxClients = "ap_maxcl";
  static constexpr const char* kKeyApClientCtl = "ap_ccu";
  static constexpr const char* kKeyApBssid = "ap_bssid";
  static constexpr const char* kKeyLegacyAp = "ap_cfg_v1";

  static bool PutUCharChecked(Preferences& prefs, const char* key, uint8_t value);
  static bool PutUShortChecked(Preferences& prefs, const char* key, uint16_t value);
  static bool PutBoolChecked(Preferences& prefs, const char* key, bool value);
  static bool PutStringChecked(Preferences& prefs, const char* key, const char* value);
  static bool PutBytesChecked(Preferences& prefs, const char* key,
                              const uint8_t* data, size_t len);
};
