#include "settings/nvs_store.h"

#include <Preferences.h>
#include <cstring>

#include "config/logging.h"

bool NvsStore::PutUCharChecked(Preferences& prefs, const char* key, uint8_t value) {
  if (prefs.putUChar(key, value) == 0) return false;
#if NVS_VERIFY_WRITES
  const uint8_t got = prefs.getUChar(key, static_cast<uint8_t>(value ^ 0xFFu));
  if (got != value) {
    LOGE("NVS verify failed: %s\r\n", key);
    return false;
  }
#endif
  return true;
}

bool NvsStore::PutUShortChecked(Preferences& prefs, const char* key, uint16_t value) {
  if (prefs.putUShort(key, value) == 0) return false;
#if NVS_VERIFY_WRITES
  const uint16_t got =
      prefs.getUShort(key, static_cast<uint16_t>(value ^ 0xFFFFu));
  if (got != value) {
    LOGE("NVS verify failed: %s\r\n", key);
    return false;
  }
#endif
  return true;
}

bool NvsStore::PutBoolChecked(Preferences& prefs, const char* key, bool value) {
  if (prefs.putBool(key, value) == 0) return false;
#if NVS_VERIFY_WRITES
  const bool got = prefs.getBool(key, !value);
  if (got != value) {
    LOGE("NVS verify failed: %s\r\n", key);
    return false;
  }
#endif
  return true;
}

bool NvsStore::PutStringChecked(Preferences& prefs, const char* key, const char* value) {
  const char* expected = value ? value : "";
  const size_t expected_len = strlen(expected);
  if (prefs.putString(key, expected) != expected_len) return false;
#if NVS_VERIFY_WRITES
  String got = prefs.getString(key, "\x01");
  if (got.length() != expected_len || !got.equals(expected)) {
    LOGE("NVS verify failed: %s\r\n", key);
    return false;
  }
#endif
  return true;
}

bool NvsStore::PutBytesChecked(Preferences& prefs, const char* key,
                               const uint8_t* data, size_t len) {
  if (prefs.putBytes(key, data, len) != len) return false;
#if NVS_VERIFY_WRITES
  uint8_t got[kMacLen] = {0};
  if (len <= sizeof(got)) {
    if (prefs.getBytes(key, got, sizeof(got)) != len ||
        memcmp(got, data, len) != 0) {
      LOGE("NVS verify failed: %s\r\n", key);
      return false;
    }
  }
#endif
  return true;
}

NvsStore::NvsStore() : ready_(false) {}

bool NvsStore::begin() {
  Preferences prefs;
  ready_ = prefs.begin(kNamespace, false);
  prefs.end();
  return ready_;
}

bool NvsStore::loadApConfig(ApConfig& out) {
  Preferences prefs;
  if (!prefs.begin(kNamespace, true)) {
    return false;
  }
  if (!prefs.isKey(kKeyApVer)) {
    prefs.end();
    return false;
  }
  const uint8_t ver = prefs.getUChar(kKeyApVer, 0);
  if (ver != kApSchemaVersion) {
    prefs.end();
    LOGW("NVS SoftAP schema %u unsupported\r\n", static_cast<unsigned>(ver));
    return false;
  }
  const uint8_t sec = prefs.getUChar(kKeyApSec, 0xFF);
  if (!IsValidSecurityValue(sec)) {
    prefs.end();
    LOGW("NVS SoftAP security %u invalid\r\n", static_cast<unsigned>(sec));
    return false;
  }
  ApConfig cfg;
  cfg.ssid = prefs.getString(kKeyApSsid, "").c_str();
  cfg.passphrase = prefs.getString(kKeyApPass, "").c_str();
  cfg.security = static_cast<ApSecurity>(sec);
  cfg.band = prefs.getUChar(kKeyApBand, kApBand2Ghz);
  cfg.channel = prefs.getUShort(kKeyApChan, 0);
  cfg.hidden_ssid = prefs.getBool(kKeyApHidden, false);
  cfg.max_clients = prefs.getUShort(kKeyApMaxClients, 0);
  cfg.client_control_by_user = prefs.getBool(kKeyApClientCtl, false);
  if (prefs.isKey(kKeyApBssid)) {
    cfg.has_bssid =
        prefs.getBytes(kKeyApBssid, cfg.bssid.b, kMacLen) == kMacLen;
  }
  prefs.end();
  if (cfg.ssid.empty()) {
    LOGW("NVS SoftAP record has no SSID\r\n");
    return false;
  }
  out = cfg;
  return true;
}

bool NvsStore::saveApConfig(const ApConfig& in) {
  Preferences prefs;
  if (!prefs.begin(kNamespace, false)) {
    return false;
  }
  bool ok = true;
  // Version is dropped first and written last so a torn save reads back as
  // "no record" instead of a mix of old and new fields.
  if (prefs.isKey(kKeyApVer)) ok &= prefs.remove(kKeyApVer);
  ok &= PutStringChecked(prefs, kKeyApSsid, in.ssid.c_str());
  if (in.passphrase.empty()) {
    if (prefs.isKey(kKeyApPass)) ok &= prefs.remove(kKeyApPass);
  } else {
    ok &= PutStringChecked(prefs, kKeyApPass, in.passphrase.c_str());
  }
  ok &= PutUCharChecked(prefs, kKeyApSec, static_cast<uint8_t>(in.security));
  ok &= PutUCharChecked(prefs, kKeyApBand, in.band);
  ok &= PutUShortChecked(prefs, kKeyApChan, in.channel);
  ok &= PutBoolChecked(prefs, kKeyApHidden, in.hidden_ssid);
  ok &= PutUShortChecked(prefs, kKeyApMaxClients, in.max_clients);
  ok &= PutBoolChecked(prefs, kKeyApClientCtl, in.client_control_by_user);
  if (in.has_bssid) {
    ok &= PutBytesChecked(prefs, kKeyApBssid, in.bssid.b, kMacLen);
  } else if (prefs.isKey(kKeyApBssid)) {
    ok &= prefs.remove(kKeyApBssid);
  }
  ok &= PutUCharChecked(prefs, kKeyApVer, kApSchemaVersion);
  prefs.end();
  if (!ok) {
    LOGE("NVS SoftAP save failed\r\n");
  }
  return ok;
}

bool NvsStore::hasLegacyApBlob() {
  Preferences prefs;
  if (!prefs.begin(kNamespace, true)) {
    return false;
  }
  const bool present = prefs.isKey(kKeyLegacyAp);
  prefs.end();
  return present;
}

bool NvsStore::loadLegacyApBlob(std::string& out) {
  Preferences prefs;
  if (!prefs.begin(kNamespace, true)) {
    return false;
  }
  const size_t len = prefs.getBytesLength(kKeyLegacyAp);
  if (len == 0 || len > kLegacyBlobMaxLen) {
    prefs.end();
    return false;
  }
  uint8_t buf[kLegacyBlobMaxLen];
  const size_t got = prefs.getBytes(kKeyLegacyAp, buf, sizeof(buf));
  prefs.end();
  if (got != len) return false;
  out.assign(reinterpret_cast<const char*>(buf), got);
  return true;
}

bool NvsStore::clearLegacyApBlob() {
  Preferences prefs;
  if (!prefs.begin(kNamespace, false)) {
    return false;
  }
  const bool removed = prefs.remove(kKeyLegacyAp);
  prefs.end();
  return removed;
}

bool NvsStore::factoryResetClearAll() {
  Preferences prefs;
  if (!prefs.begin(kNamespace, false)) {
    return false;
  }
  const bool ok = prefs.clear();
  prefs.end();
  return ok;
}
