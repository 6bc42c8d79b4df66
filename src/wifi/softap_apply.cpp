#include "wifi/softap_apply.h"

#include <Arduino.h>
#include <WiFi.h>
#include <esp_wifi.h>

#include "app/app_sleep.h"
#include "app_config.h"
#include "config/logging.h"
#include "softap/ap_channel_list.h"

namespace {

uint8_t MaxConnections(const ApConfig& cfg) {
  if (cfg.max_clients == 0 || cfg.max_clients > AppConfig::kApMaxConnectionsHw) {
    return AppConfig::kApMaxConnectionsHw;
  }
  return static_cast<uint8_t>(cfg.max_clients);
}

wifi_auth_mode_t AuthModeFor(ApSecurity s) {
  switch (s) {
    case ApSecurity::kOpen:
      return WIFI_AUTH_OPEN;
    case ApSecurity::kWpa3Sae:
      return WIFI_AUTH_WPA3_PSK;
    case ApSecurity::kWpa3SaeTransition:
      return WIFI_AUTH_WPA2_WPA3_PSK;
    case ApSecurity::kWpa2Psk:
    default:
      return WIFI_AUTH_WPA2_PSK;
  }
}

// softAP() always starts WPA2 when a passphrase is given; SAE modes are
// switched on afterwards through the IDF config.
bool ApplyAuthMode(ApSecurity s) {
  const wifi_auth_mode_t want = AuthModeFor(s);
  if (want == WIFI_AUTH_OPEN || want == WIFI_AUTH_WPA2_PSK) return true;
  wifi_config_t conf{};
  esp_err_t err = esp_wifi_get_config(WIFI_IF_AP, &conf);
  if (err != ESP_OK) {
    LOGE("Wi-Fi AP get config failed (%d)\r\n", static_cast<int>(err));
    return false;
  }
  conf.ap.authmode = want;
  conf.ap.pmf_cfg.required = (want == WIFI_AUTH_WPA3_PSK);
  conf.ap.pmf_cfg.capable = true;
  err = esp_wifi_set_config(WIFI_IF_AP, &conf);
  if (err != ESP_OK) {
    LOGE("Wi-Fi AP auth mode %s failed (%d)\r\n", ApSecurityName(s),
         static_cast<int>(err));
    return false;
  }
  return true;
}

}  // namespace

bool SoftApStart(const ApConfig& cfg, const ChannelAllowlist& allowed_2g) {
  WiFi.persistent(false);
  WiFi.softAPdisconnect(true);
  WiFi.mode(WIFI_OFF);
  AppSleepMs(100);

  WiFi.mode(WIFI_AP);
  WiFi.setSleep(false);
  if ((cfg.band & kApBand2Ghz) == 0) {
    char label[12];
    LOGW("Wi-Fi AP band %s not available on this radio, using 2.4 GHz\r\n",
         ApBandLabel(cfg.band, label, sizeof(label)));
  }
  if (cfg.has_bssid) {
    const esp_err_t err = esp_wifi_set_mac(WIFI_IF_AP, cfg.bssid.b);
    if (err != ESP_OK) {
      LOGW("Wi-Fi AP BSSID not applied (%d), using factory MAC\r\n",
           static_cast<int>(err));
    }
  }

  const IPAddress ip(AppConfig::kApIp[0], AppConfig::kApIp[1],
                     AppConfig::kApIp[2], AppConfig::kApIp[3]);
  const IPAddress mask(AppConfig::kApNetmask[0], AppConfig::kApNetmask[1],
                       AppConfig::kApNetmask[2], AppConfig::kApNetmask[3]);
  if (!WiFi.softAPConfig(ip, ip, mask)) {
    LOGE("Wi-Fi AP config failed\r\n");
  }

  const uint8_t channel = PickStartChannel(cfg.channel, allowed_2g);
  if (cfg.channel != 0 && cfg.channel != channel) {
    LOGW("Wi-Fi AP channel %u not allowed, using %u\r\n",
         static_cast<unsigned>(cfg.channel), static_cast<unsigned>(channel));
  }
  const char* pass =
      cfg.security == ApSecurity::kOpen ? nullptr : cfg.passphrase.c_str();
  const bool ok = WiFi.softAP(cfg.ssid.c_str(), pass, channel,
                              cfg.hidden_ssid ? 1 : 0, MaxConnections(cfg));
  if (!ok) {
    LOGE("Wi-Fi AP start failed\r\n");
    return false;
  }
  if (!ApplyAuthMode(cfg.security)) {
    SoftApStop();
    return false;
  }
  LOGI("Wi-Fi AP started: SSID=%s sec=%s ch=%u hidden=%u bssid=%s IP=%s\r\n",
       cfg.ssid.c_str(), ApSecurityName(cfg.security),
       static_cast<unsigned>(channel), cfg.hidden_ssid ? 1u : 0u,
       WiFi.softAPmacAddress().c_str(), WiFi.softAPIP().toString().c_str());
  return true;
}

void SoftApStop() {
  WiFi.softAPdisconnect(true);
  WiFi.mode(WIFI_OFF);
}
