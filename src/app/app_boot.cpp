#include <Arduino.h>
#include <bootloader_random.h>

#include "app/app_globals.h"
#include "app/app_runtime.h"
#include "app/app_sleep.h"
#include "app_config.h"
#include "config/factory_config.h"
#include "config/logging.h"
#include "pins.h"
#include "softap/ap_channel_list.h"
#include "wifi/softap_apply.h"

namespace {

constexpr uint32_t kFactoryResetHoldMs = 3000;
constexpr uint32_t kFactoryResetPollMs = 20;

bool g_ap_running = false;

// Button must stay pressed for the whole window; any release cancels.
bool FactoryResetRequested() {
  pinMode(Pins::kButton, INPUT_PULLUP);
  if (digitalRead(Pins::kButton) != LOW) return false;
  LOGW("Button held at boot, keep holding to reset SoftAP config\r\n");
  const uint32_t start = millis();
  while ((millis() - start) < kFactoryResetHoldMs) {
    if (digitalRead(Pins::kButton) != LOW) {
      LOGI("Factory reset cancelled\r\n");
      return false;
    }
    AppSleepMs(kFactoryResetPollMs);
  }
  return true;
}

const ApCapabilities& DeviceApCapabilities() {
  static const ApCapabilities caps = BuildApCapabilities();
  return caps;
}

}  // namespace

ApCapabilities BuildApCapabilities() {
  ApCapabilities caps;
  caps.convert_5ghz_to_any = AppConfig::kConvertApBand5GhzToAny;
  caps.sae_supported = AppConfig::kSoftApSaeSupported;
  caps.mac_randomization_supported = AppConfig::kApMacRandomizationSupported;
  caps.client_force_disconnect_supported =
      AppConfig::kClientForceDisconnectSupported;
  char err[16] = {0};
  if (!ParseChannelAllowlist(AppConfig::kSoftAp2gChannelList,
                             caps.allowed_2g_channels, err, sizeof(err))) {
    LOGE("2.4 GHz channel list \"%s\" invalid (%s), not restricting\r\n",
         AppConfig::kSoftAp2gChannelList, err);
    caps.allowed_2g_channels = ChannelAllowlist{};
  }
  return caps;
}

ApNamingTemplates BuildApNamingTemplates() {
  ApNamingTemplates names;
  names.tether_ssid_prefix = AppConfig::kTetherSsidPrefix;
  names.lohs_ssid_prefix = AppConfig::kLocalOnlySsidPrefix;
  names.mac_randomization_salt = AppConfig::kApMacRandomizationSalt;
  return names;
}

ApConfigStore& ApStore() {
  static ApConfigStore store(
      g_ap_persist, DeviceApCapabilities(), BuildApNamingTemplates(), g_rng,
      g_mac_provider,
      AppConfig::kLegacyMigrationEnabled ? &g_legacy_ap_source : nullptr);
  return store;
}

void AppSetup() {
  Serial.begin(AppConfig::kSerialBaud);
  LOGI("FW %s (%s) BUILD: %s %s\r\n", kFirmwareVersion, kBuildId, __DATE__,
       __TIME__);

  if (!g_nvs.begin()) {
    LOGE("NVS namespace unavailable, SoftAP config will not persist\r\n");
  }
  if (FactoryResetRequested()) {
    LOGW("FACTORY RESET: wiping SoftAP config and rebooting...\r\n");
    if (!g_nvs.factoryResetClearAll()) {
      LOGE("Factory reset failed\r\n");
    }
    AppSleepMs(200);
    ESP.restart();
  }

  ApConfigStore& store = ApStore();
  LOGI("SoftAP band policy: %s\r\n",
       store.bandPolicy() == BandPolicy::kConcurrentRadio ? "concurrent"
                                                          : "restricted");
  g_ap_persist.begin();

  // Radio is still off here, so esp_random() needs the bootloader entropy
  // source if this read generates the default. It must be off again before
  // Wi-Fi starts.
  bootloader_random_enable();
  const ApConfig stored = store.getApConfig();
  bootloader_random_disable();
  ApConfig cfg;
  if (!store.randomizeBssidIfUnset(stored, cfg)) {
    LOGW("SoftAP starting with factory BSSID\r\n");
    cfg = stored;
  }
  AppStartSoftAp(cfg);
}

bool AppStartSoftAp(const ApConfig& cfg) {
  g_ap_running = SoftApStart(cfg, DeviceApCapabilities().allowed_2g_channels);
  return g_ap_running;
}

bool AppSoftApRunning() { return g_ap_running; }
