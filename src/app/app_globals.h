#pragma once

#include <Arduino.h>
#include "app_config.h"
#include "app/persist_runtime.h"
#include "settings/nvs_legacy_source.h"
#include "settings/nvs_store.h"
#include "softap/ap_config_store.h"
#include "softap/esp_mac_provider.h"
#include "softap/esp_random_source.h"
#if defined(CONFIG_IDF_TARGET_ESP32C3)
#include <HWCDC.h>
// Route Serial logs to the native USB CDC/JTAG port on ESP32-C3.
#if defined(ARDUINO_USB_MODE) && (ARDUINO_USB_MODE == 1)
#ifndef Serial
#define Serial USBSerial
#endif
#endif
#endif

extern NvsStore g_nvs;
extern NvsApPersistence g_ap_persist;
extern NvsLegacyApSource g_legacy_ap_source;
extern EspRandomSource g_rng;
extern EspPersistentMacProvider g_mac_provider;
// Built on first use from AppConfig capabilities; call after g_nvs.begin().
ApConfigStore& ApStore();
