#include <Arduino.h>

#include "app/app_globals.h"
#include "app/app_runtime.h"
#include "app/persist_runtime.h"
#include "settings/nvs_legacy_source.h"
#include "settings/nvs_store.h"
#include "softap/esp_mac_provider.h"
#include "softap/esp_random_source.h"

NvsStore g_nvs;
NvsApPersistence g_ap_persist(g_nvs);
NvsLegacyApSource g_legacy_ap_source(g_nvs);
EspRandomSource g_rng;
EspPersistentMacProvider g_mac_provider;

void setup() { AppSetup(); }
void loop() { AppLoopTick(); }
