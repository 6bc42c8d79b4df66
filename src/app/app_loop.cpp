#include <Arduino.h>
#include <WiFi.h>

#include "app/app_globals.h"
#include "app/app_runtime.h"
#include "app/app_sleep.h"
#include "app/persist_runtime.h"
#include "config/logging.h"

namespace {

constexpr uint32_t kApRetryIntervalMs = 10000;
constexpr uint32_t kStatusLogIntervalMs = 30000;
constexpr uint32_t kLoopIdleMs = 10;

}  // namespace

void AppLoopTick() {
  const uint32_t now_ms = millis();
  static uint32_t last_retry_ms = 0;
  static uint32_t last_status_ms = 0;
  static uint8_t last_sta_count = 0;

  PersistRuntimeTick(now_ms);

  if (!AppSoftApRunning() && (now_ms - last_retry_ms) >= kApRetryIntervalMs) {
    last_retry_ms = now_ms;
    ApConfig cfg;
    const ApConfig stored = ApStore().getApConfig();
    if (!ApStore().randomizeBssidIfUnset(stored, cfg)) {
      cfg = stored;
    }
    LOGW("Retrying Wi-Fi AP start\r\n");
    AppStartSoftAp(cfg);
  }

  if (AppSoftApRunning()) {
    const uint8_t sta = WiFi.softAPgetStationNum();
    if (sta != last_sta_count) {
      LOGI("Wi-Fi AP stations: %u\r\n", static_cast<unsigned>(sta));
      last_sta_count = sta;
    }
  }

  if ((now_ms - last_status_ms) >= kStatusLogIntervalMs) {
    last_status_ms = now_ms;
    LOGV("[AP] running=%u commits=%lu backups=%lu heap=%u\r\n",
         AppSoftApRunning() ? 1u : 0u,
         static_cast<unsigned long>(g_ap_persist.commitCount()),
         static_cast<unsigned long>(g_ap_persist.backupChangeCount()),
         static_cast<unsigned>(ESP.getFreeHeap()));
  }

  AppSleepMs(kLoopIdleMs);
}
