#include "app/persist_runtime.h"
// SoftAP config NVS commit pacing.

#include "app/app_globals.h"
#include "app_config.h"
#include "config/factory_config.h"
#include "config/logging.h"

void NvsApPersistence::registerDataSource(IApConfigDataSource* source) {
  source_ = source;
}

void NvsApPersistence::requestPersist(bool dirty) {
  if (dirty) dirty_ = true;
}

void NvsApPersistence::notifyBackupChanged() {
  ++backup_changes_;
  if (kLogBackupNotifications) {
    LOGI("SoftAP config changed (backup #%lu)\r\n",
         static_cast<unsigned long>(backup_changes_));
  }
}

void NvsApPersistence::begin() {
  if (!source_) {
    LOGE("SoftAP persistence has no data source\r\n");
    return;
  }
  ApConfig stored;
  if (nvs_.loadApConfig(stored)) {
    source_->adopt(stored);
  } else {
    LOGI("No stored SoftAP config\r\n");
  }
  ready_ = true;
  source_->onReplayReady();
}

void NvsApPersistence::tick(uint32_t now_ms) {
  if (!ready_ || !dirty_ || !source_) return;
  const uint32_t since_commit =
      !attempted_ ? 0xFFFFFFFFu : (now_ms - last_commit_ms_);
  if (since_commit < AppConfig::kApPersistMinIntervalMs) return;

  // serialize() clears the source's new-data flag, so a failed commit is
  // retried from retry_ instead.
  if (!retry_ && !source_->hasNewDataToSerialize()) {
    dirty_ = false;
    return;
  }
  ApConfig cfg;
  if (!source_->serialize(cfg)) {
    dirty_ = false;
    return;
  }
  attempted_ = true;
  const uint32_t t0 = millis();
  if (!nvs_.saveApConfig(cfg)) {
    LOGE("SoftAP config commit failed\r\n");
    retry_ = true;
    last_commit_ms_ = now_ms;
    return;
  }
  LOGV("SoftAP config committed in %lu ms\r\n",
       static_cast<unsigned long>(millis() - t0));
  dirty_ = false;
  retry_ = false;
  ++commits_;
  last_commit_ms_ = millis();
}

void PersistRuntimeTick(uint32_t now_ms) { g_ap_persist.tick(now_ms); }
