#pragma once

#include <Arduino.h>

#include "settings/nvs_store.h"
#include "softap/ap_ports.h"

// NVS-backed persistence for the SoftAP store. Write requests only mark the
// record dirty; PersistRuntimeTick commits the latest serialized value,
// at most once per AppConfig::kApPersistMinIntervalMs.
class NvsApPersistence : public IApPersistence {
 public:
  explicit NvsApPersistence(NvsStore& nvs) : nvs_(nvs) {}

  void registerDataSource(IApConfigDataSource* source) override;
  void requestPersist(bool dirty) override;
  void notifyBackupChanged() override;

  // Initial read: hands the stored record (if any) to the data source, then
  // opens the write path and signals replay.
  void begin();
  void tick(uint32_t now_ms);

  bool ready() const { return ready_; }
  uint32_t commitCount() const { return commits_; }
  uint32_t backupChangeCount() const { return backup_changes_; }

 private:
  NvsStore& nvs_;
  IApConfigDataSource* source_ = nullptr;
  bool ready_ = false;
  bool dirty_ = false;
  bool retry_ = false;
  bool attempted_ = false;
  uint32_t last_commit_ms_ = 0;
  uint32_t commits_ = 0;
  uint32_t backup_changes_ = 0;
};

void PersistRuntimeTick(uint32_t now_ms);
