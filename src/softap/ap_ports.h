#pragma once

#include <stdint.h>

#include <string>

#include "softap/ap_config.h"

// Collaborator interfaces consumed by the SoftAP store. Device
// implementations live in settings/, app/ and softap/esp_*; tests use the
// fakes in test/support.

class IRandomSource {
 public:
  virtual ~IRandomSource() = default;
  // Uniform integer in [0, bound). bound > 0.
  virtual uint32_t uniform(uint32_t bound) = 0;
};

class IPersistentMacProvider {
 public:
  virtual ~IPersistentMacProvider() = default;
  // Same identity/salt must give the same MAC across calls and reboots.
  virtual bool derive(const std::string& identity, const std::string& salt,
                      MacAddr& out) = 0;
};

class ILegacyApSource {
 public:
  virtual ~ILegacyApSource() = default;
  virtual bool exists() = 0;
  virtual bool read(std::string& bytes) = 0;
  virtual bool remove() = 0;
};

// Implemented by the store; the persistence backend pulls/pushes through it.
class IApConfigDataSource {
 public:
  virtual ~IApConfigDataSource() = default;
  // False while nothing has been loaded or generated yet.
  virtual bool serialize(ApConfig& out) = 0;
  virtual void adopt(const ApConfig& cfg) = 0;
  // Backend finished its initial read and accepts writes from now on.
  virtual void onReplayReady() = 0;
  virtual bool hasNewDataToSerialize() const = 0;
};

class IApPersistence {
 public:
  virtual ~IApPersistence() = default;
  virtual void registerDataSource(IApConfigDataSource* source) = 0;
  virtual void requestPersist(bool dirty) = 0;
  virtual void notifyBackupChanged() = 0;
};
