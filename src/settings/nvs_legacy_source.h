#pragma once

#include <string>

#include "settings/nvs_store.h"
#include "softap/ap_ports.h"

// Legacy hotspot record kept as a single NVS blob by older firmware.
class NvsLegacyApSource : public ILegacyApSource {
 public:
  explicit NvsLegacyApSource(NvsStore& nvs) : nvs_(nvs) {}

  bool exists() override { return nvs_.hasLegacyApBlob(); }
  bool read(std::string& bytes) override { return nvs_.loadLegacyApBlob(bytes); }
  bool remove() override { return nvs_.clearLegacyApBlob(); }

 private:
  NvsStore& nvs_;
};
