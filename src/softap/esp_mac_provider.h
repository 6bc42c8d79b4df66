#pragma once

#include <string>

#include "softap/ap_config.h"
#include "softap/ap_ports.h"

// Persistent per-SSID BSSID: SHA-256(factory MAC | identity | salt),
// truncated to 6 bytes, marked locally administered and unicast.
class EspPersistentMacProvider : public IPersistentMacProvider {
 public:
  bool derive(const std::string& identity, const std::string& salt,
              MacAddr& out) override;
};
