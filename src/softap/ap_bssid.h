#pragma once

#include <string>

#include "softap/ap_config.h"
#include "softap/ap_ports.h"

struct BssidResolution {
  bool has_bssid = false;  // false: leave the factory MAC in place
  MacAddr bssid;
};

// Caller-set BSSID wins. Otherwise, with randomization supported, derive a
// persistent MAC from (ssid, salt); otherwise no assignment.
// Returns false only when the MAC provider fails; out is untouched then.
bool ResolveApBssid(const ApConfig& candidate,
                    bool mac_randomization_supported,
                    IPersistentMacProvider& provider, const std::string& salt,
                    BssidResolution& out);
