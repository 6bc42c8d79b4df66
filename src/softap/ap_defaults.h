#pragma once

#include <stdint.h>

#include <string>

#include "softap/ap_config.h"
#include "softap/ap_ports.h"

constexpr uint32_t kDefaultSsidSuffixMin = 1000;
constexpr uint32_t kDefaultSsidSuffixMax = 9999;
constexpr size_t kDefaultPassphraseLen = 15;
constexpr const char* kFallbackSsidPrefix = "AndroidAP";

// "<prefix>_NNNN", WPA3 transition if SAE is supported else WPA2, random
// 15-char alphanumeric passphrase, visible, no client limit. band is taken
// as given; the store normalizes it on the next read/write.
ApConfig GenerateDefaultApConfig(const ApCapabilities& caps,
                                 const std::string& name_prefix, uint8_t band,
                                 IRandomSource& rng);

// Local-only hotspot config on the requested band. Fields set in custom
// (BSSID, SSID, security+passphrase) override the generated ones.
ApConfig GenerateLocalOnlyHotspotConfig(const ApCapabilities& caps,
                                        const ApNamingTemplates& names,
                                        uint8_t band, const ApConfig* custom,
                                        IRandomSource& rng);
