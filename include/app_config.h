#pragma once

#include <stdint.h>

// Device capability flags for the SoftAP store. Each flag can be overridden
// from the build (e.g. -DSOFTAP_SAE_SUPPORTED=1) for boards whose radio
// firmware differs from the default ESP32 profile.
#ifndef SOFTAP_CONVERT_5GHZ_TO_ANY
#define SOFTAP_CONVERT_5GHZ_TO_ANY 0
#endif
#ifndef SOFTAP_SAE_SUPPORTED
#define SOFTAP_SAE_SUPPORTED 1
#endif
#ifndef SOFTAP_MAC_RANDOMIZATION_SUPPORTED
#define SOFTAP_MAC_RANDOMIZATION_SUPPORTED 1
#endif
#ifndef SOFTAP_CLIENT_FORCE_DISCONNECT_SUPPORTED
#define SOFTAP_CLIENT_FORCE_DISCONNECT_SUPPORTED 1
#endif
#ifndef SOFTAP_LEGACY_MIGRATION_ENABLED
#define SOFTAP_LEGACY_MIGRATION_ENABLED 1
#endif

namespace AppConfig {

// Radio can run 2.4 GHz and 5 GHz at the same time; a 5 GHz-only request is
// widened to 2.4+5 GHz. False means a single radio (ANY collapses to 5 GHz).
constexpr bool kConvertApBand5GhzToAny = (SOFTAP_CONVERT_5GHZ_TO_ANY != 0);
constexpr bool kSoftApSaeSupported = (SOFTAP_SAE_SUPPORTED != 0);
constexpr bool kApMacRandomizationSupported =
    (SOFTAP_MAC_RANDOMIZATION_SUPPORTED != 0);
constexpr bool kClientForceDisconnectSupported =
    (SOFTAP_CLIENT_FORCE_DISCONNECT_SUPPORTED != 0);
constexpr bool kLegacyMigrationEnabled = (SOFTAP_LEGACY_MIGRATION_ENABLED != 0);

// Channels allowed for an explicit 2.4 GHz AP channel ("1,6,11" or "1-11").
constexpr const char* kSoftAp2gChannelList = "1-11";

// SSID templates: "<prefix>_NNNN".
constexpr const char* kTetherSsidPrefix = "AndroidAP";
constexpr const char* kLocalOnlySsidPrefix = "AndroidShare";
// Mixed into the persistent BSSID hash so other products on the same
// silicon derive different addresses.
constexpr const char* kApMacRandomizationSalt = "softap-bssid-v1";

// AP network settings used when the stored config is applied.
constexpr uint8_t kApIp[4] = {192, 168, 4, 1};
constexpr uint8_t kApNetmask[4] = {255, 255, 255, 0};
// ESP32 SoftAP hard limit; 0 in the stored config means "no limit" and maps
// to this.
constexpr uint8_t kApMaxConnectionsHw = 10;

// Minimum spacing between NVS commits of the AP config (ms).
constexpr uint32_t kApPersistMinIntervalMs = 2000;

constexpr uint32_t kSerialBaud = 115200;

}  // namespace AppConfig
