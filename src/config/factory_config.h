#pragma once
// Factory-level configuration: firmware identity and log switches.
// Notes:
// - ASCII only
#include "app_config.h"

// Firmware metadata (printed in the boot banner).
#ifdef SOFTAP_FW_VERSION
constexpr const char* kFirmwareVersion = SOFTAP_FW_VERSION;
#else
constexpr const char* kFirmwareVersion = "0.3.0";
#endif
#ifdef SOFTAP_BUILD_ID
constexpr const char* kBuildId = SOFTAP_BUILD_ID;
#else
constexpr const char* kBuildId = "dev";
#endif

// Verbose serial logs (default false; override with -DSOFTAP_VERBOSE_LOGS=1).
#ifndef SOFTAP_VERBOSE_LOGS
#define SOFTAP_VERBOSE_LOGS 0
#endif
constexpr bool kEnableVerboseSerialLogs = (SOFTAP_VERBOSE_LOGS != 0);
// Log every backup-changed notification (noisy during migration replay).
constexpr bool kLogBackupNotifications = true;
