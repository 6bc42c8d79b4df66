#pragma once

#include <stdint.h>

#include "softap/ap_config.h"

void AppSetup();
void AppLoopTick();
bool AppStartSoftAp(const ApConfig& cfg);
bool AppSoftApRunning();

// Capabilities from AppConfig; a malformed channel list is logged and
// leaves 2.4 GHz channels unrestricted.
ApCapabilities BuildApCapabilities();
ApNamingTemplates BuildApNamingTemplates();
