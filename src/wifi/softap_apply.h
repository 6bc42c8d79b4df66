#pragma once

#include "softap/ap_config.h"

// Brings the SoftAP up with cfg. cfg.bssid is applied when has_bssid is set;
// otherwise the factory AP MAC stays. The channel comes from
// PickStartChannel, so one outside allowed_2g is replaced.
bool SoftApStart(const ApConfig& cfg, const ChannelAllowlist& allowed_2g);
void SoftApStop();
