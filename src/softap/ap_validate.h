#pragma once

#include <stddef.h>

#include "softap/ap_config.h"

// Validates a SoftAP config before it is handed to the store.
// - ssid: 1..32 UTF-8 bytes (bytes, not characters)
// - OPEN: no passphrase
// - WPA2/WPA3: passphrase 8..63
// Returns true if valid; if err is provided, writes a short reason
// ("ssid", "ssid_len", "open_pass", "pass_len", "security").
bool ValidateApConfig(const ApConfig& cfg, char* err = nullptr,
                      size_t err_len = 0);
