#pragma once

#include <stdint.h>

#include "softap/ap_ports.h"

// Hardware RNG. Only truly random while Wi-Fi or the bootloader entropy
// source is enabled; AppSetup enables the latter around the boot-time read.
class EspRandomSource : public IRandomSource {
 public:
  uint32_t uniform(uint32_t bound) override;
};
