#include "softap/esp_random_source.h"

#include <esp_system.h>

uint32_t EspRandomSource::uniform(uint32_t bound) {
  if (bound <= 1) return 0;
  // Reject the low 2^32 % bound values so every result is equally likely.
  const uint32_t threshold = (0u - bound) % bound;
  for (;;) {
    const uint32_t r = esp_random();
    if (r >= threshold) return r % bound;
  }
}
