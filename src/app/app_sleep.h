#pragma once

#include <stdint.h>

void AppSleepMs(uint32_t ms);
