#pragma once

#include <Arduino.h>
#if ARDUINO_USB_CDC_ON_BOOT
#include <USB.h>  // ensure Serial is declared when using native USB CDC
#ifndef CONFIG_TINYUSB_CDC_ENABLED
// Fallback: if TinyUSB CDC is disabled, route Serial to UART0.
#define Serial Serial0
#endif
#endif

namespace Pins {
// Held low through boot for kFactoryResetHoldMs: wipe the SoftAP namespace.
constexpr uint8_t kButton = 3;
}  // namespace Pins
