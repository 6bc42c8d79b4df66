#include "softap/esp_mac_provider.h"

#include <Arduino.h>
#include <mbedtls/sha256.h>

#include <cstring>

#include "config/logging.h"

namespace {

constexpr uint8_t kLocallyAdministeredBit = 0x02;
constexpr uint8_t kMulticastBit = 0x01;

}  // namespace

bool EspPersistentMacProvider::derive(const std::string& identity,
                                      const std::string& salt, MacAddr& out) {
  const uint64_t efuse = ESP.getEfuseMac();
  if (efuse == 0) {
    LOGE("Factory MAC unavailable\r\n");
    return false;
  }
  uint8_t factory[kMacLen];
  for (size_t i = 0; i < kMacLen; ++i) {
    factory[i] = static_cast<uint8_t>(efuse >> (8 * i));
  }

  uint8_t hash[32];
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  int rc = mbedtls_sha256_starts(&ctx, 0);
  if (rc == 0) rc = mbedtls_sha256_update(&ctx, factory, sizeof(factory));
  if (rc == 0) {
    rc = mbedtls_sha256_update(
        &ctx, reinterpret_cast<const uint8_t*>(identity.data()),
        identity.size());
  }
  if (rc == 0) {
    rc = mbedtls_sha256_update(
        &ctx, reinterpret_cast<const uint8_t*>(salt.data()), salt.size());
  }
  if (rc == 0) rc = mbedtls_sha256_finish(&ctx, hash);
  mbedtls_sha256_free(&ctx);
  if (rc != 0) {
    LOGE("BSSID hash failed (%d)\r\n", rc);
    return false;
  }

  memcpy(out.b, hash, kMacLen);
  out.b[0] = static_cast<uint8_t>((out.b[0] | kLocallyAdministeredBit) &
                                  ~kMulticastBit);
  return true;
}
