#include "softap/ap_defaults.h"

#include <cstdio>

#include "config/logging.h"

namespace {

constexpr char kPassphraseAlphabet[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr uint32_t kPassphraseAlphabetLen = sizeof(kPassphraseAlphabet) - 1;
// "_NNNN"
constexpr size_t kSsidSuffixLen = 5;

// Cuts s to at most max_bytes without splitting a UTF-8 sequence.
std::string Utf8Prefix(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<uint8_t>(s[cut]) & 0xC0u) == 0x80u) {
    --cut;
  }
  return s.substr(0, cut);
}

std::string RandomSsid(const std::string& name_prefix, IRandomSource& rng) {
  const std::string prefix =
      name_prefix.empty() ? std::string(kFallbackSsidPrefix)
                          : Utf8Prefix(name_prefix, kSsidMaxLen - kSsidSuffixLen);
  const uint32_t span = kDefaultSsidSuffixMax - kDefaultSsidSuffixMin + 1;
  const uint32_t suffix = kDefaultSsidSuffixMin + rng.uniform(span);
  char buf[8];
  snprintf(buf, sizeof(buf), "_%04u", static_cast<unsigned>(suffix));
  return prefix + buf;
}

std::string RandomPassphrase(IRandomSource& rng) {
  std::string pass;
  pass.reserve(kDefaultPassphraseLen);
  for (size_t i = 0; i < kDefaultPassphraseLen; ++i) {
    pass.push_back(kPassphraseAlphabet[rng.uniform(kPassphraseAlphabetLen)]);
  }
  return pass;
}

}  // namespace

ApConfig GenerateDefaultApConfig(const ApCapabilities& caps,
                                 const std::string& name_prefix, uint8_t band,
                                 IRandomSource& rng) {
  ApConfig cfg;
  cfg.ssid = RandomSsid(name_prefix, rng);
  cfg.passphrase = RandomPassphrase(rng);
  cfg.security = caps.sae_supported ? ApSecurity::kWpa3SaeTransition
                                    : ApSecurity::kWpa2Psk;
  cfg.band = band;
  cfg.channel = 0;
  cfg.hidden_ssid = false;
  cfg.max_clients = 0;
  cfg.client_control_by_user = false;
  cfg.has_bssid = false;
  LOGI("SoftAP default config generated: ssid=%s sec=%s\r\n", cfg.ssid.c_str(),
       ApSecurityName(cfg.security));
  return cfg;
}

ApConfig GenerateLocalOnlyHotspotConfig(const ApCapabilities& caps,
                                        const ApNamingTemplates& names,
                                        uint8_t band, const ApConfig* custom,
                                        IRandomSource& rng) {
  ApConfig cfg = GenerateDefaultApConfig(caps, names.lohs_ssid_prefix, band, rng);
  if (!custom) return cfg;
  if (custom->has_bssid) {
    cfg.has_bssid = true;
    cfg.bssid = custom->bssid;
  }
  if (!custom->ssid.empty()) {
    cfg.ssid = custom->ssid;
  }
  // A custom passphrase brings its security type along; without one the
  // generated secured defaults stay, so a LOHS is never opened by accident.
  if (!custom->passphrase.empty()) {
    cfg.security = custom->security;
    cfg.passphrase = custom->passphrase;
  }
  return cfg;
}
