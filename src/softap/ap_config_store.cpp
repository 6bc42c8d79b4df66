#include "softap/ap_config_store.h"

#include "config/logging.h"
#include "softap/ap_bssid.h"
#include "softap/ap_defaults.h"
#include "softap/ap_legacy.h"
#include "softap/ap_validate.h"

ApConfigStore::ApConfigStore(IApPersistence& persistence,
                             const ApCapabilities& caps,
                             const ApNamingTemplates& names,
                             IRandomSource& rng,
                             IPersistentMacProvider& mac_provider,
                             ILegacyApSource* legacy)
    : persistence_(persistence),
      caps_(caps),
      names_(names),
      rng_(rng),
      mac_provider_(mac_provider),
      band_policy_(BandPolicyFor(caps.convert_5ghz_to_any)) {
  persistence_.registerDataSource(this);
  if (!legacy || !legacy->exists()) {
    return;
  }
  ApConfig migrated;
  if (!MigrateLegacyApConfig(*legacy, migrated)) {
    return;
  }
  config_ = migrated;
  has_config_ = true;
  migration_ = MigrationState::kPendingReplay;
  persistConfigAndNotify();
}

ApConfig ApConfigStore::getApConfig() {
  if (!has_config_) {
    config_ = defaultTetherConfig();
    has_config_ = true;
    persistConfigAndNotify();
  }
  ApConfig cfg = config_;
  if (NormalizeApConfigBand(cfg, band_policy_)) {
    config_ = cfg;
    persistConfigAndNotify();
  }
  return cfg;
}

void ApConfigStore::setApConfig(const ApConfig* candidate) {
  if (!candidate) {
    config_ = defaultTetherConfig();
  } else {
    ApConfig cfg = resetToDefaultForUnsupportedConfig(*candidate);
    NormalizeApConfigBand(cfg, band_policy_);
    char err[16] = {0};
    if (!ValidateApConfig(cfg, err, sizeof(err))) {
      LOGW("SoftAP config stored despite validation failure (%s)\r\n", err);
    }
    config_ = cfg;
  }
  has_config_ = true;
  persistConfigAndNotify();
}

ApConfig ApConfigStore::resetToDefaultForUnsupportedConfig(
    const ApConfig& cfg) const {
  ApConfig out = cfg;
  if (!caps_.sae_supported && IsSaeSecurity(out.security)) {
    LOGI("SoftAP %s unsupported, using WPA2-PSK\r\n",
         ApSecurityName(out.security));
    out.security = ApSecurity::kWpa2Psk;
  }
  if (!caps_.client_force_disconnect_supported &&
      (out.max_clients != 0 || out.client_control_by_user)) {
    LOGI("SoftAP client control unsupported, clearing limits\r\n");
    out.max_clients = 0;
    out.client_control_by_user = false;
  }
  // An empty allowlist means the device overlay did not restrict 2.4 GHz.
  if (out.band == kApBand2Ghz && out.channel != 0 &&
      caps_.allowed_2g_channels.mask != 0 &&
      !ChannelAllowed(caps_.allowed_2g_channels, out.channel)) {
    LOGI("SoftAP 2.4 GHz channel %u not allowed, using auto\r\n",
         static_cast<unsigned>(out.channel));
    out.channel = 0;
  }
  return out;
}

ApConfig ApConfigStore::generateLocalOnlyHotspotConfig(uint8_t band,
                                                       const ApConfig* custom) {
  return GenerateLocalOnlyHotspotConfig(caps_, names_, band, custom, rng_);
}

bool ApConfigStore::randomizeBssidIfUnset(const ApConfig& in, ApConfig& out) {
  BssidResolution res;
  if (!ResolveApBssid(in, caps_.mac_randomization_supported, mac_provider_,
                      names_.mac_randomization_salt, res)) {
    return false;
  }
  out = in;
  out.has_bssid = res.has_bssid;
  out.bssid = res.bssid;
  return true;
}

bool ApConfigStore::serialize(ApConfig& out) {
  if (!has_config_) return false;
  out = config_;
  has_new_data_ = false;
  return true;
}

void ApConfigStore::adopt(const ApConfig& cfg) {
  // A damaged record is dropped; the slot keeps what it had, so an empty
  // slot still gets the default on the next read.
  if (!IsValidApBand(cfg.band)) {
    LOGW("SoftAP stored band 0x%02x invalid, ignoring record\r\n",
         static_cast<unsigned>(cfg.band));
    return;
  }
  char err[16] = {0};
  if (!ValidateApConfig(cfg, err, sizeof(err))) {
    LOGW("SoftAP stored config invalid (%s), ignoring record\r\n", err);
    return;
  }
  config_ = cfg;
  has_config_ = true;
  LOGD("SoftAP config adopted: ssid=%s\r\n", cfg.ssid.c_str());
}

void ApConfigStore::onReplayReady() {
  if (migration_ != MigrationState::kPendingReplay) return;
  migration_ = MigrationState::kReplayDone;
  persistConfigAndNotify();
}

ApConfig ApConfigStore::defaultTetherConfig() {
  return GenerateDefaultApConfig(caps_, names_.tether_ssid_prefix,
                                 kApBand2Ghz, rng_);
}

void ApConfigStore::persistConfigAndNotify() {
  has_new_data_ = true;
  persistence_.requestPersist(true);
  persistence_.notifyBackupChanged();
}
