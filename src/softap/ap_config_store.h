#pragma once

#include <stdint.h>

#include "softap/ap_band.h"
#include "softap/ap_config.h"
#include "softap/ap_ports.h"

// Owns the single persisted SoftAP configuration. Every mutation asks the
// persistence backend for a write and a backup notification; the backend
// pulls the value back through serialize().
class ApConfigStore : public IApConfigDataSource {
 public:
  // legacy may be null (migration disabled or no legacy storage).
  ApConfigStore(IApPersistence& persistence, const ApCapabilities& caps,
                const ApNamingTemplates& names, IRandomSource& rng,
                IPersistentMacProvider& mac_provider,
                ILegacyApSource* legacy = nullptr);

  // Band-normalized copy of the stored config. Generates and persists the
  // tether default on first use; persists again only if normalization
  // changed the stored value.
  ApConfig getApConfig();
  // null resets to a fresh tether default.
  void setApConfig(const ApConfig* candidate);

  ApConfig resetToDefaultForUnsupportedConfig(const ApConfig& cfg) const;
  ApConfig generateLocalOnlyHotspotConfig(uint8_t band,
                                          const ApConfig* custom);
  // out = in with the BSSID resolved. false if the MAC provider failed.
  bool randomizeBssidIfUnset(const ApConfig& in, ApConfig& out);

  BandPolicy bandPolicy() const { return band_policy_; }

  bool serialize(ApConfig& out) override;
  // Takes a value the backend already holds, without writing it back.
  // Records with an invalid band or failing ValidateApConfig are ignored.
  void adopt(const ApConfig& cfg) override;
  void onReplayReady() override;
  bool hasNewDataToSerialize() const override { return has_new_data_; }

#ifdef UNIT_TEST
  bool debug_has_config() const { return has_config_; }
  bool debug_replay_pending() const {
    return migration_ == MigrationState::kPendingReplay;
  }
#endif

 private:
  // Legacy migration writes once immediately and once more when the
  // backend is ready, so a value migrated before the backend's initial
  // read is not lost.
  enum class MigrationState : uint8_t {
    kNone = 0,
    kPendingReplay,
    kReplayDone,
  };

  ApConfig defaultTetherConfig();
  void persistConfigAndNotify();

  IApPersistence& persistence_;
  ApCapabilities caps_;
  ApNamingTemplates names_;
  IRandomSource& rng_;
  IPersistentMacProvider& mac_provider_;
  BandPolicy band_policy_;

  bool has_config_ = false;
  ApConfig config_;
  bool has_new_data_ = false;
  MigrationState migration_ = MigrationState::kNone;
};
