#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "softap/ap_config.h"
#include "softap/ap_ports.h"

// Counts write/backup requests instead of touching NVS.
class RecordingPersistence : public IApPersistence {
 public:
  void registerDataSource(IApConfigDataSource* s) override { source = s; }
  void requestPersist(bool dirty) override {
    if (dirty) ++persist_requests;
  }
  void notifyBackupChanged() override { ++backup_notifications; }

  void clearCounts() {
    persist_requests = 0;
    backup_notifications = 0;
  }

  IApConfigDataSource* source = nullptr;
  int persist_requests = 0;
  int backup_notifications = 0;
};

// Plays back script (each value reduced mod bound), then repeats fallback.
class ScriptedRandom : public IRandomSource {
 public:
  ScriptedRandom() = default;
  explicit ScriptedRandom(std::vector<uint32_t> values)
      : script(std::move(values)) {}

  uint32_t uniform(uint32_t bound) override {
    ++calls;
    const uint32_t v = pos < script.size() ? script[pos++] : fallback;
    return bound == 0 ? 0 : v % bound;
  }

  std::vector<uint32_t> script;
  size_t pos = 0;
  uint32_t fallback = 0;
  int calls = 0;
};

class MemoryLegacySource : public ILegacyApSource {
 public:
  MemoryLegacySource() = default;
  explicit MemoryLegacySource(const std::string& record)
      : present(true), bytes(record) {}

  bool exists() override { return present; }
  bool read(std::string& out) override {
    if (!present || !read_ok) return false;
    out = bytes;
    return true;
  }
  bool remove() override {
    ++remove_calls;
    if (!remove_ok) return false;
    present = false;
    bytes.clear();
    return true;
  }

  bool present = false;
  std::string bytes;
  bool read_ok = true;
  bool remove_ok = true;
  int remove_calls = 0;
};

// Deterministic stand-in for the factory-MAC hash: FNV-1a over
// identity|salt, spread over 6 bytes, locally administered and unicast.
class FixedMacProvider : public IPersistentMacProvider {
 public:
  bool derive(const std::string& identity, const std::string& salt,
              MacAddr& out) override {
    ++calls;
    last_identity = identity;
    last_salt = salt;
    if (fail) return false;
    uint64_t h = 1469598103934665603ull;
    const std::string key = identity + "|" + salt;
    for (char c : key) {
      h ^= static_cast<uint8_t>(c);
      h *= 1099511628211ull;
    }
    for (size_t i = 0; i < kMacLen; ++i) {
      out.b[i] = static_cast<uint8_t>(h >> (8 * i));
    }
    out.b[0] = static_cast<uint8_t>((out.b[0] | 0x02u) & ~0x01u);
    return true;
  }

  bool fail = false;
  int calls = 0;
  std::string last_identity;
  std::string last_salt;
};

// Builds legacy hotspot records byte for byte (big-endian ints, uint16
// length-prefixed strings).
class LegacyRecordWriter {
 public:
  LegacyRecordWriter& writeInt(int32_t v) {
    const uint32_t u = static_cast<uint32_t>(v);
    bytes.push_back(static_cast<char>((u >> 24) & 0xFF));
    bytes.push_back(static_cast<char>((u >> 16) & 0xFF));
    bytes.push_back(static_cast<char>((u >> 8) & 0xFF));
    bytes.push_back(static_cast<char>(u & 0xFF));
    return *this;
  }
  LegacyRecordWriter& writeBool(bool v) {
    bytes.push_back(static_cast<char>(v ? 1 : 0));
    return *this;
  }
  LegacyRecordWriter& writeUtf(const std::string& s) {
    bytes.push_back(static_cast<char>((s.size() >> 8) & 0xFF));
    bytes.push_back(static_cast<char>(s.size() & 0xFF));
    bytes += s;
    return *this;
  }

  std::string bytes;
};

inline ApCapabilities TestCapabilities(bool convert_5ghz_to_any = false) {
  ApCapabilities caps;
  caps.convert_5ghz_to_any = convert_5ghz_to_any;
  caps.sae_supported = true;
  caps.mac_randomization_supported = true;
  caps.client_force_disconnect_supported = true;
  return caps;
}

inline ApNamingTemplates TestNamingTemplates() {
  ApNamingTemplates names;
  names.tether_ssid_prefix = "TestAP";
  names.lohs_ssid_prefix = "TestShare";
  names.mac_randomization_salt = "test-salt";
  return names;
}

inline ApConfig MakeApConfig(const std::string& ssid, ApSecurity sec,
                             const std::string& pass, uint8_t band,
                             uint16_t channel = 0) {
  ApConfig cfg;
  cfg.ssid = ssid;
  cfg.security = sec;
  cfg.passphrase = pass;
  cfg.band = band;
  cfg.channel = channel;
  return cfg;
}
