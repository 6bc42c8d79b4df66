#include "softap/ap_legacy.h"

#include <cstring>

#include "config/logging.h"
#include "softap/ap_validate.h"

namespace {

void WriteErr(char* err, size_t err_len, const char* msg) {
  if (!err || err_len == 0) return;
  const size_t n = strnlen(msg, err_len - 1);
  memcpy(err, msg, n);
  err[n] = '\0';
}

// Sequential big-endian reader; every read fails once the buffer runs out.
class BeReader {
 public:
  BeReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}

  bool readI32(int32_t& out) {
    if (!have(4)) return false;
    const uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                       (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                       (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                       static_cast<uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    out = static_cast<int32_t>(v);
    return true;
  }

  bool readBool(bool& out) {
    if (!have(1)) return false;
    out = data_[pos_++] != 0;
    return true;
  }

  bool readStr(std::string& out) {
    if (!have(2)) return false;
    const size_t n = (static_cast<size_t>(data_[pos_]) << 8) | data_[pos_ + 1];
    pos_ += 2;
    if (!have(n)) return false;
    out.assign(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return true;
  }

 private:
  bool have(size_t n) const { return data_ && len_ - pos_ >= n; }

  const uint8_t* data_;
  size_t len_;
  size_t pos_;
};

}  // namespace

bool ParseLegacyApRecord(const uint8_t* data, size_t len, LegacyApRecord& out,
                         char* err, size_t err_len) {
  BeReader in(data, len);
  LegacyApRecord rec;
  if (!in.readI32(rec.version)) {
    WriteErr(err, err_len, "truncated");
    return false;
  }
  if (rec.version < kLegacyApVersionMin || rec.version > kLegacyApVersionMax) {
    WriteErr(err, err_len, "version");
    return false;
  }
  bool ok = in.readStr(rec.ssid);
  if (ok && rec.version >= 2) {
    ok = in.readI32(rec.band) && in.readI32(rec.channel);
  }
  if (ok && rec.version >= 3) {
    ok = in.readBool(rec.hidden);
  }
  ok = ok && in.readI32(rec.auth_type);
  if (ok && rec.auth_type != kLegacyAuthNone) {
    ok = in.readStr(rec.passphrase);
  }
  if (!ok) {
    WriteErr(err, err_len, "truncated");
    return false;
  }
  out = rec;
  WriteErr(err, err_len, "");
  return true;
}

uint8_t LegacyBandToApBand(int32_t legacy_band) {
  switch (legacy_band) {
    case kLegacyBand2Ghz:
      return kApBand2Ghz;
    case kLegacyBand5Ghz:
      return kApBand5Ghz;
    case kLegacyBandAny:
      return kApBand2Ghz | kApBand5Ghz;
    default:
      return kApBand2Ghz;
  }
}

bool ConvertLegacyApRecord(const LegacyApRecord& rec, ApConfig& out, char* err,
                           size_t err_len) {
  ApConfig cfg;
  switch (rec.auth_type) {
    case kLegacyAuthNone:
      cfg.security = ApSecurity::kOpen;
      break;
    case kLegacyAuthWpaPsk:
    case kLegacyAuthWpa2Psk:
      cfg.security = ApSecurity::kWpa2Psk;
      cfg.passphrase = rec.passphrase;
      break;
    default:
      WriteErr(err, err_len, "auth");
      return false;
  }
  if (rec.channel < 0 || rec.channel > 0xFFFF) {
    WriteErr(err, err_len, "channel");
    return false;
  }
  cfg.ssid = rec.ssid;
  cfg.band = LegacyBandToApBand(rec.band);
  cfg.channel = static_cast<uint16_t>(rec.channel);
  cfg.hidden_ssid = rec.hidden;
  if (!ValidateApConfig(cfg, err, err_len)) {
    return false;
  }
  out = cfg;
  WriteErr(err, err_len, "");
  return true;
}

bool MigrateLegacyApConfig(ILegacyApSource& source, ApConfig& out) {
  std::string bytes;
  if (!source.read(bytes)) {
    LOGW("SoftAP legacy config unreadable, skipping migration\r\n");
    return false;
  }
  char err[16] = {0};
  LegacyApRecord rec;
  if (!ParseLegacyApRecord(reinterpret_cast<const uint8_t*>(bytes.data()),
                           bytes.size(), rec, err, sizeof(err))) {
    LOGW("SoftAP legacy config parse failed (%s)\r\n", err);
    return false;
  }
  ApConfig cfg;
  if (!ConvertLegacyApRecord(rec, cfg, err, sizeof(err))) {
    LOGW("SoftAP legacy config rejected (%s)\r\n", err);
    return false;
  }
  if (!source.remove()) {
    // Adopted anyway; the next boot migrates again and rewrites the same
    // value.
    LOGW("SoftAP legacy config could not be removed\r\n");
  }
  LOGI("SoftAP legacy config v%d migrated: ssid=%s\r\n",
       static_cast<int>(rec.version), cfg.ssid.c_str());
  out = cfg;
  return true;
}
