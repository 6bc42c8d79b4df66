#include "softap/ap_validate.h"

#include <cstring>

bool ValidateApConfig(const ApConfig& cfg, char* err, size_t err_len) {
  auto writeErr = [&](const char* msg) {
    if (err && err_len > 0) {
      const size_t n = strnlen(msg, err_len - 1);
      memcpy(err, msg, n);
      err[n] = '\0';
    }
  };
  if (cfg.ssid.empty()) {
    writeErr("ssid");
    return false;
  }
  // std::string holds the encoded bytes, so size() is the UTF-8 length.
  const size_t ssid_len = cfg.ssid.size();
  if (ssid_len < kSsidMinLen || ssid_len > kSsidMaxLen) {
    writeErr("ssid_len");
    return false;
  }
  if (!IsValidSecurityValue(static_cast<uint8_t>(cfg.security))) {
    writeErr("security");
    return false;
  }
  if (!SecurityNeedsPassphrase(cfg.security)) {
    if (!cfg.passphrase.empty()) {
      writeErr("open_pass");
      return false;
    }
    writeErr("");
    return true;
  }
  const size_t pass_len = cfg.passphrase.size();
  if (pass_len < kPskMinLen || pass_len > kPskMaxLen) {
    writeErr("pass_len");
    return false;
  }
  writeErr("");
  return true;
}
