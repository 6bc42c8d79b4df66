#include "softap/ap_channel_list.h"

#include <cstdlib>
#include <cstring>

namespace {

void WriteErr(char* err, size_t err_len, const char* msg) {
  if (!err || err_len == 0) return;
  const size_t n = strnlen(msg, err_len - 1);
  memcpy(err, msg, n);
  err[n] = '\0';
}

bool ParseChannel(const char* begin, const char* end, uint16_t& out) {
  while (begin < end && *begin == ' ') ++begin;
  while (end > begin && *(end - 1) == ' ') --end;
  if (begin == end) return false;
  long v = 0;
  for (const char* p = begin; p < end; ++p) {
    if (*p < '0' || *p > '9') return false;
    v = v * 10 + (*p - '0');
    if (v > k2gChannelMax) return false;
  }
  if (v < k2gChannelMin) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

}  // namespace

bool ParseChannelAllowlist(const char* s, ChannelAllowlist& out, char* err,
                           size_t err_len) {
  if (!s) {
    WriteErr(err, err_len, "null");
    return false;
  }
  if (*s == '\0') {
    WriteErr(err, err_len, "empty");
    return false;
  }
  uint16_t mask = 0;
  const char* tok = s;
  while (true) {
    const char* comma = strchr(tok, ',');
    const char* tok_end = comma ? comma : tok + strlen(tok);
    const char* dash = static_cast<const char*>(
        memchr(tok, '-', static_cast<size_t>(tok_end - tok)));
    uint16_t lo = 0;
    uint16_t hi = 0;
    if (dash) {
      if (!ParseChannel(tok, dash, lo) || !ParseChannel(dash + 1, tok_end, hi)) {
        WriteErr(err, err_len, "token");
        return false;
      }
      if (lo > hi) {
        WriteErr(err, err_len, "range");
        return false;
      }
    } else {
      if (!ParseChannel(tok, tok_end, lo)) {
        WriteErr(err, err_len, "token");
        return false;
      }
      hi = lo;
    }
    for (uint16_t ch = lo; ch <= hi; ++ch) {
      mask |= static_cast<uint16_t>(1u << ch);
    }
    if (!comma) break;
    tok = comma + 1;
  }
  out.mask = mask;
  WriteErr(err, err_len, "");
  return true;
}

bool ChannelAllowed(const ChannelAllowlist& list, uint16_t channel) {
  if (channel < k2gChannelMin || channel > k2gChannelMax) return false;
  return (list.mask & (1u << channel)) != 0;
}

uint8_t ChannelCount(const ChannelAllowlist& list) {
  uint8_t n = 0;
  for (uint16_t ch = k2gChannelMin; ch <= k2gChannelMax; ++ch) {
    if (ChannelAllowed(list, ch)) ++n;
  }
  return n;
}

uint8_t PickStartChannel(uint16_t requested, const ChannelAllowlist& list) {
  if (requested >= k2gChannelMin && requested <= k2gChannelMax &&
      (list.mask == 0 || ChannelAllowed(list, requested))) {
    return static_cast<uint8_t>(requested);
  }
  for (uint16_t ch = k2gChannelMin; ch <= k2gChannelMax; ++ch) {
    if (ChannelAllowed(list, ch)) return static_cast<uint8_t>(ch);
  }
  return 1;
}
