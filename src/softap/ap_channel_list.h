#pragma once

#include <stddef.h>
#include <stdint.h>

constexpr uint16_t k2gChannelMin = 1;
constexpr uint16_t k2gChannelMax = 14;

// Set of 2.4 GHz channels; bit n = channel n.
struct ChannelAllowlist {
  uint16_t mask = 0;
};

// Parses "1,2,3", "1-6,11" (spaces allowed around tokens). Any malformed or
// out-of-range token fails the whole list so a typo in the device overlay
// does not silently narrow the allowed set.
bool ParseChannelAllowlist(const char* s, ChannelAllowlist& out,
                           char* err = nullptr, size_t err_len = 0);
bool ChannelAllowed(const ChannelAllowlist& list, uint16_t channel);
uint8_t ChannelCount(const ChannelAllowlist& list);

// Channel to start the 2.4 GHz AP on. An explicit channel is kept when it
// is in range and allowed (an empty list allows every channel); otherwise
// the first allowed channel, or 1.
uint8_t PickStartChannel(uint16_t requested, const ChannelAllowlist& list);
