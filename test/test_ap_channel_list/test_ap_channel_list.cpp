#include <unity.h>

#include "softap/ap_channel_list.h"

void setUp(void) {}
void tearDown(void) {}

void test_range_list(void) {
  ChannelAllowlist list;
  TEST_ASSERT_TRUE(ParseChannelAllowlist("1-11", list));
  TEST_ASSERT_EQUAL_UINT8(11, ChannelCount(list));
  TEST_ASSERT_TRUE(ChannelAllowed(list, 1));
  TEST_ASSERT_TRUE(ChannelAllowed(list, 11));
  TEST_ASSERT_FALSE(ChannelAllowed(list, 12));
  TEST_ASSERT_FALSE(ChannelAllowed(list, 0));
}

void test_single_channels_and_spaces(void) {
  ChannelAllowlist list;
  TEST_ASSERT_TRUE(ParseChannelAllowlist(" 1 , 6 - 8,13 ", list));
  TEST_ASSERT_EQUAL_UINT8(5, ChannelCount(list));
  TEST_ASSERT_TRUE(ChannelAllowed(list, 1));
  TEST_ASSERT_TRUE(ChannelAllowed(list, 7));
  TEST_ASSERT_TRUE(ChannelAllowed(list, 13));
  TEST_ASSERT_FALSE(ChannelAllowed(list, 2));
  TEST_ASSERT_FALSE(ChannelAllowed(list, 14));
}

void test_rejects_garbage(void) {
  ChannelAllowlist list;
  list.mask = 0x0042;
  char err[16] = {0};
  TEST_ASSERT_FALSE(ParseChannelAllowlist("1,x", list, err, sizeof(err)));
  TEST_ASSERT_EQUAL_STRING("token", err);
  // Failed parse leaves the previous list alone.
  TEST_ASSERT_EQUAL_HEX16(0x0042, list.mask);

  TEST_ASSERT_FALSE(ParseChannelAllowlist("1,,2", list, err, sizeof(err)));
  TEST_ASSERT_EQUAL_STRING("token", err);
  TEST_ASSERT_FALSE(ParseChannelAllowlist("0", list, err, sizeof(err)));
  TEST_ASSERT_FALSE(ParseChannelAllowlist("15", list, err, sizeof(err)));
  TEST_ASSERT_FALSE(ParseChannelAllowlist("6-3", list, err, sizeof(err)));
  TEST_ASSERT_EQUAL_STRING("range", err);
  TEST_ASSERT_FALSE(ParseChannelAllowlist("", list, err, sizeof(err)));
  TEST_ASSERT_EQUAL_STRING("empty", err);
  TEST_ASSERT_FALSE(ParseChannelAllowlist(nullptr, list, err, sizeof(err)));
  TEST_ASSERT_EQUAL_STRING("null", err);
}

void test_empty_list_allows_nothing(void) {
  ChannelAllowlist list;
  TEST_ASSERT_EQUAL_UINT8(0, ChannelCount(list));
  TEST_ASSERT_FALSE(ChannelAllowed(list, 6));
}

void test_start_channel_honours_allowlist(void) {
  ChannelAllowlist list;
  TEST_ASSERT_TRUE(ParseChannelAllowlist("1-11", list));
  TEST_ASSERT_EQUAL_UINT8(6, PickStartChannel(6, list));
  TEST_ASSERT_EQUAL_UINT8(1, PickStartChannel(13, list));
  TEST_ASSERT_EQUAL_UINT8(1, PickStartChannel(0, list));
  TEST_ASSERT_EQUAL_UINT8(1, PickStartChannel(36, list));

  TEST_ASSERT_TRUE(ParseChannelAllowlist("6,11", list));
  TEST_ASSERT_EQUAL_UINT8(6, PickStartChannel(0, list));
  TEST_ASSERT_EQUAL_UINT8(6, PickStartChannel(1, list));
  TEST_ASSERT_EQUAL_UINT8(11, PickStartChannel(11, list));
}

void test_start_channel_with_empty_list(void) {
  ChannelAllowlist list;
  TEST_ASSERT_EQUAL_UINT8(13, PickStartChannel(13, list));
  TEST_ASSERT_EQUAL_UINT8(1, PickStartChannel(0, list));
  TEST_ASSERT_EQUAL_UINT8(1, PickStartChannel(15, list));
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_range_list);
  RUN_TEST(test_single_channels_and_spaces);
  RUN_TEST(test_rejects_garbage);
  RUN_TEST(test_empty_list_allows_nothing);
  RUN_TEST(test_start_channel_honours_allowlist);
  RUN_TEST(test_start_channel_with_empty_list);
  return UNITY_END();
}
