#include <unity.h>

void setUp() {}
void tearDown() {}

void test_encode_set_direct_ids_use_three_bytes();
void test_encode_set_high_ids_go_through_escape();
void test_encode_set_rejects_unaddressable_pairs();
void test_encode_reset_is_r_space_zero();
void test_controller_set_discards_writes_and_flushes();
void test_controller_rejects_unencodable_without_touching_link();
void test_controller_reports_write_failure();
void test_controller_refuses_closed_link();
void test_controller_reset_waits_for_settle();
void test_controller_reset_settle_cut_short_by_stop();
void test_serial_open_missing_device_fails();
void test_serial_baud_table();
void test_serial_closed_port_refuses_io();
void test_serial_pty_round_trip();

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_encode_set_direct_ids_use_three_bytes);
  RUN_TEST(test_encode_set_high_ids_go_through_escape);
  RUN_TEST(test_encode_set_rejects_unaddressable_pairs);
  RUN_TEST(test_encode_reset_is_r_space_zero);
  RUN_TEST(test_controller_set_discards_writes_and_flushes);
  RUN_TEST(test_controller_rejects_unencodable_without_touching_link);
  RUN_TEST(test_controller_reports_write_failure);
  RUN_TEST(test_controller_refuses_closed_link);
  RUN_TEST(test_controller_reset_waits_for_settle);
  RUN_TEST(test_controller_reset_settle_cut_short_by_stop);
  RUN_TEST(test_serial_open_missing_device_fails);
  RUN_TEST(test_serial_baud_table);
  RUN_TEST(test_serial_closed_port_refuses_io);
  RUN_TEST(test_serial_pty_round_trip);
  return UNITY_END();
}
