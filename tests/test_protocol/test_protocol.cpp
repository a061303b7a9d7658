#include <unity.h>

#include <vector>

#include "app/Timing.h"
#include "io/SynthProtocol.h"
#include "support/Fakes.h"
#include "util/RunLog.h"

using patchprobe::ParameterController;
using patchprobe::RunLog;
using patchprobe::StopToken;
using patchprobe::testing::FakeSynth;
using patchprobe::testing::ManualClock;
namespace protocol = patchprobe::protocol;

namespace {

void expectPacket(const std::vector<std::uint8_t>& expected, const protocol::Packet& actual) {
  TEST_ASSERT_EQUAL_INT(static_cast<int>(expected.size()), static_cast<int>(actual.size()));
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected.data(), actual.data(), expected.size());
}

}  // namespace

void test_encode_set_direct_ids_use_three_bytes() {
  const auto first = protocol::encodeSet(0, 0);
  TEST_ASSERT_TRUE(first.has_value());
  expectPacket({'s', 0, 0}, *first);

  const auto last = protocol::encodeSet(254, 255);
  TEST_ASSERT_TRUE(last.has_value());
  expectPacket({'s', 254, 255}, *last);
}

void test_encode_set_high_ids_go_through_escape() {
  const auto firstEscaped = protocol::encodeSet(255, 12);
  TEST_ASSERT_TRUE(firstEscaped.has_value());
  expectPacket({'s', 0xFF, 0, 12}, *firstEscaped);

  const auto top = protocol::encodeSet(510, 1);
  TEST_ASSERT_TRUE(top.has_value());
  expectPacket({'s', 0xFF, 255, 1}, *top);

  // The boundary pair must not collide on the wire.
  TEST_ASSERT_NOT_EQUAL(protocol::encodeSet(254, 0)->size(), protocol::encodeSet(255, 0)->size());
}

void test_encode_set_rejects_unaddressable_pairs() {
  TEST_ASSERT_FALSE(protocol::encodeSet(-1, 0).has_value());
  TEST_ASSERT_FALSE(protocol::encodeSet(511, 0).has_value());
  TEST_ASSERT_FALSE(protocol::encodeSet(3, -1).has_value());
  TEST_ASSERT_FALSE(protocol::encodeSet(3, 256).has_value());
}

void test_encode_reset_is_r_space_zero() { expectPacket({'r', ' ', '0'}, protocol::encodeReset()); }

void test_controller_set_discards_writes_and_flushes() {
  FakeSynth synth;
  ManualClock clock;
  RunLog log;
  ParameterController controller(synth, clock, log);

  TEST_ASSERT_TRUE(controller.sendSet(300, 7).wasOk());
  TEST_ASSERT_EQUAL_INT(1, synth.discards);
  TEST_ASSERT_EQUAL_INT(1, synth.flushes);
  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(synth.packets.size()));
  expectPacket({'s', 0xFF, 45, 7}, synth.packets.front());
  TEST_ASSERT_EQUAL_INT(7, synth.state[300]);
}

void test_controller_rejects_unencodable_without_touching_link() {
  FakeSynth synth;
  ManualClock clock;
  RunLog log;
  ParameterController controller(synth, clock, log);

  const auto result = controller.sendSet(600, 1);
  TEST_ASSERT_TRUE(result.failed());
  TEST_ASSERT_TRUE(synth.bytes.empty());
  TEST_ASSERT_EQUAL_INT(0, synth.discards);
}

void test_controller_reports_write_failure() {
  FakeSynth synth;
  synth.failWrites = true;
  ManualClock clock;
  RunLog log;
  ParameterController controller(synth, clock, log);

  const auto result = controller.sendSet(1, 1);
  TEST_ASSERT_TRUE(result.failed());
  TEST_ASSERT_TRUE(result.getErrorMessage().contains("refused"));
  TEST_ASSERT_EQUAL_INT(0, synth.flushes);
}

void test_controller_refuses_closed_link() {
  FakeSynth synth;
  synth.open = false;
  ManualClock clock;
  RunLog log;
  ParameterController controller(synth, clock, log);

  TEST_ASSERT_TRUE(controller.sendSet(1, 1).failed());
  TEST_ASSERT_TRUE(controller.sendReset().failed());
  TEST_ASSERT_TRUE(synth.bytes.empty());
  TEST_ASSERT_EQUAL_INT(0, synth.flushes);
  TEST_ASSERT_TRUE(clock.now() == 0.0);
}

void test_controller_reset_waits_for_settle() {
  FakeSynth synth;
  ManualClock clock;
  RunLog log;
  ParameterController controller(synth, clock, log, 1.0);
  synth.state[4] = 9;

  TEST_ASSERT_TRUE(controller.sendReset().wasOk());
  TEST_ASSERT_EQUAL_INT(1, synth.resets);
  TEST_ASSERT_TRUE(synth.state.empty());
  TEST_ASSERT_TRUE(clock.now() >= 1.0);
}

void test_controller_reset_settle_cut_short_by_stop() {
  FakeSynth synth;
  ManualClock clock;
  StopToken stop;
  RunLog log(RunLog::Level::kDebug);
  log.captureHistory(true);
  clock.watch(&stop);
  stop.requestStop();
  ParameterController controller(synth, clock, log, 1.0);

  TEST_ASSERT_TRUE(controller.sendReset().wasOk());
  TEST_ASSERT_EQUAL_INT(1, synth.resets);
  TEST_ASSERT_TRUE(clock.now() < 1.0);
}
