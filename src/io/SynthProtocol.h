#pragma once

//
// SynthProtocol.h
// ---------------
// Wire format for programming the synth over its UART.  Two commands exist:
//
//   set    's' <id> <value>              id 0..254
//          's' 0xFF <id - 255> <value>   id 255..510
//   reset  'r' ' ' '0'
//
// Ids above 254 go through the 0xFF escape into a second 8-bit page.  Values
// are always one byte.  There is no checksum and no acknowledgement, so the
// controller clears stale input before each set and drains the write before
// returning.
#include <cstdint>
#include <optional>
#include <vector>

#include <juce_core/juce_core.h>

#include "hal/hal_serial.h"

namespace patchprobe {

class Clock;
class RunLog;

namespace protocol {

using Packet = std::vector<std::uint8_t>;

constexpr std::uint8_t kSetCommand = 's';
constexpr std::uint8_t kResetCommand = 'r';
constexpr std::uint8_t kEscapeId = 0xFFu;
constexpr int kMaxDirectId = 254;
constexpr int kMaxParameterId = kMaxDirectId + 1 + 0xFF;  // 510
constexpr int kMaxValue = 0xFF;

bool validParameterId(int parameterId);
bool validValue(int value);

// nullopt when the id or value cannot be expressed on the wire.
std::optional<Packet> encodeSet(int parameterId, int value);
Packet encodeReset();

}  // namespace protocol

class ParameterController {
 public:
  ParameterController(hal::serial::SerialLink& link, Clock& clock, RunLog& log, double resetSettleSeconds = 1.0);

  // Discard pending input, write the set packet, flush.  Fails without
  // touching the link when the pair is not encodable.
  juce::Result sendSet(int parameterId, int value);

  // Write the reset packet, flush, then give the synth time to reload its
  // defaults.  A stop request during the settle gap still reports ok: the
  // bytes are out.
  juce::Result sendReset();

 private:
  juce::Result transmit(const protocol::Packet& packet);

  hal::serial::SerialLink& link_;
  Clock& clock_;
  RunLog& log_;
  double resetSettleSeconds_;
};

}  // namespace patchprobe
