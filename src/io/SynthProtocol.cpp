#include "io/SynthProtocol.h"

#include "app/Timing.h"
#include "util/RunLog.h"

namespace patchprobe {

namespace protocol {

bool validParameterId(int parameterId) { return parameterId >= 0 && parameterId <= kMaxParameterId; }

bool validValue(int value) { return value >= 0 && value <= kMaxValue; }

std::optional<Packet> encodeSet(int parameterId, int value) {
  if (!validParameterId(parameterId) || !validValue(value)) {
    return std::nullopt;
  }
  Packet packet;
  packet.reserve(4);
  packet.push_back(kSetCommand);
  if (parameterId <= kMaxDirectId) {
    packet.push_back(static_cast<std::uint8_t>(parameterId));
  } else {
    packet.push_back(kEscapeId);
    packet.push_back(static_cast<std::uint8_t>(parameterId - (kMaxDirectId + 1)));
  }
  packet.push_back(static_cast<std::uint8_t>(value));
  return packet;
}

Packet encodeReset() { return Packet{kResetCommand, ' ', '0'}; }

}  // namespace protocol

ParameterController::ParameterController(hal::serial::SerialLink& link, Clock& clock, RunLog& log,
                                         double resetSettleSeconds)
    : link_(link), clock_(clock), log_(log), resetSettleSeconds_(resetSettleSeconds) {}

juce::Result ParameterController::sendSet(int parameterId, int value) {
  const auto packet = protocol::encodeSet(parameterId, value);
  if (!packet) {
    return juce::Result::fail("parameter " + juce::String(parameterId) + " = " + juce::String(value) +
                              " cannot be encoded");
  }
  // Anything still sitting in the receive buffer belongs to an older command.
  const auto drained = link_.discardInput();
  if (drained.failed()) {
    return drained;
  }
  log_.debug("set parameter " + juce::String(parameterId) + " -> " + juce::String(value));
  return transmit(*packet);
}

juce::Result ParameterController::sendReset() {
  const auto sent = transmit(protocol::encodeReset());
  if (sent.failed()) {
    return sent;
  }
  log_.debug("reset sent");
  if (!clock_.sleepFor(resetSettleSeconds_)) {
    log_.debug("reset settle cut short by stop request");
  }
  return juce::Result::ok();
}

juce::Result ParameterController::transmit(const protocol::Packet& packet) {
  if (!link_.isOpen()) {
    return juce::Result::fail("serial link is not open");
  }
  const auto written = link_.write(packet.data(), packet.size());
  if (written.failed()) {
    return written;
  }
  return link_.flush();
}

}  // namespace patchprobe
