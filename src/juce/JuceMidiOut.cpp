#include "juce/JuceMidiOut.h"

#if PATCHPROBE_JUCE_DEVICES

namespace patchprobe::juce_bridge {

juce::Result JuceMidiOut::open() {
  if (output_) {
    return juce::Result::ok();
  }
  output_ = juce::MidiOutput::openDevice(device_.identifier);
  if (!output_) {
    return juce::Result::fail("cannot open MIDI output " + device_.name);
  }
  return juce::Result::ok();
}

void JuceMidiOut::send(const juce::MidiMessage& message) {
  if (output_) {
    output_->sendMessageNow(message);
  }
}

}  // namespace patchprobe::juce_bridge

#endif  // PATCHPROBE_JUCE_DEVICES
