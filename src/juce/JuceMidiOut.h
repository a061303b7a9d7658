#pragma once

#include "PatchProbeConfig.h"

#if PATCHPROBE_JUCE_DEVICES

#include <memory>

#include <juce_audio_devices/juce_audio_devices.h>

#include "io/MidiSink.h"

namespace patchprobe::juce_bridge {

// MidiSink over a system MIDI output.  The device is looked up by index once;
// open()/close() then bracket each capture so the synth only hears us while
// something is being recorded.
class JuceMidiOut final : public MidiSink {
 public:
  explicit JuceMidiOut(juce::MidiDeviceInfo device) : device_(std::move(device)) {}
  ~JuceMidiOut() override { close(); }

  juce::Result open() override;
  void close() override { output_.reset(); }
  bool isOpen() const override { return output_ != nullptr; }
  void send(const juce::MidiMessage& message) override;

  const juce::MidiDeviceInfo& device() const { return device_; }

 private:
  juce::MidiDeviceInfo device_;
  std::unique_ptr<juce::MidiOutput> output_{};
};

}  // namespace patchprobe::juce_bridge

#endif  // PATCHPROBE_JUCE_DEVICES
