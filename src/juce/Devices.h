#pragma once

#include "PatchProbeConfig.h"

#if PATCHPROBE_JUCE_DEVICES

#include <memory>
#include <optional>

#include <juce_audio_devices/juce_audio_devices.h>

#include "io/MidiSink.h"

namespace patchprobe::juce_bridge {

// What --list-* prints.  Indices here are the ones --midi-port and
// --audio-device take.
struct DeviceListing {
  juce::Array<juce::MidiDeviceInfo> midiOutputs;
  juce::StringArray audioInputs;
  juce::Array<int> audioInputChannels;  // parallel to audioInputs, 0 when unknown
  juce::String audioDriver;
};

DeviceListing listDevices();
juce::String formatListing(const DeviceListing& listing, bool midi, bool audio);

std::optional<juce::MidiDeviceInfo> findMidiOutput(int index);

// Sink for MIDI output `index`, or nullptr when there is no such port.
std::unique_ptr<MidiSink> openMidiOutput(int index);

// First driver type that reports at least one input device.  Listing and
// opening both go through here so the indices agree.
juce::AudioIODeviceType* inputDeviceType(juce::AudioDeviceManager& manager);

}  // namespace patchprobe::juce_bridge

#endif  // PATCHPROBE_JUCE_DEVICES
