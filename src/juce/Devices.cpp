#include "juce/Devices.h"

#include "juce/JuceMidiOut.h"

#if PATCHPROBE_JUCE_DEVICES

namespace patchprobe::juce_bridge {

juce::AudioIODeviceType* inputDeviceType(juce::AudioDeviceManager& manager) {
  for (auto* type : manager.getAvailableDeviceTypes()) {
    type->scanForDevices();
    if (!type->getDeviceNames(true).isEmpty()) {
      return type;
    }
  }
  return nullptr;
}

DeviceListing listDevices() {
  DeviceListing listing;
  listing.midiOutputs = juce::MidiOutput::getAvailableDevices();

  juce::AudioDeviceManager manager;
  if (auto* type = inputDeviceType(manager)) {
    listing.audioDriver = type->getTypeName();
    listing.audioInputs = type->getDeviceNames(true);
    for (const auto& name : listing.audioInputs) {
      std::unique_ptr<juce::AudioIODevice> device(type->createDevice({}, name));
      listing.audioInputChannels.add(device ? device->getInputChannelNames().size() : 0);
    }
  }
  return listing;
}

juce::String formatListing(const DeviceListing& listing, bool midi, bool audio) {
  juce::String out;
  if (midi) {
    out << "MIDI outputs:\n";
    if (listing.midiOutputs.isEmpty()) {
      out << "  (none)\n";
    }
    for (int i = 0; i < listing.midiOutputs.size(); ++i) {
      out << "  " << i << ": " << listing.midiOutputs[i].name << "\n";
    }
  }
  if (audio) {
    out << "Audio inputs";
    if (listing.audioDriver.isNotEmpty()) {
      out << " (" << listing.audioDriver << ")";
    }
    out << ":\n";
    if (listing.audioInputs.isEmpty()) {
      out << "  (none)\n";
    }
    for (int i = 0; i < listing.audioInputs.size(); ++i) {
      out << "  " << i << ": " << listing.audioInputs[i];
      if (const int channels = listing.audioInputChannels[i]; channels > 0) {
        out << " (" << channels << " in)";
      }
      out << "\n";
    }
  }
  return out;
}

std::optional<juce::MidiDeviceInfo> findMidiOutput(int index) {
  const auto outputs = juce::MidiOutput::getAvailableDevices();
  if (index < 0 || index >= outputs.size()) {
    return std::nullopt;
  }
  return outputs[index];
}

std::unique_ptr<MidiSink> openMidiOutput(int index) {
  auto info = findMidiOutput(index);
  if (!info) {
    return nullptr;
  }
  return std::make_unique<JuceMidiOut>(*info);
}

}  // namespace patchprobe::juce_bridge

#endif  // PATCHPROBE_JUCE_DEVICES
