#include "app/ProbeConfig.h"

namespace patchprobe {

namespace {

juce::Result requirePath(const std::string& value, const char* label) {
  if (value.empty()) {
    return juce::Result::fail(juce::String(label) + " must not be empty");
  }
  return juce::Result::ok();
}

}  // namespace

juce::Result ProbeConfig::validate() const {
  struct NamedPath {
    const std::string* value;
    const char* label;
  };
  const NamedPath paths[] = {
      {&trialLogPath, "trial log path"},
      {&paramSpecPath, "parameter spec path"},
      {&midiFilePath, "MIDI file path"},
      {&audioDir, "audio directory"},
      {&serialPort, "serial port"},
  };
  for (const auto& path : paths) {
    const auto result = requirePath(*path.value, path.label);
    if (result.failed()) {
      return result;
    }
  }

  if (midiPortIndex < 0) {
    return juce::Result::fail("MIDI port index must be >= 0");
  }
  if (audioDeviceIndex < 0) {
    return juce::Result::fail("audio device index must be >= 0");
  }
  if (baudRate <= 0) {
    return juce::Result::fail("baud rate must be positive");
  }
  if (sampleRate < 8000.0 || sampleRate > 192000.0) {
    return juce::Result::fail("sample rate must be within 8000..192000 Hz, got " + juce::String(sampleRate));
  }
  if (channels < 1 || channels > 32) {
    return juce::Result::fail("channel count must be within 1..32, got " + juce::String(channels));
  }
  if (wavBitsPerSample != 16 && wavBitsPerSample != 24 && wavBitsPerSample != 32) {
    return juce::Result::fail("WAV bit depth must be 16, 24 or 32");
  }
  if (!(silenceThreshold > 0.0)) {
    return juce::Result::fail("silence threshold must be positive");
  }
  if (interTrialDelaySeconds < 0.0) {
    return juce::Result::fail("inter-trial delay must not be negative");
  }
  if (durationHours < 0.0) {
    return juce::Result::fail("run duration must not be negative");
  }
  if (probeHoldSeconds < 0.0 || evidenceSeconds < 0.0 || resetSettleSeconds < 0.0) {
    return juce::Result::fail("capture and settle intervals must not be negative");
  }
  return juce::Result::ok();
}

}  // namespace patchprobe
