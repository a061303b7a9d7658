#pragma once

//
// ProbeConfig.h
// -------------
// Everything a run needs to know about the rig and the bookkeeping files.  The
// CLI fills one of these in, `validate()` vets it once at startup, and from
// then on every component receives the pieces it cares about by reference.
// Nothing downstream reaches for a hard-coded device index or path.
#include <cstdint>
#include <string>

#include <juce_core/juce_core.h>

namespace patchprobe {

struct ProbeConfig {
  // Files.
  std::string trialLogPath{"restricted_parameter_data.csv"};
  std::string paramSpecPath{"param_specs.csv"};
  std::string midiFilePath{"test_synth.mid"};
  std::string audioDir{"."};
  std::string runLogPath{"parameter_testing.log"};

  // Devices.
  int midiPortIndex{3};
  int audioDeviceIndex{2};
  std::string serialPort{"/dev/ttyUSB0"};
  int baudRate{500000};

  // Capture.
  double sampleRate{48000.0};
  int channels{2};
  int wavBitsPerSample{16};
  double silenceThreshold{0.01};
  bool rereadProbe{false};

  // Timing, all wall clock.
  double interTrialDelaySeconds{0.5};
  double durationHours{24.0};
  double probeHoldSeconds{10.0};
  double evidenceSeconds{10.0};
  double resetSettleSeconds{1.0};

  // 0 picks a time-derived seed; the chosen value is logged either way.
  std::uint32_t rngSeed{0};

  bool debug{false};

  double durationSeconds() const { return durationHours * 3600.0; }

  // Vet ranges and required paths.  The first problem found is reported in
  // the failure message.
  juce::Result validate() const;
};

}  // namespace patchprobe
