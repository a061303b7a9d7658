//
// PatchProbe command line.
// ------------------------
// This is the one translation unit that owns real hardware.  It reads the
// flags into a `ProbeConfig`, opens the serial port, the MIDI output and the
// audio input once, and hands them to the exploration loop.  Everything the
// loop touches arrives through an interface, so this file is the only place
// where "which device" gets decided.
//
//   patchprobe --list-all
//   patchprobe --run --midi-port=3 --audio-device=2 --com-port=/dev/ttyUSB0
//
// Any startup problem exits with status 1 before the first trial.  Once the
// loop is running, Ctrl-C (or SIGTERM) finishes the current wait, throws away
// the half-done trial and still prints the run summary.
//
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "BuildInfo.h"
#include "PatchProbeConfig.h"
#include "app/Exploration.h"
#include "app/ProbeConfig.h"
#include "app/Timing.h"
#include "engine/Playback.h"
#include "hal/hal_serial.h"
#include "io/ParamSpecReader.h"
#include "io/SynthProtocol.h"
#include "io/TrialStore.h"
#include "juce/Devices.h"
#include "juce/JuceCapture.h"
#include "util/RunLog.h"

static_assert(PatchProbeConfig::kJuceDevices, "the command line needs PATCHPROBE_JUCE_DEVICES=1");

namespace {

using patchprobe::ProbeConfig;
using patchprobe::RunLog;

// Signal handlers may only touch lock-free atomics, which is all StopToken is.
patchprobe::StopToken gStop;

extern "C" void handleStopSignal(int) { gStop.requestStop(); }

juce::File resolve(const std::string& path) {
  return juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
}

juce::String optionValue(const juce::ArgumentList& args, const char* option) {
  return args.getValueForOption(option).trim();
}

bool isInteger(const juce::String& text) {
  const auto digits = text.startsWithChar('-') ? text.substring(1) : text;
  return digits.isNotEmpty() && digits.containsOnly("0123456789");
}

bool isNumber(const juce::String& text) {
  const auto body = text.startsWithChar('-') ? text.substring(1) : text;
  return body.isNotEmpty() && body.containsOnly("0123456789.") &&
         body.indexOfChar('.') == body.lastIndexOfChar('.');
}

void readInt(const juce::ArgumentList& args, const char* option, int& target) {
  const auto value = optionValue(args, option);
  if (value.isEmpty()) {
    return;
  }
  if (!isInteger(value)) {
    juce::ConsoleApplication::fail(juce::String(option) + " expects an integer, got '" + value + "'");
  }
  target = value.getIntValue();
}

void readDouble(const juce::ArgumentList& args, const char* option, double& target) {
  const auto value = optionValue(args, option);
  if (value.isEmpty()) {
    return;
  }
  if (!isNumber(value)) {
    juce::ConsoleApplication::fail(juce::String(option) + " expects a number, got '" + value + "'");
  }
  target = value.getDoubleValue();
}

void readPath(const juce::ArgumentList& args, const char* option, std::string& target) {
  const auto value = optionValue(args, option);
  if (value.isNotEmpty()) {
    target = value.toStdString();
  }
}

ProbeConfig configFromArgs(const juce::ArgumentList& args) {
  ProbeConfig config;
  readInt(args, "--midi-port", config.midiPortIndex);
  readInt(args, "--audio-device", config.audioDeviceIndex);
  readPath(args, "--com-port", config.serialPort);
  readInt(args, "--baudrate", config.baudRate);
  readDouble(args, "--sample-rate", config.sampleRate);
  readInt(args, "--channels", config.channels);
  readDouble(args, "--audio-threshold", config.silenceThreshold);
  readDouble(args, "--sample-delay", config.interTrialDelaySeconds);
  readDouble(args, "--duration", config.durationHours);
  readPath(args, "--csv-file", config.trialLogPath);
  readPath(args, "--param-specs", config.paramSpecPath);
  readPath(args, "--midi-file", config.midiFilePath);
  readPath(args, "--audio-dir", config.audioDir);
  readPath(args, "--log-file", config.runLogPath);

  int seed = 0;
  readInt(args, "--seed", seed);
  if (seed < 0) {
    juce::ConsoleApplication::fail("--seed must not be negative");
  }
  config.rngSeed = static_cast<std::uint32_t>(seed);

  config.rereadProbe = args.containsOption("--reread-probe");
  config.debug = args.containsOption("--debug");
  return config;
}

void listCommand(bool midi, bool audio) {
  juce::ScopedJuceInitialiser_GUI juceRuntime;
  const auto listing = patchprobe::juce_bridge::listDevices();
  std::cout << patchprobe::juce_bridge::formatListing(listing, midi, audio) << std::flush;
}

// Log the failure (once the log exists) and leave with status 1.
void fatal(RunLog& log, const juce::String& message) {
  log.error(message);
  juce::ConsoleApplication::fail(message, 1);
}

void runCommand(const juce::ArgumentList& args) {
  const ProbeConfig config = configFromArgs(args);
  if (const auto valid = config.validate(); valid.failed()) {
    juce::ConsoleApplication::fail(valid.getErrorMessage());
  }

  juce::ScopedJuceInitialiser_GUI juceRuntime;

  RunLog log(config.debug ? RunLog::Level::kDebug : RunLog::Level::kInfo);
  log.setConsoleEcho(!PatchProbeConfig::kQuietMode);
  if (const auto opened = log.openFile(resolve(config.runLogPath)); opened.failed()) {
    juce::ConsoleApplication::fail(opened.getErrorMessage());
  }
  log.info(juce::String("patchprobe ") + PATCHPROBE_GIT + " built " + PATCHPROBE_BUILT);
  for (const auto& flag : PatchProbeConfig::kFlagMatrix) {
    log.debug(juce::String(flag.name) + "=" + (flag.enabled ? "1" : "0") + "  " + flag.story);
  }

  patchprobe::ParameterSpec spec;
  if (const auto read = patchprobe::io::readParamSpec(resolve(config.paramSpecPath), spec, log); read.failed()) {
    fatal(log, read.getErrorMessage());
  }
  juce::MidiMessageSequence sequence;
  if (const auto loaded = patchprobe::engine::Playback::loadSequence(resolve(config.midiFilePath), sequence);
      loaded.failed()) {
    fatal(log, loaded.getErrorMessage());
  }

  if (!hal::serial::PosixSerialPort::supportsBaudRate(config.baudRate)) {
    fatal(log, "baud rate " + juce::String(config.baudRate) + " is not supported here");
  }
  hal::serial::PosixSerialPort port;
  if (const auto opened = port.open(config.serialPort, config.baudRate); opened.failed()) {
    fatal(log, opened.getErrorMessage());
  }
  log.info("serial: " + juce::String(config.serialPort) + " @ " + juce::String(config.baudRate));

  auto midi = patchprobe::juce_bridge::openMidiOutput(config.midiPortIndex);
  if (!midi) {
    fatal(log, "MIDI output index " + juce::String(config.midiPortIndex) + " does not exist (see --list-midi)");
  }
  if (auto info = patchprobe::juce_bridge::findMidiOutput(config.midiPortIndex)) {
    log.info("MIDI output: " + info->name);
  }

  patchprobe::juce_bridge::JuceCapture capture(log);
  if (const auto opened = capture.open(config.audioDeviceIndex, config.sampleRate, config.channels);
      opened.failed()) {
    fatal(log, opened.getErrorMessage());
  }

  patchprobe::SteadyClock clock;
  patchprobe::ParameterController controller(port, clock, log, config.resetSettleSeconds);

  patchprobe::engine::PlaybackSettings settings;
  settings.holdSeconds = config.probeHoldSeconds;
  settings.wavBitsPerSample = config.wavBitsPerSample;
  patchprobe::engine::Playback playback(capture, *midi, clock, log, settings);

  patchprobe::io::TrialStore store(config.trialLogPath, log);
  if (const auto checked = store.verify(); checked.failed()) {
    fatal(log, checked.getErrorMessage());
  }

  std::signal(SIGINT, handleStopSignal);
  std::signal(SIGTERM, handleStopSignal);

  patchprobe::app::ExplorationLoop loop(spec, config, controller, playback, store, clock, gStop, log);
  const auto summary = loop.run();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  capture.close();
  port.close();

  if (summary.ending == patchprobe::app::RunSummary::Ending::kExhausted) {
    log.info("every assignment in the parameter spec has been logged");
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  juce::ConsoleApplication app;
  app.addHelpCommand("--help|-h", "PatchProbe: random parameter exploration for a serial-programmed synth", true);
  app.addVersionCommand("--version", juce::String("patchprobe ") + PATCHPROBE_GIT + " (" + PATCHPROBE_BUILT + ")");

  app.addCommand({"--list-midi", "--list-midi", "List MIDI outputs and exit", {},
                  [](const juce::ArgumentList&) { listCommand(true, false); }});
  app.addCommand({"--list-audio", "--list-audio", "List audio inputs and exit", {},
                  [](const juce::ArgumentList&) { listCommand(false, true); }});
  app.addCommand({"--list-all", "--list-all", "List MIDI outputs and audio inputs and exit", {},
                  [](const juce::ArgumentList&) { listCommand(true, true); }});

  const juce::ConsoleApplication::Command run{
      "--run",
      "--run [--midi-port=N] [--audio-device=N] [--com-port=PATH] [--baudrate=N] [--sample-rate=HZ] "
      "[--channels=N] [--audio-threshold=RMS] [--sample-delay=S] [--duration=H] [--csv-file=PATH] "
      "[--param-specs=PATH] [--midi-file=PATH] [--audio-dir=PATH] [--seed=N] [--reread-probe] [--debug] "
      "[--log-file=PATH]",
      "Explore the parameter space until the duration runs out (default command)",
      "Programs random assignments over serial, records a note probe and a MIDI file pass for each, and "
      "appends every audible one to the trial log. Restarting on the same log resumes where it stopped.",
      runCommand};
  app.addCommand(run);
  app.addDefaultCommand(run);

  return app.findAndRunCommand(argc, argv);
}
