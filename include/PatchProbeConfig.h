#pragma once

//
// Build-time switches.
// --------------------
// One header for every `-D` toggle the build understands.  Touch this file
// whenever a new switch appears so the CLI's startup banner (which prints the
// flag matrix below) and CMakeLists.txt stay in sync.

// Real device backends.  When enabled the JUCE audio/MIDI device glue under
// src/juce/ is compiled in.  The core library and the tests build with it off
// so they never need a sound card.
#ifndef PATCHPROBE_JUCE_DEVICES
#define PATCHPROBE_JUCE_DEVICES 0
#endif

// Quiet mode drops the console echo of the run log.  The log file still gets
// every line.
#ifndef PATCHPROBE_QUIET
#define PATCHPROBE_QUIET 0
#endif

// Timing breadcrumbs.  Logs per-event scheduling drift during MIDI file
// playback at debug level.
#ifndef PATCHPROBE_DEBUG_TIMING
#define PATCHPROBE_DEBUG_TIMING 0
#endif

namespace PatchProbeConfig {

constexpr bool kJuceDevices = (PATCHPROBE_JUCE_DEVICES != 0);
constexpr bool kQuietMode = (PATCHPROBE_QUIET != 0);
constexpr bool kTimingDebug = (PATCHPROBE_DEBUG_TIMING != 0);

static_assert(PATCHPROBE_JUCE_DEVICES == 0 || PATCHPROBE_JUCE_DEVICES == 1,
              "PATCHPROBE_JUCE_DEVICES must be 0 or 1");
static_assert(PATCHPROBE_QUIET == 0 || PATCHPROBE_QUIET == 1,
              "PATCHPROBE_QUIET must be 0 or 1");
static_assert(PATCHPROBE_DEBUG_TIMING == 0 || PATCHPROBE_DEBUG_TIMING == 1,
              "PATCHPROBE_DEBUG_TIMING must be 0 or 1");

struct FlagSummary {
  const char* name;
  bool enabled;
  const char* story;
};

inline constexpr FlagSummary kFlagMatrix[] = {
    {"PATCHPROBE_JUCE_DEVICES", kJuceDevices,
     "JUCE device build. Talks to real audio inputs and MIDI outputs."},
    {"PATCHPROBE_QUIET", kQuietMode,
     "Run log goes to the file only, no console echo."},
    {"PATCHPROBE_DEBUG_TIMING", kTimingDebug,
     "Per-event MIDI playback drift at debug level."},
};

}  // namespace PatchProbeConfig
