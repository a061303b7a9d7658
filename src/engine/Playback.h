#pragma once

//
// Playback.h
// ----------
// Plays something into the synth while recording what comes out.  Two flavours:
//
// - Note probe: a single held note.  Cheap, short and identical for every
//   trial, so it answers "does this patch make any sound at all?"
// - MIDI file: a pre-authored phrase forwarded with its own timing, clipped or
//   padded so the recording is always exactly `duration` long.  This is the
//   evidence that gets stored with an accepted trial.
//
// Capture runs for the whole span of either mode.  The recorder is always
// stopped and the MIDI port always closed before a call returns, whatever the
// outcome; the WAV is written only for a complete recording.
#include <cstddef>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>

#include "audio/AudioCapture.h"
#include "audio/WavFile.h"

namespace patchprobe {

class Clock;
class MidiSink;
class RunLog;

namespace engine {

struct PlaybackSettings {
  double settleSeconds{0.1};  // capture running, before note-on
  double holdSeconds{10.0};   // note-on to note-off
  double tailSeconds{1.0};    // note-off to capture stop, catches the release
  int probeNote{60};
  int probeVelocity{127};
  int midiChannel{1};  // 1-based, as juce::MidiMessage wants it
  int wavBitsPerSample{audio::kDefaultWavBits};
};

struct CaptureOutcome {
  enum class Status { kRecorded, kFailed, kCancelled };

  Status status{Status::kFailed};
  audio::AudioClip clip;
  juce::String error;
  double elapsedSeconds{0.0};
  std::size_t eventsSent{0};

  bool recorded() const { return status == Status::kRecorded; }
};

class Playback {
 public:
  Playback(audio::AudioCapture& capture, MidiSink& midi, Clock& clock, RunLog& log, PlaybackSettings settings = {});

  CaptureOutcome recordNoteProbe(const juce::File& wavFile);

  CaptureOutcome recordMidiFile(const juce::File& midiFile, const juce::File& wavFile, double durationSeconds);

  // Parse a Standard MIDI File into one time-sorted sequence, timestamps in
  // seconds, all tracks merged.
  static juce::Result loadSequence(const juce::File& midiFile, juce::MidiMessageSequence& out);

  const PlaybackSettings& settings() const { return settings_; }

 private:
  void allNotesOff();
  CaptureOutcome finishRecording(CaptureOutcome outcome, const juce::File& wavFile);

  audio::AudioCapture& capture_;
  MidiSink& midi_;
  Clock& clock_;
  RunLog& log_;
  PlaybackSettings settings_;
};

}  // namespace engine
}  // namespace patchprobe
