#pragma once

//
// MidiSink.h
// ----------
// Outbound MIDI as the playback layer sees it.  The port is opened for the
// span of one capture and closed again; `ScopedMidiPort` makes sure the close
// happens on every way out of that span.
#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>

namespace patchprobe {

class MidiSink {
 public:
  virtual ~MidiSink() = default;

  virtual juce::Result open() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  // Send immediately.  Dropped silently when the port is closed.
  virtual void send(const juce::MidiMessage& message) = 0;
};

class ScopedMidiPort {
 public:
  explicit ScopedMidiPort(MidiSink& sink) : sink_(sink), result_(sink.open()) {}
  ~ScopedMidiPort() {
    if (result_.wasOk()) {
      sink_.close();
    }
  }

  ScopedMidiPort(const ScopedMidiPort&) = delete;
  ScopedMidiPort& operator=(const ScopedMidiPort&) = delete;

  const juce::Result& result() const { return result_; }

 private:
  MidiSink& sink_;
  juce::Result result_;
};

}  // namespace patchprobe
