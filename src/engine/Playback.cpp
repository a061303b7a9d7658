#include "engine/Playback.h"

#include <utility>

#include "PatchProbeConfig.h"
#include "app/Timing.h"
#include "io/MidiSink.h"
#include "util/RunLog.h"

namespace patchprobe::engine {

namespace {

// Keeps the recorder running for one scope.  Leaving the scope without
// calling take() still stops the stream and throws the audio away.
class ActiveCapture {
 public:
  explicit ActiveCapture(audio::AudioCapture& capture) : capture_(capture) {}
  ~ActiveCapture() {
    if (live_) {
      (void)capture_.stop();
    }
  }

  ActiveCapture(const ActiveCapture&) = delete;
  ActiveCapture& operator=(const ActiveCapture&) = delete;

  juce::Result start() {
    auto result = capture_.start();
    live_ = result.wasOk();
    return result;
  }

  audio::AudioClip take() {
    live_ = false;
    return capture_.stop();
  }

 private:
  audio::AudioCapture& capture_;
  bool live_{false};
};

CaptureOutcome failed(juce::String why) {
  CaptureOutcome outcome;
  outcome.status = CaptureOutcome::Status::kFailed;
  outcome.error = std::move(why);
  return outcome;
}

CaptureOutcome cancelled() {
  CaptureOutcome outcome;
  outcome.status = CaptureOutcome::Status::kCancelled;
  outcome.error = "stopped before the recording finished";
  return outcome;
}

}  // namespace

Playback::Playback(audio::AudioCapture& capture, MidiSink& midi, Clock& clock, RunLog& log, PlaybackSettings settings)
    : capture_(capture), midi_(midi), clock_(clock), log_(log), settings_(settings) {}

juce::Result Playback::loadSequence(const juce::File& midiFile, juce::MidiMessageSequence& out) {
  out.clear();
  juce::FileInputStream in(midiFile);
  if (in.failedToOpen()) {
    return juce::Result::fail("cannot open MIDI file " + midiFile.getFullPathName());
  }
  juce::MidiFile parsed;
  if (!parsed.readFrom(in)) {
    return juce::Result::fail(midiFile.getFullPathName() + " is not a readable MIDI file");
  }
  parsed.convertTimestampTicksToSeconds();
  for (int t = 0; t < parsed.getNumTracks(); ++t) {
    if (const auto* track = parsed.getTrack(t)) {
      out.addSequence(*track, 0.0);
    }
  }
  return juce::Result::ok();
}

CaptureOutcome Playback::recordNoteProbe(const juce::File& wavFile) {
  if (clock_.stopRequested()) {
    return cancelled();
  }
  const double t0 = clock_.now();
  ScopedMidiPort port(midi_);
  if (port.result().failed()) {
    return failed(port.result().getErrorMessage());
  }
  ActiveCapture recording(capture_);
  const auto started = recording.start();
  if (started.failed()) {
    return failed(started.getErrorMessage());
  }

  log_.info("recording probe to " + wavFile.getFileName());
  const auto noteOff = juce::MidiMessage::noteOff(settings_.midiChannel, settings_.probeNote, static_cast<juce::uint8>(0));

  if (!clock_.sleepFor(settings_.settleSeconds)) {
    return cancelled();
  }
  midi_.send(juce::MidiMessage::noteOn(settings_.midiChannel, settings_.probeNote,
                                       static_cast<juce::uint8>(settings_.probeVelocity)));
  if (!clock_.sleepFor(settings_.holdSeconds)) {
    midi_.send(noteOff);
    return cancelled();
  }
  midi_.send(noteOff);
  if (!clock_.sleepFor(settings_.tailSeconds)) {
    return cancelled();
  }

  CaptureOutcome outcome;
  outcome.status = CaptureOutcome::Status::kRecorded;
  outcome.clip = recording.take();
  outcome.eventsSent = 2;
  outcome.elapsedSeconds = clock_.now() - t0;
  return finishRecording(std::move(outcome), wavFile);
}

CaptureOutcome Playback::recordMidiFile(const juce::File& midiFile, const juce::File& wavFile, double durationSeconds) {
  juce::MidiMessageSequence sequence;
  const auto loaded = loadSequence(midiFile, sequence);
  if (loaded.failed()) {
    return failed(loaded.getErrorMessage());
  }
  if (clock_.stopRequested()) {
    return cancelled();
  }

  ScopedMidiPort port(midi_);
  if (port.result().failed()) {
    return failed(port.result().getErrorMessage());
  }
  ActiveCapture recording(capture_);
  const auto started = recording.start();
  if (started.failed()) {
    return failed(started.getErrorMessage());
  }

  log_.info("recording " + juce::String(durationSeconds) + "s of " + midiFile.getFileName() + " to " +
            wavFile.getFileName());
  const double start = clock_.now();
  std::size_t sent = 0;

  for (int i = 0; i < sequence.getNumEvents(); ++i) {
    const auto& message = sequence.getEventPointer(i)->message;
    if (message.isMetaEvent()) {
      continue;
    }
    const double when = message.getTimeStamp();
    if (when >= durationSeconds) {
      log_.debug("MIDI file cut at " + juce::String(when) + "s by the capture deadline");
      break;
    }
    // An event already due still waits for the stop check, so nothing is
    // sent once the run is over.
    if (!clock_.sleepUntil(start + when) || clock_.stopRequested()) {
      if (sent > 0) {
        allNotesOff();
      }
      return cancelled();
    }
    if constexpr (PatchProbeConfig::kTimingDebug) {
      log_.debug("event " + juce::String(i) + " drift " + juce::String((clock_.now() - start - when) * 1000.0, 2) +
                 " ms");
    }
    midi_.send(message);
    ++sent;
  }
  allNotesOff();

  // Short files are padded with silence so every evidence clip is the same
  // length.
  if (!clock_.sleepUntil(start + durationSeconds)) {
    return cancelled();
  }

  CaptureOutcome outcome;
  outcome.status = CaptureOutcome::Status::kRecorded;
  outcome.elapsedSeconds = clock_.now() - start;
  outcome.clip = recording.take();
  outcome.eventsSent = sent;
  return finishRecording(std::move(outcome), wavFile);
}

void Playback::allNotesOff() {
  for (int channel = 1; channel <= 16; ++channel) {
    midi_.send(juce::MidiMessage::allNotesOff(channel));
  }
}

CaptureOutcome Playback::finishRecording(CaptureOutcome outcome, const juce::File& wavFile) {
  const auto saved = audio::saveWav(outcome.clip, wavFile, settings_.wavBitsPerSample);
  if (saved.failed()) {
    outcome.status = CaptureOutcome::Status::kFailed;
    outcome.error = saved.getErrorMessage();
    return outcome;
  }
  log_.info("audio saved to " + wavFile.getFileName() + " (" + juce::String(outcome.clip.seconds(), 2) + "s)");
  return outcome;
}

}  // namespace patchprobe::engine
