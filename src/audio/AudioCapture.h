#pragma once

//
// AudioCapture.h
// --------------
// What the playback layer needs from an audio input: start recording, stop,
// get the clip.  The JUCE device implementation lives in src/juce/; tests use
// a fake that synthesizes blocks as the clock advances.
#include <juce_core/juce_core.h>

#include "audio/AudioClip.h"

namespace patchprobe::audio {

class AudioCapture {
 public:
  virtual ~AudioCapture() = default;

  // Begin accumulating input.  Failing to start leaves nothing running.
  virtual juce::Result start() = 0;

  // Stop the stream and return everything delivered since start().  The
  // producer is fenced off before this returns.  Called without a matching
  // start() it returns an empty clip.
  virtual AudioClip stop() = 0;

  virtual bool running() const = 0;
  virtual double sampleRate() const = 0;
  virtual int channels() const = 0;
};

}  // namespace patchprobe::audio
