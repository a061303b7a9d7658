#pragma once

//
// WavFile.h
// ---------
// Uncompressed PCM WAV in and out, through juce::WavAudioFormat.
#include <juce_core/juce_core.h>

#include "audio/AudioClip.h"

namespace patchprobe::audio {

constexpr int kDefaultWavBits = 16;

// Overwrite `file` with `clip`.  Parent folders are created.  16, 24 and
// 32-bit depths are supported.
juce::Result saveWav(const AudioClip& clip, const juce::File& file, int bitsPerSample = kDefaultWavBits);

// Read `file` back as normalized floats.
juce::Result loadWav(const juce::File& file, AudioClip& out);

}  // namespace patchprobe::audio
