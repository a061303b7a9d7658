#pragma once

//
// Silence gate.
// -------------
// One number decides whether a probe is worth keeping: the RMS over every
// sample of every channel.  Strictly below the threshold is silence; a clip
// sitting exactly on the threshold counts as sound.
#include "audio/AudioClip.h"

namespace patchprobe::audio {

inline constexpr double kDefaultSilenceThreshold = 0.01;

// Root mean square across all interleaved samples, 0 for an empty clip.
double rms(const AudioClip& clip);

bool isSilent(const AudioClip& clip, double threshold = kDefaultSilenceThreshold);

}  // namespace patchprobe::audio
