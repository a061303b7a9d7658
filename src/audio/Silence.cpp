#include "audio/Silence.h"

#include <cmath>

namespace patchprobe::audio {

double rms(const AudioClip& clip) {
  if (clip.samples.empty()) {
    return 0.0;
  }
  double sumSquares = 0.0;
  for (const float s : clip.samples) {
    sumSquares += static_cast<double>(s) * static_cast<double>(s);
  }
  return std::sqrt(sumSquares / static_cast<double>(clip.samples.size()));
}

bool isSilent(const AudioClip& clip, double threshold) { return rms(clip) < threshold; }

}  // namespace patchprobe::audio
