#pragma once

#include <cstddef>
#include <vector>

namespace patchprobe::audio {

// A finished recording: interleaved float frames at a fixed rate.  Once a
// capture hands one out nobody appends to it again.
struct AudioClip {
  std::vector<float> samples;  // frame-major: L R L R ...
  int channels{0};
  double sampleRate{0.0};

  std::size_t frames() const {
    return channels > 0 ? samples.size() / static_cast<std::size_t>(channels) : 0;
  }
  double seconds() const { return sampleRate > 0.0 ? static_cast<double>(frames()) / sampleRate : 0.0; }
  bool empty() const { return samples.empty(); }
};

}  // namespace patchprobe::audio
