#pragma once

//
// CaptureBuffer.h
// ---------------
// Handoff between the audio device thread (the only producer) and the control
// thread (the only consumer).  The device callback appends one interleaved
// chunk per block; chunk sizes follow whatever the driver delivers.  The
// control thread calls `seal()` when recording stops: once it returns no
// append is running and any later append is dropped, so `finish()` can stitch
// the chunks together without racing the driver.
#include <cstddef>
#include <mutex>
#include <vector>

#include "audio/AudioClip.h"

namespace patchprobe::audio {

class CaptureBuffer {
 public:
  // Forget previous chunks and start accepting blocks of `channels` width.
  void open(int channels);

  // Producer side.  `channelData` holds `numChannels` planar pointers (any of
  // them may be null); missing or null channels are written as silence.
  // Returns false when the buffer is sealed and the block was dropped.
  bool append(const float* const* channelData, int numChannels, int numFrames);

  // Stop fence.
  void seal();

  // Consumer side, valid after seal().  Concatenates every chunk in arrival
  // order and leaves the buffer empty.
  AudioClip finish(double sampleRate);

  bool sealed() const;
  std::size_t chunkCount() const;
  // Blocks that arrived with fewer channels than the buffer was opened for.
  std::size_t shortBlocks() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::vector<float>> chunks_;
  int channels_{0};
  bool sealed_{true};
  std::size_t shortBlocks_{0};
};

}  // namespace patchprobe::audio
