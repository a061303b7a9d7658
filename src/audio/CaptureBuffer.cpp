#include "audio/CaptureBuffer.h"

#include <algorithm>

namespace patchprobe::audio {

void CaptureBuffer::open(int channels) {
  std::scoped_lock lock(mutex_);
  chunks_.clear();
  channels_ = std::max(channels, 0);
  sealed_ = false;
  shortBlocks_ = 0;
}

bool CaptureBuffer::append(const float* const* channelData, int numChannels, int numFrames) {
  std::scoped_lock lock(mutex_);
  if (sealed_ || channels_ == 0 || numFrames <= 0) {
    return false;
  }

  const auto frames = static_cast<std::size_t>(numFrames);
  const auto width = static_cast<std::size_t>(channels_);
  std::vector<float> chunk(frames * width, 0.0f);
  if (numChannels < channels_) {
    ++shortBlocks_;
  }
  const int usable = channelData ? std::min(numChannels, channels_) : 0;
  for (int ch = 0; ch < usable; ++ch) {
    const float* src = channelData[ch];
    if (!src) {
      continue;
    }
    for (std::size_t i = 0; i < frames; ++i) {
      chunk[i * width + static_cast<std::size_t>(ch)] = src[i];
    }
  }
  chunks_.push_back(std::move(chunk));
  return true;
}

void CaptureBuffer::seal() {
  // Taking the lock waits out an append already in flight.
  std::scoped_lock lock(mutex_);
  sealed_ = true;
}

AudioClip CaptureBuffer::finish(double sampleRate) {
  std::scoped_lock lock(mutex_);
  AudioClip clip;
  clip.channels = channels_;
  clip.sampleRate = sampleRate;
  if (!sealed_) {
    return clip;
  }

  std::size_t total = 0;
  for (const auto& chunk : chunks_) {
    total += chunk.size();
  }
  clip.samples.reserve(total);
  for (const auto& chunk : chunks_) {
    clip.samples.insert(clip.samples.end(), chunk.begin(), chunk.end());
  }
  chunks_.clear();
  return clip;
}

bool CaptureBuffer::sealed() const {
  std::scoped_lock lock(mutex_);
  return sealed_;
}

std::size_t CaptureBuffer::chunkCount() const {
  std::scoped_lock lock(mutex_);
  return chunks_.size();
}

std::size_t CaptureBuffer::shortBlocks() const {
  std::scoped_lock lock(mutex_);
  return shortBlocks_;
}

}  // namespace patchprobe::audio
