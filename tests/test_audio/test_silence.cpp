#include <unity.h>

#include "audio/Silence.h"

using patchprobe::audio::AudioClip;

namespace {

AudioClip squareClip(float level, std::size_t frames, int channels = 2) {
  AudioClip clip;
  clip.channels = channels;
  clip.sampleRate = 48000.0;
  clip.samples.resize(frames * static_cast<std::size_t>(channels));
  for (std::size_t i = 0; i < clip.samples.size(); ++i) {
    clip.samples[i] = (i % 2 == 0) ? level : -level;
  }
  return clip;
}

}  // namespace

void test_silence_zero_clip_is_silent_at_any_threshold() {
  const auto clip = squareClip(0.0f, 4800);
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(clip, 1e-6f));
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(clip, 0.01f));
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(AudioClip{}, 1e-6f));
  TEST_ASSERT_EQUAL_FLOAT(0.0f, static_cast<float>(patchprobe::audio::rms(AudioClip{})));
}

void test_silence_rms_on_threshold_counts_as_sound() {
  const auto clip = squareClip(0.5f, 1000);
  TEST_ASSERT_EQUAL_FLOAT(0.5f, static_cast<float>(patchprobe::audio::rms(clip)));
  TEST_ASSERT_FALSE(patchprobe::audio::isSilent(clip, 0.5f));
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(clip, 0.5001f));
}

void test_silence_default_threshold_separates_hiss_from_tone() {
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(squareClip(0.001f, 4800)));
  TEST_ASSERT_FALSE(patchprobe::audio::isSilent(squareClip(0.25f, 4800)));
}

void test_silence_threshold_keeps_double_precision() {
  // 0.01f sits just below 0.01; narrowing the threshold to float would call
  // this clip sound.
  AudioClip clip;
  clip.channels = 1;
  clip.sampleRate = 48000.0;
  clip.samples.assign(4800, 0.01f);
  TEST_ASSERT_TRUE(patchprobe::audio::rms(clip) < 0.01);
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(clip, 0.01));
  TEST_ASSERT_TRUE(patchprobe::audio::isSilent(clip));
}
