#include "audio/WavFile.h"

#include <memory>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

namespace patchprobe::audio {

juce::Result saveWav(const AudioClip& clip, const juce::File& file, int bitsPerSample) {
  if (clip.channels <= 0 || clip.sampleRate <= 0.0) {
    return juce::Result::fail("cannot write " + file.getFileName() + ": clip has no format");
  }
  if (bitsPerSample != 16 && bitsPerSample != 24 && bitsPerSample != 32) {
    return juce::Result::fail("unsupported WAV bit depth " + juce::String(bitsPerSample));
  }

  const auto folder = file.getParentDirectory().createDirectory();
  if (folder.failed()) {
    return folder;
  }
  if (file.existsAsFile() && !file.deleteFile()) {
    return juce::Result::fail("cannot replace " + file.getFullPathName());
  }

  std::unique_ptr<juce::FileOutputStream> stream(file.createOutputStream());
  if (!stream || stream->failedToOpen()) {
    return juce::Result::fail("cannot open " + file.getFullPathName() + " for writing");
  }

  juce::WavAudioFormat wav;
  std::unique_ptr<juce::AudioFormatWriter> writer(wav.createWriterFor(
      stream.get(), clip.sampleRate, static_cast<unsigned int>(clip.channels), bitsPerSample, {}, 0));
  if (!writer) {
    return juce::Result::fail("WAV writer refused " + file.getFullPathName());
  }
  stream.release();  // the writer owns the stream now

  const int frames = static_cast<int>(clip.frames());
  juce::AudioBuffer<float> planar(clip.channels, frames);
  for (int ch = 0; ch < clip.channels; ++ch) {
    float* dest = planar.getWritePointer(ch);
    for (int i = 0; i < frames; ++i) {
      dest[i] = clip.samples[static_cast<std::size_t>(i) * static_cast<std::size_t>(clip.channels) +
                             static_cast<std::size_t>(ch)];
    }
  }

  if (frames > 0 && !writer->writeFromAudioSampleBuffer(planar, 0, frames)) {
    return juce::Result::fail("short write to " + file.getFullPathName());
  }
  if (!writer->flush()) {
    return juce::Result::fail("flush failed for " + file.getFullPathName());
  }
  return juce::Result::ok();
}

juce::Result loadWav(const juce::File& file, AudioClip& out) {
  out = AudioClip{};
  juce::AudioFormatManager formats;
  formats.registerBasicFormats();
  std::unique_ptr<juce::AudioFormatReader> reader(formats.createReaderFor(file));
  if (!reader) {
    return juce::Result::fail("cannot read audio from " + file.getFullPathName());
  }

  const int channels = static_cast<int>(reader->numChannels);
  const int frames = static_cast<int>(reader->lengthInSamples);
  juce::AudioBuffer<float> planar(channels, frames);
  if (frames > 0 && !reader->read(&planar, 0, frames, 0, true, true)) {
    return juce::Result::fail("read failed for " + file.getFullPathName());
  }

  out.channels = channels;
  out.sampleRate = reader->sampleRate;
  out.samples.resize(static_cast<std::size_t>(frames) * static_cast<std::size_t>(channels));
  for (int ch = 0; ch < channels; ++ch) {
    const float* src = planar.getReadPointer(ch);
    for (int i = 0; i < frames; ++i) {
      out.samples[static_cast<std::size_t>(i) * static_cast<std::size_t>(channels) + static_cast<std::size_t>(ch)] =
          src[i];
    }
  }
  return juce::Result::ok();
}

}  // namespace patchprobe::audio
