#pragma once

#include "PatchProbeConfig.h"

#if PATCHPROBE_JUCE_DEVICES

#include <atomic>

#include <juce_audio_devices/juce_audio_devices.h>

#include "audio/AudioCapture.h"
#include "audio/CaptureBuffer.h"

namespace patchprobe {
class RunLog;
}

namespace patchprobe::juce_bridge {

// Audio input on a real interface.  The device is opened once per run through
// a juce::AudioDeviceManager; each recording just registers this object as the
// manager's callback and unregisters it again.  JUCE holds its callback lock
// while unregistering, so once stop() has removed us no block is mid-delivery
// and the CaptureBuffer can be sealed and read.
class JuceCapture final : public audio::AudioCapture, public juce::AudioIODeviceCallback {
 public:
  explicit JuceCapture(RunLog& log);
  ~JuceCapture() override;

  // Open input device `inputDeviceIndex` (see listDevices()) at the requested
  // format.  Any mismatch between what was asked and what the driver granted
  // is a failure: a run must not silently record at the wrong rate.
  juce::Result open(int inputDeviceIndex, double sampleRate, int channels);
  void close();

  juce::Result start() override;
  audio::AudioClip stop() override;
  bool running() const override { return running_.load(); }
  double sampleRate() const override { return sampleRate_; }
  int channels() const override { return channels_; }

  void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
  void audioDeviceStopped() override;
  void audioDeviceError(const juce::String& errorMessage) override;
  void audioDeviceIOCallbackWithContext(const float* const* inputChannelData, int numInputChannels,
                                        float* const* outputChannelData, int numOutputChannels, int numSamples,
                                        const juce::AudioIODeviceCallbackContext& context) override;

 private:
  RunLog& log_;
  juce::AudioDeviceManager deviceManager_;
  audio::CaptureBuffer buffer_;
  std::atomic<bool> running_{false};
  std::atomic<int> deviceErrors_{0};
  double sampleRate_{0.0};
  int channels_{0};
  int xrunsAtStart_{0};
};

}  // namespace patchprobe::juce_bridge

#endif  // PATCHPROBE_JUCE_DEVICES
