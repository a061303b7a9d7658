#include "juce/JuceCapture.h"

#if PATCHPROBE_JUCE_DEVICES

#include <cmath>

#include "juce/Devices.h"
#include "util/RunLog.h"

namespace patchprobe::juce_bridge {

JuceCapture::JuceCapture(RunLog& log) : log_(log) {}

JuceCapture::~JuceCapture() { close(); }

juce::Result JuceCapture::open(int inputDeviceIndex, double sampleRate, int channels) {
  close();

  auto* type = inputDeviceType(deviceManager_);
  if (!type) {
    return juce::Result::fail("no audio input devices found");
  }
  const auto names = type->getDeviceNames(true);
  if (inputDeviceIndex < 0 || inputDeviceIndex >= names.size()) {
    return juce::Result::fail("audio input index " + juce::String(inputDeviceIndex) + " out of range (" +
                              juce::String(names.size()) + " devices)");
  }

  const juce::String initError = deviceManager_.initialise(channels, 0, nullptr, false);
  if (initError.isNotEmpty()) {
    log_.debug("default audio device did not open: " + initError);
  }
  deviceManager_.setCurrentAudioDeviceType(type->getTypeName(), true);

  auto setup = deviceManager_.getAudioDeviceSetup();
  setup.inputDeviceName = names[inputDeviceIndex];
  setup.outputDeviceName = {};
  setup.sampleRate = sampleRate;
  setup.useDefaultInputChannels = false;
  setup.inputChannels.clear();
  setup.inputChannels.setRange(0, channels, true);
  setup.useDefaultOutputChannels = false;
  setup.outputChannels.clear();

  const juce::String setupError = deviceManager_.setAudioDeviceSetup(setup, true);
  if (setupError.isNotEmpty()) {
    return juce::Result::fail("cannot open " + setup.inputDeviceName + ": " + setupError);
  }

  auto* device = deviceManager_.getCurrentAudioDevice();
  if (!device) {
    return juce::Result::fail("cannot open " + setup.inputDeviceName);
  }
  if (std::abs(device->getCurrentSampleRate() - sampleRate) > 0.5) {
    const auto granted = device->getCurrentSampleRate();
    deviceManager_.closeAudioDevice();
    return juce::Result::fail(setup.inputDeviceName + " runs at " + juce::String(granted) + " Hz, not " +
                              juce::String(sampleRate));
  }
  if (device->getActiveInputChannels().countNumberOfSetBits() < channels) {
    deviceManager_.closeAudioDevice();
    return juce::Result::fail(setup.inputDeviceName + " cannot provide " + juce::String(channels) +
                              " input channels");
  }

  sampleRate_ = sampleRate;
  channels_ = channels;
  log_.info("audio input: " + setup.inputDeviceName + " @ " + juce::String(sampleRate_) + " Hz, " +
            juce::String(channels_) + " ch, block " + juce::String(device->getCurrentBufferSizeSamples()));
  return juce::Result::ok();
}

void JuceCapture::close() {
  if (running_.load()) {
    (void)stop();
  }
  deviceManager_.closeAudioDevice();
}

juce::Result JuceCapture::start() {
  if (running_.load()) {
    return juce::Result::fail("capture already running");
  }
  auto* device = deviceManager_.getCurrentAudioDevice();
  if (!device || !device->isOpen()) {
    return juce::Result::fail("audio input is not open");
  }
  buffer_.open(channels_);
  deviceErrors_.store(0);
  xrunsAtStart_ = device->getXRunCount();
  running_.store(true);
  deviceManager_.addAudioCallback(this);
  return juce::Result::ok();
}

audio::AudioClip JuceCapture::stop() {
  if (!running_.exchange(false)) {
    audio::AudioClip empty;
    empty.channels = channels_;
    empty.sampleRate = sampleRate_;
    return empty;
  }

  deviceManager_.removeAudioCallback(this);
  buffer_.seal();

  // Overflows and driver hiccups cost a few samples, not the recording.
  if (auto* device = deviceManager_.getCurrentAudioDevice()) {
    const int xruns = device->getXRunCount() - xrunsAtStart_;
    if (xruns > 0) {
      log_.warning("audio input reported " + juce::String(xruns) + " overflow/underflow event(s) during capture");
    }
  }
  if (const auto shortBlocks = buffer_.shortBlocks(); shortBlocks > 0) {
    log_.warning(juce::String(static_cast<int>(shortBlocks)) + " block(s) arrived with missing channels");
  }
  if (const int errors = deviceErrors_.load(); errors > 0) {
    log_.warning("audio device raised " + juce::String(errors) + " error(s) during capture");
  }
  return buffer_.finish(sampleRate_);
}

void JuceCapture::audioDeviceAboutToStart(juce::AudioIODevice* device) {
  if (device) {
    log_.debug("audio device starting: " + device->getName());
  }
}

void JuceCapture::audioDeviceStopped() {}

void JuceCapture::audioDeviceError(const juce::String&) { deviceErrors_.fetch_add(1); }

void JuceCapture::audioDeviceIOCallbackWithContext(const float* const* inputChannelData, int numInputChannels,
                                                   float* const* outputChannelData, int numOutputChannels,
                                                   int numSamples, const juce::AudioIODeviceCallbackContext&) {
  for (int ch = 0; ch < numOutputChannels; ++ch) {
    if (outputChannelData[ch]) {
      juce::FloatVectorOperations::clear(outputChannelData[ch], numSamples);
    }
  }
  if (running_.load(std::memory_order_relaxed)) {
    buffer_.append(inputChannelData, numInputChannels, numSamples);
  }
}

}  // namespace patchprobe::juce_bridge

#endif  // PATCHPROBE_JUCE_DEVICES
