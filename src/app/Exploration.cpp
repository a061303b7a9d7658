#include "app/Exploration.h"

#include <exception>

#include "app/Timing.h"
#include "audio/Silence.h"
#include "audio/WavFile.h"
#include "engine/Playback.h"
#include "io/SynthProtocol.h"
#include "io/TrialStore.h"
#include "util/RunLog.h"

namespace patchprobe::app {

namespace {

juce::File resolve(const std::string& path) {
  return juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
}

}  // namespace

const char* endingName(RunSummary::Ending ending) {
  switch (ending) {
    case RunSummary::Ending::kDeadline:
      return "deadline";
    case RunSummary::Ending::kCancelled:
      return "cancelled";
    case RunSummary::Ending::kExhausted:
      return "exhausted";
  }
  return "?";
}

ExplorationLoop::ExplorationLoop(const ParameterSpec& spec, const ProbeConfig& config,
                                 ParameterController& controller, engine::Playback& playback, io::TrialStore& store,
                                 Clock& clock, StopToken& stop, RunLog& log)
    : spec_(spec),
      config_(config),
      controller_(controller),
      playback_(playback),
      store_(store),
      clock_(clock),
      stop_(stop),
      log_(log),
      audioDir_(resolve(config.audioDir)) {}

juce::File ExplorationLoop::probeFile(int index) const { return audioDir_.getChildFile(juce::String(index) + ".wav"); }

juce::File ExplorationLoop::evidenceFile(int index) const {
  return audioDir_.getChildFile(juce::String(index) + "_test.wav");
}

std::uint32_t ExplorationLoop::pickSeed() const {
  if (config_.rngSeed != 0) {
    return config_.rngSeed;
  }
  const auto ticks = static_cast<std::uint64_t>(juce::Time::getHighResolutionTicks());
  const auto millis = static_cast<std::uint64_t>(juce::Time::currentTimeMillis());
  const auto mixed = static_cast<std::uint32_t>((ticks ^ (ticks >> 32) ^ millis) & 0xFFFFFFFFu);
  return mixed != 0 ? mixed : 1u;
}

RunSummary ExplorationLoop::run() {
  RunSummary summary;
  const double started = clock_.now();
  clock_.watch(&stop_, started + config_.durationSeconds());

  const auto resume = store_.resumeState();
  std::set<std::string> tried = resume.tried;
  int index = resume.nextIndex;
  summary.firstIndex = index;

  // Rows logged under an older parameter spec stay in the tried-set but do
  // not count toward covering this one.
  const std::uint64_t space = spaceSize(spec_);
  std::uint64_t covered = 0;
  for (const auto& key : tried) {
    const auto parsed = parseAssignmentJson(key);
    if (parsed && assignmentMatchesSpec(*parsed, spec_)) {
      ++covered;
    }
  }

  summary.seed = pickSeed();
  std::uint32_t rng = summary.seed;
  log_.info("run starting: " + juce::String(static_cast<int>(spec_.size())) + " parameters, " +
            juce::String(static_cast<juce::uint64>(covered)) + " of " + juce::String(static_cast<juce::uint64>(space)) +
            " assignments already logged, next index " + juce::String(index) + ", seed " +
            juce::String(static_cast<juce::int64>(summary.seed)) + ", " + juce::String(config_.durationHours) +
            " h budget");

  for (;;) {
    if (clock_.stopRequested()) {
      summary.ending = stop_.stopRequested() ? RunSummary::Ending::kCancelled : RunSummary::Ending::kDeadline;
      break;
    }
    if (covered >= space) {
      summary.ending = RunSummary::Ending::kExhausted;
      break;
    }

    const auto assignment = sampleAssignment(spec_, rng);
    const auto key = canonicalJson(assignment);
    if (tried.count(key) != 0) {
      ++summary.duplicates;
      log_.debug("already tried " + juce::String(key));
      continue;
    }

    ++summary.attempts;
    const Attempt outcome = attempt(index, assignment);
    switch (outcome) {
      case Attempt::kAccepted:
        tried.insert(key);
        ++covered;
        ++index;
        ++summary.accepted;
        break;
      case Attempt::kSilent:
        ++summary.silent;
        break;
      case Attempt::kFailed:
        ++summary.failures;
        break;
      case Attempt::kAbandoned:
        log_.info("trial " + juce::String(index) + " abandoned, nothing logged");
        break;
    }
    // Every attempt that reached the device is followed by the pause, failed
    // ones included, so a dead link cannot spin the loop.  A stop during the
    // pause is picked up at the top of the loop.
    if (outcome != Attempt::kAbandoned) {
      clock_.sleepFor(config_.interTrialDelaySeconds);
    }
  }

  summary.nextIndex = index;
  summary.elapsedSeconds = clock_.now() - started;
  clock_.watch(nullptr);

  log_.info(juce::String("run ended (") + endingName(summary.ending) + "): " + juce::String(summary.accepted) +
            " accepted, " + juce::String(summary.silent) + " silent, " + juce::String(summary.duplicates) +
            " duplicates, " + juce::String(summary.failures) + " failures in " +
            juce::String(summary.elapsedSeconds, 1) + " s; next index " + juce::String(summary.nextIndex));
  return summary;
}

ExplorationLoop::Attempt ExplorationLoop::attempt(int index, const ParameterAssignment& assignment) {
  try {
    return tryAttempt(index, assignment);
  } catch (const std::exception& e) {
    log_.error("trial " + juce::String(index) + " threw: " + juce::String(e.what()));
    discard(index);
    resetAfterFailure();
    return Attempt::kFailed;
  }
}

ExplorationLoop::Attempt ExplorationLoop::tryAttempt(int index, const ParameterAssignment& assignment) {
  log_.info("trial " + juce::String(index) + ": " + juce::String(canonicalJson(assignment)));

  if (!program(assignment)) {
    resetAfterFailure();
    return clock_.stopRequested() ? Attempt::kAbandoned : Attempt::kFailed;
  }

  const auto probeWav = probeFile(index);
  const auto probe = playback_.recordNoteProbe(probeWav);
  const auto probeReset = controller_.sendReset();
  if (probe.status == engine::CaptureOutcome::Status::kCancelled) {
    discard(index);
    return Attempt::kAbandoned;
  }
  if (!probe.recorded()) {
    log_.warning("probe for trial " + juce::String(index) + " failed: " + probe.error);
    discard(index);
    return Attempt::kFailed;
  }
  if (probeReset.failed()) {
    log_.warning("reset after probe failed: " + probeReset.getErrorMessage());
    discard(index);
    return Attempt::kFailed;
  }

  audio::AudioClip reread;
  const audio::AudioClip* measured = &probe.clip;
  if (config_.rereadProbe) {
    const auto loaded = audio::loadWav(probeWav, reread);
    if (loaded.failed()) {
      log_.warning("cannot re-read probe: " + loaded.getErrorMessage());
      discard(index);
      return Attempt::kFailed;
    }
    measured = &reread;
  }
  const double level = audio::rms(*measured);
  if (audio::isSilent(*measured, config_.silenceThreshold)) {
    log_.info("trial " + juce::String(index) + " silent (rms " + juce::String(level, 5) + "), discarded");
    discard(index);
    return Attempt::kSilent;
  }
  log_.debug("probe rms " + juce::String(level, 5));

  if (clock_.stopRequested()) {
    discard(index);
    return Attempt::kAbandoned;
  }

  const auto evidence =
      playback_.recordMidiFile(resolve(config_.midiFilePath), evidenceFile(index), config_.evidenceSeconds);
  const auto evidenceReset = controller_.sendReset();
  if (evidence.status == engine::CaptureOutcome::Status::kCancelled) {
    discard(index);
    return Attempt::kAbandoned;
  }
  if (!evidence.recorded()) {
    log_.warning("evidence for trial " + juce::String(index) + " failed: " + evidence.error);
    discard(index);
    return Attempt::kFailed;
  }
  if (evidenceReset.failed()) {
    log_.warning("reset after evidence failed: " + evidenceReset.getErrorMessage());
    discard(index);
    return Attempt::kFailed;
  }

  const auto appended = store_.append(index, assignment);
  if (appended.failed()) {
    log_.error("cannot log trial " + juce::String(index) + ": " + appended.getErrorMessage());
    discard(index);
    return Attempt::kFailed;
  }
  log_.info("trial " + juce::String(index) + " accepted");
  return Attempt::kAccepted;
}

bool ExplorationLoop::program(const ParameterAssignment& assignment) {
  for (const auto& [id, value] : assignment) {
    if (clock_.stopRequested()) {
      return false;
    }
    const auto sent = controller_.sendSet(id, value);
    if (sent.failed()) {
      log_.warning("programming failed: " + sent.getErrorMessage());
      return false;
    }
  }
  return true;
}

void ExplorationLoop::resetAfterFailure() {
  const auto reset = controller_.sendReset();
  if (reset.failed()) {
    log_.warning("reset failed: " + reset.getErrorMessage());
  }
}

void ExplorationLoop::discard(int index) {
  for (const auto& file : {probeFile(index), evidenceFile(index)}) {
    if (file.existsAsFile() && !file.deleteFile()) {
      log_.warning("cannot delete " + file.getFullPathName());
    }
  }
}

}  // namespace patchprobe::app
