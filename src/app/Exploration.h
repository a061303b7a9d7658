#pragma once

//
// Exploration.h
// -------------
// The trial state machine.  One attempt walks
//
//   Sampling -> (dedup gate) -> Programming -> Probing -> (silence gate)
//            -> Evidence -> Accepted
//
// and any gate may send it back to Sampling instead.  Nothing is written to
// the trial log until the very last step, and an attempt that does not make
// it there leaves no audio behind either.  The loop owns no devices; main()
// builds the collaborators and hands them in so tests can swap every one of
// them for a fake.
#include <cstdint>
#include <set>
#include <string>

#include <juce_core/juce_core.h>

#include "app/Parameters.h"
#include "app/ProbeConfig.h"

namespace patchprobe {

class Clock;
class ParameterController;
class RunLog;
class StopToken;

namespace engine {
class Playback;
}

namespace io {
class TrialStore;
}

namespace app {

struct RunSummary {
  enum class Ending { kDeadline, kCancelled, kExhausted };

  int accepted{0};
  int duplicates{0};
  int silent{0};
  int failures{0};
  int attempts{0};  // assignments that reached the device
  int firstIndex{0};
  int nextIndex{0};
  double elapsedSeconds{0.0};
  Ending ending{Ending::kDeadline};
  std::uint32_t seed{0};
};

const char* endingName(RunSummary::Ending ending);

class ExplorationLoop {
 public:
  ExplorationLoop(const ParameterSpec& spec, const ProbeConfig& config, ParameterController& controller,
                  engine::Playback& playback, io::TrialStore& store, Clock& clock, StopToken& stop, RunLog& log);

  // Run until the deadline, a stop request or the space runs out.  Always
  // logs a summary before returning.
  RunSummary run();

  juce::File probeFile(int index) const;
  juce::File evidenceFile(int index) const;

 private:
  enum class Attempt { kAccepted, kSilent, kFailed, kAbandoned };

  Attempt attempt(int index, const ParameterAssignment& assignment);
  Attempt tryAttempt(int index, const ParameterAssignment& assignment);
  bool program(const ParameterAssignment& assignment);
  void resetAfterFailure();
  void discard(int index);

  std::uint32_t pickSeed() const;

  const ParameterSpec& spec_;
  const ProbeConfig& config_;
  ParameterController& controller_;
  engine::Playback& playback_;
  io::TrialStore& store_;
  Clock& clock_;
  StopToken& stop_;
  RunLog& log_;
  juce::File audioDir_;
};

}  // namespace app
}  // namespace patchprobe
