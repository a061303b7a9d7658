#pragma once

//
// Timing.h
// --------
// Wall-clock plumbing for the control thread.  Everything that waits (settle
// gaps, note holds, MIDI file scheduling, the inter-trial pause) goes through
// a `Clock`, which sleeps in short slices and gives up early once the run's
// stop condition trips: either the operator hit Ctrl-C (the StopToken) or the
// run deadline passed.  Tests drive a manual clock instead so a ten second
// note probe costs nothing.
#include <atomic>
#include <limits>

namespace patchprobe {

// Cancellation flag shared between the signal handler and the control thread.
class StopToken {
 public:
  void requestStop() noexcept { stop_.store(true, std::memory_order_relaxed); }
  bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }
  void reset() noexcept { stop_.store(false, std::memory_order_relaxed); }

 private:
  std::atomic<bool> stop_{false};
};

class Clock {
 public:
  static constexpr double kSliceSeconds = 0.02;
  static constexpr double kNoDeadline = std::numeric_limits<double>::infinity();

  virtual ~Clock() = default;

  // Monotonic seconds since an arbitrary origin.
  virtual double now() = 0;

  // Arm the stop condition.  `token` may be null; `deadline` is in now() units.
  void watch(const StopToken* token, double deadline = kNoDeadline) {
    token_ = token;
    deadline_ = deadline;
  }
  bool stopRequested();

  // Sleep until now() >= target.  Returns false when the stop condition cut
  // the wait short; the clock is then somewhere before `target`.
  bool sleepUntil(double target);
  bool sleepFor(double seconds) { return sleepUntil(now() + seconds); }

 protected:
  // Block for roughly `seconds` (always <= kSliceSeconds).
  virtual void pause(double seconds) = 0;

 private:
  const StopToken* token_{nullptr};
  double deadline_{kNoDeadline};
};

// std::chrono::steady_clock with real sleeps.
class SteadyClock final : public Clock {
 public:
  SteadyClock();
  double now() override;

 protected:
  void pause(double seconds) override;

 private:
  double origin_;
};

}  // namespace patchprobe
