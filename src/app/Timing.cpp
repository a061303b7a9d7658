#include "app/Timing.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace patchprobe {

namespace {

double steadySeconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

}  // namespace

bool Clock::stopRequested() {
  if (token_ && token_->stopRequested()) {
    return true;
  }
  return now() >= deadline_;
}

bool Clock::sleepUntil(double target) {
  for (;;) {
    const double remaining = target - now();
    if (remaining <= 0.0) {
      return true;
    }
    if (stopRequested()) {
      return false;
    }
    pause(std::min(remaining, kSliceSeconds));
  }
}

SteadyClock::SteadyClock() : origin_(steadySeconds()) {}

double SteadyClock::now() { return steadySeconds() - origin_; }

void SteadyClock::pause(double seconds) {
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

}  // namespace patchprobe
