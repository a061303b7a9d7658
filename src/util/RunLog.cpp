#include "util/RunLog.h"

namespace patchprobe {

RunLog::RunLog(Level minimum) : minimum_(minimum) {}

RunLog::~RunLog() = default;

juce::Result RunLog::openFile(const juce::File& file) {
  const auto created = file.getParentDirectory().createDirectory();
  if (created.failed()) {
    return created;
  }
  // A negative size limit keeps FileLogger from trimming yesterday's lines.
  auto logger = std::make_unique<juce::FileLogger>(file, "patchprobe run log", -1);
  if (!file.existsAsFile()) {
    return juce::Result::fail("could not create log file " + file.getFullPathName());
  }
  const juce::ScopedLock sl(lock_);
  file_ = std::move(logger);
  return juce::Result::ok();
}

juce::StringArray RunLog::history() const {
  const juce::ScopedLock sl(lock_);
  return history_;
}

void RunLog::write(Level level, const juce::String& message) {
  const juce::ScopedLock sl(lock_);
  ++counts_[static_cast<std::size_t>(level)];
  if (level < minimum_) {
    return;
  }

  const juce::String line = juce::Time::getCurrentTime().toISO8601(true) + " - " + levelName(level) + " - " + message;
  if (file_) {
    file_->logMessage(line);
  }
  if (consoleEcho_) {
    juce::Logger::outputDebugString(juce::String(levelName(level)) + ": " + message);
  }
  if (captureHistory_) {
    history_.add(line);
  }
}

std::size_t RunLog::count(Level level) const {
  const juce::ScopedLock sl(lock_);
  return counts_[static_cast<std::size_t>(level)];
}

const char* RunLog::levelName(Level level) {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarning: return "WARNING";
    case Level::kError: return "ERROR";
  }
  return "INFO";
}

}  // namespace patchprobe
