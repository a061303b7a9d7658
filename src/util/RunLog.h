#pragma once

//
// RunLog.h
// --------
// The one logging surface every component talks to.  A run is meant to go
// unattended for a day, so the log file is the operator's only witness: each
// line lands on disk (through `juce::FileLogger`, which flushes per message)
// before the call returns.  Console echo is optional and goes through
// `juce::Logger::outputDebugString`.
//
// Components receive a `RunLog&` at construction.  Tests build their own
// instance with history capture switched on and assert on what was said.
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <juce_core/juce_core.h>

namespace patchprobe {

class RunLog {
 public:
  enum class Level : std::uint8_t { kDebug = 0, kInfo, kWarning, kError };

  explicit RunLog(Level minimum = Level::kInfo);
  ~RunLog();

  RunLog(const RunLog&) = delete;
  RunLog& operator=(const RunLog&) = delete;

  // Append to `file`, creating it (and its parent folder) when missing.
  // Existing content is never trimmed.
  juce::Result openFile(const juce::File& file);

  void setConsoleEcho(bool enabled) { consoleEcho_ = enabled; }
  void setMinimumLevel(Level level) { minimum_ = level; }
  Level minimumLevel() const { return minimum_; }

  // Keep every emitted line in memory.  Meant for tests.
  void captureHistory(bool enabled) { captureHistory_ = enabled; }
  juce::StringArray history() const;

  void debug(const juce::String& message) { write(Level::kDebug, message); }
  void info(const juce::String& message) { write(Level::kInfo, message); }
  void warning(const juce::String& message) { write(Level::kWarning, message); }
  void error(const juce::String& message) { write(Level::kError, message); }

  void write(Level level, const juce::String& message);

  // Lines emitted at `level`, counted whether or not they passed the filter.
  std::size_t count(Level level) const;

  static const char* levelName(Level level);

 private:
  Level minimum_;
  bool consoleEcho_{false};
  bool captureHistory_{false};
  std::unique_ptr<juce::FileLogger> file_;
  std::array<std::size_t, 4> counts_{};
  juce::StringArray history_;
  juce::CriticalSection lock_;
};

}  // namespace patchprobe
