#pragma once

//
// TrialStore.h
// ------------
// The durable memory of the harness: a CSV log with one row per accepted
// trial.
//
//   index,timestamp,parameters
//   0,2026-10-19T14:02:11.512+02:00,"{""0"":170,""1"":0}"
//
// Rows are only ever appended, one whole line at a time and flushed, so a
// reader tailing the file (the downstream classifier) never sees half a row
// and a crash never corrupts what is already there.  On startup the same file
// rebuilds the two things a resumed run needs: the set of assignments already
// tried and the next free index.
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <juce_core/juce_core.h>

#include "app/Parameters.h"

namespace patchprobe {

class RunLog;

namespace io {

struct TrialRecord {
  int index{0};
  std::string timestamp;
  ParameterAssignment assignment;
};

// Everything a resumed run needs, from a single pass over the file.
struct ResumeState {
  std::set<std::string> tried;
  int nextIndex{0};
  std::size_t rows{0};
};

class TrialStore {
 public:
  static constexpr const char* kHeader = "index,timestamp,parameters";

  TrialStore(std::string logPath, RunLog& log);

  // Fails when an existing, non-empty log cannot be resumed from: unreadable,
  // or a header without index and parameters columns.  An absent or empty
  // file is fine.
  juce::Result verify() const;

  // Canonical forms of every assignment in the log.  Empty when the file is
  // absent.
  std::set<std::string> loadExisting() const;

  // Highest index in the log, -1 when there is none.
  int lastIndex() const;
  int nextIndex() const { return lastIndex() + 1; }

  ResumeState resumeState() const;

  // Rows whose index and parameters both parse, in file order.
  std::vector<TrialRecord> records() const;

  // Create the file with its header when needed, then append one flushed row
  // stamped with the current local time.
  juce::Result append(int index, const ParameterAssignment& assignment);

  const std::string& path() const { return path_; }

 private:
  struct Row {
    std::size_t line{0};
    std::optional<int> index;
    std::string timestamp;
    std::optional<ParameterAssignment> assignment;
  };

  // Read every complete row.  Rows that fail to parse are logged here, once
  // per scan.
  std::vector<Row> scan() const;

  juce::File file() const;

  std::string path_;
  RunLog& log_;
};

}  // namespace io
}  // namespace patchprobe
