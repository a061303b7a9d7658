#include "io/TrialStore.h"

#include <algorithm>
#include <limits>
#include <string_view>

#include "io/Csv.h"
#include "util/RunLog.h"

namespace patchprobe::io {

namespace {

struct Columns {
  int index{-1};
  int timestamp{-1};
  int parameters{-1};
};

Columns mapColumns(const std::vector<std::string>& header) {
  Columns cols;
  for (std::size_t i = 0; i < header.size(); ++i) {
    const std::string name = csv::trim(header[i]);
    if (name == "index") {
      cols.index = static_cast<int>(i);
    } else if (name == "timestamp") {
      cols.timestamp = static_cast<int>(i);
    } else if (name == "parameters") {
      cols.parameters = static_cast<int>(i);
    }
  }
  return cols;
}

const std::string* field(const std::vector<std::string>& fields, int column) {
  if (column < 0 || static_cast<std::size_t>(column) >= fields.size()) {
    return nullptr;
  }
  return &fields[static_cast<std::size_t>(column)];
}

// Spreadsheet tools like to prefix a re-saved CSV with a UTF-8 byte order
// mark, which would otherwise glue itself to the first column name.
std::string_view stripByteOrderMark(std::string_view text) {
  constexpr std::string_view kBom = "\xEF\xBB\xBF";
  if (text.substr(0, kBom.size()) == kBom) {
    text.remove_prefix(kBom.size());
  }
  return text;
}

bool usable(const Columns& cols) { return cols.index >= 0 && cols.parameters >= 0; }

Columns headerColumns(const csv::Line& line) {
  const auto header = csv::splitRow(line.text);
  return header ? mapColumns(*header) : Columns{};
}

bool endsWithNewline(const juce::File& file) {
  const auto size = file.getSize();
  if (size <= 0) {
    return true;
  }
  juce::FileInputStream in(file);
  if (in.failedToOpen() || !in.setPosition(size - 1)) {
    return true;
  }
  return in.readByte() == '\n';
}

}  // namespace

TrialStore::TrialStore(std::string logPath, RunLog& log) : path_(std::move(logPath)), log_(log) {}

juce::File TrialStore::file() const {
  return juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path_));
}

juce::Result TrialStore::verify() const {
  const auto logFile = file();
  if (!logFile.existsAsFile() || logFile.getSize() == 0) {
    return juce::Result::ok();
  }
  juce::MemoryBlock bytes;
  if (!logFile.loadFileAsData(bytes)) {
    return juce::Result::fail("trial log: could not read " + logFile.getFullPathName());
  }
  const auto text = stripByteOrderMark(std::string_view(static_cast<const char*>(bytes.getData()), bytes.getSize()));
  const auto lines = csv::splitLines(text, false);
  if (lines.empty()) {
    return juce::Result::fail("trial log " + logFile.getFullPathName() + " has no complete header line");
  }
  if (!usable(headerColumns(lines.front()))) {
    return juce::Result::fail("trial log " + logFile.getFullPathName() + ": header '" +
                              juce::String(lines.front().text) + "' lacks index/parameters columns");
  }
  return juce::Result::ok();
}

std::vector<TrialStore::Row> TrialStore::scan() const {
  std::vector<Row> rows;
  const auto file = this->file();
  if (!file.existsAsFile()) {
    return rows;
  }

  juce::MemoryBlock bytes;
  if (!file.loadFileAsData(bytes)) {
    log_.error("trial log: could not read " + file.getFullPathName());
    return rows;
  }
  const auto text = stripByteOrderMark(std::string_view(static_cast<const char*>(bytes.getData()), bytes.getSize()));
  const auto lines = csv::splitLines(text, false);
  if (lines.empty()) {
    return rows;
  }

  const Columns cols = headerColumns(lines.front());
  if (!usable(cols)) {
    log_.error("trial log: header '" + juce::String(lines.front().text) + "' lacks index/parameters columns");
    return rows;
  }

  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto& line = lines[i];
    const auto fields = csv::splitRow(line.text);
    if (!fields) {
      log_.warning("trial log line " + juce::String(static_cast<int>(line.number)) + ": malformed CSV, skipped");
      continue;
    }

    Row row;
    row.line = line.number;
    if (const auto* raw = field(*fields, cols.index)) {
      const auto parsed = csv::parseInteger(*raw);
      if (parsed && *parsed >= 0 && *parsed <= std::numeric_limits<int>::max()) {
        row.index = static_cast<int>(*parsed);
      }
    }
    if (const auto* raw = field(*fields, cols.timestamp)) {
      row.timestamp = csv::trim(*raw);
    }
    if (const auto* raw = field(*fields, cols.parameters)) {
      row.assignment = parseAssignmentJson(*raw);
    }

    if (!row.index || !row.assignment) {
      log_.warning("trial log line " + juce::String(static_cast<int>(line.number)) + ": " +
                   (!row.index ? "bad index" : "bad parameters") + ", skipped");
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

std::set<std::string> TrialStore::loadExisting() const {
  std::set<std::string> tried;
  for (const auto& row : scan()) {
    if (row.assignment) {
      tried.insert(canonicalJson(*row.assignment));
    }
  }
  return tried;
}

int TrialStore::lastIndex() const {
  int last = -1;
  for (const auto& row : scan()) {
    if (row.index) {
      last = std::max(last, *row.index);
    }
  }
  return last;
}

ResumeState TrialStore::resumeState() const {
  ResumeState state;
  int last = -1;
  for (const auto& row : scan()) {
    if (row.assignment) {
      state.tried.insert(canonicalJson(*row.assignment));
    }
    if (row.index) {
      last = std::max(last, *row.index);
    }
    ++state.rows;
  }
  state.nextIndex = last + 1;
  return state;
}

std::vector<TrialRecord> TrialStore::records() const {
  std::vector<TrialRecord> out;
  for (auto& row : scan()) {
    if (row.index && row.assignment) {
      out.push_back(TrialRecord{*row.index, row.timestamp, std::move(*row.assignment)});
    }
  }
  return out;
}

juce::Result TrialStore::append(int index, const ParameterAssignment& assignment) {
  const auto file = this->file();
  // Rows under a header nobody can map would restart the index at 0.
  if (const auto checked = verify(); checked.failed()) {
    return checked;
  }

  juce::String text;
  if (!file.existsAsFile() || file.getSize() == 0) {
    const auto created = file.create();
    if (created.failed()) {
      return created;
    }
    text << kHeader << "\n";
  } else if (!endsWithNewline(file)) {
    // Fence off a torn row from a crashed writer so ours starts on its own line.
    text << "\n";
  }

  const std::vector<std::string> fields{
      std::to_string(index),
      juce::Time::getCurrentTime().toISO8601(true).toStdString(),
      canonicalJson(assignment),
  };
  text << juce::String(csv::joinRow(fields)) << "\n";

  juce::FileOutputStream out(file);
  if (out.failedToOpen()) {
    return out.getStatus();
  }
  if (!out.writeText(text, false, false, nullptr)) {
    return juce::Result::fail("trial log: write failed for " + file.getFullPathName());
  }
  out.flush();
  if (out.getStatus().failed()) {
    return out.getStatus();
  }
  return juce::Result::ok();
}

}  // namespace patchprobe::io
