#include "io/ParamSpecReader.h"

#include <algorithm>
#include <string>
#include <vector>

#include "io/Csv.h"
#include "io/SynthProtocol.h"
#include "util/RunLog.h"

namespace patchprobe::io {

namespace {

juce::String rowLabel(const csv::Line& line) { return "param spec line " + juce::String(static_cast<int>(line.number)); }

}  // namespace

juce::Result parseParamSpec(std::string_view text, ParameterSpec& out, RunLog& log) {
  out.clear();
  const auto lines = csv::splitLines(text, true);
  std::size_t skipped = 0;

  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto& line = lines[i];
    const auto fields = csv::splitRow(line.text);
    if (!fields || fields->size() < 2) {
      log.warning(rowLabel(line) + ": could not parse row '" + juce::String(line.text) + "'");
      ++skipped;
      continue;
    }

    const auto id = csv::parseInteger((*fields)[0]);
    if (!id || *id < 0 || *id > protocol::kMaxParameterId) {
      log.warning(rowLabel(line) + ": parameter id '" + juce::String((*fields)[0]) + "' is not addressable");
      ++skipped;
      continue;
    }
    const int parameterId = static_cast<int>(*id);
    if (out.count(parameterId) != 0) {
      log.warning(rowLabel(line) + ": parameter " + juce::String(parameterId) + " already defined, row skipped");
      ++skipped;
      continue;
    }

    std::vector<int> values;
    bool rowOk = true;
    std::string_view spec = (*fields)[1];
    std::size_t start = 0;
    while (start <= spec.size()) {
      const std::size_t comma = std::min(spec.find(',', start), spec.size());
      const auto value = csv::parseInteger(spec.substr(start, comma - start));
      if (!value || *value < 0 || *value > protocol::kMaxValue) {
        log.warning(rowLabel(line) + ": value list '" + juce::String(std::string(spec)) +
                    "' holds a non-byte entry");
        rowOk = false;
        break;
      }
      if (std::find(values.begin(), values.end(), static_cast<int>(*value)) == values.end()) {
        values.push_back(static_cast<int>(*value));
      }
      start = comma + 1;
    }
    if (!rowOk || values.empty()) {
      ++skipped;
      continue;
    }
    out.emplace(parameterId, std::move(values));
  }

  if (skipped > 0) {
    log.warning("param spec: skipped " + juce::String(static_cast<int>(skipped)) + " malformed row(s)");
  }
  if (out.empty()) {
    return juce::Result::fail("parameter spec holds no usable rows");
  }
  return juce::Result::ok();
}

juce::Result readParamSpec(const juce::File& file, ParameterSpec& out, RunLog& log) {
  if (!file.existsAsFile()) {
    return juce::Result::fail("parameter spec not found: " + file.getFullPathName());
  }
  juce::MemoryBlock bytes;
  if (!file.loadFileAsData(bytes)) {
    return juce::Result::fail("could not read parameter spec: " + file.getFullPathName());
  }
  const std::string_view text(static_cast<const char*>(bytes.getData()), bytes.getSize());
  const auto result = parseParamSpec(text, out, log);
  if (result.wasOk()) {
    log.info("loaded " + juce::String(static_cast<int>(out.size())) + " parameters from " + file.getFullPathName());
  }
  return result;
}

}  // namespace patchprobe::io
