#pragma once

//
// ParamSpecReader.h
// -----------------
// Loads the parameter spec CSV:
//
//   param_num,value_spec
//   0,"0,85,170,255"
//   5,"0,127"
//
// The first line is a header and is skipped.  A row that does not parse, names
// an id the wire protocol cannot address, carries a value outside 0..255, or
// repeats an id already seen is logged and skipped; the rest still load.
#include <string_view>

#include <juce_core/juce_core.h>

#include "app/Parameters.h"

namespace patchprobe {

class RunLog;

namespace io {

// Parse spec text.  Fails only when no usable row survives.
juce::Result parseParamSpec(std::string_view text, ParameterSpec& out, RunLog& log);

// Read and parse `file`.  A missing or unreadable file is a failure.
juce::Result readParamSpec(const juce::File& file, ParameterSpec& out, RunLog& log);

}  // namespace io
}  // namespace patchprobe
