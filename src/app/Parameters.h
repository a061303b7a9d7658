#pragma once

//
// Parameters.h
// ------------
// The vocabulary of a run.  A ParameterSpec says which values each synth
// parameter may take; a ParameterAssignment picks exactly one of them per
// parameter.  Assignments compare through their canonical JSON form (keys in
// ascending numeric order, compact separators) which is also what lands in
// the trial log, so "already tried" is a plain string lookup.
//
// ArduinoJson stays inside Parameters.cpp.
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchprobe {

// parameter id -> admissible values, in file order.  Every id owns at least
// one value once the reader has vetted it.
using ParameterSpec = std::map<int, std::vector<int>>;

// parameter id -> chosen value.
using ParameterAssignment = std::map<int, int>;

// Compact JSON object, keys sorted by numeric id: {"0":170,"1":0}
std::string canonicalJson(const ParameterAssignment& assignment);

// Accepts any JSON object whose keys are decimal ids and whose values are
// integers, whatever the whitespace or key order.  Anything else is nullopt.
std::optional<ParameterAssignment> parseAssignmentJson(std::string_view json);

// Draw one admissible value per parameter, independently and uniformly.
ParameterAssignment sampleAssignment(const ParameterSpec& spec, std::uint32_t& rngState);

// True when every spec id is present with an admissible value and nothing
// else is.
bool assignmentMatchesSpec(const ParameterAssignment& assignment, const ParameterSpec& spec);

// Number of distinct assignments the parameter spec allows.  Saturates at UINT64_MAX.
std::uint64_t spaceSize(const ParameterSpec& spec);

}  // namespace patchprobe
