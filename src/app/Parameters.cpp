#include "app/Parameters.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>

#include <ArduinoJson.h>

#include "util/RNG.h"

namespace patchprobe {

namespace {

std::optional<int> parseId(const char* key) {
  if (!key || *key == '\0') {
    return std::nullopt;
  }
  for (const char* p = key; *p; ++p) {
    if (*p < '0' || *p > '9') {
      return std::nullopt;
    }
  }
  errno = 0;
  char* end = nullptr;
  const long value = std::strtol(key, &end, 10);
  if (errno != 0 || !end || *end != '\0' || value > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

}  // namespace

std::string canonicalJson(const ParameterAssignment& assignment) {
  JsonDocument doc;
  JsonObject root = doc.to<JsonObject>();
  // std::map iterates in ascending id order, and ArduinoJson keeps insertion
  // order, so the text comes out sorted.
  for (const auto& [id, value] : assignment) {
    root[std::to_string(id)] = value;
  }
  std::string json;
  serializeJson(doc, json);
  return json;
}

std::optional<ParameterAssignment> parseAssignmentJson(std::string_view json) {
  JsonDocument doc;
  const DeserializationError err = deserializeJson(doc, json.data(), json.size());
  if (err) {
    return std::nullopt;
  }
  if (!doc.is<JsonObject>()) {
    return std::nullopt;
  }

  ParameterAssignment out;
  for (JsonPair kv : doc.as<JsonObject>()) {
    const auto id = parseId(kv.key().c_str());
    if (!id) {
      return std::nullopt;
    }
    JsonVariant value = kv.value();
    if (!value.is<int>()) {
      return std::nullopt;
    }
    out[*id] = value.as<int>();
  }
  return out;
}

ParameterAssignment sampleAssignment(const ParameterSpec& spec, std::uint32_t& rngState) {
  ParameterAssignment out;
  for (const auto& [id, values] : spec) {
    if (values.empty()) {
      continue;
    }
    out[id] = values[RNG::uniformIndex(rngState, values.size())];
  }
  return out;
}

bool assignmentMatchesSpec(const ParameterAssignment& assignment, const ParameterSpec& spec) {
  if (assignment.size() != spec.size()) {
    return false;
  }
  for (const auto& [id, values] : spec) {
    const auto it = assignment.find(id);
    if (it == assignment.end()) {
      return false;
    }
    if (std::find(values.begin(), values.end(), it->second) == values.end()) {
      return false;
    }
  }
  return true;
}

std::uint64_t spaceSize(const ParameterSpec& spec) {
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t total = 1;
  for (const auto& entry : spec) {
    std::vector<int> distinct = entry.second;
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    const std::uint64_t count = distinct.size();
    if (count == 0) {
      return 0;
    }
    if (total > kMax / count) {
      return kMax;
    }
    total *= count;
  }
  return total;
}

}  // namespace patchprobe
