#pragma once

#include <flightledger/schema/field_value.hpp>
#include <flightledger/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <string>

// Schema type: log entry.
// Integrity workflow: one mission telemetry sample or event as produced by the
// off-board logging pipeline. `index` is the ordering key; the field map keeps
// names sorted so construction order never leaks into the canonical form.
namespace flightledger::schema {

using field_map_t = std::map<std::string, field_value>;

template <uint16_t Version>
struct log_entry;

template <>
struct log_entry<1> final {
  uint16_t version{1};
  uint64_t index{};
  timestamp_milliseconds_t timestamp{};
  std::string entry_type;
  field_map_t fields;
};

using log_entry_t = log_entry<1>;

}  // namespace flightledger::schema
