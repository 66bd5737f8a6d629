#pragma once

#include <flightledger/schema/primitives.hpp>
#include <cstdint>

// Schema type: canonical entry.
// Integrity workflow: deterministic byte form of a log entry; the only input
// the entry hasher ever sees.
namespace flightledger::schema {

inline constexpr uint16_t kCanonicalFormatVersion = 1;

template <uint16_t Version>
struct canonical_entry;

template <>
struct canonical_entry<1> final {
  uint16_t version{1};
  uint64_t index{};
  bytes_t bytes;
};

using canonical_entry_t = canonical_entry<1>;

}  // namespace flightledger::schema
