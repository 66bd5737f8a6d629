#pragma once

#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/primitives.hpp>
#include <cstdint>

// Schema type: checkpoint.
// Integrity workflow: trust anchor recorded at a mission milestone. Append
// only; never mutated once handed to the caller.
namespace flightledger::schema {

template <uint16_t Version>
struct checkpoint;

template <>
struct checkpoint<1> final {
  uint16_t version{1};
  uint64_t index{};
  hash32_t chain_hash{};
  timestamp_milliseconds_t timestamp{};
  hash_algorithm algorithm{kDefaultHashAlgorithm};
};

using checkpoint_t = checkpoint<1>;

}  // namespace flightledger::schema
