#pragma once

#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: mission digest.
// Integrity workflow: single commitment over a mission (or mission version)
// handed to the anchoring collaborator. `digest` commits to every other field.
namespace flightledger::schema {

template <uint16_t Version>
struct mission_digest;

template <>
struct mission_digest<1> final {
  uint16_t version{1};
  mission_id_t mission_id;
  hash_algorithm algorithm{kDefaultHashAlgorithm};
  hash32_t final_chain_hash{};
  uint64_t entry_count{};
  timestamp_milliseconds_t created_at{};
  hash32_t digest{};
};

using mission_digest_t = mission_digest<1>;

}  // namespace flightledger::schema
