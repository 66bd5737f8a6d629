#pragma once

#include <flightledger/schema/primitives.hpp>
#include <cstdint>

// Schema type: chain link.
// Integrity workflow: per-entry commitment record. `chain_hash` binds the
// entry hash, the predecessor's chain hash and the index, so it commits to
// every entry at or before `index`.
namespace flightledger::schema {

template <uint16_t Version>
struct chain_link;

template <>
struct chain_link<1> final {
  uint16_t version{1};
  uint64_t index{};
  hash32_t entry_hash{};
  hash32_t prev_chain_hash{};
  hash32_t chain_hash{};
};

using chain_link_t = chain_link<1>;

}  // namespace flightledger::schema
